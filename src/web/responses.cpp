#include "web/responses.hpp"

namespace userapi {
namespace web {

namespace {

const char* problemType(http::status status) noexcept {
    switch (status) {
        case http::status::bad_request:
            return "https://tools.ietf.org/html/rfc9110#section-15.5.1";
        case http::status::not_found:
            return "https://tools.ietf.org/html/rfc9110#section-15.5.5";
        case http::status::method_not_allowed:
            return "https://tools.ietf.org/html/rfc9110#section-15.5.6";
        case http::status::conflict:
            return "https://tools.ietf.org/html/rfc9110#section-15.5.10";
        case http::status::payload_too_large:
            return "https://tools.ietf.org/html/rfc9110#section-15.5.14";
        case http::status::internal_server_error:
            return "https://tools.ietf.org/html/rfc9110#section-15.6.1";
        default:
            return "about:blank";
    }
}

}  // namespace

Response makeEmpty(http::status status) {
    Response res{status, 11};
    return res;
}

Response makeText(http::status status, std::string body) {
    Response res{status, 11};
    res.set(http::field::content_type, textContentType);
    res.body() = std::move(body);
    return res;
}

Response makeJson(http::status status, const json& body) {
    Response res{status, 11};
    res.set(http::field::content_type, jsonContentType);
    // query values echoed in field errors may carry invalid UTF-8
    res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    return res;
}

Response makeProblem(http::status status, std::string detail) {
    json problem{{"type", problemType(status)},
                 {"title", toString(http::obsolete_reason(status))},
                 {"status", static_cast<unsigned>(status)},
                 {"detail", std::move(detail)}};

    Response res{status, 11};
    res.set(http::field::content_type, problemContentType);
    // replace invalid UTF-8 from exception messages instead of throwing
    res.body() = problem.dump(-1, ' ', false, json::error_handler_t::replace);
    return res;
}

} // namespace web
} // namespace userapi
