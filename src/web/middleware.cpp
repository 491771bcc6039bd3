#include "web/middleware.hpp"
#include <exception>
#include <fmt/format.h>
#include "common/logging.hpp"
#include "web/responses.hpp"
#include "web/url.hpp"

namespace userapi {
namespace web {

std::string formatRequest(const Request& request) {
    auto target = splitTarget(toString(request.target()));
    auto query = target.query.empty() ? std::string{} : "?" + target.query;
    return fmt::format("http {}{} {} {}", toString(request[http::field::host]), target.path, query,
                       request.body());
}

std::string formatResponse(const Response& response) {
    return fmt::format("{}: {}", response.result_int(), response.body());
}

Middleware requestLogging() {
    return [](Handler next) -> Handler {
        return [next = std::move(next)](const Request& request) {
            Logger::info("Incoming Request: {}", formatRequest(request));
            auto response = next(request);
            Logger::info("Outgoing Response: {}", formatResponse(response));
            return response;
        };
    };
}

Middleware errorHandling() {
    return [](Handler next) -> Handler {
        return [next = std::move(next)](const Request& request) {
            try {
                return next(request);
            } catch (const std::exception& e) {
                Logger::error("Unhandled exception while processing {} {}: {}",
                              toString(request.method_string()), toString(request.target()), e.what());
                return makeProblem(http::status::internal_server_error, e.what());
            }
        };
    };
}

} // namespace web
} // namespace userapi
