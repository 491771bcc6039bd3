#pragma once

#include <boost/beast/http.hpp>
#include <functional>
#include <vector>

namespace userapi {
namespace web {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// A handler produces a complete, buffered response for a request
using Handler = std::function<Response(const Request&)>;

// A middleware takes the next handler and returns a handler wrapping it
using Middleware = std::function<Handler(Handler)>;

/**
 * @brief Wraps handler in the given middleware. The first middleware in the list
 * is the outermost one and sees the request first.
 */
inline Handler applyMiddleware(Handler handler, const std::vector<Middleware>& middleware) {
    for (auto it = middleware.rbegin(); it != middleware.rend(); ++it)
        handler = (*it)(std::move(handler));
    return handler;
}

} // namespace web
} // namespace userapi
