#pragma once

#include <string>
#include "web/types.hpp"

namespace userapi {
namespace web {

/**
 * @brief Logs every request (scheme, host, path, query and body) before handing
 * it on, and the status and body of the response produced downstream. The
 * buffered response is forwarded unchanged.
 */
Middleware requestLogging();

/**
 * @brief Converts any exception escaping the wrapped handler into a 500 problem
 * response whose detail is the exception message.
 */
Middleware errorHandling();

// "<scheme> <host><path> <?query> <body>"
std::string formatRequest(const Request& request);

// "<status>: <body>"
std::string formatResponse(const Response& response);

} // namespace web
} // namespace userapi
