#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "web/types.hpp"

namespace userapi {
namespace web {

using json = nlohmann::json;

inline constexpr char jsonContentType[] = "application/json; charset=utf-8";
inline constexpr char problemContentType[] = "application/problem+json";
inline constexpr char textContentType[] = "text/plain; charset=utf-8";

Response makeEmpty(http::status status);

Response makeText(http::status status, std::string body);

Response makeJson(http::status status, const json& body);

/**
 * @brief Builds a problem details response ({type, title, status, detail}).
 */
Response makeProblem(http::status status, std::string detail);

// Value of a header or body field as std::string
inline std::string toString(boost::beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

} // namespace web
} // namespace userapi
