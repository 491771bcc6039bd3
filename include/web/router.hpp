#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "web/types.hpp"
#include "web/url.hpp"

namespace userapi {
namespace web {

/**
 * @brief Everything a route handler gets to see about a matched request
 */
struct RequestContext {
    const Request& request;
    std::string path;
    std::unordered_map<std::string, std::string> routeValues;
    query_t query;

    // Route value of an {name:int} segment. Matching guarantees it parses.
    int32_t intRouteValue(const std::string& name) const;

    std::optional<std::string> queryValue(const std::string& name) const;
};

/**
 * @brief Dispatches requests to handlers by method and path template.
 *
 * Templates consist of literal segments and parameters, e.g. "/users/{id:int}".
 * Literal segments match case-insensitively, an ":int" parameter only matches
 * 32-bit integers, and trailing slashes are ignored. Routes are tried in
 * registration order.
 */
class Router {
   public:
    using RouteHandler = std::function<Response(const RequestContext&)>;

    Router() = default;

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    void add(http::verb method, std::string_view pattern, RouteHandler handler);

    // Matches any method
    void any(std::string_view pattern, RouteHandler handler);

    /**
     * @brief Runs the first matching route. Unknown paths yield 404, known paths
     * with an unregistered method yield 405 with an Allow header.
     */
    Response handle(const Request& request) const;

   private:
    struct Segment {
        std::string text;
        bool isParameter = false;
        bool intOnly = false;
    };

    struct Route {
        std::optional<http::verb> method;
        std::string pattern;
        std::vector<Segment> segments;
        RouteHandler handler;
    };

    std::vector<Route> routes;

    static std::vector<Segment> parsePattern(std::string_view pattern);

    static std::vector<std::string> splitPath(std::string_view path);

    static bool match(const Route& route, const std::vector<std::string>& pathSegments,
                      std::unordered_map<std::string, std::string>& routeValues);
};

} // namespace web
} // namespace userapi
