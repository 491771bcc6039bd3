#include "web/router.hpp"
#include <algorithm>
#include <cctype>
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "web/responses.hpp"

namespace userapi {
namespace web {

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

}  // namespace

int32_t RequestContext::intRouteValue(const std::string& name) const {
    auto it = routeValues.find(name);
    if (it == routeValues.end())
        throw InternalError("route value '" + name + "' is not part of the matched route");
    auto value = parseInteger<int32_t>(it->second);
    if (!value)
        throw InternalError("route value '" + name + "' is not an integer");
    return *value;
}

std::optional<std::string> RequestContext::queryValue(const std::string& name) const {
    auto it = query.find(name);
    if (it == query.end())
        return std::nullopt;
    return it->second;
}

void Router::add(http::verb method, std::string_view pattern, RouteHandler handler) {
    routes.push_back(Route{method, std::string(pattern), parsePattern(pattern), std::move(handler)});
    Logger::debug("Registered route {} {}", toString(http::to_string(method)), pattern);
}

void Router::any(std::string_view pattern, RouteHandler handler) {
    routes.push_back(Route{std::nullopt, std::string(pattern), parsePattern(pattern), std::move(handler)});
    Logger::debug("Registered route * {}", pattern);
}

std::vector<Router::Segment> Router::parsePattern(std::string_view pattern) {
    std::vector<Segment> segments;
    for (auto& part : splitPath(pattern)) {
        if (part.size() >= 2 && part.front() == '{' && part.back() == '}') {
            auto inner = part.substr(1, part.size() - 2);
            auto colon = inner.find(':');
            Segment segment{inner.substr(0, colon), true, false};
            if (colon != std::string::npos) {
                auto constraint = inner.substr(colon + 1);
                if (constraint != "int")
                    throw InternalError("unsupported route constraint '" + constraint + "' in " +
                                        std::string(pattern));
                segment.intOnly = true;
            }
            if (segment.text.empty())
                throw InternalError("unnamed route parameter in " + std::string(pattern));
            segments.push_back(std::move(segment));
        } else {
            segments.push_back(Segment{part, false, false});
        }
    }
    return segments;
}

std::vector<std::string> Router::splitPath(std::string_view path) {
    std::vector<std::string> parts;
    while (!path.empty()) {
        auto slash = path.find('/');
        auto part = path.substr(0, slash);
        if (!part.empty())
            parts.emplace_back(part);
        if (slash == std::string_view::npos)
            break;
        path.remove_prefix(slash + 1);
    }
    return parts;
}

bool Router::match(const Route& route, const std::vector<std::string>& pathSegments,
                   std::unordered_map<std::string, std::string>& routeValues) {
    if (route.segments.size() != pathSegments.size())
        return false;

    routeValues.clear();
    for (size_t i = 0; i < pathSegments.size(); ++i) {
        const auto& segment = route.segments[i];
        auto value = urlDecode(pathSegments[i]);
        if (!segment.isParameter) {
            if (!equalsIgnoreCase(segment.text, value))
                return false;
            continue;
        }
        if (segment.intOnly && !parseInteger<int32_t>(value))
            return false;
        routeValues[segment.text] = std::move(value);
    }
    return true;
}

Response Router::handle(const Request& request) const {
    auto target = splitTarget(toString(request.target()));
    auto pathSegments = splitPath(target.path);

    std::unordered_map<std::string, std::string> routeValues;
    std::vector<http::verb> allowed;
    for (const auto& route : routes) {
        if (!match(route, pathSegments, routeValues))
            continue;

        if (route.method && *route.method != request.method()) {
            allowed.push_back(*route.method);
            continue;
        }

        RequestContext ctx{request, target.path, std::move(routeValues), parseQuery(target.query)};
        return route.handler(ctx);
    }

    if (allowed.empty()) {
        Logger::debug("No route for {} {}", toString(request.method_string()), target.path);
        return makeEmpty(http::status::not_found);
    }

    std::string allow;
    for (auto verb : allowed) {
        if (!allow.empty())
            allow += ", ";
        allow += toString(http::to_string(verb));
    }
    auto res = makeEmpty(http::status::method_not_allowed);
    res.set(http::field::allow, allow);
    return res;
}

} // namespace web
} // namespace userapi
