#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace userapi {
namespace web {

using query_t = std::unordered_map<std::string, std::string>;

struct Target {
    std::string path;
    // Raw query string without the leading '?'
    std::string query;
};

Target splitTarget(std::string_view target);

/**
 * @brief Percent-decodes s. Malformed escapes are kept literally.
 */
std::string urlDecode(std::string_view s, bool plusAsSpace = false);

// Later occurrences of a key replace earlier ones
query_t parseQuery(std::string_view query);

template <typename int_t>
std::optional<int_t> parseInteger(std::string_view s) noexcept {
    int_t value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty())
        return std::nullopt;
    return value;
}

} // namespace web
} // namespace userapi
