#include "web/url.hpp"

namespace userapi {
namespace web {

namespace {

int hexValue(char h) noexcept {
    if (h >= '0' && h <= '9')
        return h - '0';
    if (h >= 'a' && h <= 'f')
        return 10 + (h - 'a');
    if (h >= 'A' && h <= 'F')
        return 10 + (h - 'A');
    return -1;
}

}  // namespace

Target splitTarget(std::string_view target) {
    auto pos = target.find('?');
    if (pos == std::string_view::npos)
        return Target{std::string(target), {}};
    return Target{std::string(target.substr(0, pos)), std::string(target.substr(pos + 1))};
}

std::string urlDecode(std::string_view s, bool plusAsSpace) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(plusAsSpace && c == '+' ? ' ' : c);
    }
    return out;
}

query_t parseQuery(std::string_view query) {
    query_t params;
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty())
            continue;

        auto eq = pair.find('=');
        auto key = urlDecode(pair.substr(0, eq), true);
        auto value = (eq == std::string_view::npos) ? std::string{} : urlDecode(pair.substr(eq + 1), true);
        params[std::move(key)] = std::move(value);
    }
    return params;
}

} // namespace web
} // namespace userapi
