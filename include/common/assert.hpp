#pragma once

#ifdef NDEBUG
#define uapi_assert(...)
#define uapi_unreachable(...) __builtin_unreachable()
#else

#include <fmt/format.h>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

namespace userapi {

void logAssertionFailed(std::string_view, const std::source_location&, std::string msg) noexcept;

template <typename... Args>
[[noreturn]] static void printAssertFailed(std::string_view condition, std::string_view message,
                                           const std::source_location& source_location,
                                           Args&&... args) noexcept {
    std::string formatted_message = fmt::vformat(message, fmt::make_format_args(args...));
    logAssertionFailed(condition, source_location, formatted_message);
    std::abort();
}

}  // namespace userapi

#define uapi_assert(cond, msg, ...)                                                               \
    if (!(cond)) {                                                                                \
        userapi::printAssertFailed(#cond, (msg), std::source_location::current(), ##__VA_ARGS__); \
    }

#define uapi_unreachable(msg)                                                            \
    do {                                                                                 \
        userapi::printAssertFailed("unreachable", msg, std::source_location::current()); \
        __builtin_unreachable();                                                         \
    } while (0)

#endif
