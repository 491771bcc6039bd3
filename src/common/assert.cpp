#include "common/assert.hpp"
#include <source_location>
#include "common/logging.hpp"

#ifndef NDEBUG

namespace userapi {

void logAssertionFailed(std::string_view condition, const std::source_location& source_location,
                        std::string msg) noexcept {
    Logger::critical("Assertion '{}' in {}:{} in function {} failed!\n Message: {}", condition,
                     source_location.file_name(), source_location.line(),
                     source_location.function_name(), msg);
    getLogger().flush();
}
}  // namespace userapi

#endif
