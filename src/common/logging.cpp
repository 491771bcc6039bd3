#include "common/logging.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>

namespace userapi {

namespace {
constexpr const char* logPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v";
}

logger_t& getLogger() {
    static auto logger = []() {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);

        auto logger = spdlog::logger("userapi", spdlog::sinks_init_list{console_sink});
        logger.set_pattern(logPattern);
        logger.set_level(spdlog::level::info);
        return logger;
    }();

    return logger;
}

void configureLogger(spdlog::level::level_enum level, const std::optional<std::string>& logFile) {
    auto& logger = getLogger();
    if (logFile) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*logFile, true);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern(logPattern);
        logger.sinks().push_back(file_sink);
    }
    logger.set_level(level);
    logger.flush_on(spdlog::level::warn);
}

} // namespace userapi
