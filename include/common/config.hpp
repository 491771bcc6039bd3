#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/common.h>
#include <string>

namespace userapi {

namespace fs = std::filesystem;
using json = nlohmann::json;

/**
 * @brief Server settings. Every field has a default, so an empty JSON object
 * (or no config file at all) is a valid configuration.
 */
struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 5000;
    unsigned threads = defaultThreadCount();
    spdlog::level::level_enum logLevel = spdlog::level::info;
    std::optional<std::string> logFile;
    int readTimeoutSeconds = 30;
    uint64_t bodyLimitBytes = 1024 * 1024;

    static unsigned defaultThreadCount() noexcept;

    /**
     * @brief Reads settings from a JSON object. Unknown keys are ignored.
     * @throws ConfigException if a known key has the wrong type or an invalid value
     */
    static ServerConfig from_json(const json& obj);

    json to_json() const;

    /**
     * @brief Loads a config file
     * @return the config, or an error message if the file cannot be read or is invalid
     */
    static std::expected<ServerConfig, std::string> load(const fs::path& path);
};

}  // namespace userapi
