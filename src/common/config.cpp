#include "common/config.hpp"
#include <boost/asio/ip/address.hpp>
#include <fstream>
#include <limits>
#include <thread>
#include "common/errors.hpp"

namespace userapi {

namespace {

template <typename int_t>
int_t readInteger(const json& obj, const char* key, int_t current, int64_t min, int64_t max) {
    auto it = obj.find(key);
    if (it == obj.end())
        return current;
    if (!it->is_number_integer())
        throw ConfigException("expected an integer", key);
    if (it->is_number_unsigned() && it->get<uint64_t>() > static_cast<uint64_t>(max))
        throw ConfigException("must be at most " + std::to_string(max), key);
    auto value = it->get<int64_t>();
    if (value < min || value > max)
        throw ConfigException("must be between " + std::to_string(min) + " and " + std::to_string(max), key);
    return static_cast<int_t>(value);
}

std::optional<std::string> readString(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return std::nullopt;
    if (!it->is_string())
        throw ConfigException("expected a string", key);
    return it->get<std::string>();
}

}  // namespace

unsigned ServerConfig::defaultThreadCount() noexcept {
    auto n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

ServerConfig ServerConfig::from_json(const json& obj) {
    if (!obj.is_object())
        throw ConfigException("expected a JSON object", "<root>");

    ServerConfig config;
    if (auto host = readString(obj, "host")) {
        boost::system::error_code ec;
        boost::asio::ip::make_address(*host, ec);
        if (ec)
            throw ConfigException("'" + *host + "' is not an IP address", "host");
        config.host = *host;
    }

    config.port = readInteger<uint16_t>(obj, "port", config.port, 0, std::numeric_limits<uint16_t>::max());
    config.threads = readInteger<unsigned>(obj, "threads", config.threads, 1, 256);
    config.readTimeoutSeconds =
        readInteger<int>(obj, "read_timeout_seconds", config.readTimeoutSeconds, 1, 3600);
    config.bodyLimitBytes = readInteger<uint64_t>(obj, "body_limit_bytes", config.bodyLimitBytes, 1,
                                                  std::numeric_limits<int64_t>::max());

    if (auto level = readString(obj, "log_level")) {
        auto parsed = spdlog::level::from_str(*level);
        // from_str falls back to "off" for unknown names
        if (parsed == spdlog::level::off && *level != "off")
            throw ConfigException("unknown log level '" + *level + "'", "log_level");
        config.logLevel = parsed;
    }

    config.logFile = readString(obj, "log_file");
    return config;
}

json ServerConfig::to_json() const {
    auto level = spdlog::level::to_string_view(logLevel);
    json obj{{"host", host},
             {"port", port},
             {"threads", threads},
             {"log_level", std::string(level.data(), level.size())},
             {"read_timeout_seconds", readTimeoutSeconds},
             {"body_limit_bytes", bodyLimitBytes}};
    if (logFile)
        obj["log_file"] = *logFile;
    return obj;
}

std::expected<ServerConfig, std::string> ServerConfig::load(const fs::path& path) {
    std::ifstream ifs(path);
    if (!ifs)
        return std::unexpected("cannot open config file " + path.string());

    json root;
    try {
        ifs >> root;
    } catch (const json::exception& e) {
        return std::unexpected("error reading config json " + path.string() + ": " + e.what());
    }

    try {
        return from_json(root);
    } catch (const ConfigException& e) {
        return std::unexpected(std::string(e.what()));
    }
}

}  // namespace userapi
