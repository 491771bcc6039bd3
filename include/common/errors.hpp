#pragma once

#include <stdexcept>
#include <string>

namespace userapi {

class UserApiException : public std::runtime_error {
   public:
    explicit UserApiException(const std::string& message) : std::runtime_error(message) {}

    explicit UserApiException(const char* message) : std::runtime_error(message) {}
};

class ConfigException : public UserApiException {
   public:
    ConfigException(const std::string& message, std::string key)
        : UserApiException("Invalid configuration value for '" + key + "': " + message),
          key_(std::move(key)) {}

    const std::string& getKey() const noexcept { return key_; }

   private:
    std::string key_;
};

class InternalError : public UserApiException {
   public:
    explicit InternalError(const std::string& message)
        : UserApiException("Internal error: " + message) {}
};

}  // namespace userapi
