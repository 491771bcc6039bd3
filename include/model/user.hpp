#pragma once

#include <fmt/format.h>
#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace userapi {

using json = nlohmann::json;
using user_id_t = int32_t;

/**
 * @brief A user record. Records are values: an update replaces the whole record.
 */
struct User {
    user_id_t id = 0;
    std::string name;
    std::string email;

    json to_json() const { return json{{"id", id}, {"name", name}, {"email", email}}; }

    /**
     * @brief Builds a user from a request body.
     *
     * Missing name/email become empty strings and are left for the validator to
     * reject. A missing id is taken from defaultId.
     *
     * @return the user, or a message describing why the body is malformed
     */
    static std::expected<User, std::string> from_json(const json& obj,
                                                      std::optional<user_id_t> defaultId = std::nullopt);

    bool operator==(const User& other) const noexcept = default;
};

json toJsonArray(const std::vector<User>& users);

std::ostream& operator<<(std::ostream& os, const User& user);

}  // namespace userapi

template <>
struct fmt::formatter<userapi::User> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const userapi::User& user, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "User{{id={}, name='{}', email='{}'}}", user.id, user.name,
                              user.email);
    }
};
