#include "model/user.hpp"
#include <limits>
#include <string>
#include <vector>

namespace userapi {

namespace {

std::expected<std::string, std::string> readString(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return std::string{};
    if (!it->is_string())
        return std::unexpected(std::string("field '") + key + "' must be a string");
    return it->get<std::string>();
}

}  // namespace

std::expected<User, std::string> User::from_json(const json& obj, std::optional<user_id_t> defaultId) {
    if (!obj.is_object())
        return std::unexpected("request body must be a JSON object");

    User user;
    auto idIt = obj.find("id");
    if (idIt == obj.end() || idIt->is_null()) {
        user.id = defaultId.value_or(0);
    } else if (idIt->is_number_unsigned()) {
        if (idIt->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<user_id_t>::max()))
            return std::unexpected("field 'id' is out of range");
        user.id = static_cast<user_id_t>(idIt->get<uint64_t>());
    } else if (idIt->is_number_integer()) {
        auto value = idIt->get<int64_t>();
        if (value < std::numeric_limits<user_id_t>::min() || value > std::numeric_limits<user_id_t>::max())
            return std::unexpected("field 'id' is out of range");
        user.id = static_cast<user_id_t>(value);
    } else {
        return std::unexpected("field 'id' must be an integer");
    }

    auto name = readString(obj, "name");
    if (!name)
        return std::unexpected(name.error());
    user.name = std::move(*name);

    auto email = readString(obj, "email");
    if (!email)
        return std::unexpected(email.error());
    user.email = std::move(*email);

    return user;
}

json toJsonArray(const std::vector<User>& users) {
    json arr = json::array();
    for (auto& user : users)
        arr.push_back(user.to_json());
    return arr;
}

std::ostream& operator<<(std::ostream& os, const User& user) {
    return os << fmt::format("{}", user);
}

}  // namespace userapi
