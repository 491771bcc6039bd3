#include "validation/user_validator.hpp"
#include <algorithm>
#include <cctype>

namespace userapi {

namespace {

bool isBlank(std::string_view s) noexcept {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

bool isDomainChar(unsigned char c) noexcept {
    return std::isalnum(c) || c == '-' || c >= 0x80;
}

}  // namespace

json toJsonArray(const std::vector<FieldError>& errors) {
    json arr = json::array();
    for (auto& error : errors)
        arr.push_back(error.to_json());
    return arr;
}

std::vector<FieldError> UserValidator::validate(const User& user) const {
    std::vector<FieldError> errors;

    if (isBlank(user.name))
        errors.push_back({"Name", "'Name' must not be empty."});

    if (isBlank(user.email)) {
        errors.push_back({"Email", "'Email' must not be empty."});
    } else if (!isValidEmail(user.email)) {
        errors.push_back({"Email", "'Email' is not a valid email address."});
    }

    return errors;
}

bool UserValidator::isValidEmail(std::string_view email) noexcept {
    auto at = email.find('@');
    if (at == std::string_view::npos || at == 0 || email.find('@', at + 1) != std::string_view::npos)
        return false;

    auto local = email.substr(0, at);
    auto domain = email.substr(at + 1);

    for (unsigned char c : local) {
        if (std::isspace(c) || std::iscntrl(c) || c == '"' || c == '(' || c == ')' || c == ',' ||
            c == ':' || c == ';' || c == '<' || c == '>' || c == '[' || c == ']' || c == '\\')
            return false;
    }
    if (local.front() == '.' || local.back() == '.' || local.find("..") != std::string_view::npos)
        return false;

    // domain: labels separated by dots, at least two labels
    size_t labels = 0;
    size_t labelLength = 0;
    for (unsigned char c : domain) {
        if (c == '.') {
            if (labelLength == 0)
                return false;
            ++labels;
            labelLength = 0;
        } else if (isDomainChar(c)) {
            ++labelLength;
        } else {
            return false;
        }
    }
    if (labelLength == 0)
        return false;
    ++labels;

    return labels >= 2;
}

}  // namespace userapi
