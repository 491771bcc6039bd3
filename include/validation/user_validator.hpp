#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "model/user.hpp"

namespace userapi {

struct FieldError {
    std::string propertyName;
    std::string errorMessage;

    json to_json() const { return json{{"propertyName", propertyName}, {"errorMessage", errorMessage}}; }

    bool operator==(const FieldError& other) const noexcept = default;
};

json toJsonArray(const std::vector<FieldError>& errors);

/**
 * @brief Field-level checks applied to users before they are stored.
 */
class UserValidator {
   public:
    /**
     * @brief Validates name and email
     * @return one entry per failed rule, empty if the user is valid
     */
    std::vector<FieldError> validate(const User& user) const;

    /**
     * @brief Accepts local@domain where the domain has at least two labels, no
     * whitespace and exactly one '@'
     */
    static bool isValidEmail(std::string_view email) noexcept;
};

}  // namespace userapi
