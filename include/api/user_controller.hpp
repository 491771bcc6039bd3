#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>
#include "storage/user_store.hpp"
#include "validation/user_validator.hpp"
#include "web/router.hpp"
#include "web/types.hpp"

namespace userapi {
namespace api {

/**
 * @brief Expected failures of the user endpoints
 */
struct ApiError {
    enum class Kind { NotFound, ValidationFailure, BadRequest, Conflict };

    Kind kind;
    std::vector<FieldError> errors;
    std::string detail;

    static ApiError notFound() { return ApiError{Kind::NotFound, {}, {}}; }

    static ApiError validationFailure(std::vector<FieldError> errors) {
        return ApiError{Kind::ValidationFailure, std::move(errors), {}};
    }

    static ApiError badRequest(std::string detail) { return ApiError{Kind::BadRequest, {}, std::move(detail)}; }

    static ApiError conflict(std::string detail) { return ApiError{Kind::Conflict, {}, std::move(detail)}; }
};

using ApiResult = std::expected<web::Response, ApiError>;

/**
 * @brief Maps an API error to its HTTP response: 404 with an empty body, 400
 * with the field error list, or a 400/409 problem response.
 */
web::Response toResponse(ApiResult result);

/**
 * @brief The /users endpoints
 */
class UserController {
   public:
    explicit UserController(UserStore& store, UserValidator validator = {})
        : store_(store), validator_(validator) {}

    void registerRoutes(web::Router& router);

    // GET /users?page=&pageSize=
    ApiResult listUsers(const web::RequestContext& ctx);

    // GET /users/{id}
    ApiResult getUser(const web::RequestContext& ctx);

    /**
     * POST /users. Rejects invalid users and ids that are already taken, and
     * answers 201 with a Location header otherwise.
     */
    ApiResult createUser(const web::RequestContext& ctx);

    /**
     * PUT /users/{id}. The whole record is replaced. A body without an id takes
     * the id from the path; a body with a different id is rejected.
     */
    ApiResult updateUser(const web::RequestContext& ctx);

    // DELETE /users/{id}
    ApiResult deleteUser(const web::RequestContext& ctx);

   private:
    UserStore& store_;
    UserValidator validator_;

    std::expected<User, ApiError> parseBody(const web::RequestContext& ctx,
                                            std::optional<user_id_t> defaultId) const;
};

} // namespace api
} // namespace userapi
