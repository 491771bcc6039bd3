#include "api/user_controller.hpp"
#include <optional>
#include "common/assert.hpp"
#include "common/logging.hpp"
#include "web/responses.hpp"
#include "web/url.hpp"

namespace userapi {
namespace api {

namespace http = web::http;

namespace {

std::expected<int64_t, FieldError> readQueryInteger(const web::RequestContext& ctx, const std::string& name,
                                                    int64_t defaultValue) {
    auto raw = ctx.queryValue(name);
    if (!raw || raw->empty())
        return defaultValue;
    auto value = web::parseInteger<int64_t>(*raw);
    if (!value)
        return std::unexpected(FieldError{name, "The value '" + *raw + "' is not valid for " + name + "."});
    return *value;
}

}  // namespace

web::Response toResponse(ApiResult result) {
    if (result)
        return std::move(*result);

    auto& error = result.error();
    switch (error.kind) {
        case ApiError::Kind::NotFound:
            return web::makeEmpty(http::status::not_found);
        case ApiError::Kind::ValidationFailure:
            return web::makeJson(http::status::bad_request, toJsonArray(error.errors));
        case ApiError::Kind::BadRequest:
            return web::makeProblem(http::status::bad_request, error.detail);
        case ApiError::Kind::Conflict:
            return web::makeProblem(http::status::conflict, error.detail);
    }
    uapi_unreachable("Unknown API error kind");
}

void UserController::registerRoutes(web::Router& router) {
    router.add(http::verb::get, "/users",
               [this](const web::RequestContext& ctx) { return toResponse(listUsers(ctx)); });
    router.add(http::verb::get, "/users/{id:int}",
               [this](const web::RequestContext& ctx) { return toResponse(getUser(ctx)); });
    router.add(http::verb::post, "/users",
               [this](const web::RequestContext& ctx) { return toResponse(createUser(ctx)); });
    router.add(http::verb::put, "/users/{id:int}",
               [this](const web::RequestContext& ctx) { return toResponse(updateUser(ctx)); });
    router.add(http::verb::delete_, "/users/{id:int}",
               [this](const web::RequestContext& ctx) { return toResponse(deleteUser(ctx)); });
}

ApiResult UserController::listUsers(const web::RequestContext& ctx) {
    std::vector<FieldError> errors;
    auto page = readQueryInteger(ctx, "page", UserStore::defaultPage);
    if (!page)
        errors.push_back(page.error());
    auto pageSize = readQueryInteger(ctx, "pageSize", UserStore::defaultPageSize);
    if (!pageSize)
        errors.push_back(pageSize.error());
    if (!errors.empty())
        return std::unexpected(ApiError::validationFailure(std::move(errors)));

    return web::makeJson(http::status::ok, toJsonArray(store_.listUsers(*page, *pageSize)));
}

ApiResult UserController::getUser(const web::RequestContext& ctx) {
    auto user = store_.getUser(ctx.intRouteValue("id"));
    if (!user)
        return std::unexpected(ApiError::notFound());
    return web::makeJson(http::status::ok, user->to_json());
}

ApiResult UserController::createUser(const web::RequestContext& ctx) {
    auto user = parseBody(ctx, std::nullopt);
    if (!user)
        return std::unexpected(user.error());

    auto errors = validator_.validate(*user);
    if (!errors.empty())
        return std::unexpected(ApiError::validationFailure(std::move(errors)));

    if (!store_.addUserIfAbsent(*user))
        return std::unexpected(ApiError::conflict("A user with id " + std::to_string(user->id) + " already exists."));

    Logger::debug("Created {}", *user);
    auto res = web::makeJson(http::status::created, user->to_json());
    res.set(http::field::location, "/users/" + std::to_string(user->id));
    return res;
}

ApiResult UserController::updateUser(const web::RequestContext& ctx) {
    auto id = ctx.intRouteValue("id");
    if (!store_.getUser(id))
        return std::unexpected(ApiError::notFound());

    auto user = parseBody(ctx, id);
    if (!user)
        return std::unexpected(user.error());

    std::vector<FieldError> errors;
    if (user->id != id)
        errors.push_back({"Id", "'Id' must match the id in the route."});
    auto fieldErrors = validator_.validate(*user);
    errors.insert(errors.end(), fieldErrors.begin(), fieldErrors.end());
    if (!errors.empty())
        return std::unexpected(ApiError::validationFailure(std::move(errors)));

    // the user may have been deleted since the existence check
    if (!store_.updateUser(id, *user))
        return std::unexpected(ApiError::notFound());

    return web::makeEmpty(http::status::no_content);
}

ApiResult UserController::deleteUser(const web::RequestContext& ctx) {
    if (store_.deleteUser(ctx.intRouteValue("id")) == 0)
        return std::unexpected(ApiError::notFound());
    return web::makeEmpty(http::status::no_content);
}

std::expected<User, ApiError> UserController::parseBody(const web::RequestContext& ctx,
                                                        std::optional<user_id_t> defaultId) const {
    auto body = json::parse(ctx.request.body(), nullptr, false);
    if (body.is_discarded())
        return std::unexpected(ApiError::badRequest("The request body is not valid JSON."));

    auto user = User::from_json(body, defaultId);
    if (!user)
        return std::unexpected(ApiError::badRequest("Invalid user: " + user.error() + "."));
    return std::move(*user);
}

} // namespace api
} // namespace userapi
