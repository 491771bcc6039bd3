#pragma once

#include "api/user_controller.hpp"
#include "storage/user_store.hpp"
#include "web/router.hpp"
#include "web/types.hpp"

namespace userapi {
namespace api {

constexpr const char* rootGreeting = "Root";

/**
 * @brief The complete request pipeline: request logging, then error handling,
 * then routing to the endpoints.
 *
 * The store is owned by the caller and must outlive the application.
 */
class Application {
   public:
    explicit Application(UserStore& store);

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    web::Response handle(const web::Request& request) const { return pipeline_(request); }

    // Handler suitable for HttpServer. Refers to this application.
    web::Handler handler() const {
        return [this](const web::Request& request) { return pipeline_(request); };
    }

    web::Router& router() noexcept { return router_; }

   private:
    UserController users_;
    web::Router router_;
    web::Handler pipeline_;
};

} // namespace api
} // namespace userapi
