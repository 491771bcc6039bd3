#include "api/application.hpp"
#include "web/middleware.hpp"
#include "web/responses.hpp"

namespace userapi {
namespace api {

namespace http = web::http;

Application::Application(UserStore& store) : users_(store) {
    router_.add(http::verb::get, "/",
                [](const web::RequestContext&) { return web::makeText(http::status::ok, rootGreeting); });

    users_.registerRoutes(router_);

    router_.any("/error", [](const web::RequestContext&) {
        return web::makeProblem(http::status::internal_server_error,
                                "An error occurred while processing your request.");
    });

    pipeline_ = web::applyMiddleware([this](const web::Request& request) { return router_.handle(request); },
                                     {web::requestLogging(), web::errorHandling()});
}

} // namespace api
} // namespace userapi
