#include <exception>
#include <string>
#include "api/application.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"
#include "common/stacktrace.hpp"
#include "storage/user_store.hpp"
#include "web/http_server.hpp"

using namespace userapi;

int main(int argc, char* argv[]) {
    userapi::initializeSignalHandlers();

    ServerConfig config;
    if (argc > 2) {
        Logger::error("Usage: {} [config.json]", argv[0]);
        return 1;
    }
    if (argc == 2) {
        auto loaded = ServerConfig::load(argv[1]);
        if (!loaded) {
            Logger::error("{}", loaded.error());
            return 1;
        }
        config = std::move(*loaded);
    }

    try {
        configureLogger(config.logLevel, config.logFile);
        Logger::info("userapi starting with config {}", config.to_json().dump());

        UserStore store;
        api::Application app{store};

        web::HttpServer server{config, app.handler()};
        server.start();
        server.stopOnSignals();
        server.run();
    } catch (const std::exception& e) {
        Logger::critical("Fatal: {}", e.what());
        return 1;
    }

    return 0;
}
