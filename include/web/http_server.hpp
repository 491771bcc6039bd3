#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/core/error.hpp>
#include <cstdint>
#include <thread>
#include <vector>
#include "common/config.hpp"
#include "web/types.hpp"

namespace userapi {
namespace web {

/**
 * @brief Asynchronous HTTP/1.1 server. Every parsed request is passed to the
 * handler, and the returned response is written back on the same connection.
 * Connections are kept alive as the client requests.
 */
class HttpServer {
   public:
    HttpServer(ServerConfig config, Handler handler);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    ~HttpServer();

    /**
     * @brief Binds the listening socket and starts accepting connections
     * @return the bound port, which differs from the configured one if that was 0
     * @throws UserApiException if the socket cannot be bound
     */
    uint16_t start();

    // Stops the server when SIGINT or SIGTERM arrives
    void stopOnSignals();

    /**
     * @brief Serves requests on config.threads threads, including the calling
     * one, until stop() is called.
     */
    void run();

    // Safe to call from any thread
    void stop();

    uint16_t port() const noexcept { return port_; }

   private:
    void doAccept();

    void onAccept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

    ServerConfig config_;
    Handler handler_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::signal_set signals_;
    std::vector<std::thread> workers_;
    uint16_t port_ = 0;
};

} // namespace web
} // namespace userapi
