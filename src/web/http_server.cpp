#include "web/http_server.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <optional>
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "web/responses.hpp"

namespace userapi {
namespace web {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

bool isMalformedRequest(const beast::error_code& ec) noexcept {
    return ec == http::error::bad_line_ending || ec == http::error::bad_method ||
           ec == http::error::bad_target || ec == http::error::bad_version ||
           ec == http::error::bad_field || ec == http::error::bad_value ||
           ec == http::error::bad_content_length || ec == http::error::bad_transfer_encoding ||
           ec == http::error::bad_chunk || ec == http::error::bad_chunk_extension ||
           ec == http::error::bad_obs_fold || ec == http::error::header_limit;
}

/**
 * One connection. Owned by the pending asynchronous operation, so it lives
 * exactly as long as there is something to read or write. The handler and
 * config belong to the server, which outlives the io_context's work.
 */
class Session : public std::enable_shared_from_this<Session> {
   public:
    Session(tcp::socket&& socket, const Handler& handler, const ServerConfig& config)
        : stream_(std::move(socket)), handler_(handler), config_(config) {}

    void run() {
        net::dispatch(stream_.get_executor(), beast::bind_front_handler(&Session::doRead, shared_from_this()));
    }

   private:
    void doRead() {
        parser_.emplace();
        parser_->body_limit(config_.bodyLimitBytes);
        stream_.expires_after(std::chrono::seconds(config_.readTimeoutSeconds));
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream)
            return doClose();

        if (ec == http::error::body_limit) {
            Logger::warn("Rejecting request body larger than {} bytes", config_.bodyLimitBytes);
            return sendResponse(makeProblem(http::status::payload_too_large, "request body too large"), 11, false);
        }

        if (isMalformedRequest(ec)) {
            Logger::debug("Malformed request: {}", ec.message());
            return sendResponse(makeProblem(http::status::bad_request, "malformed HTTP request"), 11, false);
        }

        if (ec) {
            if (ec != beast::error::timeout && ec != net::error::operation_aborted)
                Logger::debug("Read failed: {}", ec.message());
            return;
        }

        auto request = parser_->release();
        Response response;
        try {
            response = handler_(request);
        } catch (const std::exception& e) {
            Logger::error("Handler failed for {}: {}", toString(request.target()), e.what());
            response = makeProblem(http::status::internal_server_error, e.what());
        }
        sendResponse(std::move(response), request.version(), request.keep_alive());
    }

    void sendResponse(Response&& response, unsigned version, bool keepAlive) {
        response_ = std::make_shared<Response>(std::move(response));
        response_->version(version);
        response_->keep_alive(keepAlive);
        response_->prepare_payload();

        http::async_write(stream_, *response_,
                          beast::bind_front_handler(&Session::onWrite, shared_from_this(),
                                                    response_->need_eof()));
    }

    void onWrite(bool close, beast::error_code ec, std::size_t) {
        response_.reset();
        if (ec) {
            Logger::debug("Write failed: {}", ec.message());
            return;
        }
        if (close)
            return doClose();
        doRead();
    }

    void doClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        if (ec && ec != net::error::not_connected)
            Logger::debug("Shutdown failed: {}", ec.message());
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<Response> response_;
    const Handler& handler_;
    const ServerConfig& config_;
};

}  // namespace

HttpServer::HttpServer(ServerConfig config, Handler handler)
    : config_(std::move(config)),
      handler_(std::move(handler)),
      ioc_(static_cast<int>(config_.threads)),
      acceptor_(net::make_strand(ioc_)),
      signals_(ioc_) {}

HttpServer::~HttpServer() {
    stop();
    for (auto& worker : workers_) {
        if (worker.joinable())
            worker.join();
    }
}

uint16_t HttpServer::start() {
    beast::error_code ec;
    auto address = net::ip::make_address(config_.host, ec);
    if (ec)
        throw ConfigException(ec.message(), "host");

    tcp::endpoint endpoint{address, config_.port};
    acceptor_.open(endpoint.protocol(), ec);
    if (ec)
        throw UserApiException("Could not open socket: " + ec.message());

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec)
        throw UserApiException("Could not set SO_REUSEADDR: " + ec.message());

    acceptor_.bind(endpoint, ec);
    if (ec)
        throw UserApiException("Could not bind to " + config_.host + ":" + std::to_string(config_.port) +
                               ": " + ec.message());

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec)
        throw UserApiException("Could not listen: " + ec.message());

    port_ = acceptor_.local_endpoint().port();
    Logger::info("Listening on http://{}:{}", config_.host, port_);
    doAccept();
    return port_;
}

void HttpServer::stopOnSignals() {
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const beast::error_code& ec, int signo) {
        if (ec)
            return;
        Logger::info("Received signal {}, shutting down", signo);
        stop();
    });
}

void HttpServer::run() {
    auto extra = config_.threads > 0 ? config_.threads - 1 : 0;
    workers_.reserve(extra);
    for (unsigned i = 0; i < extra; ++i)
        workers_.emplace_back([this] { ioc_.run(); });

    ioc_.run();

    for (auto& worker : workers_)
        worker.join();
    workers_.clear();
    Logger::info("Server stopped");
}

void HttpServer::stop() {
    ioc_.stop();
}

void HttpServer::doAccept() {
    acceptor_.async_accept(net::make_strand(ioc_), beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted)
            return;
        Logger::warn("Accept failed: {}", ec.message());
    } else {
        auto remote = socket.remote_endpoint(ec);
        if (!ec)
            Logger::trace("Accepted connection from {}:{}", remote.address().to_string(), remote.port());
        std::make_shared<Session>(std::move(socket), handler_, config_)->run();
    }
    doAccept();
}

} // namespace web
} // namespace userapi
