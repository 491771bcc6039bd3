#include "gtest/gtest.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <thread>
#include "api/application.hpp"
#include "storage/user_store.hpp"
#include "test_helpers.hpp"
#include "web/http_server.hpp"

using namespace userapi;
using userapi::test::makeRequest;
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class HttpServerTest : public ::testing::Test {
protected:
    UserStore store;
    api::Application app{store};
    std::unique_ptr<web::HttpServer> server;
    std::thread runner;
    uint16_t port = 0;

    void startServer(uint64_t bodyLimit = 1024 * 1024) {
        ServerConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.threads = 2;
        config.readTimeoutSeconds = 5;
        config.bodyLimitBytes = bodyLimit;

        server = std::make_unique<web::HttpServer>(config, app.handler());
        port = server->start();
        runner = std::thread([this] { server->run(); });
    }

    void TearDown() override {
        if (server)
            server->stop();
        if (runner.joinable())
            runner.join();
    }

    tcp::socket connect() {
        tcp::socket socket{ioc};
        socket.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), port});
        return socket;
    }

    web::Response roundTrip(tcp::socket& socket, web::Request request) {
        http::write(socket, request);
        beast::flat_buffer buffer;
        web::Response response;
        http::read(socket, buffer, response);
        return response;
    }

    net::io_context ioc;
};

TEST_F(HttpServerTest, BindsEphemeralPort) {
    startServer();
    EXPECT_NE(port, 0);
    EXPECT_EQ(server->port(), port);
}

TEST_F(HttpServerTest, ServesRequestsOnKeepAliveConnection) {
    startServer();
    auto socket = connect();

    auto root = roundTrip(socket, makeRequest(http::verb::get, "/"));
    EXPECT_EQ(root.result(), http::status::ok);
    EXPECT_EQ(root.body(), "Root");
    EXPECT_TRUE(root.keep_alive());

    auto created = roundTrip(socket, makeRequest(http::verb::post, "/users",
                                                 R"({"id":1,"name":"Alice","email":"alice@example.com"})"));
    EXPECT_EQ(created.result(), http::status::created);
    EXPECT_EQ(test::header(created, http::field::location), "/users/1");

    auto fetched = roundTrip(socket, makeRequest(http::verb::get, "/users/1"));
    EXPECT_EQ(fetched.result(), http::status::ok);
    EXPECT_EQ(json::parse(fetched.body()), json::parse(R"({"id":1,"name":"Alice","email":"alice@example.com"})"));

    auto missing = roundTrip(socket, makeRequest(http::verb::get, "/users/2"));
    EXPECT_EQ(missing.result(), http::status::not_found);
    EXPECT_EQ(missing.body(), "");
}

TEST_F(HttpServerTest, ClosesWhenClientAsks) {
    startServer();
    auto socket = connect();

    auto request = makeRequest(http::verb::get, "/users");
    request.keep_alive(false);
    auto response = roundTrip(socket, request);
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_FALSE(response.keep_alive());

    beast::flat_buffer buffer;
    web::Response next;
    beast::error_code ec;
    http::read(socket, buffer, next, ec);
    EXPECT_EQ(ec, http::error::end_of_stream);
}

TEST_F(HttpServerTest, RejectsOversizedBody) {
    startServer(16);
    auto socket = connect();

    auto request = makeRequest(http::verb::post, "/users",
                               R"({"id":1,"name":"Alice","email":"alice@example.com"})");
    auto response = roundTrip(socket, request);
    EXPECT_EQ(response.result(), http::status::payload_too_large);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(HttpServerTest, SeparateConnectionsShareTheStore) {
    startServer();
    {
        auto socket = connect();
        auto created = roundTrip(socket, makeRequest(http::verb::post, "/users",
                                                     R"({"id":5,"name":"Eve","email":"eve@example.com"})"));
        ASSERT_EQ(created.result(), http::status::created);
    }

    auto socket = connect();
    auto listed = roundTrip(socket, makeRequest(http::verb::get, "/users?page=1&pageSize=5"));
    EXPECT_EQ(listed.result(), http::status::ok);
    EXPECT_EQ(json::parse(listed.body()).size(), 1u);
}
