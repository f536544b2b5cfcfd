#include "ingest/network/http_transport.hpp"

#include <boost/asio.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

namespace asio = boost::asio;
using asio::ip::tcp;
using ingest::ErrorKind;
using ingest::network::AsioHttpTransport;
using ingest::network::HttpMethod;
using ingest::network::HttpRequest;
using ingest::network::Url;

namespace {

/**
 * One-shot loopback server: accepts a single connection, captures the
 * request head and body, and answers with a canned response.
 */
class OneShotServer {
public:
    explicit OneShotServer(std::string response, bool respond = true)
        : acceptor_(io_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
          response_(std::move(response)),
          respond_(respond) {
        thread_ = std::thread([this] { serve(); });
    }

    ~OneShotServer() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::uint16_t port() const { return acceptor_.local_endpoint().port(); }
    const std::string& received() const { return received_; }

private:
    void serve() {
        boost::system::error_code ec;
        tcp::socket socket(io_);
        acceptor_.accept(socket, ec);
        if (ec) {
            return;
        }

        asio::streambuf buffer;
        asio::read_until(socket, buffer, "\r\n\r\n", ec);
        if (ec) {
            return;
        }
        received_.assign(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));

        const auto length_pos = received_.find("Content-Length: ");
        if (length_pos != std::string::npos) {
            const std::size_t head_end = received_.find("\r\n\r\n") + 4;
            const std::size_t length = std::stoul(received_.substr(length_pos + 16));
            const std::size_t have = received_.size() - head_end;
            if (have < length) {
                std::string rest(length - have, '\0');
                asio::read(socket, asio::buffer(rest), ec);
                received_ += rest;
            }
        }

        if (!respond_) {
            // Hold the connection open so the client hits its deadline
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            return;
        }
        asio::write(socket, asio::buffer(response_), ec);
        socket.shutdown(tcp::socket::shutdown_both, ec);
    }

    asio::io_context io_;
    tcp::acceptor acceptor_;
    std::string response_;
    bool respond_;
    std::string received_;
    std::thread thread_;
};

Url loopback(std::uint16_t port, const std::string& base = "") {
    return Url::parse("http://127.0.0.1:" + std::to_string(port) + base).value();
}

} // namespace

TEST(AsioHttpTransportTest, ExchangesRequestAndResponse) {
    OneShotServer server("HTTP/1.1 200 OK\r\nContent-Length: 15\r\n\r\n{\"hash\":\"abc\"}\n");
    AsioHttpTransport transport(loopback(server.port(), "/api"), std::chrono::seconds(5));

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.target = "/upload/hash/id/x";
    request.set_body("payload");

    auto response = transport.send(request);
    ASSERT_TRUE(response.is_ok()) << response.error().describe();
    EXPECT_EQ(response.value().status_code, 200);
    EXPECT_EQ(response.value().body_as_string(), "{\"hash\":\"abc\"}\n");

    const auto& received = server.received();
    EXPECT_EQ(received.rfind("POST /api/upload/hash/id/x HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(received.find("Host: 127.0.0.1:"), std::string::npos);
    EXPECT_EQ(received.substr(received.size() - 7), "payload");
}

TEST(AsioHttpTransportTest, ErrorStatusIsStillAResponse) {
    OneShotServer server("HTTP/1.1 429 Too Many Requests\r\nContent-Length: 0\r\n\r\n");
    AsioHttpTransport transport(loopback(server.port()), std::chrono::seconds(5));

    auto response = transport.send(HttpRequest{});
    ASSERT_TRUE(response.is_ok());
    EXPECT_EQ(response.value().status_code, 429);
}

TEST(AsioHttpTransportTest, DeadlineIsNetworkFailure) {
    OneShotServer server("", false);
    AsioHttpTransport transport(loopback(server.port()), std::chrono::milliseconds(100));

    auto response = transport.send(HttpRequest{});
    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().kind, ErrorKind::NetworkFailure);
}

TEST(AsioHttpTransportTest, RefusedConnectionIsNetworkFailure) {
    std::uint16_t port = 0;
    {
        asio::io_context io;
        tcp::acceptor scratch(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        port = scratch.local_endpoint().port();
    }
    AsioHttpTransport transport(loopback(port), std::chrono::seconds(2));

    auto response = transport.send(HttpRequest{});
    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().kind, ErrorKind::NetworkFailure);
}
