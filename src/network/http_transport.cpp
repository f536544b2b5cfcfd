#include "ingest/network/http_transport.hpp"
#include "ingest/network/http_parser.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <string>

namespace ingest {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using Clock = std::chrono::steady_clock;

namespace {

struct StepOutcome {
    boost::system::error_code ec;
    std::size_t bytes = 0;
};

/**
 * @brief Start one async operation and run the loop until it settles
 *
 * @p initiate receives a completion callback taking (error_code, bytes).
 * Only a missed deadline is reported as an error here; the operation's
 * own error code is handed back for the caller to interpret.
 */
template<typename Initiate>
Result<StepOutcome> run_step(asio::io_context& io, Clock::time_point deadline,
                             const char* step, Initiate&& initiate) {
    bool done = false;
    StepOutcome outcome;
    initiate([&done, &outcome](const boost::system::error_code& ec, std::size_t bytes) {
        done = true;
        outcome.ec = ec;
        outcome.bytes = bytes;
    });

    io.restart();
    io.run_until(deadline);

    if (!done) {
        return Err<StepOutcome>(Error::network_failure(std::string(step) + " timed out"));
    }
    return Ok(outcome);
}

Result<void> check(const Result<StepOutcome>& outcome, const char* step) {
    if (outcome.is_error()) {
        return Err<void>(outcome.error());
    }
    if (outcome.value().ec) {
        return Err<void>(Error::network_failure(std::string(step) + " failed: " +
                                                outcome.value().ec.message()));
    }
    return Ok();
}

bool is_end_of_stream(const boost::system::error_code& ec) {
    // Servers that close without close_notify surface as stream_truncated
    return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

template<typename Stream>
Result<HttpResponse> exchange(asio::io_context& io, Stream& stream, Clock::time_point deadline,
                              const std::vector<uint8_t>& wire) {
    auto written = run_step(io, deadline, "write", [&](auto complete) {
        asio::async_write(stream, asio::buffer(wire), complete);
    });
    if (auto res = check(written, "write"); res.is_error()) {
        return Err<HttpResponse>(res.error());
    }

    HttpResponseParser parser;
    std::array<char, 16384> buffer{};

    while (true) {
        auto read = run_step(io, deadline, "read", [&](auto complete) {
            stream.async_read_some(asio::buffer(buffer), complete);
        });
        if (read.is_error()) {
            return Err<HttpResponse>(read.error());
        }

        const auto& outcome = read.value();
        if (outcome.bytes > 0) {
            auto parsed = parser.parse(buffer.data(), outcome.bytes);
            if (parsed.is_error()) {
                return Err<HttpResponse>(parsed.error());
            }
            if (parsed.value()) {
                return Ok(parser.get_response());
            }
        }

        if (is_end_of_stream(outcome.ec)) {
            if (auto finished = parser.finish(); finished.is_error()) {
                return Err<HttpResponse>(finished.error());
            }
            return Ok(parser.get_response());
        }
        if (outcome.ec) {
            return Err<HttpResponse>(Error::network_failure("read failed: " + outcome.ec.message()));
        }
    }
}

} // namespace

AsioHttpTransport::AsioHttpTransport(Url endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)),
      timeout_(timeout) {
    if (endpoint_.is_tls()) {
        tls_context_ = std::make_unique<asio::ssl::context>(asio::ssl::context::tls_client);
        tls_context_->set_default_verify_paths();
        tls_context_->set_verify_mode(asio::ssl::verify_peer);
    }
}

Result<HttpResponse> AsioHttpTransport::send(const HttpRequest& request) {
    const auto deadline = Clock::now() + timeout_;

    HttpRequest outgoing = request;
    outgoing.target = endpoint_.base_path + request.target;

    const bool default_port = endpoint_.port == (endpoint_.is_tls() ? 443 : 80);
    const std::string host_header =
        default_port ? endpoint_.host : endpoint_.host + ":" + std::to_string(endpoint_.port);
    const std::vector<uint8_t> wire = outgoing.serialize(host_header);

    spdlog::debug("{} {}{}", HttpMethodUtils::to_string(outgoing.method), endpoint_.host, outgoing.target);

    asio::io_context io;
    tcp::resolver resolver(io);

    tcp::resolver::results_type endpoints;
    auto resolved = run_step(io, deadline, "resolve", [&](auto complete) {
        resolver.async_resolve(endpoint_.host, std::to_string(endpoint_.port),
            [&endpoints, complete](const boost::system::error_code& ec,
                                   tcp::resolver::results_type results) {
                endpoints = std::move(results);
                complete(ec, 0);
            });
    });
    if (auto res = check(resolved, "resolve"); res.is_error()) {
        return Err<HttpResponse>(res.error());
    }

    Result<HttpResponse> response = Err<HttpResponse>(Error::network_failure("no response"));

    if (!endpoint_.is_tls()) {
        tcp::socket socket(io);
        auto connected = run_step(io, deadline, "connect", [&](auto complete) {
            asio::async_connect(socket, endpoints,
                [complete](const boost::system::error_code& ec, const tcp::endpoint&) {
                    complete(ec, 0);
                });
        });
        if (auto res = check(connected, "connect"); res.is_error()) {
            return Err<HttpResponse>(res.error());
        }
        response = exchange(io, socket, deadline, wire);
    } else {
        asio::ssl::stream<tcp::socket> stream(io, *tls_context_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
            return Err<HttpResponse>(Error::network_failure("Failed to set TLS server name for " + endpoint_.host));
        }
        stream.set_verify_callback(asio::ssl::host_name_verification(endpoint_.host));

        auto connected = run_step(io, deadline, "connect", [&](auto complete) {
            asio::async_connect(stream.lowest_layer(), endpoints,
                [complete](const boost::system::error_code& ec, const tcp::endpoint&) {
                    complete(ec, 0);
                });
        });
        if (auto res = check(connected, "connect"); res.is_error()) {
            return Err<HttpResponse>(res.error());
        }

        auto handshake = run_step(io, deadline, "tls handshake", [&](auto complete) {
            stream.async_handshake(asio::ssl::stream_base::client,
                [complete](const boost::system::error_code& ec) { complete(ec, 0); });
        });
        if (auto res = check(handshake, "tls handshake"); res.is_error()) {
            return Err<HttpResponse>(res.error());
        }
        response = exchange(io, stream, deadline, wire);
    }

    if (response.is_ok()) {
        spdlog::debug("{} {} -> {}", HttpMethodUtils::to_string(outgoing.method), outgoing.target,
                      response.value().status_code);
    }
    return response;
}

} // namespace network
} // namespace ingest
