#pragma once

#include "http_types.hpp"
#include "ingest/core/result.hpp"

#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <memory>

namespace ingest {
namespace network {

/**
 * @brief One request in, one response out
 *
 * This is the seam between the upload protocol and the wire. The API
 * client only depends on this interface, so tests can plug in an
 * in-process fake of the ingestion service.
 *
 * Implementations must be safe to call from several threads at once;
 * the dispatcher sends chunks concurrently through one transport.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform a single exchange
     *
     * Any complete response, including 4xx/5xx, is returned as Ok.
     * Connection, TLS and timeout problems are NetworkFailure.
     */
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/**
 * @brief HTTP/1.1 client transport on Boost.Asio
 *
 * Opens a fresh connection per request (Connection: close) and drives the
 * resolve/connect/handshake/write/read chain asynchronously on a private
 * io_context, bounded by a per-request deadline. https endpoints are
 * wrapped in an OpenSSL stream with peer and host name verification.
 *
 * Usage:
 * ```cpp
 * auto url = Url::parse("https://api.example.org");
 * AsioHttpTransport transport(url.value(), std::chrono::seconds(30));
 * HttpRequest request;
 * request.target = "/health";
 * auto response = transport.send(request);
 * ```
 */
class AsioHttpTransport : public HttpTransport {
public:
    AsioHttpTransport(Url endpoint, std::chrono::milliseconds timeout);

    Result<HttpResponse> send(const HttpRequest& request) override;

    const Url& endpoint() const noexcept { return endpoint_; }

private:
    Url endpoint_;
    std::chrono::milliseconds timeout_;
    std::unique_ptr<boost::asio::ssl::context> tls_context_;  // Only for https
};

} // namespace network
} // namespace ingest
