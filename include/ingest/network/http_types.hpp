#pragma once

#include "ingest/core/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ingest {
namespace network {

/**
 * @brief HTTP request methods as defined in RFC 7231
 *
 * DELETE is spelled DELETE_METHOD to stay clear of the Windows macro.
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,
    HEAD,
    OPTIONS,
    PATCH,
    UNKNOWN
};

/**
 * @brief Status codes the upload protocol reacts to
 *
 * Anything else is still carried as a plain int in HttpResponse.
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    TOO_MANY_REQUESTS = 429,
    INTERNAL_SERVER_ERROR = 500,
    BAD_GATEWAY = 502,
    SERVICE_UNAVAILABLE = 503,
    GATEWAY_TIMEOUT = 504
};

using Headers = std::unordered_map<std::string, std::string>;

/// Case-insensitive header lookup; empty string when absent.
std::string find_header(const Headers& headers, const std::string& name);

/**
 * @brief An outgoing HTTP/1.1 request
 *
 * `target` is the origin-form request target (path plus encoded query),
 * e.g. "/upload/status/organizations/N:organization:1/id/abc". The
 * transport fills in Host, Content-Length and Connection.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string target = "/";
    Headers headers;
    std::vector<uint8_t> body;   // Binary safe, chunk payloads go here as-is

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
    }

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    /// Serialise to the HTTP/1.1 wire format for @p host.
    std::vector<uint8_t> serialize(const std::string& host) const;
};

/**
 * @brief A response as read back from the server
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    Headers headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    HttpResponse(int status, const std::string& content)
        : status_code(status) {
        body.assign(content.begin(), content.end());
    }

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    bool is_client_error() const { return status_code >= 400 && status_code < 500; }
    bool is_server_error() const { return status_code >= 500 && status_code < 600; }
    bool is_error() const { return is_client_error() || is_server_error(); }
};

class HttpMethodUtils {
public:
    static std::string to_string(HttpMethod method);

    /// POST and DELETE may have side effects when repeated; everything
    /// else is treated as idempotent for retry purposes.
    static bool is_idempotent(HttpMethod method) {
        return method != HttpMethod::POST && method != HttpMethod::DELETE_METHOD;
    }
};

/**
 * @brief Parsed absolute URL ("https://host:port/base")
 */
struct Url {
    std::string scheme;      // "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string base_path;   // Never ends with '/', may be empty

    bool is_tls() const { return scheme == "https"; }

    static Result<Url> parse(const std::string& text);
};

/// RFC 3986 percent-encoding of everything outside the unreserved set.
std::string url_encode(const std::string& value);

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// "/path?k=v&k2=v2" with both keys and values encoded.
std::string make_target(const std::string& path, const QueryParams& params);

} // namespace network
} // namespace ingest
