#include "ingest/network/http_types.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <strings.h>

namespace ingest {
namespace network {

std::string find_header(const Headers& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

std::vector<uint8_t> HttpRequest::serialize(const std::string& host) const {
    std::ostringstream oss;

    oss << HttpMethodUtils::to_string(method) << " " << target << " HTTP/1.1\r\n";
    oss << "Host: " << host << "\r\n";
    for (const auto& [name, value] : headers) {
        oss << name << ": " << value << "\r\n";
    }
    if (method == HttpMethod::POST || method == HttpMethod::PUT ||
        method == HttpMethod::PATCH || !body.empty()) {
        oss << "Content-Length: " << body.size() << "\r\n";
    }
    // One request per connection keeps response framing simple
    oss << "Connection: close\r\n";
    oss << "\r\n";

    std::string header_str = oss.str();
    std::vector<uint8_t> result(header_str.begin(), header_str.end());
    result.insert(result.end(), body.begin(), body.end());
    return result;
}

std::string HttpMethodUtils::to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE_METHOD: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::OPTIONS: return "OPTIONS";
        case HttpMethod::PATCH: return "PATCH";
        default: return "UNKNOWN";
    }
}

Result<Url> Url::parse(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Url>(Error::invalid_argument("URL has no scheme: " + text));
    }

    Url url;
    url.scheme = text.substr(0, scheme_end);
    for (auto& c : url.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<Url>(Error::invalid_argument("Unsupported URL scheme: " + url.scheme));
    }

    const auto authority_start = scheme_end + 3;
    const auto path_start = text.find('/', authority_start);
    std::string authority = text.substr(authority_start, path_start - authority_start);
    if (path_start != std::string::npos) {
        url.base_path = text.substr(path_start);
        while (!url.base_path.empty() && url.base_path.back() == '/') {
            url.base_path.pop_back();
        }
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        const std::string port_text = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        try {
            const auto port = std::stoul(port_text);
            if (port == 0 || port > 65535) {
                return Err<Url>(Error::invalid_argument("URL port out of range: " + port_text));
            }
            url.port = static_cast<uint16_t>(port);
        } catch (const std::exception&) {
            return Err<Url>(Error::invalid_argument("Invalid URL port: " + port_text));
        }
    } else {
        url.port = url.is_tls() ? 443 : 80;
    }

    if (authority.empty()) {
        return Err<Url>(Error::invalid_argument("URL has no host: " + text));
    }
    url.host = authority;
    return Ok(url);
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (const char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
            continue;
        }
        escaped << std::uppercase;
        escaped << '%' << std::setw(2) << int(static_cast<unsigned char>(c));
        escaped << std::nouppercase;
    }

    return escaped.str();
}

std::string make_target(const std::string& path, const QueryParams& params) {
    std::string target = path;
    char separator = '?';
    for (const auto& [key, value] : params) {
        target += separator;
        target += url_encode(key);
        target += '=';
        target += url_encode(value);
        separator = '&';
    }
    return target;
}

} // namespace network
} // namespace ingest
