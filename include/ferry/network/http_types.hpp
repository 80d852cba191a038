#pragma once

#include "ferry/core/result.hpp"

#include <cstdint>
#include <cstring>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef _WIN32
#include <strings.h>
#endif

namespace ferry {
namespace network {

/**
 * @brief HTTP request methods used by the job API client
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // DELETE collides with a Windows macro
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/// Status classes the transfer layer cares about
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    REQUEST_TIMEOUT = 408,
    PAYLOAD_TOO_LARGE = 413,
    TOO_MANY_REQUESTS = 429,
    INTERNAL_SERVER_ERROR = 500,
    BAD_GATEWAY = 502,
    SERVICE_UNAVAILABLE = 503,
    GATEWAY_TIMEOUT = 504
};

// Case-insensitive header lookup shared by requests and responses
inline int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
    return _stricmp(s1, s2);
#else
    return strcasecmp(s1, s2);
#endif
}

inline std::string find_header(const std::unordered_map<std::string, std::string>& headers,
                               const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

/**
 * @brief Outgoing HTTP/1.1 request
 *
 * The client always closes the connection after one exchange, so
 * serialize_head() adds "Connection: close" and a Content-Length for every
 * body. The body is written after the head as is, never copied into it.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string target;                                   // e.g. "/api/upload-file?x=1"
    std::string host;
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    void set_body(std::string content) {
        body = std::move(content);
    }

    /// Request line and headers, terminated by the blank line
    std::string serialize_head() const;
};

/**
 * @brief Parsed HTTP response
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 0;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    bool is_success() const {
        return status_code >= 200 && status_code < 300;
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief Base URL of the job API ("http://host[:port][/prefix]")
 */
struct Url {
    std::string scheme = "http";
    std::string host;
    uint16_t port = 80;
    std::string base_path;   // No trailing slash, may be empty

    static Result<Url> parse(const std::string& text);

    /// Joins base_path and an absolute path such as "/api/create-job"
    std::string resolve(const std::string& path) const {
        return base_path + path;
    }

    std::string authority() const {
        return port == 80 ? host : host + ":" + std::to_string(port);
    }
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            default: return "UNKNOWN";
        }
    }
};

/// Percent-encodes a query parameter value (RFC 3986 unreserved set kept)
std::string url_encode(const std::string& value);

} // namespace network
} // namespace ferry
