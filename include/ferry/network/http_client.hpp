#pragma once

#include "ferry/core/result.hpp"
#include "ferry/network/http_types.hpp"

#include <chrono>
#include <string>

namespace ferry::network {

/**
 * @brief Minimal blocking HTTP/1.1 client, one connection per request
 *
 * Errors are transport-level only (resolve/connect/send/receive/parse). Any
 * response the server managed to send, whatever its status, is returned as a
 * successful Result so callers can classify it.
 */
class HttpClient {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{30000};

    explicit HttpClient(Url base_url, std::chrono::milliseconds timeout = kDefaultTimeout);

    Result<HttpResponse> send(HttpRequest request) const;

    Result<HttpResponse> get(const std::string& path) const;
    Result<HttpResponse> post_json(const std::string& path, std::string json_body) const;

    const Url& base_url() const noexcept { return base_url_; }

private:
    Url base_url_;
    std::chrono::milliseconds timeout_;
};

} // namespace ferry::network
