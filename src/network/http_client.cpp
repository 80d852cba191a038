#include "ferry/network/http_client.hpp"

#include "ferry/network/http_response_parser.hpp"
#include "ferry/network/socket.hpp"

#include <spdlog/spdlog.h>

namespace ferry::network {

namespace {

constexpr size_t kReceiveBufferSize = 16 * 1024;

} // namespace

HttpClient::HttpClient(Url base_url, std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url)), timeout_(timeout) {}

Result<HttpResponse> HttpClient::send(HttpRequest request) const {
    request.host = base_url_.authority();
    request.target = base_url_.resolve(request.target);

    Socket socket;
    if (auto created = socket.create(); created.is_error()) {
        return Err<HttpResponse>(created.error());
    }
    if (auto timeout = socket.set_timeout(timeout_); timeout.is_error()) {
        return Err<HttpResponse>(timeout.error());
    }
    if (auto connected = socket.connect(base_url_.host, base_url_.port); connected.is_error()) {
        return Err<HttpResponse>(connected.error());
    }

    spdlog::debug("{} {} ({} body bytes)",
                  HttpMethodUtils::to_string(request.method), request.target, request.body.size());

    const std::string head = request.serialize_head();
    if (auto sent = socket.send_all(head.data(), head.size()); sent.is_error()) {
        return Err<HttpResponse>(sent.error());
    }
    if (!request.body.empty()) {
        if (auto sent = socket.send_all(request.body.data(), request.body.size()); sent.is_error()) {
            return Err<HttpResponse>(sent.error());
        }
    }

    HttpResponseParser parser;
    while (!parser.is_complete()) {
        auto data = socket.receive(kReceiveBufferSize);
        if (data.is_error()) {
            return Err<HttpResponse>(data.error());
        }
        if (data.value().empty()) {
            if (auto finished = parser.finish(); finished.is_error()) {
                return Err<HttpResponse>(finished.error());
            }
            break;
        }
        auto parsed = parser.parse(reinterpret_cast<const char*>(data.value().data()), data.value().size());
        if (parsed.is_error()) {
            return Err<HttpResponse>(parsed.error());
        }
    }

    const HttpResponse& response = parser.response();
    spdlog::debug("{} {} -> {} {}", HttpMethodUtils::to_string(request.method), request.target,
                  response.status_code, response.reason_phrase);
    return Ok(response);
}

Result<HttpResponse> HttpClient::get(const std::string& path) const {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.target = path;
    request.set_header("Accept", "application/json");
    return send(std::move(request));
}

Result<HttpResponse> HttpClient::post_json(const std::string& path, std::string json_body) const {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.target = path;
    request.set_header("Content-Type", "application/json");
    request.set_header("Accept", "application/json");
    request.set_body(std::move(json_body));
    return send(std::move(request));
}

} // namespace ferry::network
