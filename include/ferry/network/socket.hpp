#pragma once

#include "ferry/core/platform.hpp"
#include "ferry/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ferry::network {

#ifdef FERRY_PLATFORM_WINDOWS
    using socket_t = SOCKET;
    constexpr socket_t INVALID_SOCKET_VALUE = INVALID_SOCKET;
#else
    using socket_t = int;
    constexpr socket_t INVALID_SOCKET_VALUE = -1;
#endif

/**
 * @brief Blocking TCP socket used by the HTTP client
 *
 * connect() accepts either a dotted IPv4 address or a hostname (resolved with
 * getaddrinfo). Timeouts apply to every subsequent send/receive; a receive
 * that times out is reported as an error rather than an empty read.
 */
class Socket {
public:
    Socket();
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    Result<void> create();
    Result<void> bind(const std::string& address, uint16_t port);
    Result<void> listen(int backlog = 5);
    Result<std::unique_ptr<Socket>> accept();
    Result<void> connect(const std::string& host, uint16_t port);

    Result<size_t> send(const std::vector<uint8_t>& data);
    Result<void> send_all(const std::vector<uint8_t>& data);
    Result<void> send_all(const char* data, size_t size);
    Result<std::vector<uint8_t>> receive(size_t max_size);

    Result<void> set_timeout(std::chrono::milliseconds timeout);
    Result<void> set_reuse_address(bool enable);

    /// Port the socket is bound to (useful after binding port 0)
    Result<uint16_t> local_port() const;

    void close();
    bool is_valid() const { return socket_ != INVALID_SOCKET_VALUE; }

    socket_t native_handle() const { return socket_; }

    static std::unique_ptr<Socket> create_from_native(socket_t socket) {
        return std::unique_ptr<Socket>(new Socket(socket));
    }

private:
    explicit Socket(socket_t socket);

    static Result<std::string> resolve_ipv4(const std::string& host);

    socket_t socket_;
    bool is_connected_;

    static bool platform_initialized_;
    static Result<void> initialize_platform();
};

} // namespace ferry::network
