#include "ferry/network/socket.hpp"

#include <spdlog/spdlog.h>

namespace ferry::network {

bool Socket::platform_initialized_ = false;

Result<void> Socket::initialize_platform() {
    if (platform_initialized_) {
        return Ok();
    }

#ifdef FERRY_PLATFORM_WINDOWS
    WSADATA wsa_data;
    if (WSAStartup(MAKEWORD(2, 2), &wsa_data) != 0) {
        return Err<void>(std::string("Failed to initialize Winsock"));
    }
#endif

    platform_initialized_ = true;
    return Ok();
}

Socket::Socket()
    : socket_(INVALID_SOCKET_VALUE)
    , is_connected_(false) {
    if (auto init = initialize_platform(); init.is_error()) {
        spdlog::error("Socket platform initialisation failed: {}", init.error());
    }
}

Socket::Socket(socket_t socket)
    : socket_(socket)
    , is_connected_(true) {
}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept
    : socket_(other.socket_)
    , is_connected_(other.is_connected_) {
    other.socket_ = INVALID_SOCKET_VALUE;
    other.is_connected_ = false;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        is_connected_ = other.is_connected_;
        other.socket_ = INVALID_SOCKET_VALUE;
        other.is_connected_ = false;
    }
    return *this;
}

Result<void> Socket::create() {
    if (socket_ != INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket already created"));
    }

    socket_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>("Failed to create socket: " + socket_error_message(last_socket_error()));
    }

    spdlog::debug("Socket created: fd={}", socket_);
    return Ok();
}

Result<void> Socket::bind(const std::string& address, uint16_t port) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (address == "0.0.0.0" || address.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else {
        if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) <= 0) {
            return Err<void>(std::string("Invalid address: ") + address);
        }
    }

    if (::bind(socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return Err<void>("Failed to bind to " + address + ":" + std::to_string(port) + ": " +
                         socket_error_message(last_socket_error()));
    }

    spdlog::debug("Socket bound to {}:{}", address, port);
    return Ok();
}

Result<void> Socket::listen(int backlog) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

    if (::listen(socket_, backlog) < 0) {
        return Err<void>(std::string("Failed to listen"));
    }

    spdlog::debug("Socket listening with backlog={}", backlog);
    return Ok();
}

Result<std::unique_ptr<Socket>> Socket::accept() {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<std::unique_ptr<Socket>>(std::string("Socket not created"));
    }

    sockaddr_in client_addr{};
    socklen_type addr_len = sizeof(client_addr);

    socket_t client_socket = ::accept(socket_,
                                      reinterpret_cast<sockaddr*>(&client_addr),
                                      &addr_len);

    if (client_socket == INVALID_SOCKET_VALUE) {
        return Err<std::unique_ptr<Socket>>(std::string("Failed to accept connection"));
    }

    char addr_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &client_addr.sin_addr, addr_str, INET_ADDRSTRLEN);
    spdlog::debug("Accepted connection from {}:{}", addr_str, ntohs(client_addr.sin_port));

    return Ok(Socket::create_from_native(client_socket));
}

Result<std::string> Socket::resolve_ipv4(const std::string& host) {
    in_addr numeric{};
    if (inet_pton(AF_INET, host.c_str(), &numeric) == 1) {
        return Ok(host);
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &results);
    if (rc != 0 || results == nullptr) {
        return Err<std::string>(std::string("Failed to resolve host: ") + host);
    }

    char addr_str[INET_ADDRSTRLEN];
    const auto* ipv4 = reinterpret_cast<const sockaddr_in*>(results->ai_addr);
    inet_ntop(AF_INET, &ipv4->sin_addr, addr_str, INET_ADDRSTRLEN);
    ::freeaddrinfo(results);
    return Ok(std::string(addr_str));
}

Result<void> Socket::connect(const std::string& host, uint16_t port) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

    auto resolved = resolve_ipv4(host);
    if (resolved.is_error()) {
        return Err<void>(resolved.error());
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (inet_pton(AF_INET, resolved.value().c_str(), &addr.sin_addr) <= 0) {
        return Err<void>(std::string("Invalid address: ") + resolved.value());
    }

    if (::connect(socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const int code = last_socket_error();
        return Err<void>("Failed to connect to " + host + ":" + std::to_string(port) + ": " +
                         (is_timeout_error(code) ? std::string("timed out") : socket_error_message(code)));
    }

    is_connected_ = true;
    spdlog::debug("Connected to {}:{}", host, port);
    return Ok();
}

Result<size_t> Socket::send(const std::vector<uint8_t>& data) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<size_t>(std::string("Socket not created"));
    }

    auto sent = ::send(socket_,
                       reinterpret_cast<const char*>(data.data()),
                       data.size(), kSendFlags);

    if (sent < 0) {
        return Err<size_t>("Failed to send data: " + socket_error_message(last_socket_error()));
    }

    return Ok(static_cast<size_t>(sent));
}

Result<void> Socket::send_all(const std::vector<uint8_t>& data) {
    return send_all(reinterpret_cast<const char*>(data.data()), data.size());
}

Result<void> Socket::send_all(const char* data, size_t size) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

    size_t total_sent = 0;
    while (total_sent < size) {
        auto sent = ::send(socket_, data + total_sent, size - total_sent, kSendFlags);
        if (sent < 0) {
            const int code = last_socket_error();
            if (is_interrupted(code)) {
                continue;
            }
            return Err<void>("Failed to send data: " + socket_error_message(code));
        }
        total_sent += static_cast<size_t>(sent);
    }

    spdlog::trace("Sent {} bytes", total_sent);
    return Ok();
}

Result<std::vector<uint8_t>> Socket::receive(size_t max_size) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<std::vector<uint8_t>>(std::string("Socket not created"));
    }

    std::vector<uint8_t> buffer(max_size);
    auto received = ::recv(socket_,
                           reinterpret_cast<char*>(buffer.data()),
                           max_size, 0);

    while (received < 0 && is_interrupted(last_socket_error())) {
        received = ::recv(socket_, reinterpret_cast<char*>(buffer.data()), max_size, 0);
    }
    if (received < 0) {
        const int code = last_socket_error();
        if (is_timeout_error(code)) {
            return Err<std::vector<uint8_t>>(std::string("Receive timed out"));
        }
        return Err<std::vector<uint8_t>>("Failed to receive data: " + socket_error_message(code));
    }

    buffer.resize(static_cast<size_t>(received));
    return Ok(std::move(buffer));
}

Result<void> Socket::set_timeout(std::chrono::milliseconds timeout) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

#ifdef FERRY_PLATFORM_WINDOWS
    DWORD value = static_cast<DWORD>(timeout.count());
    const char* option = reinterpret_cast<const char*>(&value);
    const int option_len = sizeof(value);
#else
    timeval value{};
    value.tv_sec = static_cast<decltype(value.tv_sec)>(timeout.count() / 1000);
    value.tv_usec = static_cast<decltype(value.tv_usec)>((timeout.count() % 1000) * 1000);
    const void* option = &value;
    const socklen_type option_len = sizeof(value);
#endif

    if (setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, option, option_len) < 0 ||
        setsockopt(socket_, SOL_SOCKET, SO_SNDTIMEO, option, option_len) < 0) {
        return Err<void>(std::string("Failed to set socket timeout"));
    }

    return Ok();
}

Result<void> Socket::set_reuse_address(bool enable) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

    int opt = enable ? 1 : 0;
    if (setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR,
                   reinterpret_cast<const char*>(&opt), sizeof(opt)) < 0) {
        return Err<void>(std::string("Failed to set SO_REUSEADDR"));
    }

    return Ok();
}

Result<uint16_t> Socket::local_port() const {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<uint16_t>(std::string("Socket not created"));
    }

    sockaddr_in addr{};
    socklen_type addr_len = sizeof(addr);
    if (::getsockname(socket_, reinterpret_cast<sockaddr*>(&addr), &addr_len) < 0) {
        return Err<uint16_t>(std::string("Failed to query socket name"));
    }
    return Ok(static_cast<uint16_t>(ntohs(addr.sin_port)));
}

void Socket::close() {
    if (socket_ != INVALID_SOCKET_VALUE) {
        close_native_socket(socket_);
        socket_ = INVALID_SOCKET_VALUE;
        is_connected_ = false;
        spdlog::trace("Socket closed");
    }
}

} // namespace ferry::network
