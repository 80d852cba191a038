#pragma once

#include <string>

#ifdef _WIN32
    #define FERRY_PLATFORM_WINDOWS
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
#else
    #define FERRY_PLATFORM_LINUX
    #include <sys/socket.h>
    #include <sys/time.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <netdb.h>
    #include <unistd.h>
    #include <cerrno>
    #include <cstring>
#endif

namespace ferry {

#ifdef FERRY_PLATFORM_WINDOWS
    using socklen_type = int;
    constexpr int kSendFlags = 0;
#else
    using socklen_type = socklen_t;
    // A server that hangs up mid-upload must not kill the process with SIGPIPE
    constexpr int kSendFlags = MSG_NOSIGNAL;
#endif

inline int last_socket_error() {
#ifdef FERRY_PLATFORM_WINDOWS
    return WSAGetLastError();
#else
    return errno;
#endif
}

inline bool is_timeout_error(int code) {
#ifdef FERRY_PLATFORM_WINDOWS
    return code == WSAETIMEDOUT || code == WSAEWOULDBLOCK;
#else
    return code == EAGAIN || code == EWOULDBLOCK || code == ETIMEDOUT;
#endif
}

inline bool is_interrupted(int code) {
#ifdef FERRY_PLATFORM_WINDOWS
    return code == WSAEINTR;
#else
    return code == EINTR;
#endif
}

inline std::string socket_error_message(int code) {
#ifdef FERRY_PLATFORM_WINDOWS
    return "WSA error " + std::to_string(code);
#else
    return std::strerror(code);
#endif
}

inline int close_native_socket(
#ifdef FERRY_PLATFORM_WINDOWS
    SOCKET socket
#else
    int socket
#endif
) {
#ifdef FERRY_PLATFORM_WINDOWS
    return ::closesocket(socket);
#else
    return ::close(socket);
#endif
}

} // namespace ferry
