#include "socket_util.hpp"
#include <chrono>
#include <cstring>
#include <cerrno>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <sys/types.h>
#  include <netdb.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret;
    do {
        ret = poll(&pfd, 1, timeout_ms);
    } while (ret < 0 && errno == EINTR);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

const char* connect_status_name(ConnectStatus status) {
    switch (status) {
        case ConnectStatus::Ok:            return "ok";
        case ConnectStatus::Refused:       return "connection refused";
        case ConnectStatus::TimedOut:      return "connect timed out";
        case ConnectStatus::Unreachable:   return "host unreachable";
        case ConnectStatus::ResolveFailed: return "resolve failed";
        case ConnectStatus::Error:         return "connect error";
    }
    return "connect error";
}

static ConnectStatus classify_errno(int err) {
    switch (err) {
#ifdef _WIN32
        case WSAECONNREFUSED: return ConnectStatus::Refused;
        case WSAETIMEDOUT:    return ConnectStatus::TimedOut;
        case WSAEHOSTUNREACH:
        case WSAENETUNREACH:  return ConnectStatus::Unreachable;
#else
        case ECONNREFUSED:    return ConnectStatus::Refused;
        case ETIMEDOUT:       return ConnectStatus::TimedOut;
        case EHOSTUNREACH:
        case ENETUNREACH:     return ConnectStatus::Unreachable;
#endif
        default:              return ConnectStatus::Error;
    }
}

ConnectResult connect_tcp(const std::string& host, int port, int timeout_ms) {
    init_networking();

    ConnectResult result;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* addrs = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &addrs);
    if (gai != 0 || !addrs) {
        result.status = ConnectStatus::ResolveFailed;
        result.error = "Failed to resolve host: " + host;
        return result;
    }

    for (struct addrinfo* ai = addrs; ai; ai = ai->ai_next) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.status = ConnectStatus::TimedOut;
            result.error = "Connection timed out: " + host;
            break;
        }

        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == RPROV_INVALID_SOCKET) {
            result.status = ConnectStatus::Error;
            result.error = "Failed to create socket";
            continue;
        }

        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
        if (ret == 0) {
            result.sock = sock;
            result.status = ConnectStatus::Ok;
            result.error.clear();
            break;
        }

#ifdef _WIN32
        int err = WSAGetLastError();
        bool in_progress = (err == WSAEWOULDBLOCK);
#else
        int err = errno;
        bool in_progress = (err == EINPROGRESS);
#endif
        if (!in_progress) {
            close_socket(sock);
            result.status = classify_errno(err);
            result.error = "Failed to connect: " + std::string(std::strerror(err));
            continue;
        }

        // Wait for non-blocking connect to complete
        int revents = poll_socket(sock, POLLOUT, static_cast<int>(remaining));
        if (revents == 0) {
            close_socket(sock);
            result.status = ConnectStatus::TimedOut;
            result.error = "Connection timed out: " + host;
            continue;
        }

        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            result.status = classify_errno(sock_err);
            result.error = "Connection failed: " + std::string(std::strerror(sock_err));
            continue;
        }

        int nodelay = 1;
        setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, reinterpret_cast<const char*>(&nodelay), sizeof(nodelay));

        result.sock = sock;
        result.status = ConnectStatus::Ok;
        result.error.clear();
        break;
    }

    freeaddrinfo(addrs);
    return result;
}

} // namespace platform
