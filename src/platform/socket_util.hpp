#pragma once

// Cross-platform socket utilities.

#include <string>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define RPROV_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define RPROV_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

enum class ConnectStatus {
    Ok,
    Refused,        // RST from the peer: nothing listening
    TimedOut,
    Unreachable,    // host/network unreachable
    ResolveFailed,
    Error,
};

const char* connect_status_name(ConnectStatus status);

struct ConnectResult {
    socket_t sock = RPROV_INVALID_SOCKET;
    ConnectStatus status = ConnectStatus::Error;
    std::string error;

    bool ok() const { return status == ConnectStatus::Ok; }
};

// Resolve host and open a TCP connection, bounded by timeout_ms across all
// resolved addresses. On success the socket is left non-blocking.
ConnectResult connect_tcp(const std::string& host, int port, int timeout_ms);

} // namespace platform
