#include "http_connection.hpp"
#include <core/constants.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>

#ifndef _WIN32
#  include <sys/socket.h>
#  include <unistd.h>
#endif

#ifndef MSG_NOSIGNAL
#  define MSG_NOSIGNAL 0
#endif

const char* net_failure_name(NetFailure f) {
    switch (f) {
        case NetFailure::None:           return "ok";
        case NetFailure::ConnectRefused: return "connection refused";
        case NetFailure::ConnectTimeout: return "connect timed out";
        case NetFailure::ConnectError:   return "connect failed";
        case NetFailure::WriteError:     return "write failed";
        case NetFailure::ReadTimeout:    return "read timed out";
        case NetFailure::ReadError:      return "read failed";
        case NetFailure::PeerClosed:     return "connection closed by peer";
        case NetFailure::BadResponse:    return "malformed response";
    }
    return "unknown";
}

static int remaining_ms(HttpConnection::Clock::time_point deadline, Millis cap) {
    auto left = std::chrono::duration_cast<Millis>(deadline - HttpConnection::Clock::now());
    return static_cast<int>(std::max<int64_t>(0, std::min(left.count(), cap.count())));
}

HttpConnection::HttpConnection(std::string host, int port)
    : host_(std::move(host)), port_(port) {}

HttpConnection::~HttpConnection() {
    close();
}

void HttpConnection::close() {
    if (sock_ != RPROV_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = RPROV_INVALID_SOCKET;
    }
}

Exchange HttpConnection::open(Millis timeout) {
    Exchange ex;
    close();

    auto cr = platform::connect_tcp(host_, port_, static_cast<int>(timeout.count()));
    if (cr.ok()) {
        sock_ = cr.sock;
        return ex;
    }

    switch (cr.status) {
        case platform::ConnectStatus::Refused:  ex.failure = NetFailure::ConnectRefused; break;
        case platform::ConnectStatus::TimedOut: ex.failure = NetFailure::ConnectTimeout; break;
        default:                                ex.failure = NetFailure::ConnectError;   break;
    }
    ex.error = cr.error.empty() ? platform::connect_status_name(cr.status) : cr.error;
    return ex;
}

bool HttpConnection::is_stale() const {
    if (sock_ == RPROV_INVALID_SOCKET) return true;
    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents == 0) return false;
    // Readable while idle: either EOF or unsolicited bytes. Neither is usable.
    return true;
}

Exchange HttpConnection::roundtrip(const std::string& wire, Clock::time_point deadline,
                                   Millis read_timeout) {
    Exchange ex;
    if (sock_ == RPROV_INVALID_SOCKET) {
        ex.failure = NetFailure::WriteError;
        ex.error = "connection not open";
        return ex;
    }

    // ── Write ──
    while (ex.bytes_sent < wire.size()) {
        int wait = remaining_ms(deadline, read_timeout);
        if (wait <= 0) {
            ex.failure = NetFailure::ReadTimeout;
            ex.error = "timed out sending request";
            return ex;
        }
        int revents = platform::poll_socket(sock_, POLLOUT, wait);
        if (revents == 0) {
            ex.failure = NetFailure::ReadTimeout;
            ex.error = "timed out sending request";
            return ex;
        }
        if (revents & (POLLERR | POLLNVAL)) {
            ex.failure = NetFailure::WriteError;
            ex.error = "socket error while sending";
            return ex;
        }

        auto n = ::send(sock_, wire.data() + ex.bytes_sent, wire.size() - ex.bytes_sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            ex.failure = (ex.bytes_sent == 0 && (errno == EPIPE || errno == ECONNRESET))
                             ? NetFailure::PeerClosed : NetFailure::WriteError;
            ex.error = std::string("send: ") + std::strerror(errno);
            return ex;
        }
        ex.bytes_sent += static_cast<size_t>(n);
    }

    // ── Read ──
    HttpResponseParser parser;
    char buf[HTTP_READ_BUF_SIZE];
    while (!parser.complete()) {
        int wait = remaining_ms(deadline, read_timeout);
        int revents = wait > 0 ? platform::poll_socket(sock_, POLLIN, wait) : 0;
        if (revents == 0) {
            ex.failure = NetFailure::ReadTimeout;
            ex.error = "timed out waiting for response";
            return ex;
        }

        auto n = ::recv(sock_, buf, sizeof(buf), 0);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            ex.failure = (ex.bytes_received == 0) ? NetFailure::PeerClosed : NetFailure::ReadError;
            ex.error = std::string("recv: ") + std::strerror(errno);
            return ex;
        }
        if (n == 0) {
            parser.on_eof();
            if (parser.complete()) break;
            ex.failure = NetFailure::PeerClosed;
            ex.error = parser.error().empty() ? "connection closed by peer" : parser.error();
            return ex;
        }

        ex.bytes_received += static_cast<size_t>(n);
        parser.feed(buf, static_cast<size_t>(n));
        if (parser.failed()) {
            ex.failure = NetFailure::BadResponse;
            ex.error = parser.error();
            return ex;
        }
    }

    ex.response = parser.take();
    if (!ex.response.keep_alive) close();
    return ex;
}
