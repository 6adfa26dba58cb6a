#pragma once

#include <chrono>
#include <string>
#include <platform/socket_util.hpp>
#include <core/types.hpp>
#include "http_message.hpp"

// Why an exchange failed. Only some of these are worth a retry; see
// HttpTransport::is_transient().
enum class NetFailure {
    None,
    ConnectRefused,
    ConnectTimeout,
    ConnectError,     // resolve failure, unreachable, socket() failure
    WriteError,
    ReadTimeout,
    ReadError,
    PeerClosed,       // EOF before a complete response
    BadResponse,      // unparseable response
};

const char* net_failure_name(NetFailure f);

struct Exchange {
    NetFailure failure = NetFailure::None;
    std::string error;
    HttpResponse response;
    size_t bytes_sent = 0;        // request bytes accepted by the socket
    size_t bytes_received = 0;

    bool ok() const { return failure == NetFailure::None; }
};

// One keep-alive TCP connection to host:port. Owns its socket.
class HttpConnection {
public:
    using Clock = std::chrono::steady_clock;

    HttpConnection(std::string host, int port);
    ~HttpConnection();

    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    // Connect, bounded by `timeout`. On failure the Exchange carries the cause.
    Exchange open(Millis timeout);

    // Write `wire` then read one response. Every wait is bounded by
    // min(read_timeout, deadline - now).
    Exchange roundtrip(const std::string& wire, Clock::time_point deadline, Millis read_timeout);

    // True if an idle socket was closed (or written to) by the peer.
    bool is_stale() const;

    bool is_open() const { return sock_ != RPROV_INVALID_SOCKET; }
    void close();

    const std::string& host() const { return host_; }
    int port() const { return port_; }

private:
    std::string host_;
    int port_;
    socket_t sock_ = RPROV_INVALID_SOCKET;
};
