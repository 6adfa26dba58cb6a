#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <core/settings.hpp>
#include "connection_pool.hpp"
#include "http_message.hpp"

// Request/response client. Throws TransportError once retries are spent.
class Transport {
public:
    virtual ~Transport() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

// HTTP/1.1 over pooled keep-alive connections to one host:port.
//
// Retry policy: connect refused, connect timeout, read timeout and 5xx
// responses are retried up to Settings::retries times, Settings::retry_delay
// apart. A non-idempotent request is only retried while none of its body
// has reached the socket. Other failures surface on the first attempt.
class HttpTransport : public Transport {
public:
    HttpTransport(std::string host, int port, const Settings& settings,
                  std::shared_ptr<ConnectionPool> pool = nullptr);

    HttpResponse send(const HttpRequest& request) override;

    // Counters for diagnostics and tests
    int attempts() const { return attempts_.load(); }
    int connections_opened() const { return connections_opened_.load(); }

    const std::string& host() const { return host_; }
    int port() const { return port_; }

    static bool is_transient(NetFailure f);

private:
    std::string host_;
    int port_;
    Settings settings_;
    std::shared_ptr<ConnectionPool> pool_;
    std::atomic<int> attempts_{0};
    std::atomic<int> connections_opened_{0};

    Exchange attempt(const std::string& wire, HttpConnection::Clock::time_point deadline);
};
