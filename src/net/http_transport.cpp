#include "http_transport.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <algorithm>

HttpTransport::HttpTransport(std::string host, int port, const Settings& settings,
                             std::shared_ptr<ConnectionPool> pool)
    : host_(std::move(host)), port_(port), settings_(settings),
      pool_(pool ? std::move(pool) : std::make_shared<ConnectionPool>()) {}

bool HttpTransport::is_transient(NetFailure f) {
    switch (f) {
        case NetFailure::ConnectRefused:
        case NetFailure::ConnectTimeout:
        case NetFailure::ReadTimeout:
            return true;
        default:
            return false;
    }
}

// ── One attempt ─────────────────────────────────────────────

Exchange HttpTransport::attempt(const std::string& wire,
                                HttpConnection::Clock::time_point deadline) {
    using Clock = HttpConnection::Clock;

    auto open_fresh = [&](std::unique_ptr<HttpConnection>& conn) -> Exchange {
        conn = std::make_unique<HttpConnection>(host_, port_);
        auto left = std::chrono::duration_cast<Millis>(deadline - Clock::now());
        auto budget = std::max(Millis(1), std::min(settings_.connect_timeout, left));
        auto ex = conn->open(budget);
        if (ex.ok()) connections_opened_++;
        return ex;
    };

    auto conn = pool_->acquire(host_, port_);
    bool reused = conn != nullptr;
    if (reused && conn->is_stale()) {
        rprov_log(fmt::format("transport: discarding stale idle connection to {}:{}", host_, port_));
        conn.reset();
        reused = false;
    }

    if (!conn) {
        auto ex = open_fresh(conn);
        if (!ex.ok()) return ex;
    }

    PooledConnection pc(*pool_, std::move(conn), reused);
    auto ex = pc->roundtrip(wire, deadline, settings_.read_timeout);

    // A pooled socket the server already closed fails before anything was
    // read back. Replace it once without charging an attempt.
    if (!ex.ok() && pc.reused() && ex.bytes_received == 0 &&
        (ex.failure == NetFailure::PeerClosed ||
         (ex.failure == NetFailure::WriteError && ex.bytes_sent == 0))) {
        rprov_log(fmt::format("transport: pooled connection to {}:{} was stale ({}), reconnecting",
                              host_, port_, ex.error));
        std::unique_ptr<HttpConnection> fresh;
        auto open_ex = open_fresh(fresh);
        if (!open_ex.ok()) return open_ex;
        PooledConnection retry_pc(*pool_, std::move(fresh), false);
        ex = retry_pc->roundtrip(wire, deadline, settings_.read_timeout);
        if (ex.ok() && ex.response.keep_alive) retry_pc.mark_reusable();
        return ex;
    }

    if (ex.ok() && ex.response.keep_alive) pc.mark_reusable();
    return ex;
}

// ── Retry loop ──────────────────────────────────────────────

HttpResponse HttpTransport::send(const HttpRequest& request) {
    const std::string host_header = port_ == 80 ? host_ : fmt::format("{}:{}", host_, port_);
    const std::string wire = serialize_request(request, host_header);
    const Millis budget = request.timeout ? *request.timeout : settings_.timeout;
    const int max_attempts = settings_.retries + 1;

    std::string last_cause;
    for (int i = 0; i < max_attempts; i++) {
        if (i > 0) {
            rprov_log(fmt::format("transport: {} {} retry {}/{} in {}ms ({})",
                                  request.method, request.path, i, settings_.retries,
                                  settings_.retry_delay.count(), last_cause));
            platform::sleep_ms(static_cast<int>(settings_.retry_delay.count()));
        }

        attempts_++;
        auto deadline = HttpConnection::Clock::now() + budget;
        auto ex = attempt(wire, deadline);
        // Once the socket accepted any byte the device may have acted on it
        bool request_started = ex.bytes_sent > 0;

        if (ex.ok()) {
            if (!ex.response.server_error()) return ex.response;
            last_cause = fmt::format("{}:{} answered HTTP {}", host_, port_, ex.response.status_code);
            // The server saw the full request; replaying an upload is not safe.
            if (!request.idempotent) {
                throw TransportError(fmt::format("{} {}: {}", request.method, request.path, last_cause));
            }
            continue;
        }

        if (ex.failure == NetFailure::ConnectRefused || ex.failure == NetFailure::ConnectTimeout ||
            ex.failure == NetFailure::ConnectError) {
            last_cause = fmt::format("connect to {}:{} {}", host_, port_,
                                     ex.failure == NetFailure::ConnectRefused ? "refused"
                                     : ex.failure == NetFailure::ConnectTimeout ? "timed out"
                                     : "failed: " + ex.error);
        } else {
            last_cause = fmt::format("{}:{} {}", host_, port_, ex.error.empty()
                                     ? std::string(net_failure_name(ex.failure)) : ex.error);
        }

        if (!is_transient(ex.failure)) {
            throw TransportError(fmt::format("{} {}: {}", request.method, request.path, last_cause));
        }
        if (!request.idempotent && request_started) {
            throw TransportError(fmt::format("{} {}: {} after the request started, not retried",
                                             request.method, request.path, last_cause));
        }
    }

    throw TransportError(fmt::format("{} {}: {} attempt(s) failed: {}",
                                     request.method, request.path, max_attempts, last_cause));
}
