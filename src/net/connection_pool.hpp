#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <core/constants.hpp>
#include "http_connection.hpp"

// Idle keep-alive connections for the host:port the pool is currently
// bound to. Acquiring for a different host:port drops the idle set.
class ConnectionPool {
public:
    explicit ConnectionPool(size_t max_idle = POOL_MAX_IDLE);

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // An idle connection, or nullptr when none is available.
    std::unique_ptr<HttpConnection> acquire(const std::string& host, int port);

    // Return a healthy connection. Dropped if closed, for another host,
    // or the pool is full.
    void release(std::unique_ptr<HttpConnection> conn);

    size_t idle_count() const;
    void clear();

private:
    size_t max_idle_;
    mutable std::mutex mutex_;
    std::string host_;
    int port_ = 0;
    std::deque<std::unique_ptr<HttpConnection>> idle_;
};

// Borrowed connection. Goes back to the pool only when the exchange that
// used it succeeded (mark_reusable); any other exit closes the socket.
class PooledConnection {
public:
    PooledConnection(ConnectionPool& pool, std::unique_ptr<HttpConnection> conn, bool reused)
        : pool_(pool), conn_(std::move(conn)), reused_(reused) {}

    ~PooledConnection() {
        if (conn_ && reusable_ && conn_->is_open()) pool_.release(std::move(conn_));
    }

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    HttpConnection* operator->() { return conn_.get(); }
    HttpConnection& get() { return *conn_; }
    bool reused() const { return reused_; }

    void mark_reusable() { reusable_ = true; }

private:
    ConnectionPool& pool_;
    std::unique_ptr<HttpConnection> conn_;
    bool reused_;
    bool reusable_ = false;
};
