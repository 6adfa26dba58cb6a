#include "connection_pool.hpp"
#include <core/log.hpp>

ConnectionPool::ConnectionPool(size_t max_idle) : max_idle_(max_idle) {}

std::unique_ptr<HttpConnection> ConnectionPool::acquire(const std::string& host, int port) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (host != host_ || port != port_) {
        if (!idle_.empty()) {
            rprov_log(fmt::format("pool: target changed {}:{} -> {}:{}, dropping {} idle",
                                  host_, port_, host, port, idle_.size()));
        }
        idle_.clear();
        host_ = host;
        port_ = port;
        return nullptr;
    }

    if (idle_.empty()) return nullptr;
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return conn;
}

void ConnectionPool::release(std::unique_ptr<HttpConnection> conn) {
    if (!conn || !conn->is_open()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (conn->host() != host_ || conn->port() != port_) return;
    if (idle_.size() >= max_idle_) return;
    idle_.push_back(std::move(conn));
}

size_t ConnectionPool::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

void ConnectionPool::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.clear();
}
