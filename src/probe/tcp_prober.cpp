#include "tcp_prober.hpp"
#include <platform/socket_util.hpp>
#include <chrono>

ProbeResult TcpProber::probe_port(const std::string& host, int port, Millis timeout) {
    ProbeResult r;
    r.port = port;

    auto start = std::chrono::steady_clock::now();
    auto cr = platform::connect_tcp(host, port, static_cast<int>(timeout.count()));
    r.latency = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - start);

    if (cr.ok()) {
        platform::close_socket(cr.sock);
        r.reachable = true;
    } else {
        r.error = cr.error.empty() ? std::string(platform::connect_status_name(cr.status)) : cr.error;
    }
    return r;
}
