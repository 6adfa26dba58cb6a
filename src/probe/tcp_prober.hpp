#pragma once

#include "prober.hpp"

// TCP connect probe: a port is reachable when the handshake completes.
class TcpProber : public Prober {
public:
    ProbeResult probe_port(const std::string& host, int port, Millis timeout) override;
};
