#pragma once

#include <string>
#include <core/types.hpp>

// One reachability attempt against one port. Implementations must return
// within roughly `timeout` and must be callable from several threads at once.
class Prober {
public:
    virtual ~Prober() = default;
    virtual ProbeResult probe_port(const std::string& host, int port, Millis timeout) = 0;
};
