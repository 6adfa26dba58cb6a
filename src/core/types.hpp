#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <chrono>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

using Millis = std::chrono::milliseconds;

// Login material for the device's web endpoint
struct Credentials {
    std::string username;
    std::string password;
};

// The device being provisioned. Built once per invocation, never mutated
// after the run starts.
struct Target {
    std::string host;
    int http_port = 80;
    std::vector<int> ports;                  // service ports that must come up
    std::optional<Credentials> credentials;
    std::string account;                     // optional, part of the cache key

    // Cache key: "host" or "account@host"
    std::string identity() const {
        return account.empty() ? host : account + "@" + host;
    }
};

// One reachability attempt against one port
struct ProbeResult {
    int port = 0;
    bool reachable = false;
    Millis latency{0};
    std::optional<std::string> error;
};

// Where the device's login and provisioning handlers live
struct EndpointConfig {
    int port = 80;
    std::string auth_path = "/api/auth";
    std::string deliver_path = "/api/provision";
};

// Commands to run over SSH once the services are up
struct PostInstallConfig {
    std::string user = "root";
    std::string password;
    int port = 22;
    std::vector<std::string> commands;

    bool enabled() const { return !commands.empty(); }
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
