#pragma once

#include <stdexcept>
#include <string>

// Failure taxonomy of a provisioning run. cli/exit_codes maps each kind to
// the process exit status.
enum class ErrorKind {
    None = 0,
    Transport,     // network-level, retried up to policy
    Auth,          // credential rejected
    Build,         // payload invariant violated
    Timeout,       // services did not come up in time
    Cache,         // persisted cache unreadable (recovered locally)
    Cancelled,     // external cancellation
    Internal,      // unexpected exception from a collaborator
};

const char* error_kind_name(ErrorKind kind);

class ProvisionError : public std::runtime_error {
public:
    ProvisionError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class TransportError : public ProvisionError {
public:
    explicit TransportError(const std::string& msg)
        : ProvisionError(ErrorKind::Transport, msg) {}
};

class AuthError : public ProvisionError {
public:
    explicit AuthError(const std::string& msg)
        : ProvisionError(ErrorKind::Auth, msg) {}
};

class BuildError : public ProvisionError {
public:
    explicit BuildError(const std::string& msg)
        : ProvisionError(ErrorKind::Build, msg) {}
};

class TimeoutError : public ProvisionError {
public:
    explicit TimeoutError(const std::string& msg)
        : ProvisionError(ErrorKind::Timeout, msg) {}
};

// Never escapes the credential cache; carried to the warning callback.
class CacheError : public ProvisionError {
public:
    explicit CacheError(const std::string& msg)
        : ProvisionError(ErrorKind::Cache, msg) {}
};
