#pragma once

#include <chrono>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

struct ShellTarget {
    std::string host;
    int port = 22;
    std::string user = "root";
    std::string password;
    int timeout_secs = 10;       // TCP connect + handshake
};

// Runs one-off commands on a device. RemoteShell is the libssh2 version;
// tests substitute their own.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual Result<void> connect(StatusCallback callback = nullptr) = 0;
    virtual SSHResult run(const std::string& command, int timeout_secs) = 0;
    virtual void close() = 0;
};

// Password-authenticated SSH session with one exec channel per command.
class RemoteShell : public CommandRunner {
public:
    explicit RemoteShell(ShellTarget target);
    ~RemoteShell() override;

    RemoteShell(const RemoteShell&) = delete;
    RemoteShell& operator=(const RemoteShell&) = delete;

    Result<void> connect(StatusCallback callback = nullptr) override;
    SSHResult run(const std::string& command, int timeout_secs) override;
    void close() override;

    bool is_active() const { return session_ != nullptr; }

private:
    ShellTarget target_;
    LIBSSH2_SESSION* session_ = nullptr;
    socket_t sock_ = RPROV_INVALID_SOCKET;

    // Both auth exchanges share the connect deadline
    Result<void> userauth(StatusCallback callback, std::chrono::steady_clock::time_point deadline);
    // Block (bounded) until the socket is ready in the direction libssh2 wants
    void wait_socket(int timeout_ms);
};
