#include "remote_shell.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <mutex>

static constexpr int EAGAIN_WAIT_MS = 100;

// libssh2_init is process-wide and not thread-safe
static bool ensure_libssh2() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    return rc == 0;
}

RemoteShell::RemoteShell(ShellTarget target) : target_(std::move(target)) {}

RemoteShell::~RemoteShell() {
    close();
}

void RemoteShell::wait_socket(int timeout_ms) {
    if (!session_ || sock_ == RPROV_INVALID_SOCKET) return;
    int dir = libssh2_session_block_directions(session_);
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;
    platform::poll_socket(sock_, events, timeout_ms);
}

Result<void> RemoteShell::connect(StatusCallback callback) {
    close();
    if (!ensure_libssh2()) return Result<void>::Err("Failed to initialize libssh2");

    if (callback) callback(fmt::format("Connecting to {}:{}...", target_.host, target_.port));

    auto cr = platform::connect_tcp(target_.host, target_.port, target_.timeout_secs * 1000);
    if (!cr.ok()) {
        return Result<void>::Err(fmt::format("Failed to connect to {}:{}: {}", target_.host, target_.port,
                                             cr.error.empty() ? platform::connect_status_name(cr.status) : cr.error));
    }
    sock_ = cr.sock;

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        return Result<void>::Err("Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout_secs);
    int rc;
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) break;
        wait_socket(EAGAIN_WAIT_MS);
    }
    if (rc != 0) {
        close();
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            return Result<void>::Err(fmt::format("SSH handshake with {} timed out after {}s",
                                                 target_.host, target_.timeout_secs));
        }
        return Result<void>::Err("SSH handshake failed with " + target_.host);
    }

    auto auth = userauth(callback, deadline);
    if (auth.is_err()) {
        close();
        return auth;
    }

    rprov_log(fmt::format("ssh: connected to {}@{}:{}", target_.user, target_.host, target_.port));
    if (callback) callback("Connected to " + target_.host);
    return Result<void>::Ok();
}

Result<void> RemoteShell::userauth(StatusCallback callback,
                                   std::chrono::steady_clock::time_point deadline) {
    auto expired = [&] { return std::chrono::steady_clock::now() >= deadline; };
    auto timed_out = [&] {
        return Result<void>::Err(fmt::format("SSH authentication with {} timed out after {}s",
                                             target_.host, target_.timeout_secs));
    };

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned int>(target_.user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            // "none" auth accepted (passwordless root on a fresh device)
            return Result<void>::Ok();
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        if (expired()) return timed_out();
        wait_socket(EAGAIN_WAIT_MS);
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) callback("Auth methods: " + methods);

    if (methods.empty() || methods.find("password") != std::string::npos) {
        int rc;
        while ((rc = libssh2_userauth_password(session_, target_.user.c_str(),
                                               target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            if (expired()) return timed_out();
            wait_socket(EAGAIN_WAIT_MS);
        }
        if (rc == 0) return Result<void>::Ok();
    }

    return Result<void>::Err(fmt::format("Authentication failed for {}@{}", target_.user, target_.host));
}

SSHResult RemoteShell::run(const std::string& command, int timeout_secs) {
    if (!session_) return SSHResult{-1, "", "No session available"};

    int effective_timeout = timeout_secs > 0 ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);
    auto expired = [&] { return std::chrono::steady_clock::now() >= deadline; };

    LIBSSH2_CHANNEL* ch = nullptr;
    while ((ch = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN || expired()) {
            return SSHResult{-1, "", "Failed to open exec channel"};
        }
        wait_socket(EAGAIN_WAIT_MS);
    }

    int rc;
    while ((rc = libssh2_channel_exec(ch, command.c_str())) == LIBSSH2_ERROR_EAGAIN && !expired()) {
        wait_socket(EAGAIN_WAIT_MS);
    }
    if (rc != 0) {
        libssh2_channel_free(ch);
        return SSHResult{-1, "", "Failed to exec command on channel"};
    }

    std::string out, err;
    char buf[SSH_READ_BUF_SIZE];
    bool timed_out = false;
    for (;;) {
        ssize_t n = libssh2_channel_read(ch, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        ssize_t e = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
        if (e > 0) {
            err.append(buf, static_cast<size_t>(e));
            continue;
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) break;
        if (libssh2_channel_eof(ch)) break;
        if (expired()) {
            timed_out = true;
            break;
        }
        wait_socket(EAGAIN_WAIT_MS);
    }

    int exit_status = -1;
    while ((rc = libssh2_channel_close(ch)) == LIBSSH2_ERROR_EAGAIN && !expired()) {
        wait_socket(EAGAIN_WAIT_MS);
    }
    if (rc == 0 && !timed_out) exit_status = libssh2_channel_get_exit_status(ch);
    libssh2_channel_free(ch);

    if (timed_out) {
        err += fmt::format("command timed out after {}s", effective_timeout);
    }
    return SSHResult{exit_status, out, err};
}

void RemoteShell::close() {
    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != RPROV_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = RPROV_INVALID_SOCKET;
    }
}
