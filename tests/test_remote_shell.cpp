#include <gtest/gtest.h>
#include <ssh/remote_shell.hpp>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

// Loopback port that accepts TCP and optionally sends a banner, then never
// says anything else
class SilentServer {
public:
    explicit SilentServer(std::string banner = "") : banner_(std::move(banner)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listen_fd_, 4);

        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        accept_thread_ = std::thread([this] { accept_loop(); });
    }

    ~SilentServer() {
        stop_ = true;
        accept_thread_.join();
        if (conn_fd_ >= 0) ::close(conn_fd_);
        ::close(listen_fd_);
    }

    int port() const { return port_; }

private:
    std::string banner_;
    int listen_fd_ = -1;
    int conn_fd_ = -1;
    int port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread accept_thread_;

    void accept_loop() {
        while (!stop_ && conn_fd_ < 0) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) continue;
            conn_fd_ = ::accept(listen_fd_, nullptr, nullptr);
            if (conn_fd_ >= 0 && !banner_.empty()) {
                ::send(conn_fd_, banner_.data(), banner_.size(), MSG_NOSIGNAL);
            }
        }
    }
};

ShellTarget loopback(int port) {
    ShellTarget t;
    t.host = "127.0.0.1";
    t.port = port;
    t.user = "admin";
    t.password = "admin";
    t.timeout_secs = 1;
    return t;
}

} // namespace

TEST(RemoteShell, SilentServerTimesOut) {
    SilentServer server;
    RemoteShell shell(loopback(server.port()));

    auto start = std::chrono::steady_clock::now();
    auto r = shell.connect();
    auto took = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("timed out"), std::string::npos) << r.error;
    EXPECT_LT(took, std::chrono::seconds(4));
    EXPECT_FALSE(shell.is_active());
}

TEST(RemoteShell, StalledKeyExchangeTimesOut) {
    SilentServer server("SSH-2.0-OpenSSH_8.9\r\n");
    RemoteShell shell(loopback(server.port()));

    auto start = std::chrono::steady_clock::now();
    auto r = shell.connect();
    auto took = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("timed out"), std::string::npos) << r.error;
    EXPECT_LT(took, std::chrono::seconds(4));
}

TEST(RemoteShell, RefusedPortFails) {
    int port;
    {
        SilentServer closed;
        port = closed.port();
    }
    RemoteShell shell(loopback(port));
    auto r = shell.connect();
    EXPECT_TRUE(r.is_err());
    EXPECT_FALSE(shell.is_active());
}
