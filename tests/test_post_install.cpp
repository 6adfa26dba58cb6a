#include <gtest/gtest.h>
#include <ssh/post_install.hpp>
#include <deque>
#include <map>

namespace {

class FakeRunner : public CommandRunner {
public:
    int connect_failures = 0;                   // first N connects fail
    std::map<std::string, std::deque<int>> exits;   // per-command exit codes; 0 once exhausted
    std::vector<std::string> ran;
    int connects = 0;
    bool closed = false;

    Result<void> connect(StatusCallback) override {
        if (connects++ < connect_failures) return Result<void>::Err("connection refused");
        return Result<void>::Ok();
    }

    SSHResult run(const std::string& command, int) override {
        ran.push_back(command);
        auto& q = exits[command];
        int code = 0;
        if (!q.empty()) {
            code = q.front();
            q.pop_front();
        }
        return {code, code == 0 ? "done" : "", code == 0 ? "" : "boom"};
    }

    void close() override { closed = true; }
};

Settings quick() {
    Settings s = Settings::aggressive();
    s.retries = 2;
    s.retry_delay = Millis(1);
    return s;
}

PostInstallConfig commands(std::vector<std::string> cmds) {
    PostInstallConfig c;
    c.commands = std::move(cmds);
    return c;
}

} // namespace

TEST(PostInstall, RunsEveryCommand) {
    FakeRunner runner;
    auto report = run_post_install(runner, commands({"a", "b"}), quick());

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(runner.ran, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(report.commands[0].output, "done");
    EXPECT_TRUE(runner.closed);
}

TEST(PostInstall, ConnectRetried) {
    FakeRunner runner;
    runner.connect_failures = 2;
    auto report = run_post_install(runner, commands({"a"}), quick());
    EXPECT_TRUE(report.connected);
    EXPECT_EQ(runner.connects, 3);
    EXPECT_TRUE(report.ok());
}

TEST(PostInstall, ConnectGivesUp) {
    FakeRunner runner;
    runner.connect_failures = 10;
    auto report = run_post_install(runner, commands({"a"}), quick());
    EXPECT_FALSE(report.connected);
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.error, "connection refused");
    EXPECT_TRUE(runner.ran.empty());
}

TEST(PostInstall, FailingCommandRetriedAndLaterOnesStillRun) {
    FakeRunner runner;
    runner.exits["flaky"] = {1};
    runner.exits["broken"] = {2, 2, 2};

    std::vector<std::string> status;
    auto report = run_post_install(runner, commands({"flaky", "broken", "after"}), quick(),
                                   [&](const std::string& s) { status.push_back(s); });

    ASSERT_EQ(report.commands.size(), 3u);
    EXPECT_TRUE(report.commands[0].ok());
    EXPECT_EQ(report.commands[0].attempts, 2);
    EXPECT_FALSE(report.commands[1].ok());
    EXPECT_EQ(report.commands[1].attempts, 3);
    EXPECT_EQ(report.commands[1].exit_code, 2);
    EXPECT_EQ(report.commands[1].output, "boom");
    EXPECT_TRUE(report.commands[2].ok());
    EXPECT_FALSE(report.ok());
    EXPECT_FALSE(status.empty());
}
