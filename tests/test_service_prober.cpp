#include <gtest/gtest.h>
#include "fakes.hpp"
#include <probe/tcp_prober.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

Settings probe_settings() {
    Settings s = Settings::aggressive();
    s.connect_timeout = Millis(100);
    s.max_concurrency = 8;
    s.max_service_wait = Millis(15000);
    s.probe_base_delay = Millis(500);
    s.probe_backoff_cap = Millis(4000);
    s.probe_jitter = 0.0;
    return s;
}

Target make_target(std::vector<int> ports) {
    Target t;
    t.host = "10.0.0.1";
    t.ports = std::move(ports);
    return t;
}

} // namespace

// ── Single round ────────────────────────────────────────────

TEST(ServiceProber, RoundDeadlineScalesWithWaves) {
    Settings s = probe_settings();
    s.max_concurrency = 3;
    EXPECT_EQ(ServiceProber::round_deadline(3, s).count(), 100 + 250);
    EXPECT_EQ(ServiceProber::round_deadline(4, s).count(), 200 + 250);
    EXPECT_EQ(ServiceProber::round_deadline(9, s).count(), 300 + 250);
}

TEST(ServiceProber, ProbeOnceSortedAndDeduplicated) {
    auto fake = std::make_shared<FakeProber>();
    fake->reachable = [](int port, int) { return port != 21; };
    ServiceProber prober(fake, 1);

    auto results = prober.probe_once(make_target({}), {23, 22, 21, 22}, probe_settings());
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].port, 21);
    EXPECT_EQ(results[1].port, 22);
    EXPECT_EQ(results[2].port, 23);
    EXPECT_FALSE(results[0].reachable);
    EXPECT_TRUE(results[1].reachable);
    EXPECT_TRUE(results[0].error.has_value());
    EXPECT_EQ(fake->calls.load(), 3);
}

TEST(ServiceProber, ConcurrencyBounded) {
    auto fake = std::make_shared<FakeProber>();
    fake->delay = Millis(30);
    ServiceProber prober(fake, 1);

    Settings s = probe_settings();
    s.max_concurrency = 3;
    std::vector<int> ports;
    for (int p = 1000; p < 1020; p++) ports.push_back(p);

    auto results = prober.probe_once(make_target({}), ports, s);
    ASSERT_EQ(results.size(), 20u);
    for (const auto& r : results) EXPECT_TRUE(r.reachable) << r.port;
    EXPECT_LE(fake->max_in_flight.load(), 3);
    EXPECT_GE(fake->max_in_flight.load(), 2);
}

TEST(ServiceProber, HangingPortHitsRoundDeadline) {
    auto fake = std::make_shared<FakeProber>();
    fake->hang_ports = {23};
    ServiceProber prober(fake, 1);

    auto start = std::chrono::steady_clock::now();
    auto results = prober.probe_once(make_target({}), {22, 23}, probe_settings());
    auto took = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].reachable);
    EXPECT_FALSE(results[1].reachable);
    EXPECT_EQ(results[1].error.value_or(""), "round deadline exceeded");
    EXPECT_LT(took, std::chrono::milliseconds(550));
}

TEST(ServiceProber, ThrowingProberReportsError) {
    class ThrowingProber : public Prober {
    public:
        ProbeResult probe_port(const std::string&, int, Millis) override {
            throw std::runtime_error("resolver failed");
        }
    };
    ServiceProber prober(std::make_shared<ThrowingProber>(), 1);

    auto results = prober.probe_once(make_target({}), {22}, probe_settings());
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].reachable);
    EXPECT_EQ(results[0].error.value_or(""), "resolver failed");
}

// ── Wait loop ───────────────────────────────────────────────

TEST(ServiceProber, AllUpFirstRound) {
    auto fake = std::make_shared<FakeProber>();
    FakeTiming clock;
    ServiceProber prober(fake, 1, clock.timing());

    std::vector<std::string> status;
    auto result = prober.wait_until_ready(make_target({}), {22, 23, 21}, probe_settings(),
                                          CancelToken(),
                                          [&](const std::string& s) { status.push_back(s); });
    EXPECT_TRUE(result.all_ready);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.rounds, 1);
    EXPECT_EQ(result.reachable_ports(), (std::vector<int>{21, 22, 23}));
    ASSERT_EQ(status.size(), 1u);
    EXPECT_EQ(status[0], "round 1: 3/3 ports reachable");
}

TEST(ServiceProber, PartialAfterMaxWait) {
    auto fake = std::make_shared<FakeProber>();
    fake->reachable = [](int port, int) { return port == 23; };
    FakeTiming clock;
    ServiceProber prober(fake, 1, clock.timing());

    auto result = prober.wait_until_ready(make_target({}), {22, 23, 21}, probe_settings(),
                                          CancelToken());
    EXPECT_FALSE(result.all_ready);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.reachable_ports(), (std::vector<int>{23}));
    EXPECT_EQ(result.unreachable_ports(), (std::vector<int>{21, 22}));
    EXPECT_EQ(result.elapsed.count(), 15000);

    // 23 came up in the first round and was not probed again
    EXPECT_EQ(fake->calls_for(23), 1);
    EXPECT_EQ(fake->calls_for(22), result.rounds);
    // Sleeps of 500, 1000, 2000, 4000, 4000, then the 3500ms remainder
    EXPECT_EQ(result.rounds, 6);
}

TEST(ServiceProber, PortsComeUpLater) {
    auto fake = std::make_shared<FakeProber>();
    fake->reachable = [](int port, int call) { return port == 22 || call >= 2; };
    FakeTiming clock;
    ServiceProber prober(fake, 1, clock.timing());

    auto result = prober.wait_until_ready(make_target({}), {22, 80}, probe_settings(),
                                          CancelToken());
    EXPECT_TRUE(result.all_ready);
    EXPECT_EQ(result.rounds, 3);
    EXPECT_EQ(fake->calls_for(22), 1);
    EXPECT_EQ(fake->calls_for(80), 3);
    // 500ms + 1000ms of backoff on the virtual clock
    EXPECT_EQ(result.elapsed.count(), 1500);
}

TEST(ServiceProber, EmptyPortListIsReady) {
    auto fake = std::make_shared<FakeProber>();
    ServiceProber prober(fake, 1);
    auto result = prober.wait_until_ready(make_target({}), {}, probe_settings(), CancelToken());
    EXPECT_TRUE(result.all_ready);
    EXPECT_EQ(result.rounds, 0);
    EXPECT_EQ(fake->calls.load(), 0);
}

TEST(ServiceProber, TerminatesWithinBoundOnRealClock) {
    auto fake = std::make_shared<FakeProber>();
    fake->reachable = [](int, int) { return false; };
    ServiceProber prober(fake, 1);

    Settings s = probe_settings();
    s.max_service_wait = Millis(600);
    s.probe_base_delay = Millis(100);
    s.probe_backoff_cap = Millis(200);
    s.probe_jitter = 0.2;

    auto start = std::chrono::steady_clock::now();
    auto result = prober.wait_until_ready(make_target({}), {22, 23}, s, CancelToken());
    auto took = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - start);

    EXPECT_TRUE(result.timed_out);
    EXPECT_GE(result.rounds, 2);
    auto bound = s.max_service_wait + ServiceProber::round_deadline(2, s) + Millis(200);
    EXPECT_LE(took.count(), bound.count());
}

TEST(ServiceProber, SlowAttemptKeepsItsSlotAcrossRounds) {
    auto fake = std::make_shared<FakeProber>();
    fake->hang_ports = {22};
    fake->hang = Millis(3000);
    FakeTiming clock;
    ServiceProber prober(fake, 1, clock.timing());

    Settings s = probe_settings();
    s.max_concurrency = 1;
    s.max_service_wait = Millis(4000);

    auto result = prober.wait_until_ready(make_target({}), {22}, s, CancelToken());

    EXPECT_TRUE(result.timed_out);
    // Backoff of 500, 1000, 2000, then the 500ms remainder
    EXPECT_EQ(result.rounds, 4);
    // The first attempt is still running when the later rounds start
    EXPECT_EQ(fake->max_in_flight.load(), 1);
    EXPECT_EQ(fake->calls_for(22), 1);
    ASSERT_EQ(result.ports.size(), 1u);
    EXPECT_EQ(result.ports[0].error.value_or(""), "round deadline exceeded");
}

TEST(ServiceProber, BusySlotsShrinkNextRound) {
    auto fake = std::make_shared<FakeProber>();
    fake->hang_ports = {22};
    fake->hang = Millis(800);
    ServiceProber prober(fake, 1);

    Settings s = probe_settings();
    s.max_concurrency = 2;

    // 22 outlives its round and keeps one of the two slots
    auto first = prober.probe_once(make_target({}), {22, 23}, s);
    EXPECT_FALSE(first[0].reachable);
    EXPECT_TRUE(first[1].reachable);

    // One free slot is enough; the round does not wait for the busy one
    auto start = std::chrono::steady_clock::now();
    auto second = prober.probe_once(make_target({}), {23, 24, 25}, s);
    EXPECT_LT(std::chrono::steady_clock::now() - start, Millis(300));
    for (const auto& r : second) EXPECT_TRUE(r.reachable) << r.port;
    EXPECT_LE(fake->max_in_flight.load(), 2);
}

TEST(ServiceProber, CancelStopsWaiting) {
    auto fake = std::make_shared<FakeProber>();
    fake->reachable = [](int, int) { return false; };
    ServiceProber prober(fake, 1);

    Settings s = probe_settings();
    s.max_service_wait = Millis(60000);

    CancelToken cancel;
    std::thread canceller([cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        cancel.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto result = prober.wait_until_ready(make_target({}), {22}, s, cancel);
    auto took = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.all_ready);
    EXPECT_LT(took, std::chrono::milliseconds(1000));
}

TEST(ServiceProber, CancelledBeforeStart) {
    auto fake = std::make_shared<FakeProber>();
    ServiceProber prober(fake, 1);
    CancelToken cancel;
    cancel.cancel();

    auto result = prober.wait_until_ready(make_target({}), {22}, probe_settings(), cancel);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.rounds, 0);
    ASSERT_EQ(result.ports.size(), 1u);
    EXPECT_EQ(result.ports[0].error.value_or(""), "not probed");
}

// ── TCP prober ──────────────────────────────────────────────

TEST(TcpProber, ListeningAndClosedPorts) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(fd, 4), 0);
    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    int open_port = ntohs(addr.sin_port);

    TcpProber prober;
    auto up = prober.probe_port("127.0.0.1", open_port, Millis(500));
    EXPECT_TRUE(up.reachable);
    EXPECT_EQ(up.port, open_port);

    ::close(fd);
    auto down = prober.probe_port("127.0.0.1", open_port, Millis(500));
    EXPECT_FALSE(down.reachable);
    EXPECT_TRUE(down.error.has_value());
}
