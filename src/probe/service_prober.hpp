#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <vector>
#include <core/cancel.hpp>
#include <core/settings.hpp>
#include <core/types.hpp>
#include "prober.hpp"

struct ServiceWaitResult {
    std::vector<ProbeResult> ports;   // latest result per port, sorted by port
    bool all_ready = false;
    bool timed_out = false;
    bool cancelled = false;
    int rounds = 0;
    Millis elapsed{0};

    std::vector<int> reachable_ports() const;
    std::vector<int> unreachable_ports() const;
};

// Polls a set of ports through a Prober on a bounded worker pool.
//
// Worker threads own shared references to the prober and to their round's
// bookkeeping, so a round can be abandoned (deadline, cancel) without
// waiting for slow connects to finish. Late results are dropped.
class ServiceProber {
public:
    using Clock = std::chrono::steady_clock;

    // Time source for wait_until_ready deadlines and inter-round sleeps.
    // Rounds themselves always run on the real clock.
    struct Timing {
        std::function<Clock::time_point()> now;
        std::function<bool(Millis, const CancelToken&)> sleep;   // false if cancelled

        static Timing system();
    };

    explicit ServiceProber(std::shared_ptr<Prober> prober,
                           uint32_t seed = std::random_device{}(),
                           Timing timing = Timing::system());
    ~ServiceProber();

    ServiceProber(const ServiceProber&) = delete;
    ServiceProber& operator=(const ServiceProber&) = delete;

    // One attempt per port, at most max_concurrency in flight.
    std::vector<ProbeResult> probe_once(const Target& target, const std::vector<int>& ports,
                                        const Settings& settings);

    // Repeat rounds with backoff until every port is up, max_service_wait
    // passes, or `cancel` fires. Never throws on timeout; the caller decides.
    ServiceWaitResult wait_until_ready(const Target& target, const std::vector<int>& ports,
                                       const Settings& settings, const CancelToken& cancel,
                                       StatusCallback cb = nullptr);

    // Length of one round for this many ports under `settings`.
    static Millis round_deadline(size_t port_count, const Settings& settings);

private:
    struct Inflight {
        std::mutex mutex;
        std::condition_variable cv;
        int workers = 0;
    };

    std::shared_ptr<Prober> prober_;
    std::mt19937 rng_;
    Timing timing_;
    std::shared_ptr<Inflight> inflight_;
    Millis longest_round_{0};

    std::vector<ProbeResult> run_round(const std::string& host, const std::vector<int>& ports,
                                       const Settings& settings, const CancelToken* cancel);
};
