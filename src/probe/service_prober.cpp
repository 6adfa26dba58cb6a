#include "service_prober.hpp"
#include "backoff.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <algorithm>
#include <deque>
#include <map>
#include <system_error>
#include <thread>

namespace {

// Shared between the coordinating thread and its workers
struct RoundState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<int> queue;
    std::map<int, ProbeResult> results;
    bool abandoned = false;
};

constexpr Millis CANCEL_POLL_INTERVAL{50};

std::vector<int> unique_ports(const std::vector<int>& ports) {
    std::vector<int> out(ports);
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

} // namespace

// ── ServiceWaitResult ───────────────────────────────────────

std::vector<int> ServiceWaitResult::reachable_ports() const {
    std::vector<int> out;
    for (const auto& r : ports) if (r.reachable) out.push_back(r.port);
    return out;
}

std::vector<int> ServiceWaitResult::unreachable_ports() const {
    std::vector<int> out;
    for (const auto& r : ports) if (!r.reachable) out.push_back(r.port);
    return out;
}

// ── Construction ────────────────────────────────────────────

ServiceProber::Timing ServiceProber::Timing::system() {
    Timing t;
    t.now = [] { return Clock::now(); };
    t.sleep = [](Millis d, const CancelToken& cancel) { return cancel.sleep_for(d); };
    return t;
}

ServiceProber::ServiceProber(std::shared_ptr<Prober> prober, uint32_t seed, Timing timing)
    : prober_(std::move(prober)), rng_(seed), timing_(std::move(timing)),
      inflight_(std::make_shared<Inflight>()) {}

ServiceProber::~ServiceProber() {
    // Give abandoned workers one round to unwind. They hold their own
    // references, so returning early is safe.
    std::unique_lock<std::mutex> lock(inflight_->mutex);
    inflight_->cv.wait_for(lock, longest_round_, [this] { return inflight_->workers == 0; });
}

Millis ServiceProber::round_deadline(size_t port_count, const Settings& settings) {
    size_t per_wave = static_cast<size_t>(std::max(1, settings.max_concurrency));
    size_t waves = port_count == 0 ? 0 : (port_count + per_wave - 1) / per_wave;
    return settings.connect_timeout * static_cast<int64_t>(waves) + Millis(PROBE_ROUND_SLACK_MS);
}

// ── One round ───────────────────────────────────────────────

std::vector<ProbeResult> ServiceProber::run_round(const std::string& host,
                                                  const std::vector<int>& ports,
                                                  const Settings& settings,
                                                  const CancelToken* cancel) {
    if (ports.empty()) return {};

    auto state = std::make_shared<RoundState>();
    state->queue.assign(ports.begin(), ports.end());

    const Millis limit = round_deadline(ports.size(), settings);
    longest_round_ = std::max(longest_round_, limit);
    const auto deadline = Clock::now() + limit;
    const Millis per_port = settings.connect_timeout;
    const int limit_workers = std::max(1, settings.max_concurrency);
    size_t worker_count = std::min(ports.size(), static_cast<size_t>(limit_workers));

    for (size_t i = 0; i < worker_count; i++) {
        {
            // Workers abandoned by an earlier round still hold a slot until
            // their attempt returns
            std::unique_lock<std::mutex> lock(inflight_->mutex);
            auto free_slot = [&] { return inflight_->workers < limit_workers; };
            auto drained = [&] {
                std::lock_guard<std::mutex> q(state->mutex);
                return state->queue.empty();
            };
            while (!free_slot() && !drained() && Clock::now() < deadline &&
                   !(cancel && cancel->cancelled())) {
                auto slice = std::min<Clock::duration>(deadline - Clock::now(), CANCEL_POLL_INTERVAL);
                inflight_->cv.wait_for(lock, slice, free_slot);
            }
            if (drained()) break;
            if (!free_slot()) {
                rprov_log(fmt::format("probe {}: {} earlier worker(s) still busy, started {} of {}",
                                      host, inflight_->workers, i, worker_count));
                break;
            }
            inflight_->workers++;
        }
        auto worker = [state, prober = prober_, inflight = inflight_, host, per_port] {
            for (;;) {
                int port;
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    if (state->abandoned || state->queue.empty()) break;
                    port = state->queue.front();
                    state->queue.pop_front();
                }

                ProbeResult r;
                try {
                    r = prober->probe_port(host, port, per_port);
                } catch (const std::exception& e) {
                    r.reachable = false;
                    r.error = e.what();
                }
                r.port = port;

                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    if (!state->abandoned) state->results[port] = std::move(r);
                }
                state->cv.notify_all();
            }

            {
                std::lock_guard<std::mutex> lock(inflight->mutex);
                inflight->workers--;
            }
            inflight->cv.notify_all();
        };

        try {
            std::thread(worker).detach();
        } catch (const std::system_error&) {
            {
                std::lock_guard<std::mutex> lock(inflight_->mutex);
                inflight_->workers--;
            }
            std::lock_guard<std::mutex> lock(state->mutex);
            state->abandoned = true;
            throw;
        }
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    auto finished = [&] { return state->results.size() == ports.size(); };
    bool was_cancelled = false;
    while (!finished()) {
        auto now = Clock::now();
        if (now >= deadline) break;
        if (cancel && cancel->cancelled()) { was_cancelled = true; break; }
        auto slice = std::min<Clock::duration>(deadline - now, CANCEL_POLL_INTERVAL);
        state->cv.wait_for(lock, slice, finished);
    }
    state->abandoned = true;

    std::vector<ProbeResult> out;
    out.reserve(ports.size());
    for (int port : ports) {
        auto it = state->results.find(port);
        if (it != state->results.end()) {
            out.push_back(it->second);
        } else {
            ProbeResult r;
            r.port = port;
            r.error = was_cancelled ? "cancelled" : "round deadline exceeded";
            out.push_back(r);
        }
    }
    return out;
}

std::vector<ProbeResult> ServiceProber::probe_once(const Target& target,
                                                   const std::vector<int>& ports,
                                                   const Settings& settings) {
    return run_round(target.host, unique_ports(ports), settings, nullptr);
}

// ── Wait loop ───────────────────────────────────────────────

ServiceWaitResult ServiceProber::wait_until_ready(const Target& target,
                                                  const std::vector<int>& ports,
                                                  const Settings& settings,
                                                  const CancelToken& cancel,
                                                  StatusCallback cb) {
    ServiceWaitResult result;
    const auto wanted = unique_ports(ports);
    const auto start = timing_.now();
    const auto deadline = start + settings.max_service_wait;

    std::map<int, ProbeResult> latest;
    for (int port : wanted) {
        ProbeResult r;
        r.port = port;
        r.error = "not probed";
        latest[port] = r;
    }

    auto finish = [&]() {
        result.ports.clear();
        for (auto& [port, r] : latest) result.ports.push_back(r);
        result.elapsed = std::chrono::duration_cast<Millis>(timing_.now() - start);
        return result;
    };

    if (wanted.empty()) {
        result.all_ready = true;
        return finish();
    }

    for (int attempt = 0;; attempt++) {
        if (cancel.cancelled()) {
            result.cancelled = true;
            return finish();
        }

        // Only re-probe what is still down
        std::vector<int> pending;
        for (auto& [port, r] : latest) if (!r.reachable) pending.push_back(port);

        auto round = run_round(target.host, pending, settings, &cancel);
        result.rounds++;
        for (auto& r : round) latest[r.port] = r;

        if (cancel.cancelled()) {
            result.cancelled = true;
            return finish();
        }

        size_t up = 0;
        for (auto& [port, r] : latest) if (r.reachable) up++;
        rprov_log(fmt::format("probe {}: round {} -> {}/{} ports up",
                              target.host, result.rounds, up, latest.size()));
        if (cb) cb(fmt::format("round {}: {}/{} ports reachable", result.rounds, up, latest.size()));

        if (up == latest.size()) {
            result.all_ready = true;
            return finish();
        }

        auto now = timing_.now();
        if (now >= deadline) {
            result.timed_out = true;
            return finish();
        }

        auto remaining = std::chrono::duration_cast<Millis>(deadline - now);
        auto delay = std::min(remaining, backoff_delay(attempt, settings.probe_base_delay,
                                                       settings.probe_backoff_cap,
                                                       settings.probe_jitter, rng_));
        if (!timing_.sleep(delay, cancel)) {
            result.cancelled = true;
            return finish();
        }
        if (timing_.now() >= deadline) {
            result.timed_out = true;
            return finish();
        }
    }
}
