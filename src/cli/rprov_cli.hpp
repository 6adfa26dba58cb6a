#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/settings.hpp>
#include <managers/credential_cache.hpp>
#include <pipeline/orchestrator.hpp>
#include "args.hpp"
#include "console_observer.hpp"

// Command dispatch for the rprov executable. Each method returns the
// process exit status.
class RprovCLI {
public:
    explicit RprovCLI(CliOptions opts);

    int run();

    // Exposed for tests: config + flags folded into the per-run values
    Result<Settings> resolve_settings() const;
    Result<Target> make_target(const std::string& host) const;

    Result<void> load_config();
    const Config& config() const { return config_; }

private:
    CliOptions opts_;
    Config config_;

    // Live runs, cancelled together on SIGINT
    std::mutex runs_mutex_;
    std::vector<Orchestrator*> runs_;

    int cmd_run();
    int cmd_probe();
    int cmd_cache();

    std::shared_ptr<CredentialCache> open_cache(ConsoleObserver* observer) const;
    int run_target(const std::string& host, const Settings& settings,
                   const std::shared_ptr<CredentialCache>& cache, ConsoleObserver& observer);

    void track(Orchestrator* o);
    void untrack(Orchestrator* o);
    void cancel_all();

    // Registered for SIGINT cancellation for exactly its own lifetime
    class TrackedRun {
    public:
        TrackedRun(RprovCLI& cli, Orchestrator* o) : cli_(cli), o_(o) { cli_.track(o_); }
        ~TrackedRun() { cli_.untrack(o_); }
        TrackedRun(const TrackedRun&) = delete;
        TrackedRun& operator=(const TrackedRun&) = delete;

    private:
        RprovCLI& cli_;
        Orchestrator* o_;
    };
};
