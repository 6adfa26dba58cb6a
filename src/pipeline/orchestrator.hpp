#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <core/cancel.hpp>
#include <core/settings.hpp>
#include <core/types.hpp>
#include <managers/credential_cache.hpp>
#include <payload/payload_source.hpp>
#include <probe/service_prober.hpp>
#include "device_endpoint.hpp"
#include "pipeline_state.hpp"
#include "progress.hpp"

// Collaborators of one run. The cache, endpoint and prober may be shared
// with other Orchestrator instances.
struct PipelineDeps {
    std::shared_ptr<CredentialCache> cache;
    std::shared_ptr<DeviceEndpoint> endpoint;
    std::shared_ptr<PayloadSource> payload;
    std::shared_ptr<ServiceProber> prober;
};

// Drives one provisioning run:
//
//   Idle -> Authenticating -> BuildingPayload -> Delivering
//        -> WaitingForServices -> Succeeded
//
// Any stage may end in Failed. An instance runs at most once.
class Orchestrator {
public:
    Orchestrator(Target target, Settings settings, PipelineDeps deps,
                 ProgressObserver* observer = nullptr);

    // Blocks until a terminal state. Pipeline failures are reported in the
    // outcome, not thrown. Throws std::logic_error if called twice.
    RunOutcome run();

    // Thread-safe. Takes effect at the next checkpoint.
    void cancel();

    PipelineState state() const { return state_.load(); }
    const Target& target() const { return target_; }

private:
    using Clock = std::chrono::steady_clock;

    Target target_;
    Settings settings_;
    PipelineDeps deps_;
    ProgressObserver* observer_;
    CancelToken cancel_;
    std::atomic<PipelineState> state_{PipelineState::Idle};
    std::atomic<bool> started_{false};
    Clock::time_point start_;
    RunOutcome outcome_;

    void transition(PipelineState next, const std::string& message);
    void status(const std::string& message);
    Millis elapsed() const;

    void checkpoint();
    std::string authenticate();
    std::string build_payload();
    void deliver(const std::string& token, const std::string& artifact);
    void wait_for_services();

    RunOutcome fail(ErrorKind kind, const std::string& stage, const std::string& cause);
};
