#include "orchestrator.hpp"
#include <core/log.hpp>
#include <payload/payload_builder.hpp>
#include <algorithm>
#include <stdexcept>

static const char* stage_label(PipelineState s) {
    switch (s) {
        case PipelineState::Authenticating:     return "authenticate";
        case PipelineState::BuildingPayload:    return "build";
        case PipelineState::Delivering:         return "deliver";
        case PipelineState::WaitingForServices: return "wait";
        default:                                return pipeline_state_name(s);
    }
}

static std::string join_ports(const std::vector<int>& ports) {
    std::string out;
    for (int p : ports) {
        if (!out.empty()) out += ",";
        out += std::to_string(p);
    }
    return out.empty() ? "none" : out;
}

Orchestrator::Orchestrator(Target target, Settings settings, PipelineDeps deps,
                           ProgressObserver* observer)
    : target_(std::move(target)), settings_(std::move(settings)),
      deps_(std::move(deps)), observer_(observer) {
    if (!deps_.cache || !deps_.endpoint || !deps_.payload || !deps_.prober) {
        throw std::invalid_argument("Orchestrator: every pipeline dependency is required");
    }
}

// ── Progress ────────────────────────────────────────────────

Millis Orchestrator::elapsed() const {
    return std::chrono::duration_cast<Millis>(Clock::now() - start_);
}

void Orchestrator::transition(PipelineState next, const std::string& message) {
    PipelineState prev = state_.exchange(next);
    rprov_log(fmt::format("run {}: {} -> {} ({})", target_.identity(),
                          pipeline_state_name(prev), pipeline_state_name(next), message));
    if (observer_) observer_->on_transition({target_.identity(), next, elapsed(), message});
}

void Orchestrator::status(const std::string& message) {
    rprov_log(fmt::format("run {}: {}", target_.identity(), message));
    if (observer_) observer_->on_status({target_.identity(), state_.load(), elapsed(), message});
}

void Orchestrator::cancel() {
    cancel_.cancel();
}

void Orchestrator::checkpoint() {
    if (cancel_.cancelled()) {
        throw ProvisionError(ErrorKind::Cancelled, "cancelled");
    }
}

// ── Stages ──────────────────────────────────────────────────

std::string Orchestrator::authenticate() {
    const std::string identity = target_.identity();

    if (auto cached = deps_.cache->get(identity)) {
        outcome_.used_cached_token = true;
        status("using cached token");
        return cached->token;
    }

    if (!target_.credentials) {
        throw AuthError("no cached token and no credentials for " + identity);
    }

    const int attempts = settings_.auth_retries + 1;
    std::string last;
    for (int i = 0; i < attempts; i++) {
        checkpoint();
        try {
            std::string token = deps_.endpoint->authenticate(*target_.credentials);
            deps_.cache->put(identity, token, settings_.credential_ttl);
            status("authenticated, token cached");
            return token;
        } catch (const AuthError& e) {
            last = e.what();
            if (i + 1 < attempts) {
                status(fmt::format("login rejected ({}), retrying", last));
                if (!cancel_.sleep_for(settings_.retry_delay)) {
                    throw ProvisionError(ErrorKind::Cancelled, "cancelled");
                }
            }
        }
    }
    throw AuthError(fmt::format("{} attempt(s) rejected: {}", attempts, last));
}

std::string Orchestrator::build_payload() {
    PayloadBuilder builder(settings_.max_payload_bytes);
    auto artifact = builder.build(deps_.payload->load());
    status(fmt::format("artifact ready ({} bytes)", artifact.size()));
    return artifact;
}

void Orchestrator::deliver(const std::string& token, const std::string& artifact) {
    try {
        deps_.endpoint->deliver_and_trigger(token, artifact);
    } catch (const AuthError&) {
        // The token is no good; make sure the next run logs in again
        deps_.cache->invalidate(target_.identity());
        throw;
    }
}

void Orchestrator::wait_for_services() {
    auto result = deps_.prober->wait_until_ready(
        target_, target_.ports, settings_, cancel_,
        [this](const std::string& msg) { status(msg); });

    outcome_.ports = result.ports;
    outcome_.probe_rounds = result.rounds;

    if (result.cancelled) {
        throw ProvisionError(ErrorKind::Cancelled, "cancelled while waiting for services");
    }
    if (!result.all_ready) {
        throw TimeoutError(fmt::format("ports {} not reachable within {}ms (reachable: {})",
                                       join_ports(result.unreachable_ports()),
                                       settings_.max_service_wait.count(),
                                       join_ports(result.reachable_ports())));
    }
}

// ── Run ─────────────────────────────────────────────────────

RunOutcome Orchestrator::fail(ErrorKind kind, const std::string& stage, const std::string& cause) {
    outcome_.failed_in = state_.load();
    outcome_.error_kind = kind;
    outcome_.causes = {stage, cause};
    outcome_.state = PipelineState::Failed;
    transition(PipelineState::Failed,
               fmt::format("{} in {}: {}", error_kind_name(kind),
                           pipeline_state_name(outcome_.failed_in), outcome_.cause_chain()));
    outcome_.elapsed = elapsed();
    return outcome_;
}

RunOutcome Orchestrator::run() {
    if (started_.exchange(true)) {
        throw std::logic_error("Orchestrator::run() called twice; create a new instance per run");
    }

    start_ = Clock::now();
    outcome_ = RunOutcome{};
    for (int port : target_.ports) {
        ProbeResult r;
        r.port = port;
        r.error = "not probed";
        outcome_.ports.push_back(r);
    }
    std::sort(outcome_.ports.begin(), outcome_.ports.end(),
              [](const ProbeResult& a, const ProbeResult& b) { return a.port < b.port; });

    try {
        transition(PipelineState::Authenticating, "start");
        checkpoint();
        std::string token = authenticate();

        checkpoint();
        transition(PipelineState::BuildingPayload,
                   outcome_.used_cached_token ? "cached credential valid" : "credential obtained");
        std::string artifact = build_payload();

        checkpoint();
        transition(PipelineState::Delivering, "artifact built");
        deliver(token, artifact);

        checkpoint();
        transition(PipelineState::WaitingForServices, "payload triggered");
        wait_for_services();
    } catch (const ProvisionError& e) {
        return fail(e.kind(), stage_label(state_.load()), e.what());
    } catch (const std::exception& e) {
        rprov_log(fmt::format("run {}: unexpected exception in {}: {}",
                              target_.identity(), stage_label(state_.load()), e.what()));
        return fail(ErrorKind::Internal, stage_label(state_.load()), e.what());
    }

    outcome_.state = PipelineState::Succeeded;
    transition(PipelineState::Succeeded, "all services reachable");
    outcome_.elapsed = elapsed();
    return outcome_;
}
