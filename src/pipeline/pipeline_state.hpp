#pragma once

#include <string>
#include <vector>
#include <core/errors.hpp>
#include <core/types.hpp>

enum class PipelineState {
    Idle,
    Authenticating,
    BuildingPayload,
    Delivering,
    WaitingForServices,
    Succeeded,
    Failed,
};

const char* pipeline_state_name(PipelineState state);

inline bool is_terminal(PipelineState state) {
    return state == PipelineState::Succeeded || state == PipelineState::Failed;
}

struct RunOutcome {
    PipelineState state = PipelineState::Idle;
    PipelineState failed_in = PipelineState::Idle;   // meaningful when Failed
    Millis elapsed{0};
    std::vector<ProbeResult> ports;                  // sorted by port
    ErrorKind error_kind = ErrorKind::None;
    std::vector<std::string> causes;                 // outermost first
    bool used_cached_token = false;
    int probe_rounds = 0;

    bool succeeded() const { return state == PipelineState::Succeeded; }

    // "deliver: POST /api/provision: 3 attempt(s) failed: ..."
    std::string cause_chain() const;
};
