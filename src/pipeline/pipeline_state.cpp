#include "pipeline_state.hpp"

const char* pipeline_state_name(PipelineState state) {
    switch (state) {
        case PipelineState::Idle:               return "Idle";
        case PipelineState::Authenticating:     return "Authenticating";
        case PipelineState::BuildingPayload:    return "BuildingPayload";
        case PipelineState::Delivering:         return "Delivering";
        case PipelineState::WaitingForServices: return "WaitingForServices";
        case PipelineState::Succeeded:          return "Succeeded";
        case PipelineState::Failed:             return "Failed";
    }
    return "Unknown";
}

std::string RunOutcome::cause_chain() const {
    std::string out;
    for (const auto& c : causes) {
        if (!out.empty()) out += ": ";
        out += c;
    }
    return out;
}
