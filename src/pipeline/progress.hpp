#pragma once

#include <string>
#include <core/errors.hpp>
#include <core/types.hpp>
#include "pipeline_state.hpp"

struct ProgressEvent {
    std::string target;        // identity of the run's target
    PipelineState state;
    Millis elapsed{0};         // since run() started
    std::string message;
};

// Receives run progress. Called on the run's own thread.
class ProgressObserver {
public:
    virtual ~ProgressObserver() = default;

    // Every state transition
    virtual void on_transition(const ProgressEvent& event) = 0;

    // Detail inside a state (probe rounds, retries)
    virtual void on_status(const ProgressEvent&) {}

    // Recovered problems such as a damaged credential cache
    virtual void on_warning(const std::string& /*target*/, const std::string& /*message*/) {}
};
