#pragma once

#include <core/errors.hpp>
#include <pipeline/pipeline_state.hpp>

constexpr int EXIT_OK         = 0;
constexpr int EXIT_USAGE      = 1;   // bad flags, config or settings
constexpr int EXIT_AUTH       = 2;
constexpr int EXIT_TRANSPORT  = 3;
constexpr int EXIT_BUILD      = 4;
constexpr int EXIT_TIMEOUT    = 5;
constexpr int EXIT_CANCELLED  = 6;
constexpr int EXIT_INTERNAL   = 7;

inline int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:      return EXIT_OK;
        case ErrorKind::Auth:      return EXIT_AUTH;
        case ErrorKind::Transport: return EXIT_TRANSPORT;
        case ErrorKind::Build:     return EXIT_BUILD;
        case ErrorKind::Timeout:   return EXIT_TIMEOUT;
        case ErrorKind::Cancelled: return EXIT_CANCELLED;
        case ErrorKind::Cache:     return EXIT_USAGE;
        case ErrorKind::Internal:  return EXIT_INTERNAL;
    }
    return EXIT_USAGE;
}

inline int exit_code_for(const RunOutcome& outcome) {
    return outcome.succeeded() ? EXIT_OK : exit_code_for(outcome.error_kind);
}
