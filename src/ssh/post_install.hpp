#pragma once

#include <string>
#include <vector>
#include <core/settings.hpp>
#include <core/types.hpp>
#include "remote_shell.hpp"

struct CommandReport {
    std::string command;
    int attempts = 0;
    int exit_code = -1;
    Millis elapsed{0};
    std::string output;

    bool ok() const { return exit_code == 0; }
};

struct PostInstallReport {
    bool connected = false;
    std::string error;                 // connect failure, if any
    std::vector<CommandReport> commands;

    bool ok() const;
};

// Connect (retried per Settings::retries / retry_delay), then run every
// command in order, retrying each one that exits non-zero. A failing
// command does not stop the ones after it.
PostInstallReport run_post_install(CommandRunner& runner, const PostInstallConfig& config,
                                   const Settings& settings, StatusCallback callback = nullptr);
