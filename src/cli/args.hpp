#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <core/settings.hpp>
#include <core/types.hpp>

enum class Verbosity { Quiet, Normal, Verbose };

struct CliOptions {
    std::string command;                    // run | probe | cache
    std::vector<std::string> positional;    // e.g. cache subcommand and host
    std::vector<std::string> targets;

    std::optional<std::string> preset;
    SettingsOverrides overrides;
    std::optional<std::vector<int>> ports;

    std::optional<std::string> user;
    std::optional<std::string> password;
    std::optional<std::string> account;
    std::optional<std::string> token;

    std::optional<std::filesystem::path> payload_dir;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> cache_path;

    bool no_post = false;
    Verbosity verbosity = Verbosity::Normal;
    bool help = false;
    bool version = false;
};

// argv without the program name. Fails on unknown flags, missing values
// and malformed numbers; range checks are left to Settings::validate().
Result<CliOptions> parse_args(const std::vector<std::string>& args);
