#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <vector>
#include "settings.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

// Contents of ~/.rprov/config.yaml (or --config). Every key is optional;
// command-line flags are layered on top by the CLI.
class Config {
public:
    // Load from an explicit path. A missing file is an error.
    static Result<Config> load(const fs::path& path);

    // Load ~/.rprov/config.yaml if present, defaults otherwise.
    static Result<Config> load_default();

    // Parse YAML text; `origin` names the source in error messages.
    static Result<Config> parse(const std::string& text, const std::string& origin = "config");

    // Accessors
    const std::string& preset() const { return preset_; }
    const SettingsOverrides& overrides() const { return overrides_; }
    const std::vector<int>& ports() const { return ports_; }
    const std::string& user() const { return user_; }
    const std::string& password() const { return password_; }
    const EndpointConfig& endpoint() const { return endpoint_; }
    const std::optional<fs::path>& payload_dir() const { return payload_dir_; }
    const std::optional<fs::path>& cache_file() const { return cache_file_; }
    const PostInstallConfig& post_install() const { return post_install_; }

    Config() = default;

private:
    std::string preset_;
    SettingsOverrides overrides_;
    std::vector<int> ports_;
    std::string user_;
    std::string password_;
    EndpointConfig endpoint_;
    std::optional<fs::path> payload_dir_;
    std::optional<fs::path> cache_file_;
    PostInstallConfig post_install_;
};

fs::path get_config_path();
