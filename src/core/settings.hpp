#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <cstdint>
#include "types.hpp"

// Per-run tuning. Constructed once (preset + overrides), validated, then
// passed by const reference to every component. There is no process-wide
// settings object.
struct Settings {
    std::string preset;                 // name of the preset it was built from

    Millis timeout{0};                  // budget for one request attempt
    Millis connect_timeout{0};
    Millis read_timeout{0};
    int retries = 0;                    // extra attempts after the first
    Millis retry_delay{0};              // fixed delay between transport attempts
    Millis max_service_wait{0};
    int max_concurrency = 1;            // simultaneous in-flight probes

    // Probe round backoff: min(base * 2^attempt, cap), jittered ±probe_jitter
    Millis probe_base_delay{0};
    Millis probe_backoff_cap{0};
    double probe_jitter = 0.0;

    int64_t max_payload_bytes = 0;      // uncompressed ceiling
    std::chrono::seconds credential_ttl{0};
    int auth_retries = 0;               // extra attempts on a rejected login

    Result<void> validate() const;

    static Settings aggressive();
    static Settings conservative();
};

// Individual field overrides layered on top of a preset. Config file and
// command line each produce one of these.
struct SettingsOverrides {
    std::optional<Millis> timeout;
    std::optional<Millis> connect_timeout;
    std::optional<Millis> read_timeout;
    std::optional<int> retries;
    std::optional<Millis> retry_delay;
    std::optional<Millis> max_service_wait;
    std::optional<int> max_concurrency;
    std::optional<Millis> probe_base_delay;
    std::optional<Millis> probe_backoff_cap;
    std::optional<double> probe_jitter;
    std::optional<int64_t> max_payload_bytes;
    std::optional<std::chrono::seconds> credential_ttl;
    std::optional<int> auth_retries;

    // Fields set in `other` win.
    void merge(const SettingsOverrides& other);
    void apply_to(Settings& s) const;
};

// Look up a preset by name ("aggressive"/"v1", "conservative"/"v2").
Result<Settings> preset_settings(const std::string& name);

// Preset + overrides, validated.
Result<Settings> make_settings(const std::string& preset,
                               const SettingsOverrides& overrides = {});

// Parse "1.5", "250ms", "2s", "1m" into milliseconds.
Result<Millis> parse_duration(const std::string& text);
