#include "settings.hpp"
#include "constants.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cmath>

// ── Presets ─────────────────────────────────────────────────

Settings Settings::aggressive() {
    Settings s;
    s.preset = "aggressive";
    s.timeout = Millis(AGGRESSIVE_TIMEOUT_MS);
    s.connect_timeout = Millis(AGGRESSIVE_TIMEOUT_MS);
    s.read_timeout = Millis(AGGRESSIVE_TIMEOUT_MS);
    s.retries = AGGRESSIVE_RETRIES;
    s.retry_delay = Millis(AGGRESSIVE_RETRY_DELAY_MS);
    s.max_service_wait = Millis(AGGRESSIVE_MAX_WAIT_MS);
    s.max_concurrency = AGGRESSIVE_CONCURRENCY;
    s.probe_base_delay = Millis(PROBE_BASE_DELAY_MS);
    s.probe_backoff_cap = Millis(PROBE_BACKOFF_CAP_MS);
    s.probe_jitter = PROBE_JITTER;
    s.max_payload_bytes = MAX_PAYLOAD_BYTES;
    s.credential_ttl = std::chrono::seconds(CREDENTIAL_TTL_SECS);
    s.auth_retries = 0;
    return s;
}

Settings Settings::conservative() {
    Settings s = aggressive();
    s.preset = "conservative";
    s.timeout = Millis(CONSERVATIVE_TIMEOUT_MS);
    s.connect_timeout = Millis(CONSERVATIVE_TIMEOUT_MS);
    s.read_timeout = Millis(CONSERVATIVE_TIMEOUT_MS);
    s.retries = CONSERVATIVE_RETRIES;
    s.retry_delay = Millis(CONSERVATIVE_RETRY_DELAY_MS);
    s.max_service_wait = Millis(CONSERVATIVE_MAX_WAIT_MS);
    s.max_concurrency = CONSERVATIVE_CONCURRENCY;
    s.auth_retries = 1;
    return s;
}

Result<Settings> preset_settings(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (n == "aggressive" || n == "v1" || n.empty()) {
        return Result<Settings>::Ok(Settings::aggressive());
    }
    if (n == "conservative" || n == "v2") {
        return Result<Settings>::Ok(Settings::conservative());
    }
    return Result<Settings>::Err(fmt::format(
        "Unknown preset '{}' (expected aggressive or conservative)", name));
}

// ── Validation ──────────────────────────────────────────────

Result<void> Settings::validate() const {
    auto in_range = [](const char* field, Millis v) -> Result<void> {
        if (v.count() <= 0) {
            return Result<void>::Err(fmt::format("{} must be > 0 (got {}ms)", field, v.count()));
        }
        if (v.count() > MAX_DURATION_MS) {
            return Result<void>::Err(fmt::format("{} must be <= {}ms (got {}ms)",
                                                 field, MAX_DURATION_MS, v.count()));
        }
        return Result<void>::Ok();
    };

    const std::pair<const char*, Millis> durations[] = {
        {"timeout", timeout},
        {"connect_timeout", connect_timeout},
        {"read_timeout", read_timeout},
        {"retry_delay", retry_delay},
        {"max_service_wait", max_service_wait},
        {"probe_base_delay", probe_base_delay},
        {"probe_backoff_cap", probe_backoff_cap},
    };
    for (const auto& [field, value] : durations) {
        auto r = in_range(field, value);
        if (r.is_err()) return r;
    }

    if (retries < 0) {
        return Result<void>::Err(fmt::format("retries must be >= 0 (got {})", retries));
    }
    if (auth_retries < 0) {
        return Result<void>::Err(fmt::format("auth_retries must be >= 0 (got {})", auth_retries));
    }
    if (max_concurrency < 1) {
        return Result<void>::Err(fmt::format("max_concurrency must be >= 1 (got {})", max_concurrency));
    }
    if (!(probe_jitter >= 0.0 && probe_jitter < 1.0)) {
        return Result<void>::Err(fmt::format("probe_jitter must be in [0, 1) (got {})", probe_jitter));
    }
    if (max_payload_bytes <= 0) {
        return Result<void>::Err("max_payload_bytes must be > 0");
    }
    if (credential_ttl.count() <= 0) {
        return Result<void>::Err("credential_ttl must be > 0");
    }
    if (credential_ttl.count() > MAX_CREDENTIAL_TTL_SECS) {
        return Result<void>::Err(fmt::format("credential_ttl must be <= {}s (got {}s)",
                                             MAX_CREDENTIAL_TTL_SECS, credential_ttl.count()));
    }
    return Result<void>::Ok();
}

// ── Overrides ───────────────────────────────────────────────

void SettingsOverrides::merge(const SettingsOverrides& o) {
    if (o.timeout) timeout = o.timeout;
    if (o.connect_timeout) connect_timeout = o.connect_timeout;
    if (o.read_timeout) read_timeout = o.read_timeout;
    if (o.retries) retries = o.retries;
    if (o.retry_delay) retry_delay = o.retry_delay;
    if (o.max_service_wait) max_service_wait = o.max_service_wait;
    if (o.max_concurrency) max_concurrency = o.max_concurrency;
    if (o.probe_base_delay) probe_base_delay = o.probe_base_delay;
    if (o.probe_backoff_cap) probe_backoff_cap = o.probe_backoff_cap;
    if (o.probe_jitter) probe_jitter = o.probe_jitter;
    if (o.max_payload_bytes) max_payload_bytes = o.max_payload_bytes;
    if (o.credential_ttl) credential_ttl = o.credential_ttl;
    if (o.auth_retries) auth_retries = o.auth_retries;
}

void SettingsOverrides::apply_to(Settings& s) const {
    if (timeout) s.timeout = *timeout;
    if (connect_timeout) s.connect_timeout = *connect_timeout;
    if (read_timeout) s.read_timeout = *read_timeout;
    if (retries) s.retries = *retries;
    if (retry_delay) s.retry_delay = *retry_delay;
    if (max_service_wait) s.max_service_wait = *max_service_wait;
    if (max_concurrency) s.max_concurrency = *max_concurrency;
    if (probe_base_delay) s.probe_base_delay = *probe_base_delay;
    if (probe_backoff_cap) s.probe_backoff_cap = *probe_backoff_cap;
    if (probe_jitter) s.probe_jitter = *probe_jitter;
    if (max_payload_bytes) s.max_payload_bytes = *max_payload_bytes;
    if (credential_ttl) s.credential_ttl = *credential_ttl;
    if (auth_retries) s.auth_retries = *auth_retries;
}

Result<Settings> make_settings(const std::string& preset,
                               const SettingsOverrides& overrides) {
    auto base = preset_settings(preset);
    if (base.is_err()) return base;

    Settings s = base.value;
    overrides.apply_to(s);

    auto valid = s.validate();
    if (valid.is_err()) {
        return Result<Settings>::Err("Invalid settings: " + valid.error);
    }
    return Result<Settings>::Ok(s);
}

// ── Duration parsing ────────────────────────────────────────
// Bare numbers are seconds (matches the --timeout 0.5 style of the CLI).

Result<Millis> parse_duration(const std::string& text) {
    if (text.empty()) return Result<Millis>::Err("empty duration");

    size_t idx = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &idx);
    } catch (const std::exception&) {
        return Result<Millis>::Err(fmt::format("invalid duration '{}'", text));
    }

    std::string unit = text.substr(idx);
    double ms;
    if (unit.empty() || unit == "s") {
        ms = value * 1000.0;
    } else if (unit == "ms") {
        ms = value;
    } else if (unit == "m") {
        ms = value * 60000.0;
    } else {
        return Result<Millis>::Err(fmt::format("invalid duration unit in '{}'", text));
    }

    if (!std::isfinite(ms) || ms < 0.0) {
        return Result<Millis>::Err(fmt::format("invalid duration '{}'", text));
    }
    // Longest accepted value is the credential TTL ceiling; timings are
    // narrowed further by Settings::validate
    if (ms > static_cast<double>(MAX_CREDENTIAL_TTL_SECS) * 1000.0) {
        return Result<Millis>::Err(fmt::format("duration '{}' is too large", text));
    }
    return Result<Millis>::Ok(Millis(static_cast<int64_t>(std::llround(ms))));
}
