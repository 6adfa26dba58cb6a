#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/errors.hpp>

namespace fs = std::filesystem;

struct CachedCredential {
    std::string identity;
    std::string token;
    std::chrono::system_clock::time_point issued_at;
    std::chrono::seconds ttl{0};

    bool valid_at(std::chrono::system_clock::time_point now) const {
        return now < issued_at + ttl;
    }
};

// Device tokens persisted across runs in a YAML file keyed by target
// identity. One instance may be shared by concurrent runs; every
// read-modify-write holds the store mutex.
//
// A damaged file never fails a run: it reads as empty (or minus the bad
// entries) and the problem goes to the warning callback and the debug log.
// The callback runs after the store mutex is released and may use the cache.
class CredentialCache {
public:
    using Clock = std::chrono::system_clock;
    using NowFn = std::function<Clock::time_point()>;
    using WarningCallback = std::function<void(const CacheError&)>;

    explicit CredentialCache(fs::path path, NowFn now = nullptr);

    // ~/.rprov/credentials.yaml
    static fs::path default_path();

    // Unexpired credential for `identity`, if any
    std::optional<CachedCredential> get(const std::string& identity);
    void put(const std::string& identity, const std::string& token, std::chrono::seconds ttl);
    void invalidate(const std::string& identity);

    // Every stored entry, expired ones included
    std::vector<CachedCredential> list();
    // Drop everything; returns how many entries were removed
    size_t clear();

    void set_warning_callback(WarningCallback cb);
    const fs::path& path() const { return path_; }

private:
    using Entries = std::map<std::string, CachedCredential>;
    using Warnings = std::vector<std::string>;

    fs::path path_;
    NowFn now_;
    WarningCallback on_warning_;
    std::mutex mutex_;

    // Under mutex_; problems are appended to `warnings`
    Entries load_locked(Warnings& warnings);
    void save_locked(const Entries& entries, Warnings& warnings);
    void note(Warnings& warnings, const std::string& msg);
    // Without mutex_ held
    void report(const Warnings& warnings);
};
