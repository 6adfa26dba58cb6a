#include "credential_cache.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

CredentialCache::CredentialCache(fs::path path, NowFn now)
    : path_(std::move(path)), now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {}

fs::path CredentialCache::default_path() {
    return platform::rprov_home() / CACHE_FILE_NAME;
}

void CredentialCache::set_warning_callback(WarningCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_warning_ = std::move(cb);
}

void CredentialCache::note(Warnings& warnings, const std::string& msg) {
    rprov_log("credential_cache: " + msg);
    warnings.push_back(msg);
}

void CredentialCache::report(const Warnings& warnings) {
    if (warnings.empty()) return;
    WarningCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cb = on_warning_;
    }
    if (!cb) return;
    for (const auto& msg : warnings) cb(CacheError(msg));
}

// ── Persistence ─────────────────────────────────────────────

CredentialCache::Entries CredentialCache::load_locked(Warnings& warnings) {
    Entries entries;

    std::error_code ec;
    if (!fs::exists(path_, ec)) return entries;

    YAML::Node root;
    try {
        root = YAML::LoadFile(path_.string());
    } catch (const std::exception& e) {
        note(warnings, fmt::format("{} is unreadable, treating cache as empty ({})", path_.string(), e.what()));
        return entries;
    }

    if (root.IsNull()) return entries;
    if (!root.IsMap()) {
        note(warnings, fmt::format("{} is not a mapping, treating cache as empty", path_.string()));
        return entries;
    }

    for (const auto& kv : root) {
        std::string identity;
        try {
            identity = kv.first.as<std::string>();
            const YAML::Node& n = kv.second;
            if (!n.IsMap() || !n["token"] || !n["issued_at"] || !n["ttl"]) {
                throw YAML::Exception(YAML::Mark::null_mark(), "missing token, issued_at or ttl");
            }

            CachedCredential c;
            c.identity = identity;
            c.token = n["token"].as<std::string>();
            c.issued_at = Clock::time_point(std::chrono::seconds(n["issued_at"].as<int64_t>()));
            c.ttl = std::chrono::seconds(n["ttl"].as<int64_t>());
            if (c.token.empty() || c.ttl.count() <= 0) {
                throw YAML::Exception(YAML::Mark::null_mark(), "empty token or non-positive ttl");
            }
            entries[identity] = std::move(c);
        } catch (const YAML::Exception& e) {
            note(warnings, fmt::format("skipping malformed cache entry '{}': {}", identity, e.msg));
        }
    }
    return entries;
}

void CredentialCache::save_locked(const Entries& entries, Warnings& warnings) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [identity, c] : entries) {
        auto issued = std::chrono::duration_cast<std::chrono::seconds>(
            c.issued_at.time_since_epoch()).count();
        out << YAML::Key << identity << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "token" << YAML::Value << c.token;
        out << YAML::Key << "issued_at" << YAML::Value << static_cast<int64_t>(issued);
        out << YAML::Key << "ttl" << YAML::Value << static_cast<int64_t>(c.ttl.count());
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    std::error_code ec;
    if (path_.has_parent_path()) fs::create_directories(path_.parent_path(), ec);

    // Write beside the target, then rename over it
    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream fout(tmp, std::ios::trunc);
        if (!fout) {
            note(warnings, fmt::format("cannot write {}, token not persisted", tmp.string()));
            return;
        }
        fout << out.c_str() << "\n";
        if (!fout) {
            note(warnings, fmt::format("short write to {}, token not persisted", tmp.string()));
            return;
        }
    }

    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    fs::rename(tmp, path_, ec);
    if (ec) {
        note(warnings, fmt::format("cannot replace {}: {}", path_.string(), ec.message()));
        fs::remove(tmp, ec);
    }
}

// ── Operations ──────────────────────────────────────────────

std::optional<CachedCredential> CredentialCache::get(const std::string& identity) {
    Warnings warnings;
    std::optional<CachedCredential> found;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entries = load_locked(warnings);
        auto it = entries.find(identity);
        if (it != entries.end()) {
            if (it->second.valid_at(now_())) {
                found = it->second;
            } else {
                rprov_log("credential_cache: token for " + identity + " expired");
            }
        }
    }
    report(warnings);
    return found;
}

void CredentialCache::put(const std::string& identity, const std::string& token,
                          std::chrono::seconds ttl) {
    Warnings warnings;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entries = load_locked(warnings);

        // Expired entries are dropped whenever the file is rewritten
        auto now = now_();
        for (auto it = entries.begin(); it != entries.end();) {
            it = it->second.valid_at(now) ? std::next(it) : entries.erase(it);
        }

        CachedCredential c;
        c.identity = identity;
        c.token = token;
        c.issued_at = std::chrono::time_point_cast<std::chrono::seconds>(now);
        c.ttl = ttl;
        entries[identity] = std::move(c);
        save_locked(entries, warnings);
    }
    report(warnings);
}

void CredentialCache::invalidate(const std::string& identity) {
    Warnings warnings;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entries = load_locked(warnings);
        if (entries.erase(identity) > 0) {
            rprov_log("credential_cache: invalidated " + identity);
            save_locked(entries, warnings);
        }
    }
    report(warnings);
}

std::vector<CachedCredential> CredentialCache::list() {
    Warnings warnings;
    std::vector<CachedCredential> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [identity, c] : load_locked(warnings)) out.push_back(c);
    }
    report(warnings);
    return out;
}

size_t CredentialCache::clear() {
    Warnings warnings;
    size_t n = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        n = load_locked(warnings).size();
        save_locked({}, warnings);
    }
    report(warnings);
    return n;
}
