#include "payload_builder.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/archive.hpp>

PayloadBuilder::PayloadBuilder(int64_t max_payload_bytes)
    : max_payload_bytes_(max_payload_bytes) {}

Result<std::string> PayloadBuilder::normalize_name(const std::string& name) {
    std::string s = name;
    for (auto& c : s) {
        if (c == '\\') c = '/';
    }

    std::string out;
    size_t pos = 0;
    while (pos <= s.size()) {
        size_t slash = s.find('/', pos);
        if (slash == std::string::npos) slash = s.size();
        std::string seg = s.substr(pos, slash - pos);
        pos = slash + 1;

        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            return Result<std::string>::Err(fmt::format("'{}' escapes the archive root", name));
        }
        if (!out.empty()) out += '/';
        out += seg;
    }

    if (out.empty()) {
        return Result<std::string>::Err(fmt::format("'{}' is not a valid entry name", name));
    }
    return Result<std::string>::Ok(out);
}

int PayloadBuilder::entry_mode(const std::string& normalized_name) {
    const std::string ext = ".sh";
    bool script = normalized_name.size() >= ext.size() &&
                  normalized_name.compare(normalized_name.size() - ext.size(), ext.size(), ext) == 0;
    return script ? 0755 : 0644;
}

std::string PayloadBuilder::build(const PayloadFiles& files) const {
    if (files.empty()) throw BuildError("payload is empty");

    // std::map keeps entries sorted by normalized name
    std::map<std::string, const std::string*> entries;
    std::map<std::string, std::string> origin;
    int64_t total = 0;

    for (const auto& [name, data] : files) {
        auto norm = normalize_name(name);
        if (norm.is_err()) throw BuildError("invalid payload entry: " + norm.error);

        auto [it, inserted] = entries.emplace(norm.value, &data);
        if (!inserted) {
            throw BuildError(fmt::format("payload entries '{}' and '{}' both map to '{}'",
                                         origin[norm.value], name, norm.value));
        }
        origin[norm.value] = name;

        total += static_cast<int64_t>(data.size());
        if (total > max_payload_bytes_) {
            throw BuildError(fmt::format("payload exceeds {} bytes uncompressed", max_payload_bytes_));
        }
    }

    std::vector<platform::TarEntry> tar;
    tar.reserve(entries.size());
    for (const auto& [name, data] : entries) {
        tar.push_back({name, *data, entry_mode(name)});
    }

    std::string artifact;
    try {
        artifact = platform::create_tar_gz(tar, PAYLOAD_ENTRY_MTIME);
    } catch (const std::runtime_error& e) {
        throw BuildError(e.what());
    }

    rprov_log(fmt::format("payload: {} entries, {} bytes -> {} bytes gzip",
                          tar.size(), total, artifact.size()));
    return artifact;
}
