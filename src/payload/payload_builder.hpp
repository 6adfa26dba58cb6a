#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <core/types.hpp>

// name -> file contents, as supplied by a PayloadSource
using PayloadFiles = std::map<std::string, std::string>;

// Assembles the delivery artifact: a deterministic .tar.gz held in memory.
class PayloadBuilder {
public:
    explicit PayloadBuilder(int64_t max_payload_bytes);

    // Throws BuildError on empty input, an invalid or colliding name, or when
    // the uncompressed total exceeds the ceiling.
    std::string build(const PayloadFiles& files) const;

    // "./a\\b//c" -> "a/b/c". Rejects empty names and ".." segments.
    static Result<std::string> normalize_name(const std::string& name);

    // 0755 for shell scripts, 0644 otherwise
    static int entry_mode(const std::string& normalized_name);

private:
    int64_t max_payload_bytes_;
};
