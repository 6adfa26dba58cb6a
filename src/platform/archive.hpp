#pragma once

#include <string>
#include <vector>

namespace platform {

struct TarEntry {
    std::string name;       // path inside the archive
    std::string data;
    int mode = 0644;
};

// Build a gzip-compressed ustar archive in memory. Entries are written in
// the order given with mtime, owner and group fixed, and the gzip header
// carries no timestamp, so identical input yields identical bytes.
// Throws std::runtime_error on libarchive failure.
std::string create_tar_gz(const std::vector<TarEntry>& entries, long mtime = 0);

} // namespace platform
