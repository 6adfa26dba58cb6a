#include "payload_source.hpp"
#include <core/errors.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

DirectoryPayloadSource::DirectoryPayloadSource(fs::path dir, int64_t max_bytes)
    : dir_(std::move(dir)), max_bytes_(max_bytes) {}

PayloadFiles DirectoryPayloadSource::load() {
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        throw BuildError(fmt::format("payload directory {} not found", dir_.string()));
    }

    PayloadFiles files;
    int64_t total = 0;
    fs::recursive_directory_iterator it(dir_, ec), end;
    if (ec) throw BuildError(fmt::format("cannot read {}: {}", dir_.string(), ec.message()));

    for (; it != end; it.increment(ec)) {
        if (ec) throw BuildError(fmt::format("cannot read {}: {}", dir_.string(), ec.message()));
        if (!it->is_regular_file(ec)) continue;

        auto size = it->file_size(ec);
        if (ec) throw BuildError(fmt::format("cannot stat {}: {}", it->path().string(), ec.message()));
        total += static_cast<int64_t>(size);
        if (total > max_bytes_) {
            throw BuildError(fmt::format("payload exceeds {} bytes uncompressed", max_bytes_));
        }

        std::ifstream in(it->path(), std::ios::binary);
        if (!in) throw BuildError(fmt::format("cannot open {}", it->path().string()));
        std::ostringstream buf;
        buf << in.rdbuf();

        auto rel = fs::relative(it->path(), dir_, ec);
        if (ec) throw BuildError(fmt::format("cannot resolve {}", it->path().string()));
        files[rel.generic_string()] = buf.str();
    }
    return files;
}
