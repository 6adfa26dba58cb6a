#include "archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <stdexcept>

namespace platform {

static la_ssize_t append_to_string(struct archive*, void* client_data,
                                   const void* buffer, size_t length) {
    auto* out = static_cast<std::string*>(client_data);
    out->append(static_cast<const char*>(buffer), length);
    return static_cast<la_ssize_t>(length);
}

std::string create_tar_gz(const std::vector<TarEntry>& entries, long mtime) {
    std::string out;

    struct archive* a = archive_write_new();
    if (!a) throw std::runtime_error("Failed to create archive writer");

    auto fail = [&](const std::string& what) {
        const char* detail = archive_error_string(a);
        std::string err = what + (detail ? std::string(": ") + detail : std::string());
        archive_write_free(a);
        throw std::runtime_error(err);
    };

    if (archive_write_set_format_ustar(a) != ARCHIVE_OK) fail("Failed to select ustar format");
    if (archive_write_add_filter_gzip(a) != ARCHIVE_OK) fail("Failed to enable gzip");
    if (archive_write_set_options(a, "gzip:!timestamp") != ARCHIVE_OK) fail("Failed to drop gzip timestamp");

    if (archive_write_open(a, &out, nullptr, append_to_string, nullptr) != ARCHIVE_OK) {
        fail("Failed to open in-memory archive");
    }

    struct archive_entry* entry = archive_entry_new();
    for (const auto& e : entries) {
        archive_entry_clear(entry);
        archive_entry_set_pathname(entry, e.name.c_str());
        archive_entry_set_size(entry, static_cast<la_int64_t>(e.data.size()));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, static_cast<mode_t>(e.mode));
        archive_entry_set_mtime(entry, mtime, 0);
        archive_entry_set_uid(entry, 0);
        archive_entry_set_gid(entry, 0);
        archive_entry_set_uname(entry, "root");
        archive_entry_set_gname(entry, "root");

        if (archive_write_header(a, entry) != ARCHIVE_OK) {
            archive_entry_free(entry);
            fail("Failed to write header for " + e.name);
        }
        if (!e.data.empty() &&
            archive_write_data(a, e.data.data(), e.data.size()) != static_cast<la_ssize_t>(e.data.size())) {
            archive_entry_free(entry);
            fail("Failed to write data for " + e.name);
        }
    }
    archive_entry_free(entry);

    if (archive_write_close(a) != ARCHIVE_OK) fail("Failed to finish archive");
    archive_write_free(a);
    return out;
}

} // namespace platform
