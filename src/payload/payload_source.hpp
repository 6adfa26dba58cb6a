#pragma once

#include <cstdint>
#include <filesystem>
#include "payload_builder.hpp"
#include <core/constants.hpp>

// Supplies the files that go into the artifact
class PayloadSource {
public:
    virtual ~PayloadSource() = default;
    virtual PayloadFiles load() = 0;
};

// Every regular file below a local directory, keyed by its relative path.
// Never writes to the directory. Throws BuildError if it cannot be read
// or if the files together exceed max_bytes (checked before reading each one).
class DirectoryPayloadSource : public PayloadSource {
public:
    explicit DirectoryPayloadSource(std::filesystem::path dir,
                                    int64_t max_bytes = MAX_PAYLOAD_BYTES);
    PayloadFiles load() override;

private:
    std::filesystem::path dir_;
    int64_t max_bytes_;
};

// Fixed set of files
class InMemoryPayloadSource : public PayloadSource {
public:
    explicit InMemoryPayloadSource(PayloadFiles files) : files_(std::move(files)) {}
    PayloadFiles load() override { return files_; }

private:
    PayloadFiles files_;
};
