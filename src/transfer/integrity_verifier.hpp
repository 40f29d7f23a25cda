#pragma once

#include <string>
#include <filesystem>
#include <cstddef>
#include <core/types.hpp>

namespace fs = std::filesystem;

// SHA-256 comparison of a source and its copy, streamed in the same chunk
// size as the copy.
class IntegrityVerifier {
public:
    explicit IntegrityVerifier(std::size_t chunk_size_bytes);

    // Lowercase hex SHA-256 of the file. IoFailure if it cannot be read.
    Result<std::string> digest(const fs::path& path) const;

    // true when digests match. A mismatch is a value, not an error.
    Result<bool> verify(const fs::path& src, const fs::path& dest) const;

private:
    std::size_t chunk_size_bytes_;
};
