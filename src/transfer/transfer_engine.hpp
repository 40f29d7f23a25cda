#pragma once

#include <string>
#include <functional>
#include <filesystem>
#include <cstdint>
#include <cstddef>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Streams one file to its destination in fixed-size chunks. Never holds
// more than one chunk in memory. On failure the destination may be left
// partially written; removing it is the caller's job.
class TransferEngine {
public:
    // Called after every chunk is written with the number of bytes in it.
    using ChunkCallback = std::function<void(uint64_t chunk_bytes)>;

    explicit TransferEngine(std::size_t chunk_size_bytes);
    virtual ~TransferEngine() = default;

    // Creates missing parent directories of dest. Returns bytes copied, or
    // IoFailure on any open/read/write error.
    virtual Result<uint64_t> copy(const fs::path& src, const fs::path& dest,
                                  const ChunkCallback& on_chunk = nullptr);

    std::size_t chunk_size_bytes() const { return chunk_size_bytes_; }

private:
    std::size_t chunk_size_bytes_;
};
