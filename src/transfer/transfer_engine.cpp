#include "transfer_engine.hpp"
#include <fmt/format.h>
#include <fstream>
#include <vector>
#include <cerrno>
#include <cstring>

TransferEngine::TransferEngine(std::size_t chunk_size_bytes)
    : chunk_size_bytes_(chunk_size_bytes > 0 ? chunk_size_bytes : 1) {}

static std::string errno_text() {
    return errno ? std::strerror(errno) : "unknown error";
}

Result<uint64_t> TransferEngine::copy(const fs::path& src, const fs::path& dest,
                                      const ChunkCallback& on_chunk) {
    std::error_code same_ec;
    if (fs::exists(dest, same_ec) && fs::equivalent(src, dest, same_ec)) {
        return Result<uint64_t>::Err(ErrorKind::InvalidInput,
            fmt::format("Source and destination are the same file: {}", src.string()));
    }

    if (dest.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(dest.parent_path(), ec);
        if (ec) {
            return Result<uint64_t>::Err(ErrorKind::IoFailure,
                fmt::format("Cannot create {}: {}", dest.parent_path().string(), ec.message()));
        }
    }

    errno = 0;
    std::ifstream in(src, std::ios::binary);
    if (!in) {
        return Result<uint64_t>::Err(ErrorKind::IoFailure,
            fmt::format("Cannot open {}: {}", src.string(), errno_text()));
    }

    errno = 0;
    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<uint64_t>::Err(ErrorKind::IoFailure,
            fmt::format("Cannot create {}: {}", dest.string(), errno_text()));
    }

    std::vector<char> buffer(chunk_size_bytes_);
    uint64_t total = 0;

    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = in.gcount();
        if (n <= 0) break;

        out.write(buffer.data(), n);
        if (!out) {
            return Result<uint64_t>::Err(ErrorKind::IoFailure,
                fmt::format("Write failed on {} after {} bytes", dest.string(), total));
        }
        total += static_cast<uint64_t>(n);
        if (on_chunk) on_chunk(static_cast<uint64_t>(n));
    }

    if (in.bad()) {
        return Result<uint64_t>::Err(ErrorKind::IoFailure,
            fmt::format("Read failed on {} after {} bytes", src.string(), total));
    }

    out.flush();
    out.close();
    if (out.fail()) {
        return Result<uint64_t>::Err(ErrorKind::IoFailure,
            fmt::format("Failed to flush {}", dest.string()));
    }

    return Result<uint64_t>::Ok(total);
}
