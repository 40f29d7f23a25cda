#include "integrity_verifier.hpp"
#include <openssl/evp.h>
#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <vector>

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string to_hex(const unsigned char* data, unsigned int len) {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out(static_cast<std::size_t>(len) * 2, '0');
    for (unsigned int i = 0; i < len; ++i) {
        out[2 * i]     = hex[(data[i] >> 4) & 0xF];
        out[2 * i + 1] = hex[data[i] & 0xF];
    }
    return out;
}

} // namespace

IntegrityVerifier::IntegrityVerifier(std::size_t chunk_size_bytes)
    : chunk_size_bytes_(chunk_size_bytes > 0 ? chunk_size_bytes : 1) {}

Result<std::string> IntegrityVerifier::digest(const fs::path& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err(ErrorKind::IoFailure,
            fmt::format("Cannot open {} for hashing", path.string()));
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Result<std::string>::Err(ErrorKind::IoFailure, "SHA-256 context setup failed");
    }

    std::vector<char> buf(chunk_size_bytes_);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = in.gcount();
        if (n <= 0) break;
        if (EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<std::size_t>(n)) != 1) {
            return Result<std::string>::Err(ErrorKind::IoFailure, "SHA-256 update failed");
        }
    }
    if (in.bad()) {
        return Result<std::string>::Err(ErrorKind::IoFailure,
            fmt::format("Read failed while hashing {}", path.string()));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &len) != 1) {
        return Result<std::string>::Err(ErrorKind::IoFailure, "SHA-256 finalize failed");
    }
    return Result<std::string>::Ok(to_hex(hash, len));
}

Result<bool> IntegrityVerifier::verify(const fs::path& src, const fs::path& dest) const {
    auto src_hash = digest(src);
    if (src_hash.is_err()) return Result<bool>::Err(src_hash);

    auto dest_hash = digest(dest);
    if (dest_hash.is_err()) return Result<bool>::Err(dest_hash);

    return Result<bool>::Ok(src_hash.value == dest_hash.value);
}
