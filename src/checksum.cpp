#include "checksum.hpp"

#include <openssl/evp.h>
#include <zlib.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>

#include "log.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kReadBlockSize = 64 * 1024;

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

EvpMdCtxPtr make_digest(const EVP_MD* md, std::string& error) {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if(!ctx) {
        error = "EVP_MD_CTX_new failed";
        return nullptr;
    }
    if(EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        error = "EVP_DigestInit_ex failed";
        return nullptr;
    }
    return ctx;
}

std::optional<std::string> finish_digest(EVP_MD_CTX* ctx) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if(EVP_DigestFinal_ex(ctx, out, &out_len) != 1) return std::nullopt;
    return hex_from_bytes(out, out_len);
}

} // namespace

std::optional<Fingerprint> compute_fingerprint(const std::filesystem::path& file, std::string& error) {
    error.clear();
    std::ifstream in(file, std::ios::binary);
    if(!in) {
        error = std::string("cannot open: ") + std::strerror(errno);
        return std::nullopt;
    }

    auto md5 = make_digest(EVP_md5(), error);
    if(!md5) return std::nullopt;
    auto sha1 = make_digest(EVP_sha1(), error);
    if(!sha1) return std::nullopt;
    uLong crc = crc32(0L, Z_NULL, 0);
    uint64_t total = 0;

    std::array<char, kReadBlockSize> buffer{};
    while(in) {
        in.read(buffer.data(), buffer.size());
        std::streamsize read = in.gcount();
        if(read <= 0) continue;
        auto bytes = reinterpret_cast<const unsigned char*>(buffer.data());
        auto length = static_cast<size_t>(read);
        if(EVP_DigestUpdate(md5.get(), bytes, length) != 1 ||
           EVP_DigestUpdate(sha1.get(), bytes, length) != 1) {
            error = "EVP_DigestUpdate failed";
            return std::nullopt;
        }
        crc = crc32(crc, bytes, static_cast<uInt>(length));
        total += length;
    }
    if(in.bad()) {
        error = "read error";
        return std::nullopt;
    }

    Fingerprint fp;
    auto md5_hex = finish_digest(md5.get());
    auto sha1_hex = finish_digest(sha1.get());
    if(!md5_hex || !sha1_hex) {
        error = "EVP_DigestFinal_ex failed";
        return std::nullopt;
    }
    fp.md5 = std::move(*md5_hex);
    fp.sha1 = std::move(*sha1_hex);
    fp.crc32 = hex_from_u32(static_cast<uint32_t>(crc & 0xFFFFFFFFUL));
    fp.size = total;
    return fp;
}

Fingerprint fingerprint_file(const std::filesystem::path& file, Logger* logger) {
    std::string error;
    auto fp = compute_fingerprint(file, error);
    if(!fp) {
        log_error(logger, "Error calculating checksums for {}: {}", file.string(), error);
        return Fingerprint{};
    }
    return *fp;
}
