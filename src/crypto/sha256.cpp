#include "crypto/sha256.hpp"

#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <array>
#include <cerrno>
#include <cstdint>
#include <memory>
#include <vector>

namespace peel {

namespace {

constexpr std::size_t kDigestChunk = 128 * 1024;

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string ToHex(const unsigned char* bytes, unsigned int len) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2u);
    for (unsigned int i = 0; i < len; ++i) {
        hex.push_back(kDigits[bytes[i] >> 4]);
        hex.push_back(kDigits[bytes[i] & 0x0f]);
    }
    return hex;
}

} // namespace

std::string Sha256Hex(IReader& reader) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return {};

    std::vector<std::uint8_t> chunk(kDigestChunk);
    for (;;) {
        const ssize_t got = reader.Read(std::span<std::uint8_t>(chunk));
        if (got < 0) return {};
        if (got == 0) break;
        if (EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<std::size_t>(got)) != 1) {
            return {};
        }
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md.data(), &md_len) != 1) return {};
    return ToHex(md.data(), md_len);
}

Result Sha256HexFile(const std::string& path, std::string& out_hex) {
    out_hex.clear();
    FileReader file;
    if (auto r = FileReader::Open(path, file); !r.ok) return r;
    std::string hex = Sha256Hex(file);
    if (hex.empty()) {
        return Result::Fail(EIO, "cannot fingerprint " + path);
    }
    out_hex = std::move(hex);
    return Result::Ok();
}

} // namespace peel
