#include "digest.hpp"

#include <array>
#include <memory>
#include <openssl/evp.h>

namespace snapgate::util {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

} // namespace

auto sha256_hex(std::span<const uint8_t> data) -> Result<std::string> {
    MdCtxPtr ctx{EVP_MD_CTX_new()};
    if (!ctx) {
        return make_error<std::string>(ErrorCode::unknown_error, "Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return make_error<std::string>(ErrorCode::unknown_error, "EVP_DigestInit_ex failed");
    }
    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return make_error<std::string>(ErrorCode::unknown_error, "EVP_DigestUpdate failed");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md.data(), &md_len) != 1) {
        return make_error<std::string>(ErrorCode::unknown_error, "EVP_DigestFinal_ex failed");
    }

    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<size_t>(md_len) * 2);
    for (unsigned int i = 0; i < md_len; ++i) {
        out.push_back(HEX[md[i] >> 4]);
        out.push_back(HEX[md[i] & 0x0f]);
    }
    return out;
}

} // namespace snapgate::util
