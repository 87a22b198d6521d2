#include "crypto/threshold/utils.hpp"
#include "crypto/common.hpp"
#include "crypto/error.hpp"
#include <array>
#include <blst.h>
#include <memory>
#include <openssl/evp.h>
#include <string_view>
#include <vector>

namespace Ballot::Crypto::Utils {

namespace {
    using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX,
        decltype([](EVP_MD_CTX* ctx) {
            EVP_MD_CTX_free(ctx);
        })>;
} // namespace

auto sha256(std::initializer_list<BytesSpan> parts) -> std::expected<Hash256, std::error_code>
{
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return std::unexpected(Error::OpenSSLError);
    }
    if (1 != EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
        return std::unexpected(Error::OpenSSLError);
    }
    for (BytesSpan part : parts) {
        if (1 != EVP_DigestUpdate(ctx.get(), u8ptr(part), part.size())) {
            return std::unexpected(Error::OpenSSLError);
        }
    }

    Hash256 hash {};
    unsigned int len = 0;
    if (1 != EVP_DigestFinal_ex(ctx.get(), u8ptr(hash.data()), &len) || len != hash.size()) {
        return std::unexpected(Error::OpenSSLError);
    }
    return hash;
}

auto sha256(BytesSpan data) -> std::expected<Hash256, std::error_code>
{
    return sha256({ data });
}

auto hashG(const P1& point) -> std::expected<Hash256, std::error_code>
{
    return sha256(point.compress());
}

Scalar hash_to_scalar(std::initializer_list<BytesSpan> parts, std::string_view dst)
{
    std::vector<Byte> msg;
    for (BytesSpan part : parts) {
        msg.insert(msg.end(), part.begin(), part.end());
    }

    // 48 字节再模 r，与 Scalar::random 相同的去偏差处理
    std::array<Byte, 48> out {};
    blst_expand_message_xmd(u8ptr(out.data()), out.size(),
        u8ptr(msg.data()), msg.size(),
        u8ptr(dst.data()), dst.size());
    return Scalar::from_be_bytes(out);
}

} // namespace Ballot::Crypto::Utils
