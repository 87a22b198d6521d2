#pragma once

#include "crypto/common.hpp"
#include <array>
#include <expected>
#include <memory>
#include <system_error>

struct evp_cipher_ctx_st;

namespace Ballot::Crypto {
class RandomSource;
}

/**
 * Symmetric half of the hybrid share transport (Elgamal::Hybrid).
 *
 * AES-256-CBC with PKCS#7 padding. A sealed box is IV(16) || ciphertext,
 * the IV drawn from the caller's random source.
 */
namespace Ballot::Crypto::Aes {

using AesKey = std::array<Byte, 32>;
inline constexpr size_t IV_SIZE = 16;
inline constexpr size_t BLOCK_SIZE = 16;

// 可复用的 EVP 上下文，seal/open 每次重新初始化
class Context {
public:
    Context();

    [[nodiscard]] evp_cipher_ctx_st* get() const { return ptr_.get(); }

private:
    struct Free {
        void operator()(evp_cipher_ctx_st* ctx) const;
    };
    std::unique_ptr<evp_cipher_ctx_st, Free> ptr_;
};

[[nodiscard]]
auto seal(Context& ctx, RandomSource& rng, const AesKey& key, BytesSpan plaintext)
    -> std::expected<Bytes, std::error_code>;

// DecryptionFailed：填充错误（通常是密钥不对）或长度不是整块
[[nodiscard]]
auto open(Context& ctx, const AesKey& key, BytesSpan sealed) -> std::expected<Bytes, std::error_code>;

} // namespace Ballot::Crypto::Aes
