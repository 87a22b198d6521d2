#pragma once
#include "crypto/aes.hpp"
#include "crypto/blst/P1.hpp"
#include "crypto/blst/Scalar.hpp"
#include "crypto/common.hpp"
#include <array>
#include <expected>
#include <span>
#include <system_error>
#include <vector>

namespace Ballot::Crypto {
class RandomSource;
}

namespace Ballot::Crypto::Elgamal {

// BLS 基础类型
using P1 = bls::P1;
using Scalar = bls::Scalar;

using PublicKey = P1; // g·sk (G1 点)
using SecretKey = Scalar;

/**
 * @struct Ciphertext
 * @brief Lifted (exponential) ElGamal ciphertext over G1: (g·r, g·m + pk·r).
 *
 * Additively homomorphic: component-wise addition adds the plaintexts.
 */
struct Ciphertext {
    P1 e1;
    P1 e2;

    static constexpr size_t SERIALIZED_SIZE = 2 * P1::COMPRESSED_SIZE;

    static Ciphertext zero() { return { .e1 = P1::identity(), .e2 = P1::identity() }; }

    Ciphertext& add(const Ciphertext& other);
    Ciphertext& mult(const Scalar& s);

    [[nodiscard]] std::array<Byte, SERIALIZED_SIZE> to_bytes() const;
    static auto from_bytes(BytesSpan in) -> std::expected<Ciphertext, std::error_code>;
};

// Chaum-Pedersen 证明: log_g(pk) == log_e1(d)
struct DleqProof {
    Scalar challenge;
    Scalar response;

    static constexpr size_t SERIALIZED_SIZE = 2 * Scalar::SERIALIZED_SIZE;
};

struct PartialDecryption {
    P1 value; // e1·sk
    DleqProof proof;

    static constexpr size_t SERIALIZED_SIZE = P1::COMPRESSED_SIZE + DleqProof::SERIALIZED_SIZE;

    [[nodiscard]] std::array<Byte, SERIALIZED_SIZE> to_bytes() const;
    static auto from_bytes(BytesSpan in) -> std::expected<PartialDecryption, std::error_code>;
};

[[nodiscard]]
Ciphertext encrypt_with(const PublicKey& public_key, const Scalar& message, const Scalar& randomness);

[[nodiscard]]
auto encrypt(const PublicKey& public_key, const Scalar& message, RandomSource& rng)
    -> std::expected<Ciphertext, std::error_code>;

// 生成解密份额。nonce 由私钥与密文确定性导出，相同输入得到逐字节相同的结果
[[nodiscard]]
PartialDecryption decrypt_share(const SecretKey& secret, const Ciphertext& ciphertext);

// 验证解密份额
[[nodiscard]]
bool verify_share(const PublicKey& public_key,
    const PartialDecryption& decryption,
    const Ciphertext& ciphertext);

// g·m = e2 - combined, combined 为聚合后的 e1·sk
[[nodiscard]]
P1 message_point(const Ciphertext& ciphertext, const P1& combined_decryption);

/**
 * Hybrid encryption of arbitrary bytes to a G1 public key: U = g·r,
 * AES-256-CBC under SHA-256(pk·r). Used to deliver VSS shares to the
 * recipient's communication key.
 */
namespace Hybrid {
    struct HybridCiphertext {
        P1 u_component; // U
        std::vector<Byte> data_ciphertext; // IV || AES-CBC
    };

    [[nodiscard]]
    auto encrypt(Aes::Context& ctx, RandomSource& rng, const PublicKey& recipient,
        BytesSpan plaintext)
        -> std::expected<HybridCiphertext, std::error_code>;

    [[nodiscard]]
    auto decrypt(Aes::Context& ctx, const SecretKey& recipient_secret,
        const HybridCiphertext& ciphertext)
        -> std::expected<std::vector<Byte>, std::error_code>;
} // namespace Hybrid

} // namespace Ballot::Crypto::Elgamal
