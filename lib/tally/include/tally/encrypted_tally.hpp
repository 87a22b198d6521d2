#pragma once

#include "crypto/elgamal.hpp"
#include "tally/keys.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace Ballot::Crypto {
class RandomSource;
}

namespace Ballot::Tally {

using Crypto::Elgamal::Ciphertext;

/**
 * @class EncryptedTally
 * @brief Homomorphic aggregate of the ballots cast on one proposal: one ElGamal
 *        ciphertext per vote option.
 *
 * Wire form is the plain concatenation of the option ciphertexts
 * (compress(e1) || compress(e2), 96 bytes each), the option count being
 * implied by the length.
 */
class EncryptedTally {
public:
    EncryptedTally() = default;
    explicit EncryptedTally(std::vector<Ciphertext> options)
        : options_(std::move(options))
    {
    }

    // 所有选项均为 (O, O) 的空计票
    static EncryptedTally zero(size_t options);

    // MalformedEncryptedTally：为空、长度不是 96 的倍数或点非法
    static auto from_bytes(BytesSpan bytes) -> std::expected<EncryptedTally, std::error_code>;
    static auto from_base64(std::string_view text) -> std::expected<EncryptedTally, std::error_code>;

    [[nodiscard]] Bytes to_bytes() const;
    [[nodiscard]] std::string to_base64() const;

    // 累加一张选票，按权重放大
    auto add(const EncryptedTally& ballot, uint64_t weight) -> std::expected<void, std::error_code>;

    [[nodiscard]] size_t options() const { return options_.size(); }
    [[nodiscard]] const std::vector<Ciphertext>& ciphertexts() const { return options_; }

private:
    std::vector<Ciphertext> options_;
};

// 生成份额时解析出的密文，开票时再次使用
using TallyState = EncryptedTally;

/**
 * Encrypts a unit vector ballot: option `choice` gets Enc(1), all the others
 * Enc(0), each under fresh randomness from `rng`.
 */
[[nodiscard]]
auto encrypt_vote(const EncryptingPublicKey& key, size_t choice, size_t options, Crypto::RandomSource& rng)
    -> std::expected<EncryptedTally, std::error_code>;

} // namespace Ballot::Tally
