#pragma once

#include "crypto/common.hpp"
#include <cstdint>
#include <expected>
#include <span>
#include <system_error>

namespace Ballot::Crypto {

/**
 * @class RandomSource
 * @brief Byte stream consumed by every generation step (keys, polynomials, nonces, IVs).
 *
 * Passed by reference into each call so that the consumption order is explicit.
 * Implementations are not thread-safe.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    [[nodiscard]]
    virtual auto fill(std::span<Byte> out) -> std::expected<void, std::error_code> = 0;
};

// OpenSSL RAND_bytes
class SystemRandom final : public RandomSource {
public:
    [[nodiscard]]
    auto fill(std::span<Byte> out) -> std::expected<void, std::error_code> override;
};

/**
 * @class SeededRandom
 * @brief Deterministic stream: block_i = SHA-256(seed || be64(i)).
 *
 * Used for reproducible committee setups and tests. Not a substitute for
 * SystemRandom in production key generation.
 */
class SeededRandom final : public RandomSource {
public:
    explicit SeededRandom(BytesSpan seed);
    explicit SeededRandom(uint64_t seed);

    [[nodiscard]]
    auto fill(std::span<Byte> out) -> std::expected<void, std::error_code> override;

private:
    Bytes seed_;
    uint64_t counter_ = 0;
    Hash256 block_ {};
    size_t block_used_ = sizeof(Hash256);
};

} // namespace Ballot::Crypto
