#pragma once

#include "crypto/common.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <system_error>

namespace Ballot::Crypto {
class RandomSource;
}

namespace Ballot::Crypto::bls {

/**
 * @struct Scalar
 * @brief Element of the BLS12-381 scalar field Fr.
 *
 * Standard-layout wrapper whose storage is bit-compatible with blst_scalar
 * (little-endian limbs). Values are always kept reduced modulo r.
 */
struct Scalar {
    std::array<uint64_t, 4> limbs {};

    static constexpr size_t BIT_LENGTH = 255;
    static constexpr size_t SERIALIZED_SIZE = 32;

    static Scalar from_uint64(uint64_t v);

    // 任意长度输入，模 r 约减
    static Scalar from_le_bytes(BytesSpan bytes);
    static Scalar from_be_bytes(BytesSpan bytes);

    // 32 字节大端规范编码，拒绝 >= r 的值
    static auto from_bytes(BytesSpan bytes) -> std::expected<Scalar, std::error_code>;

    static auto random(RandomSource& rng, const char* DST = "BALLOT_DEFAULT_SALT")
        -> std::expected<Scalar, std::error_code>;

    // ===== serialization =====

    [[nodiscard]] std::array<Byte, SERIALIZED_SIZE> to_bytes() const;

    // ===== arithmetic (in-place) =====

    Scalar& operator+=(const Scalar& other);
    Scalar& operator-=(const Scalar& other);
    Scalar& operator*=(const Scalar& other);

    // ===== arithmetic (value) =====

    friend Scalar operator+(Scalar a, const Scalar& b) { return a += b; }
    friend Scalar operator-(Scalar a, const Scalar& b) { return a -= b; }
    friend Scalar operator*(Scalar a, const Scalar& b) { return a *= b; }

    Scalar operator-() const;

    // ===== field operations =====

    [[nodiscard]] Scalar inverse() const;
    [[nodiscard]] bool is_zero() const;

    // ===== comparison =====

    bool operator==(const Scalar& other) const = default;
};

} // namespace Ballot::Crypto::bls
