#pragma once

#include "crypto/blst/Scalar.hpp"
#include "crypto/common.hpp"
#include <array>
#include <cstddef>
#include <expected>
#include <system_error>

extern "C" {
#include <blst.h>
}

namespace Ballot::Crypto::bls {

/**
 * @class P1
 * @brief Point of the BLS12-381 G1 group in Jacobian coordinates.
 *
 * Default construction yields the point at infinity (Z = 0). Decoding from
 * bytes always performs the subgroup check, so every P1 built from external
 * input is a valid group element.
 */
class P1 {
public:
    static constexpr size_t COMPRESSED_SIZE = 48;
    static constexpr size_t SERIALIZED_SIZE = 96;

    P1() = default;

    /* ---------- factories ---------- */

    static P1 generator();
    static P1 identity();

    // 接受 48 字节压缩编码或 96 字节非压缩编码
    static auto from_bytes(BytesSpan in) -> std::expected<P1, std::error_code>;

    static P1 from_hash(BytesSpan msg, BytesSpan dst);

    /* ---------- mutators ---------- */

    P1& add(const P1& a);
    P1& mult(const Scalar& s);
    P1& neg();

    // 返回新对象
    P1 operator-() const;

    /* ---------- observers ---------- */

    [[nodiscard]] bool is_identity() const;
    [[nodiscard]] std::array<Byte, COMPRESSED_SIZE> compress() const;
    [[nodiscard]] std::array<Byte, SERIALIZED_SIZE> serialize() const;

    friend bool operator==(const P1& a, const P1& b);

private:
    blst_p1 point {};
};

// g·s
inline P1 mul_generator(const Scalar& s)
{
    P1 p = P1::generator();
    p.mult(s);
    return p;
}

} // namespace Ballot::Crypto::bls
