#include <array>
#include <bit>
#include <cstring>

extern "C" {
#include <blst.h>
}
#include "crypto/blst/Scalar.hpp"
#include "crypto/common.hpp"
#include "crypto/error.hpp"
#include "crypto/random.hpp"
#include "impl_common.hpp"

namespace Ballot::Crypto::bls {
static_assert(sizeof(Scalar) == sizeof(blst_scalar), "Scalar size mismatch with blst_scalar");
static_assert(std::endian::native == std::endian::little,
    "Scalar limbs are reinterpreted as little-endian blst_scalar bytes");

using impl::to_native;

namespace {
    // 运算统一走 Montgomery 形式的 blst_fr，避免 blst_sk_*_n_check 对零值返回失败
    blst_fr to_fr(const Scalar& s)
    {
        blst_fr r;
        blst_fr_from_scalar(&r, to_native<blst_scalar>(&s));
        return r;
    }

    Scalar from_fr(const blst_fr& f)
    {
        Scalar s {};
        blst_scalar_from_fr(to_native<blst_scalar>(&s), &f);
        return s;
    }
} // namespace

// --- 运算符实现 ---

Scalar& Scalar::operator+=(const Scalar& other)
{
    blst_fr a = to_fr(*this);
    blst_fr b = to_fr(other);
    blst_fr_add(&a, &a, &b);
    *this = from_fr(a);
    return *this;
}

Scalar& Scalar::operator-=(const Scalar& other)
{
    blst_fr a = to_fr(*this);
    blst_fr b = to_fr(other);
    blst_fr_sub(&a, &a, &b);
    *this = from_fr(a);
    return *this;
}

Scalar& Scalar::operator*=(const Scalar& other)
{
    blst_fr a = to_fr(*this);
    blst_fr b = to_fr(other);
    blst_fr_mul(&a, &a, &b);
    *this = from_fr(a);
    return *this;
}

Scalar Scalar::operator-() const
{
    blst_fr a = to_fr(*this);
    blst_fr_cneg(&a, &a, true);
    return from_fr(a);
}

Scalar Scalar::inverse() const
{
    // 零的逆定义为零，调用方负责保证非零（拉格朗日分母来自互不相同的 ID）
    blst_fr a = to_fr(*this);
    blst_fr_inverse(&a, &a);
    return from_fr(a);
}

bool Scalar::is_zero() const
{
    return limbs == std::array<uint64_t, 4> {};
}

Scalar Scalar::from_uint64(uint64_t v)
{
    return Scalar { { v, 0, 0, 0 } };
}

Scalar Scalar::from_le_bytes(BytesSpan bytes)
{
    Scalar s {};
    blst_scalar_from_le_bytes(
        to_native<blst_scalar>(&s),
        u8ptr(bytes.data()),
        bytes.size());
    return s;
}

Scalar Scalar::from_be_bytes(BytesSpan bytes)
{
    Scalar s {};
    blst_scalar_from_be_bytes(
        to_native<blst_scalar>(&s),
        u8ptr(bytes.data()),
        bytes.size());
    return s;
}

auto Scalar::from_bytes(BytesSpan bytes) -> std::expected<Scalar, std::error_code>
{
    if (bytes.size() != SERIALIZED_SIZE) {
        return std::unexpected(Error::ScalarDecodingFailed);
    }
    Scalar s {};
    blst_scalar_from_bendian(to_native<blst_scalar>(&s), u8ptr(bytes.data()));
    if (!blst_scalar_fr_check(to_native<blst_scalar>(&s))) {
        return std::unexpected(Error::ScalarDecodingFailed);
    }
    return s;
}

auto Scalar::random(RandomSource& rng, const char* DST)
    -> std::expected<Scalar, std::error_code>
{
    std::array<Byte, 32> ikm {};
    if (auto filled = rng.fill(ikm); !filled) {
        return std::unexpected(filled.error());
    }

    // 生成 48 字节 (384 bits) 的均匀随机数，然后模 r
    // 这样做是为了消除模偏差 (modular bias)
    std::array<Byte, 48> out {};
    blst_expand_message_xmd(u8ptr(out.data()), out.size(),
        u8ptr(ikm.data()), ikm.size(),
        u8ptr(DST), std::strlen(DST));

    return from_be_bytes(out);
}

// --- 序列化成员函数 ---

std::array<Byte, Scalar::SERIALIZED_SIZE> Scalar::to_bytes() const
{
    std::array<Byte, SERIALIZED_SIZE> out {};
    blst_bendian_from_scalar(u8ptr(out.data()), to_native<blst_scalar>(this));
    return out;
}

} // namespace Ballot::Crypto::bls
