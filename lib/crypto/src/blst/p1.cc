extern "C" {
#include <blst.h>
}

#include "crypto/blst/P1.hpp"
#include "crypto/blst/Scalar.hpp"
#include "crypto/common.hpp"
#include "crypto/error.hpp"
#include "impl_common.hpp"
#include <array>
#include <cstring>

namespace Ballot::Crypto::bls {
using impl::to_native;

static_assert(sizeof(P1) == sizeof(blst_p1), "P1 size mismatch");
static_assert(alignof(P1) >= alignof(blst_p1), "P1 alignment mismatch");

P1 P1::generator()
{
    P1 ret {};
    *to_native<blst_p1>(&ret) = *blst_p1_generator();
    return ret;
}

P1 P1::identity()
{
    P1 ret {};
    // blst_p1 内部 Z=0 代表无穷远点
    std::memset(to_native<blst_p1>(&ret), 0, sizeof(blst_p1));
    return ret;
}

auto P1::from_bytes(BytesSpan in) -> std::expected<P1, std::error_code>
{
    blst_p1_affine a;
    BLST_ERROR err = BLST_BAD_ENCODING;
    if (in.size() == COMPRESSED_SIZE) {
        err = blst_p1_uncompress(&a, u8ptr(in.data()));
    } else if (in.size() == SERIALIZED_SIZE) {
        err = blst_p1_deserialize(&a, u8ptr(in.data()));
    }
    if (err != BLST_SUCCESS) {
        return std::unexpected(Error::PointDecodingFailed);
    }
    // 曲线上但不在素数阶子群中的点同样拒绝
    if (!blst_p1_affine_in_g1(&a)) {
        return std::unexpected(Error::PointDecodingFailed);
    }

    P1 ret {};
    blst_p1_from_affine(to_native<blst_p1>(&ret), &a);
    return ret;
}

P1 P1::from_hash(BytesSpan msg, BytesSpan dst)
{
    P1 ret {};
    blst_hash_to_g1(
        to_native<blst_p1>(&ret),
        u8ptr(msg.data()), msg.size(),
        u8ptr(dst.data()), dst.size(),
        nullptr, 0 // No aug
    );
    return ret;
}

P1& P1::add(const P1& a)
{
    blst_p1_add_or_double(
        to_native<blst_p1>(this),
        to_native<blst_p1>(this),
        to_native<blst_p1>(&a));
    return *this;
}

P1& P1::mult(const Scalar& s)
{
    // blst_p1_mult 的第三个参数是小端字节序的标量，第四个是 bits
    blst_p1_mult(
        to_native<blst_p1>(this),
        to_native<blst_p1>(this),
        to_native<blst_scalar>(&s)->b,
        Scalar::BIT_LENGTH);
    return *this;
}

P1& P1::neg()
{
    blst_p1_cneg(to_native<blst_p1>(this), true);
    return *this;
}

P1 P1::operator-() const
{
    P1 ret = *this;
    ret.neg();
    return ret;
}

bool P1::is_identity() const
{
    return blst_p1_is_inf(to_native<blst_p1>(this));
}

bool operator==(const P1& a, const P1& b)
{
    return blst_p1_is_equal(
        to_native<blst_p1>(&a),
        to_native<blst_p1>(&b));
}

std::array<Byte, P1::SERIALIZED_SIZE> P1::serialize() const
{
    std::array<Byte, P1::SERIALIZED_SIZE> buf {};
    blst_p1_serialize(
        u8ptr(buf.data()),
        to_native<blst_p1>(this));
    return buf;
}

std::array<Byte, P1::COMPRESSED_SIZE> P1::compress() const
{
    std::array<Byte, P1::COMPRESSED_SIZE> buf {};
    blst_p1_compress(
        u8ptr(buf.data()),
        to_native<blst_p1>(this));
    return buf;
}

} // namespace Ballot::Crypto::bls
