#pragma once

extern "C" {
#include <blst.h>
}

namespace Ballot::Crypto::bls::impl {

// =============================================================================
// Opaque Storage Casting Helpers (Wrapper* <-> BlstType*)
// =============================================================================

// P1 与 Scalar 都是标准布局 (Standard Layout) 结构体，且唯一成员就是 blst 的原生存储。
// C++ 标准保证指向结构体的指针可以 reinterpret_cast 为指向其第一个成员的指针。

template <typename BlstT, typename WrapperT>
inline BlstT* to_native(WrapperT* w)
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return reinterpret_cast<BlstT*>(w);
}

template <typename BlstT, typename WrapperT>
inline const BlstT* to_native(const WrapperT* w)
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return reinterpret_cast<const BlstT*>(w);
}

} // namespace Ballot::Crypto::bls::impl
