#pragma once

#include "crypto/blst/P1.hpp"
#include "crypto/blst/Scalar.hpp"
#include "crypto/common.hpp"
#include <expected>
#include <initializer_list>
#include <string_view>
#include <system_error>

namespace Ballot::Crypto::Utils {

using P1 = bls::P1;
using Scalar = bls::Scalar;

[[nodiscard]]
auto sha256(BytesSpan data) -> std::expected<Hash256, std::error_code>;

// SHA-256 over the concatenation of several parts
[[nodiscard]]
auto sha256(std::initializer_list<BytesSpan> parts) -> std::expected<Hash256, std::error_code>;

// HashG: G1 -> 32 bytes
[[nodiscard]]
auto hashG(const P1& point) -> std::expected<Hash256, std::error_code>;

// Fiat-Shamir 挑战 / 确定性 nonce: 对拼接后的消息做 expand_message_xmd 再模 r
[[nodiscard]]
Scalar hash_to_scalar(std::initializer_list<BytesSpan> parts, std::string_view dst);

} // namespace Ballot::Crypto::Utils
