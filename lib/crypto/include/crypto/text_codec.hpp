#pragma once

#include "crypto/common.hpp"
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace Ballot::Crypto::Bech32 {

struct Decoded {
    std::string hrp; // human readable part, lower case
    std::vector<Byte> data; // 8-bit payload
};

// BIP-173 编码，不限制总长度（密钥载荷超过 90 字符）
[[nodiscard]]
auto encode(std::string_view hrp, BytesSpan data) -> std::expected<std::string, std::error_code>;

[[nodiscard]]
auto decode(std::string_view text) -> std::expected<Decoded, std::error_code>;

} // namespace Ballot::Crypto::Bech32

namespace Ballot::Crypto::Base64 {

[[nodiscard]]
std::string encode(BytesSpan data);

// 忽略首尾空白；要求标准字母表与 '=' 填充
[[nodiscard]]
auto decode(std::string_view text) -> std::expected<std::vector<Byte>, std::error_code>;

} // namespace Ballot::Crypto::Base64
