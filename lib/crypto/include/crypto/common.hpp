#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Ballot::Crypto {

using Byte = uint8_t;
using Bytes = std::vector<Byte>;
using BytesSpan = std::span<const Byte>;
using Hash256 = std::array<Byte, 32>;

inline BytesSpan as_span(std::string_view s)
{
    return BytesSpan(reinterpret_cast<const Byte*>(s.data()), s.size());
}

// blst / OpenSSL 接口统一使用 unsigned char*
inline const unsigned char* u8ptr(const Byte* p)
{
    return reinterpret_cast<const unsigned char*>(p);
}

inline unsigned char* u8ptr(Byte* p)
{
    return reinterpret_cast<unsigned char*>(p);
}

inline const unsigned char* u8ptr(BytesSpan s)
{
    return u8ptr(s.data());
}

inline const unsigned char* u8ptr(const char* s)
{
    return reinterpret_cast<const unsigned char*>(s);
}

// 大端 u32，用于索引前缀
inline void put_u32_be(Bytes& out, uint32_t v)
{
    out.push_back(static_cast<Byte>(v >> 24));
    out.push_back(static_cast<Byte>(v >> 16));
    out.push_back(static_cast<Byte>(v >> 8));
    out.push_back(static_cast<Byte>(v));
}

// 调用方保证 in.size() >= 4
inline uint32_t get_u32_be(BytesSpan in)
{
    return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16)
        | (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}

// 小工具：十六进制编解码，仅用于标识符与测试输出
std::string to_hex(BytesSpan data);

} // namespace Ballot::Crypto
