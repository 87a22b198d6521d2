#include "crypto/text_codec.hpp"
#include "crypto/error.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <openssl/evp.h>

namespace Ballot::Crypto::Bech32 {

namespace {
    constexpr std::string_view CHARSET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
    constexpr size_t CHECKSUM_SIZE = 6;

    uint32_t polymod(const std::vector<uint8_t>& values)
    {
        constexpr std::array<uint32_t, 5> GEN = {
            0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3
        };
        uint32_t chk = 1;
        for (uint8_t v : values) {
            const uint32_t top = chk >> 25;
            chk = ((chk & 0x1ffffff) << 5) ^ v;
            for (size_t i = 0; i < GEN.size(); ++i) {
                if ((top >> i) & 1) {
                    chk ^= GEN[i];
                }
            }
        }
        return chk;
    }

    std::vector<uint8_t> expand_hrp(std::string_view hrp)
    {
        std::vector<uint8_t> ret;
        ret.reserve(hrp.size() * 2 + 1);
        for (char c : hrp) {
            ret.push_back(static_cast<uint8_t>(c) >> 5);
        }
        ret.push_back(0);
        for (char c : hrp) {
            ret.push_back(static_cast<uint8_t>(c) & 0x1f);
        }
        return ret;
    }

    bool valid_hrp(std::string_view hrp)
    {
        return !hrp.empty() && std::ranges::all_of(hrp, [](char c) {
            return c >= 33 && c <= 126 && !(c >= 'A' && c <= 'Z');
        });
    }

    // 通用位宽转换 (8 -> 5 补零, 5 -> 8 严格)
    template <int From, int To>
    auto convert_bits(std::span<const uint8_t> in, bool pad)
        -> std::expected<std::vector<uint8_t>, std::error_code>
    {
        uint32_t acc = 0;
        int bits = 0;
        constexpr uint32_t maxv = (1u << To) - 1;
        std::vector<uint8_t> out;
        out.reserve(in.size() * From / To + 1);
        for (uint8_t v : in) {
            if ((v >> From) != 0) {
                return std::unexpected(Error::InvalidEncoding);
            }
            acc = (acc << From) | v;
            bits += From;
            while (bits >= To) {
                bits -= To;
                out.push_back(static_cast<uint8_t>((acc >> bits) & maxv));
            }
        }
        if (pad) {
            if (bits > 0) {
                out.push_back(static_cast<uint8_t>((acc << (To - bits)) & maxv));
            }
        } else if (bits >= From || ((acc << (To - bits)) & maxv) != 0) {
            return std::unexpected(Error::InvalidEncoding);
        }
        return out;
    }
} // namespace

auto encode(std::string_view hrp, BytesSpan data) -> std::expected<std::string, std::error_code>
{
    if (!valid_hrp(hrp)) {
        return std::unexpected(Error::InvalidEncoding);
    }
    auto values = convert_bits<8, 5>(data, true);
    if (!values) {
        return std::unexpected(values.error());
    }

    std::vector<uint8_t> enc = expand_hrp(hrp);
    enc.insert(enc.end(), values->begin(), values->end());
    enc.resize(enc.size() + CHECKSUM_SIZE, 0);
    const uint32_t mod = polymod(enc) ^ 1;

    std::string out(hrp);
    out.reserve(hrp.size() + 1 + values->size() + CHECKSUM_SIZE);
    out.push_back('1');
    for (uint8_t v : *values) {
        out.push_back(CHARSET[v]);
    }
    for (size_t i = 0; i < CHECKSUM_SIZE; ++i) {
        out.push_back(CHARSET[(mod >> (5 * (5 - i))) & 0x1f]);
    }
    return out;
}

auto decode(std::string_view text) -> std::expected<Decoded, std::error_code>
{
    bool lower = false;
    bool upper = false;
    for (char c : text) {
        if (c < 33 || c > 126) {
            return std::unexpected(Error::InvalidEncoding);
        }
        lower |= (c >= 'a' && c <= 'z');
        upper |= (c >= 'A' && c <= 'Z');
    }
    // 大小写混用非法
    if (lower && upper) {
        return std::unexpected(Error::InvalidEncoding);
    }

    const size_t pos = text.rfind('1');
    if (pos == std::string_view::npos || pos == 0 || pos + 1 + CHECKSUM_SIZE > text.size()) {
        return std::unexpected(Error::InvalidEncoding);
    }

    std::string hrp;
    hrp.reserve(pos);
    for (char c : text.substr(0, pos)) {
        hrp.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c);
    }

    std::vector<uint8_t> values;
    values.reserve(text.size() - pos - 1);
    for (char c : text.substr(pos + 1)) {
        const char lc = (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
        const size_t idx = CHARSET.find(lc);
        if (idx == std::string_view::npos) {
            return std::unexpected(Error::InvalidEncoding);
        }
        values.push_back(static_cast<uint8_t>(idx));
    }

    std::vector<uint8_t> check = expand_hrp(hrp);
    check.insert(check.end(), values.begin(), values.end());
    if (polymod(check) != 1) {
        return std::unexpected(Error::InvalidChecksum);
    }

    values.resize(values.size() - CHECKSUM_SIZE);
    auto data = convert_bits<5, 8>(values, false);
    if (!data) {
        return std::unexpected(data.error());
    }
    return Decoded { .hrp = std::move(hrp), .data = std::move(*data) };
}

} // namespace Ballot::Crypto::Bech32

namespace Ballot::Crypto::Base64 {

std::string encode(BytesSpan data)
{
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    if (out.empty()) {
        return out;
    }
    const int len = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(out.data()), u8ptr(data), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(len));
    return out;
}

auto decode(std::string_view text) -> std::expected<std::vector<Byte>, std::error_code>
{
    constexpr std::string_view WHITESPACE = " \t\r\n";
    const size_t first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return std::unexpected(Error::InvalidEncoding);
    }
    text = text.substr(first, text.find_last_not_of(WHITESPACE) - first + 1);

    if (text.size() % 4 != 0) {
        return std::unexpected(Error::InvalidEncoding);
    }

    size_t padding = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        const bool alpha = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
            || c == '+' || c == '/';
        if (c == '=') {
            // '=' 只允许出现在最后两个位置
            if (i + 2 < text.size()) {
                return std::unexpected(Error::InvalidEncoding);
            }
            ++padding;
        } else if (!alpha || padding > 0) {
            return std::unexpected(Error::InvalidEncoding);
        }
    }

    std::vector<Byte> out(text.size() / 4 * 3);
    const int len = EVP_DecodeBlock(
        u8ptr(out.data()), reinterpret_cast<const unsigned char*>(text.data()), static_cast<int>(text.size()));
    if (len < 0 || static_cast<size_t>(len) < padding) {
        return std::unexpected(Error::InvalidEncoding);
    }
    // EVP_DecodeBlock 不去除填充产生的零字节
    out.resize(static_cast<size_t>(len) - padding);
    return out;
}

} // namespace Ballot::Crypto::Base64
