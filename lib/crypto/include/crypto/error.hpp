#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Ballot::Crypto {
enum class Error : std::uint8_t {
    Success = 0,
    InvalidThreshold, // K 值不合法
    InvalidPlayerCount, // N 值不合法
    InvalidShareID, // ID 超出范围或不合法
    ShareVerificationFailed, // 份额验证失败
    NotEnoughShares, // 聚合时份额数量不足
    DuplicatePlayerID,
    OpenSSLError, // 随机数 / 摘要 / AES 失败
    PointDecodingFailed, // 非法的 G1 点编码或不在子群中
    ScalarDecodingFailed, // 非规范标量
    InvalidEncoding, // bech32 / base64 字符或结构错误
    InvalidChecksum, // bech32 校验和错误
    DecryptionFailed // 混合加密解密失败
};

class CryptoErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "BallotCrypto"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::InvalidThreshold:
            return "Threshold k must be between 1 and players";
        case Error::InvalidPlayerCount:
            return "Player count must be positive";
        case Error::InvalidShareID:
            return "Share ID is out of valid range";
        case Error::ShareVerificationFailed:
            return "Share verification failed";
        case Error::NotEnoughShares:
            return "Not enough shares to interpolate";
        case Error::DuplicatePlayerID:
            return "Duplicate player ID";
        case Error::OpenSSLError:
            return "OpenSSL failure";
        case Error::PointDecodingFailed:
            return "Invalid G1 point encoding";
        case Error::ScalarDecodingFailed:
            return "Invalid scalar encoding";
        case Error::InvalidEncoding:
            return "Invalid text encoding";
        case Error::InvalidChecksum:
            return "Invalid bech32 checksum";
        case Error::DecryptionFailed:
            return "Hybrid decryption failed";
        default:
            return "Unknown crypto error";
        }
    }
};

inline const std::error_category& crypto_category()
{
    static CryptoErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), crypto_category() };
}
} // namespace Ballot::Crypto

namespace std {
template <>
struct is_error_code_enum<Ballot::Crypto::Error> : true_type { };
} // namespace std
