#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Ballot::Tally {
enum class Error : std::uint8_t {
    Success = 0,
    InvalidThreshold, // 门限不在 [1, |roster|] 内
    DuplicateIdentity, // 名册中身份重复
    FormatError, // 文本不是合法的 bech32 / base64 或载荷无法解析
    TagMismatch, // bech32 标签与期望的密钥种类不符
    MalformedEncryptedTally, // 加密计票无法解析
    DeserializationError, // 份额文档结构错误
    CryptoError, // 底层原语失败，不重试
    DuplicateContribution, // 同一成员的份额被合并两次
    VotePlanMismatch, // 合并的文档属于不同的投票计划
    VotePlanNotFound,
    AmbiguousVotePlan, // 未指定 id 且文档中有多个投票计划
    ShareVerificationFailed,
    NotEnoughShares,
    TallyOutOfRange, // 离散对数超出 max_votes
    ConfigError,
    IoError
};

class TallyErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "BallotTally"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::InvalidThreshold:
            return "Threshold must be between 1 and the committee size";
        case Error::DuplicateIdentity:
            return "Committee roster contains a duplicate identity";
        case Error::FormatError:
            return "Malformed encoded text";
        case Error::TagMismatch:
            return "Encoded key has an unexpected type tag";
        case Error::MalformedEncryptedTally:
            return "Malformed encrypted tally";
        case Error::DeserializationError:
            return "Malformed decryption share document";
        case Error::CryptoError:
            return "Cryptographic primitive failure";
        case Error::DuplicateContribution:
            return "Duplicate contribution from the same committee member";
        case Error::VotePlanMismatch:
            return "Share documents belong to different vote plans";
        case Error::VotePlanNotFound:
            return "Vote plan not found";
        case Error::AmbiguousVotePlan:
            return "Several vote plans present, a vote plan id is required";
        case Error::ShareVerificationFailed:
            return "Decryption share verification failed";
        case Error::NotEnoughShares:
            return "Not enough decryption shares to open the tally";
        case Error::TallyOutOfRange:
            return "Decrypted tally exceeds the maximum vote count";
        case Error::ConfigError:
            return "Invalid committee configuration";
        case Error::IoError:
            return "I/O error";
        default:
            return "Unknown tally error";
        }
    }
};

inline const std::error_category& tally_category()
{
    static TallyErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), tally_category() };
}
} // namespace Ballot::Tally

namespace std {
template <>
struct is_error_code_enum<Ballot::Tally::Error> : true_type { };
} // namespace std
