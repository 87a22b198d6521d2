#pragma once

#include "crypto/blst/P1.hpp"
#include "crypto/blst/Scalar.hpp"
#include "crypto/common.hpp"
#include "tally/error.hpp"
#include <concepts>
#include <cstdint>
#include <expected>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace Ballot::Crypto {
class RandomSource;
}

namespace Ballot::Tally {

using Crypto::Byte;
using Crypto::Bytes;
using Crypto::BytesSpan;
using Scalar = Crypto::bls::Scalar;
using P1 = Crypto::bls::P1;

// 每种密钥一个互不兼容的 bech32 标签
namespace Tags {
    inline constexpr std::string_view COMMUNICATION_SECRET_KEY = "bls_vcommsk";
    inline constexpr std::string_view COMMUNICATION_PUBLIC_KEY = "bls_vcommpk";
    inline constexpr std::string_view MEMBER_SECRET_KEY = "bls_membersk";
    inline constexpr std::string_view MEMBER_PUBLIC_KEY = "bls_memberpk";
    inline constexpr std::string_view ENCRYPTING_VOTE_KEY = "bls_votepk";
} // namespace Tags

// ============================================================================
// KeyMaterialCodec
// ============================================================================

struct TaggedBytes {
    std::string tag;
    Bytes data;
};

[[nodiscard]]
auto encode(std::string_view tag, BytesSpan raw_bytes) -> std::expected<std::string, std::error_code>;

// FormatError if `text` is not a valid tagged encoding
[[nodiscard]]
auto decode(std::string_view text) -> std::expected<TaggedBytes, std::error_code>;

// As above, and TagMismatch if the tag differs from `expected_tag`
[[nodiscard]]
auto decode(std::string_view text, std::string_view expected_tag) -> std::expected<Bytes, std::error_code>;

// ============================================================================
// Key types
// ============================================================================

class CommunicationPublicKey {
public:
    static constexpr std::string_view TAG = Tags::COMMUNICATION_PUBLIC_KEY;

    CommunicationPublicKey() = default;
    explicit CommunicationPublicKey(const P1& point)
        : point_(point)
    {
    }

    [[nodiscard]] const P1& point() const { return point_; }
    [[nodiscard]] Bytes to_bytes() const;
    static auto from_bytes(BytesSpan bytes) -> std::expected<CommunicationPublicKey, std::error_code>;

    friend bool operator==(const CommunicationPublicKey&, const CommunicationPublicKey&) = default;

private:
    P1 point_;
};

/**
 * @class CommunicationSecretKey
 * @brief Secures the key-generation protocol's share delivery. Never shared.
 */
class CommunicationSecretKey {
public:
    static constexpr std::string_view TAG = Tags::COMMUNICATION_SECRET_KEY;

    CommunicationSecretKey() = default;
    explicit CommunicationSecretKey(const Scalar& secret)
        : secret_(secret)
    {
    }

    static auto generate(Crypto::RandomSource& rng) -> std::expected<CommunicationSecretKey, std::error_code>;

    [[nodiscard]] CommunicationPublicKey to_public() const;
    [[nodiscard]] const Scalar& scalar() const { return secret_; }
    [[nodiscard]] Bytes to_bytes() const;
    static auto from_bytes(BytesSpan bytes) -> std::expected<CommunicationSecretKey, std::error_code>;

    friend bool operator==(const CommunicationSecretKey&, const CommunicationSecretKey&) = default;

private:
    Scalar secret_;
};

/**
 * @class MemberPublicKey
 * @brief g·secret for a member, together with the member's VSS index
 *        (1-based roster position). Publishable.
 */
class MemberPublicKey {
public:
    static constexpr std::string_view TAG = Tags::MEMBER_PUBLIC_KEY;
    static constexpr size_t SERIALIZED_SIZE = 4 + P1::COMPRESSED_SIZE;

    MemberPublicKey() = default;
    MemberPublicKey(uint32_t index, const P1& point)
        : index_(index)
        , point_(point)
    {
    }

    [[nodiscard]] uint32_t index() const { return index_; }
    [[nodiscard]] const P1& point() const { return point_; }
    [[nodiscard]] Bytes to_bytes() const;
    static auto from_bytes(BytesSpan bytes) -> std::expected<MemberPublicKey, std::error_code>;

    friend bool operator==(const MemberPublicKey&, const MemberPublicKey&) = default;

private:
    uint32_t index_ = 0;
    P1 point_;
};

/**
 * @class MemberSecretKey
 * @brief A member's long-term share of the tally decryption capability.
 *
 * Must be kept private. Streaming it prints "<redacted>", never key bytes.
 */
class MemberSecretKey {
public:
    static constexpr std::string_view TAG = Tags::MEMBER_SECRET_KEY;
    static constexpr size_t SERIALIZED_SIZE = 4 + Scalar::SERIALIZED_SIZE;

    MemberSecretKey() = default;
    MemberSecretKey(uint32_t index, const Scalar& secret)
        : index_(index)
        , secret_(secret)
    {
    }

    [[nodiscard]] uint32_t index() const { return index_; }
    [[nodiscard]] const Scalar& scalar() const { return secret_; }
    [[nodiscard]] MemberPublicKey to_public() const;
    [[nodiscard]] Bytes to_bytes() const;
    static auto from_bytes(BytesSpan bytes) -> std::expected<MemberSecretKey, std::error_code>;

    friend bool operator==(const MemberSecretKey&, const MemberSecretKey&) = default;

private:
    uint32_t index_ = 0;
    Scalar secret_;
};

/**
 * @class EncryptingPublicKey
 * @brief Election key under which ballots are encrypted.
 */
class EncryptingPublicKey {
public:
    static constexpr std::string_view TAG = Tags::ENCRYPTING_VOTE_KEY;

    EncryptingPublicKey() = default;
    explicit EncryptingPublicKey(const P1& point)
        : point_(point)
    {
    }

    // 参与者公钥之和
    static EncryptingPublicKey from_participants(std::span<const MemberPublicKey> participants);

    [[nodiscard]] const P1& point() const { return point_; }
    [[nodiscard]] Bytes to_bytes() const;
    static auto from_bytes(BytesSpan bytes) -> std::expected<EncryptingPublicKey, std::error_code>;

    friend bool operator==(const EncryptingPublicKey&, const EncryptingPublicKey&) = default;

private:
    P1 point_;
};

template <typename K>
concept EncodableKey = requires(const K& key, BytesSpan bytes) {
    { K::TAG } -> std::convertible_to<std::string_view>;
    { key.to_bytes() } -> std::same_as<Bytes>;
    { K::from_bytes(bytes) } -> std::same_as<std::expected<K, std::error_code>>;
};

template <EncodableKey K>
[[nodiscard]] auto encode_key(const K& key) -> std::expected<std::string, std::error_code>
{
    return encode(K::TAG, key.to_bytes());
}

// 先按 K 的标签解码（拒绝跨类型复用），再解析载荷
template <EncodableKey K>
[[nodiscard]] auto decode_key(std::string_view text) -> std::expected<K, std::error_code>
{
    auto raw = decode(text, K::TAG);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return K::from_bytes(*raw);
}

std::ostream& operator<<(std::ostream& os, const CommunicationSecretKey& key);
std::ostream& operator<<(std::ostream& os, const MemberSecretKey& key);
std::ostream& operator<<(std::ostream& os, const CommunicationPublicKey& key);
std::ostream& operator<<(std::ostream& os, const MemberPublicKey& key);
std::ostream& operator<<(std::ostream& os, const EncryptingPublicKey& key);

} // namespace Ballot::Tally
