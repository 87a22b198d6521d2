#include "tally/keys.hpp"
#include "crypto/blst/P1.hpp"
#include "crypto/random.hpp"
#include "crypto/text_codec.hpp"
#include "tally/error.hpp"
#include <algorithm>
#include <ostream>

namespace Ballot::Tally {

namespace {
    auto point_from(BytesSpan bytes) -> std::expected<P1, std::error_code>
    {
        if (bytes.size() != P1::COMPRESSED_SIZE) {
            return std::unexpected(Error::FormatError);
        }
        auto point = P1::from_bytes(bytes);
        if (!point) {
            return std::unexpected(Error::FormatError);
        }
        return *point;
    }

    auto scalar_from(BytesSpan bytes) -> std::expected<Scalar, std::error_code>
    {
        auto s = Scalar::from_bytes(bytes);
        if (!s) {
            return std::unexpected(Error::FormatError);
        }
        return *s;
    }

    template <typename Key>
    std::ostream& print_public(std::ostream& os, const Key& key)
    {
        auto text = encode_key(key);
        return os << (text ? *text : std::string("<unencodable>"));
    }
} // namespace

// --- KeyMaterialCodec ---

auto encode(std::string_view tag, BytesSpan raw_bytes) -> std::expected<std::string, std::error_code>
{
    auto text = Crypto::Bech32::encode(tag, raw_bytes);
    if (!text) {
        return std::unexpected(Error::FormatError);
    }
    return text;
}

auto decode(std::string_view text) -> std::expected<TaggedBytes, std::error_code>
{
    auto decoded = Crypto::Bech32::decode(text);
    if (!decoded) {
        return std::unexpected(Error::FormatError);
    }
    return TaggedBytes { .tag = std::move(decoded->hrp), .data = std::move(decoded->data) };
}

auto decode(std::string_view text, std::string_view expected_tag) -> std::expected<Bytes, std::error_code>
{
    auto decoded = decode(text);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }
    if (decoded->tag != expected_tag) {
        return std::unexpected(Error::TagMismatch);
    }
    return std::move(decoded->data);
}

// --- CommunicationPublicKey ---

Bytes CommunicationPublicKey::to_bytes() const
{
    auto c = point_.compress();
    return { c.begin(), c.end() };
}

auto CommunicationPublicKey::from_bytes(BytesSpan bytes) -> std::expected<CommunicationPublicKey, std::error_code>
{
    auto point = point_from(bytes);
    if (!point) {
        return std::unexpected(point.error());
    }
    return CommunicationPublicKey(*point);
}

// --- CommunicationSecretKey ---

auto CommunicationSecretKey::generate(Crypto::RandomSource& rng)
    -> std::expected<CommunicationSecretKey, std::error_code>
{
    auto s = Scalar::random(rng, "BALLOT_COMMUNICATION_KEY");
    if (!s) {
        return std::unexpected(Error::CryptoError);
    }
    return CommunicationSecretKey(*s);
}

CommunicationPublicKey CommunicationSecretKey::to_public() const
{
    return CommunicationPublicKey(Crypto::bls::mul_generator(secret_));
}

Bytes CommunicationSecretKey::to_bytes() const
{
    auto b = secret_.to_bytes();
    return { b.begin(), b.end() };
}

auto CommunicationSecretKey::from_bytes(BytesSpan bytes) -> std::expected<CommunicationSecretKey, std::error_code>
{
    auto s = scalar_from(bytes);
    if (!s) {
        return std::unexpected(s.error());
    }
    return CommunicationSecretKey(*s);
}

// --- MemberPublicKey ---

Bytes MemberPublicKey::to_bytes() const
{
    Bytes out;
    out.reserve(SERIALIZED_SIZE);
    Crypto::put_u32_be(out, index_);
    auto c = point_.compress();
    out.insert(out.end(), c.begin(), c.end());
    return out;
}

auto MemberPublicKey::from_bytes(BytesSpan bytes) -> std::expected<MemberPublicKey, std::error_code>
{
    if (bytes.size() != SERIALIZED_SIZE) {
        return std::unexpected(Error::FormatError);
    }
    const uint32_t index = Crypto::get_u32_be(bytes);
    if (index == 0) {
        return std::unexpected(Error::FormatError);
    }
    auto point = point_from(bytes.subspan(4));
    if (!point) {
        return std::unexpected(point.error());
    }
    return MemberPublicKey(index, *point);
}

// --- MemberSecretKey ---

MemberPublicKey MemberSecretKey::to_public() const
{
    return MemberPublicKey(index_, Crypto::bls::mul_generator(secret_));
}

Bytes MemberSecretKey::to_bytes() const
{
    Bytes out;
    out.reserve(SERIALIZED_SIZE);
    Crypto::put_u32_be(out, index_);
    auto b = secret_.to_bytes();
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

auto MemberSecretKey::from_bytes(BytesSpan bytes) -> std::expected<MemberSecretKey, std::error_code>
{
    if (bytes.size() != SERIALIZED_SIZE) {
        return std::unexpected(Error::FormatError);
    }
    const uint32_t index = Crypto::get_u32_be(bytes);
    if (index == 0) {
        return std::unexpected(Error::FormatError);
    }
    auto s = scalar_from(bytes.subspan(4));
    if (!s) {
        return std::unexpected(s.error());
    }
    return MemberSecretKey(index, *s);
}

// --- EncryptingPublicKey ---

EncryptingPublicKey EncryptingPublicKey::from_participants(std::span<const MemberPublicKey> participants)
{
    P1 sum = P1::identity();
    for (const auto& pk : participants) {
        sum.add(pk.point());
    }
    return EncryptingPublicKey(sum);
}

Bytes EncryptingPublicKey::to_bytes() const
{
    auto c = point_.compress();
    return { c.begin(), c.end() };
}

auto EncryptingPublicKey::from_bytes(BytesSpan bytes) -> std::expected<EncryptingPublicKey, std::error_code>
{
    auto point = point_from(bytes);
    if (!point) {
        return std::unexpected(point.error());
    }
    return EncryptingPublicKey(*point);
}

// --- 输出：私钥一律脱敏 ---

std::ostream& operator<<(std::ostream& os, const CommunicationSecretKey&)
{
    return os << "<redacted>";
}

std::ostream& operator<<(std::ostream& os, const MemberSecretKey& key)
{
    return os << "MemberSecretKey(index=" << key.index() << ", <redacted>)";
}

std::ostream& operator<<(std::ostream& os, const CommunicationPublicKey& key)
{
    return print_public(os, key);
}

std::ostream& operator<<(std::ostream& os, const MemberPublicKey& key)
{
    return print_public(os, key);
}

std::ostream& operator<<(std::ostream& os, const EncryptingPublicKey& key)
{
    return print_public(os, key);
}

} // namespace Ballot::Tally
