#include "tally/encrypted_tally.hpp"
#include "crypto/random.hpp"
#include "crypto/text_codec.hpp"
#include "tally/error.hpp"
#include "tally/log.hpp"
#include <algorithm>
#include <format>
#include <ranges>

namespace Ballot::Tally {

EncryptedTally EncryptedTally::zero(size_t options)
{
    return EncryptedTally(std::vector<Ciphertext>(options, Ciphertext::zero()));
}

auto EncryptedTally::from_bytes(BytesSpan bytes) -> std::expected<EncryptedTally, std::error_code>
{
    constexpr size_t CT = Ciphertext::SERIALIZED_SIZE;
    if (bytes.empty() || bytes.size() % CT != 0) {
        logger().debug(std::format("encrypted tally: invalid length {}", bytes.size()));
        return std::unexpected(Error::MalformedEncryptedTally);
    }

    std::vector<Ciphertext> options;
    options.reserve(bytes.size() / CT);
    for (size_t offset = 0; offset < bytes.size(); offset += CT) {
        auto ct = Ciphertext::from_bytes(bytes.subspan(offset, CT));
        if (!ct) {
            logger().debug(std::format("encrypted tally: option {}: {}", offset / CT, ct.error().message()));
            return std::unexpected(Error::MalformedEncryptedTally);
        }
        options.push_back(*ct);
    }
    return EncryptedTally(std::move(options));
}

auto EncryptedTally::from_base64(std::string_view text) -> std::expected<EncryptedTally, std::error_code>
{
    auto bytes = Crypto::Base64::decode(text);
    if (!bytes) {
        return std::unexpected(Error::MalformedEncryptedTally);
    }
    return from_bytes(*bytes);
}

Bytes EncryptedTally::to_bytes() const
{
    Bytes out;
    out.reserve(options_.size() * Ciphertext::SERIALIZED_SIZE);
    for (const auto& ct : options_) {
        auto b = ct.to_bytes();
        out.insert(out.end(), b.begin(), b.end());
    }
    return out;
}

std::string EncryptedTally::to_base64() const
{
    return Crypto::Base64::encode(to_bytes());
}

auto EncryptedTally::add(const EncryptedTally& ballot, uint64_t weight) -> std::expected<void, std::error_code>
{
    if (ballot.options() != options()) {
        return std::unexpected(Error::MalformedEncryptedTally);
    }
    const Scalar w = Scalar::from_uint64(weight);
    for (auto&& [acc, ct] : std::views::zip(options_, ballot.options_)) {
        Ciphertext scaled = ct;
        acc.add(scaled.mult(w));
    }
    return {};
}

auto encrypt_vote(const EncryptingPublicKey& key, size_t choice, size_t options, Crypto::RandomSource& rng)
    -> std::expected<EncryptedTally, std::error_code>
{
    if (options == 0 || choice >= options) {
        return std::unexpected(Error::MalformedEncryptedTally);
    }

    std::vector<Ciphertext> cts;
    cts.reserve(options);
    for (size_t i = 0; i < options; ++i) {
        auto ct = Crypto::Elgamal::encrypt(key.point(), Scalar::from_uint64(i == choice ? 1 : 0), rng);
        if (!ct) {
            logger().error(std::format("ballot encryption failed: {}", ct.error().message()));
            return std::unexpected(Error::CryptoError);
        }
        cts.push_back(*ct);
    }
    return EncryptedTally(std::move(cts));
}

} // namespace Ballot::Tally
