#include "crypto/threshold/key_gen.hpp"
#include "crypto/blst/P1.hpp"
#include "crypto/blst/Scalar.hpp"
#include "crypto/common.hpp"
#include "crypto/error.hpp"
#include "crypto/random.hpp"
#include <algorithm>
#include <array>
#include <ranges>

namespace Ballot::Crypto::Threshold {

namespace {
    constexpr std::string_view DST_CRS = "BALLOT_CRS_BLS12381G1_XMD:SHA-256_SSWU_RO_";

    // 份额明文: f(j) || f'(j)，各 32 字节
    std::array<Byte, 2 * Scalar::SERIALIZED_SIZE> share_bytes(const DealtShare& share)
    {
        std::array<Byte, 2 * Scalar::SERIALIZED_SIZE> out {};
        auto it = std::ranges::copy(share.value.to_bytes(), out.begin()).out;
        std::ranges::copy(share.blinding.to_bytes(), it);
        return out;
    }
} // namespace

auto CommonReferenceString::random(RandomSource& rng)
    -> std::expected<CommonReferenceString, std::error_code>
{
    std::array<Byte, 32> seed {};
    if (auto filled = rng.fill(seed); !filled) {
        return std::unexpected(filled.error());
    }
    return CommonReferenceString { .h = P1::from_hash(seed, as_span(DST_CRS)) };
}

auto deal(Aes::Context& ctx,
    RandomSource& rng,
    int threshold,
    const CommonReferenceString& crs,
    std::span<const P1> communication_keys,
    int dealer_index)
    -> std::expected<DealerState, std::error_code>
{
    const int players = static_cast<int>(communication_keys.size());
    if (players < 1)
        return std::unexpected(Error::InvalidPlayerCount);
    if (threshold < 1 || threshold > players)
        return std::unexpected(Error::InvalidThreshold);
    if (dealer_index < 0 || dealer_index >= players)
        return std::unexpected(Error::InvalidShareID);

    auto secret_poly = random_poly(rng, threshold);
    if (!secret_poly)
        return std::unexpected(secret_poly.error());
    auto blinding_poly = random_poly(rng, threshold);
    if (!blinding_poly)
        return std::unexpected(blinding_poly.error());

    // C_k = g·a_k + h·b_k
    std::vector<P1> commitments;
    commitments.reserve(threshold);
    for (const auto& [a, b] : std::views::zip(*secret_poly, *blinding_poly)) {
        P1 c = bls::mul_generator(a);
        P1 hb = crs.h;
        hb.mult(b);
        c.add(hb);
        commitments.push_back(c);
    }

    std::vector<EncryptedShare> encrypted_shares;
    encrypted_shares.reserve(players);
    for (int recipient_id : std::views::iota(1, players + 1)) {
        const Scalar x = Scalar::from_uint64(recipient_id);
        DealtShare share {
            .value = polynom_eval(x, *secret_poly),
            .blinding = polynom_eval(x, *blinding_poly),
        };

        auto ct = Elgamal::Hybrid::encrypt(ctx, rng, communication_keys[recipient_id - 1], share_bytes(share));
        if (!ct)
            return std::unexpected(ct.error());

        encrypted_shares.push_back({ .recipient_id = recipient_id, .ciphertext = std::move(*ct) });
    }

    // The secret is the constant term (a_0) of the polynomial.
    const Scalar& secret = (*secret_poly)[0];

    return DealerState {
        .dealing = {
            .dealer_id = dealer_index + 1,
            .threshold = threshold,
            .commitments = std::move(commitments),
            .encrypted_shares = std::move(encrypted_shares),
        },
        .secret = secret,
        .public_key = bls::mul_generator(secret),
    };
}

auto open_share(Aes::Context& ctx,
    const Dealing& dealing,
    int recipient_id,
    const Scalar& communication_secret)
    -> std::expected<DealtShare, std::error_code>
{
    auto it = std::ranges::find(dealing.encrypted_shares, recipient_id, &EncryptedShare::recipient_id);
    if (it == dealing.encrypted_shares.end())
        return std::unexpected(Error::InvalidShareID);

    auto plaintext = Elgamal::Hybrid::decrypt(ctx, communication_secret, it->ciphertext);
    if (!plaintext)
        return std::unexpected(plaintext.error());
    if (plaintext->size() != 2 * Scalar::SERIALIZED_SIZE)
        return std::unexpected(Error::DecryptionFailed);

    BytesSpan bytes(*plaintext);
    auto value = Scalar::from_bytes(bytes.first(Scalar::SERIALIZED_SIZE));
    if (!value)
        return std::unexpected(value.error());
    auto blinding = Scalar::from_bytes(bytes.subspan(Scalar::SERIALIZED_SIZE));
    if (!blinding)
        return std::unexpected(blinding.error());

    return DealtShare { .value = *value, .blinding = *blinding };
}

bool verify_share(const CommonReferenceString& crs,
    const Dealing& dealing,
    int recipient_id,
    const DealtShare& share)
{
    if (recipient_id < 1 || dealing.commitments.empty())
        return false;

    // lhs = g·f(j) + h·f'(j)
    P1 lhs = bls::mul_generator(share.value);
    P1 hb = crs.h;
    hb.mult(share.blinding);
    lhs.add(hb);

    // rhs = Σ_k C_k · j^k
    const Scalar x = Scalar::from_uint64(recipient_id);
    Scalar power = Scalar::from_uint64(1);
    P1 rhs = P1::identity();
    for (const P1& commitment : dealing.commitments) {
        P1 term = commitment;
        term.mult(power);
        rhs.add(term);
        power *= x;
    }

    return lhs == rhs;
}

} // namespace Ballot::Crypto::Threshold
