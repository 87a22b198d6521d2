#include "crypto/elgamal.hpp"
#include "crypto/blst/P1.hpp"
#include "crypto/blst/Scalar.hpp"
#include "crypto/common.hpp"
#include "crypto/error.hpp"
#include "crypto/random.hpp"
#include "crypto/threshold/utils.hpp"
#include <algorithm>
#include <array>
#include <expected>
#include <system_error>
#include <vector>

namespace Ballot::Crypto::Elgamal {

namespace {
    constexpr std::string_view DST_NONCE = "BALLOT_DLEQ_NONCE_BLS12381G1_V1";
    constexpr std::string_view DST_CHALLENGE = "BALLOT_DLEQ_CHALLENGE_BLS12381G1_V1";
    constexpr std::string_view DST_ENCRYPT = "BALLOT_ELGAMAL_RANDOMNESS";

    Scalar challenge_for(const P1& public_key, const P1& e1, const P1& d, const P1& a1, const P1& a2)
    {
        return Utils::hash_to_scalar(
            {
                P1::generator().compress(),
                public_key.compress(),
                e1.compress(),
                d.compress(),
                a1.compress(),
                a2.compress(),
            },
            DST_CHALLENGE);
    }
} // namespace

Ciphertext& Ciphertext::add(const Ciphertext& other)
{
    e1.add(other.e1);
    e2.add(other.e2);
    return *this;
}

Ciphertext& Ciphertext::mult(const Scalar& s)
{
    e1.mult(s);
    e2.mult(s);
    return *this;
}

std::array<Byte, Ciphertext::SERIALIZED_SIZE> Ciphertext::to_bytes() const
{
    std::array<Byte, SERIALIZED_SIZE> out {};
    auto first = e1.compress();
    auto second = e2.compress();
    std::ranges::copy(first, out.begin());
    std::ranges::copy(second, out.begin() + P1::COMPRESSED_SIZE);
    return out;
}

auto Ciphertext::from_bytes(BytesSpan in) -> std::expected<Ciphertext, std::error_code>
{
    if (in.size() != SERIALIZED_SIZE) {
        return std::unexpected(Error::PointDecodingFailed);
    }
    auto e1 = P1::from_bytes(in.first(P1::COMPRESSED_SIZE));
    if (!e1) {
        return std::unexpected(e1.error());
    }
    auto e2 = P1::from_bytes(in.subspan(P1::COMPRESSED_SIZE));
    if (!e2) {
        return std::unexpected(e2.error());
    }
    return Ciphertext { .e1 = *e1, .e2 = *e2 };
}

std::array<Byte, PartialDecryption::SERIALIZED_SIZE> PartialDecryption::to_bytes() const
{
    std::array<Byte, SERIALIZED_SIZE> out {};
    auto it = std::ranges::copy(value.compress(), out.begin()).out;
    it = std::ranges::copy(proof.challenge.to_bytes(), it).out;
    std::ranges::copy(proof.response.to_bytes(), it);
    return out;
}

auto PartialDecryption::from_bytes(BytesSpan in) -> std::expected<PartialDecryption, std::error_code>
{
    if (in.size() != SERIALIZED_SIZE) {
        return std::unexpected(Error::PointDecodingFailed);
    }
    auto value = P1::from_bytes(in.first(P1::COMPRESSED_SIZE));
    if (!value) {
        return std::unexpected(value.error());
    }
    auto challenge = Scalar::from_bytes(in.subspan(P1::COMPRESSED_SIZE, Scalar::SERIALIZED_SIZE));
    if (!challenge) {
        return std::unexpected(challenge.error());
    }
    auto response = Scalar::from_bytes(in.subspan(P1::COMPRESSED_SIZE + Scalar::SERIALIZED_SIZE));
    if (!response) {
        return std::unexpected(response.error());
    }
    return PartialDecryption {
        .value = *value,
        .proof = { .challenge = *challenge, .response = *response },
    };
}

Ciphertext encrypt_with(const PublicKey& public_key, const Scalar& message, const Scalar& randomness)
{
    P1 e1 = bls::mul_generator(randomness);

    P1 e2 = bls::mul_generator(message);
    P1 mask = public_key;
    mask.mult(randomness);
    e2.add(mask);

    return { .e1 = e1, .e2 = e2 };
}

auto encrypt(const PublicKey& public_key, const Scalar& message, RandomSource& rng)
    -> std::expected<Ciphertext, std::error_code>
{
    auto r = Scalar::random(rng, DST_ENCRYPT.data());
    if (!r) {
        return std::unexpected(r.error());
    }
    return encrypt_with(public_key, message, *r);
}

PartialDecryption decrypt_share(const SecretKey& secret, const Ciphertext& ciphertext)
{
    P1 d = ciphertext.e1;
    d.mult(secret);

    // 确定性 nonce: k = H(sk || e1)，份额因此是输入的纯函数
    Scalar k = Utils::hash_to_scalar({ secret.to_bytes(), ciphertext.e1.compress() }, DST_NONCE);

    P1 a1 = bls::mul_generator(k);
    P1 a2 = ciphertext.e1;
    a2.mult(k);

    P1 public_key = bls::mul_generator(secret);
    Scalar c = challenge_for(public_key, ciphertext.e1, d, a1, a2);
    Scalar z = k + c * secret;

    return { .value = d, .proof = { .challenge = c, .response = z } };
}

bool verify_share(const PublicKey& public_key,
    const PartialDecryption& decryption,
    const Ciphertext& ciphertext)
{
    const Scalar& c = decryption.proof.challenge;
    const Scalar& z = decryption.proof.response;

    // a1 = g·z - pk·c
    P1 a1 = bls::mul_generator(z);
    P1 pk_c = public_key;
    pk_c.mult(c);
    a1.add(-pk_c);

    // a2 = e1·z - d·c
    P1 a2 = ciphertext.e1;
    a2.mult(z);
    P1 d_c = decryption.value;
    d_c.mult(c);
    a2.add(-d_c);

    return challenge_for(public_key, ciphertext.e1, decryption.value, a1, a2) == c;
}

P1 message_point(const Ciphertext& ciphertext, const P1& combined_decryption)
{
    P1 m = ciphertext.e2;
    m.add(-combined_decryption);
    return m;
}

namespace Hybrid {

    namespace {
        constexpr std::string_view DST_HYBRID = "BALLOT_HYBRID_EPHEMERAL";

        auto session_key(const P1& shared_point) -> std::expected<Aes::AesKey, std::error_code>
        {
            return Utils::hashG(shared_point);
        }
    } // namespace

    auto encrypt(Aes::Context& ctx, RandomSource& rng, const PublicKey& recipient,
        BytesSpan plaintext)
        -> std::expected<HybridCiphertext, std::error_code>
    {
        auto r = Scalar::random(rng, DST_HYBRID.data());
        if (!r) {
            return std::unexpected(r.error());
        }

        P1 u = bls::mul_generator(*r);
        P1 shared = recipient;
        shared.mult(*r);

        auto key = session_key(shared);
        if (!key) {
            return std::unexpected(key.error());
        }

        auto data = Aes::seal(ctx, rng, *key, plaintext);
        if (!data) {
            return std::unexpected(data.error());
        }
        return HybridCiphertext { .u_component = u, .data_ciphertext = std::move(*data) };
    }

    auto decrypt(Aes::Context& ctx, const SecretKey& recipient_secret,
        const HybridCiphertext& ciphertext)
        -> std::expected<std::vector<Byte>, std::error_code>
    {
        P1 shared = ciphertext.u_component;
        shared.mult(recipient_secret);

        auto key = session_key(shared);
        if (!key) {
            return std::unexpected(key.error());
        }
        return Aes::open(ctx, *key, ciphertext.data_ciphertext);
    }

} // namespace Hybrid

} // namespace Ballot::Crypto::Elgamal
