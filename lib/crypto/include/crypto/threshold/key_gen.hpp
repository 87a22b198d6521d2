#pragma once

#include "crypto/aes.hpp"
#include "crypto/blst/P1.hpp"
#include "crypto/blst/Scalar.hpp"
#include "crypto/elgamal.hpp"
#include <expected>
#include <span>
#include <system_error>
#include <vector>

namespace Ballot::Crypto {
class RandomSource;
}

namespace Ballot::Crypto::Threshold {

using Scalar = bls::Scalar;
using P1 = bls::P1;

// 秘密份额（标量）
using SecretShare = Scalar;

/**
 * @struct CommonReferenceString
 * @brief Second generator h for Pedersen commitments, with unknown log_g(h).
 */
struct CommonReferenceString {
    P1 h;

    static auto random(RandomSource& rng) -> std::expected<CommonReferenceString, std::error_code>;
};

/**
 * @struct DealtShare
 * @brief Evaluation of a dealer's secret and blinding polynomials at one
 *        participant id: (f(j), f'(j)).
 */
struct DealtShare {
    SecretShare value;
    Scalar blinding;
};

struct EncryptedShare {
    int recipient_id; // 1-based
    Elgamal::Hybrid::HybridCiphertext ciphertext;
};

/**
 * @struct Dealing
 * @brief Public output of one participant's Pedersen VSS step.
 *
 * commitments[k] = g·a_k + h·b_k for the coefficients of f and f'. Shares are
 * encrypted to each recipient's communication key.
 */
struct Dealing {
    int dealer_id; // 1-based
    int threshold;
    std::vector<P1> commitments;
    std::vector<EncryptedShare> encrypted_shares;
};

/**
 * @struct DealerState
 * @brief Everything a participant keeps after dealing. `secret` (the constant
 *        term a_0) is private; `public_key` = g·a_0.
 */
struct DealerState {
    Dealing dealing;
    SecretShare secret;
    P1 public_key;
};

inline auto random_poly(RandomSource& rng, int coefficients)
    -> std::expected<std::vector<Scalar>, std::error_code>
{
    std::vector<Scalar> coeffs;
    coeffs.reserve(coefficients);
    for (int i = 0; i < coefficients; ++i) {
        auto c = Scalar::random(rng, "BALLOT_VSS_POLYNOMIAL");
        if (!c) {
            return std::unexpected(c.error());
        }
        coeffs.push_back(*c);
    }
    return coeffs;
}

inline Scalar polynom_eval(Scalar x, std::span<const Scalar> coeffs)
{
    if (coeffs.empty())
        return Scalar::from_uint64(0);
    Scalar res = coeffs.back();
    for (auto it = coeffs.rbegin() + 1; it != coeffs.rend(); ++it)
        res = res * x + (*it);
    return res;
}

/**
 * Runs participant `dealer_index` (0-based roster position, VSS id
 * dealer_index + 1) of a (threshold, n) Pedersen VSS where n is the number of
 * communication keys. A (k, n) scheme requires polynomials of degree k-1.
 */
[[nodiscard]]
auto deal(Aes::Context& ctx,
    RandomSource& rng,
    int threshold,
    const CommonReferenceString& crs,
    std::span<const P1> communication_keys,
    int dealer_index)
    -> std::expected<DealerState, std::error_code>;

// 接收方用自己的通信私钥解出份额
[[nodiscard]]
auto open_share(Aes::Context& ctx,
    const Dealing& dealing,
    int recipient_id,
    const Scalar& communication_secret)
    -> std::expected<DealtShare, std::error_code>;

// g·f(j) + h·f'(j) == Σ_k C_k · j^k
[[nodiscard]]
bool verify_share(const CommonReferenceString& crs,
    const Dealing& dealing,
    int recipient_id,
    const DealtShare& share);

} // namespace Ballot::Crypto::Threshold
