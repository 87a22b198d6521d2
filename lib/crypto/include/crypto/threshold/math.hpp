#pragma once

#include "crypto/blst/Scalar.hpp"
#include "crypto/error.hpp"
#include <expected>
#include <span>
#include <system_error>
#include <type_traits>
#include <unordered_set>
#include <vector>

namespace Ballot::Crypto::Math {

using Scalar = Ballot::Crypto::bls::Scalar;

template <typename T>
concept Interpolatable = requires(T a, T b, Scalar s) {
    { a.identity() } -> std::same_as<T>;
    { a.add(b) } -> std::same_as<T&>;
    { a.mult(s) } -> std::same_as<T&>;
};

template <typename T>
concept ShareLike = requires(const T& a) {
    { a.player_id } -> std::convertible_to<int>;
    requires Interpolatable<std::decay_t<decltype(a.value)>>;
};

/**
 * @brief Lagrange basis coefficients λ_i(0) for the given (distinct, >= 1) ids.
 */
inline auto lagrange_coefficients_at_zero(std::span<const int> ids)
    -> std::expected<std::vector<Scalar>, std::error_code>
{
    const size_t k = ids.size();
    if (k == 0) {
        return std::unexpected(Error::NotEnoughShares);
    }

    // --- 校验并提取插值点 x_i ---
    std::vector<Scalar> xs;
    xs.reserve(k);
    std::unordered_set<int> seen_ids;
    for (int id : ids) {
        if (id < 1) {
            return std::unexpected(Error::InvalidShareID);
        }
        if (!seen_ids.insert(id).second) {
            return std::unexpected(Error::DuplicatePlayerID);
        }
        xs.push_back(Scalar::from_uint64(static_cast<uint64_t>(id)));
    }

    std::vector<Scalar> lambdas;
    lambdas.reserve(k);
    for (size_t i = 0; i < k; ++i) {
        // λ_i(0) = Π_{j≠i} (0 - x_j) / Π_{j≠i} (x_i - x_j)
        auto numerator = Scalar::from_uint64(1);
        auto denominator = Scalar::from_uint64(1);
        for (size_t j = 0; j < k; ++j) {
            if (i == j)
                continue;
            numerator *= -xs[j];
            denominator *= (xs[i] - xs[j]);
        }
        lambdas.push_back(numerator * denominator.inverse());
    }
    return lambdas;
}

/**
 * @brief Performs Lagrange interpolation to find the polynomial's value at x=0.
 *
 * @tparam ShareT A type that satisfies the ShareLike concept.
 * @param shares A span of k shares to interpolate.
 * @return The interpolated value at x=0, or an error.
 */
template <ShareLike ShareT>
auto interpolate_at_zero(std::span<const ShareT> shares)
    -> std::expected<std::decay_t<decltype(shares[0].value)>, std::error_code>
{
    using ValueT = std::decay_t<decltype(shares[0].value)>;

    std::vector<int> ids;
    ids.reserve(shares.size());
    for (const auto& s : shares) {
        ids.push_back(s.player_id);
    }

    auto lambdas = lagrange_coefficients_at_zero(ids);
    if (!lambdas) {
        return std::unexpected(lambdas.error());
    }

    // --- 聚合 ∑ λ_i(0) · y_i ---
    auto result = ValueT::identity();
    for (size_t i = 0; i < shares.size(); ++i) {
        ValueT term = shares[i].value; // This is a copy
        term.mult((*lambdas)[i]);
        result.add(term);
    }
    return result;
}

} // namespace Ballot::Crypto::Math
