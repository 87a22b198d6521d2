#include <gtest/gtest.h>
#include <vector>

#include "crypto/blst/P1.hpp"
#include "crypto/error.hpp"
#include "crypto/threshold/key_gen.hpp"
#include "crypto/threshold/math.hpp"

using namespace Ballot::Crypto;
using Ballot::Crypto::bls::P1;
using Ballot::Crypto::bls::Scalar;

namespace {
struct PointShare {
    int player_id;
    P1 value;
};
} // namespace

TEST(LagrangeTest, CoefficientsSumToOne)
{
    std::vector<int> ids = { 1, 3, 4 };
    auto lambdas = Math::lagrange_coefficients_at_zero(ids);
    ASSERT_TRUE(lambdas.has_value());

    Scalar sum = Scalar::from_uint64(0);
    for (const auto& l : *lambdas)
        sum += l;
    EXPECT_EQ(sum, Scalar::from_uint64(1));
}

TEST(LagrangeTest, InterpolatesPolynomialInTheExponent)
{
    // f(x) = 5 + 2x + 7x^2，任意 3 个点都能恢复 g·5
    std::vector<Scalar> coeffs = { Scalar::from_uint64(5), Scalar::from_uint64(2), Scalar::from_uint64(7) };

    std::vector<PointShare> shares;
    for (int id : { 2, 4, 5 }) {
        Scalar y = Threshold::polynom_eval(Scalar::from_uint64(id), coeffs);
        shares.push_back({ .player_id = id, .value = bls::mul_generator(y) });
    }

    auto secret = Math::interpolate_at_zero(std::span<const PointShare>(shares));
    ASSERT_TRUE(secret.has_value());
    EXPECT_EQ(*secret, bls::mul_generator(Scalar::from_uint64(5)));
}

TEST(LagrangeTest, RejectsBadIds)
{
    EXPECT_EQ(Math::lagrange_coefficients_at_zero({}).error(), Error::NotEnoughShares);

    std::vector<int> zero = { 0, 1 };
    EXPECT_EQ(Math::lagrange_coefficients_at_zero(zero).error(), Error::InvalidShareID);

    std::vector<int> dup = { 2, 2 };
    EXPECT_EQ(Math::lagrange_coefficients_at_zero(dup).error(), Error::DuplicatePlayerID);
}
