#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "crypto/blst/P1.hpp"
#include "crypto/elgamal.hpp"
#include "crypto/error.hpp"
#include "crypto/random.hpp"

using namespace Ballot::Crypto;
using namespace Ballot::Crypto::Elgamal;

class ElgamalTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        auto sk = Scalar::random(rng_);
        ASSERT_TRUE(sk.has_value());
        secret_ = *sk;
        public_ = bls::mul_generator(secret_);
    }

    SeededRandom rng_ { 2024 };
    SecretKey secret_;
    PublicKey public_;
};

TEST_F(ElgamalTest, DecryptWithOwnShare)
{
    auto ct = encrypt(public_, Scalar::from_uint64(5), rng_);
    ASSERT_TRUE(ct.has_value());

    PartialDecryption share = decrypt_share(secret_, *ct);
    EXPECT_TRUE(verify_share(public_, share, *ct));
    EXPECT_EQ(message_point(*ct, share.value), bls::mul_generator(Scalar::from_uint64(5)));
}

TEST_F(ElgamalTest, HomomorphicAddition)
{
    auto a = encrypt(public_, Scalar::from_uint64(3), rng_);
    auto b = encrypt(public_, Scalar::from_uint64(4), rng_);
    ASSERT_TRUE(a && b);

    Ciphertext sum = *a;
    sum.add(*b);
    PartialDecryption share = decrypt_share(secret_, sum);
    EXPECT_EQ(message_point(sum, share.value), bls::mul_generator(Scalar::from_uint64(7)));
}

TEST_F(ElgamalTest, ShareIsDeterministic)
{
    auto ct = encrypt(public_, Scalar::from_uint64(1), rng_);
    ASSERT_TRUE(ct.has_value());

    EXPECT_EQ(decrypt_share(secret_, *ct).to_bytes(), decrypt_share(secret_, *ct).to_bytes());
}

TEST_F(ElgamalTest, ForgedShareIsRejected)
{
    auto ct = encrypt(public_, Scalar::from_uint64(1), rng_);
    ASSERT_TRUE(ct.has_value());
    PartialDecryption share = decrypt_share(secret_, *ct);

    // 篡改部分解密值
    PartialDecryption tampered = share;
    tampered.value.add(P1::generator());
    EXPECT_FALSE(verify_share(public_, tampered, *ct));

    // 用别人的私钥生成的份额不能冒充
    auto other = Scalar::random(rng_);
    ASSERT_TRUE(other.has_value());
    EXPECT_FALSE(verify_share(public_, decrypt_share(*other, *ct), *ct));
}

TEST_F(ElgamalTest, CiphertextAndShareEncoding)
{
    auto ct = encrypt(public_, Scalar::from_uint64(9), rng_);
    ASSERT_TRUE(ct.has_value());

    auto ct_bytes = ct->to_bytes();
    auto ct2 = Ciphertext::from_bytes(ct_bytes);
    ASSERT_TRUE(ct2.has_value());
    EXPECT_EQ(ct2->e1, ct->e1);
    EXPECT_EQ(ct2->e2, ct->e2);

    PartialDecryption share = decrypt_share(secret_, *ct);
    auto share2 = PartialDecryption::from_bytes(share.to_bytes());
    ASSERT_TRUE(share2.has_value());
    EXPECT_TRUE(verify_share(public_, *share2, *ct));

    EXPECT_FALSE(Ciphertext::from_bytes(BytesSpan(ct_bytes).first(95)));
}

TEST_F(ElgamalTest, HybridRoundTrip)
{
    Aes::Context ctx;
    const std::string msg = "f(j) || f'(j)";
    std::vector<Byte> plaintext(msg.begin(), msg.end());

    auto hc = Hybrid::encrypt(ctx, rng_, public_, plaintext);
    ASSERT_TRUE(hc.has_value());

    auto pt = Hybrid::decrypt(ctx, secret_, *hc);
    ASSERT_TRUE(pt.has_value());
    EXPECT_EQ(*pt, plaintext);

    auto wrong = Scalar::random(rng_);
    ASSERT_TRUE(wrong.has_value());
    auto bad = Hybrid::decrypt(ctx, *wrong, *hc);
    EXPECT_TRUE(!bad.has_value() || *bad != plaintext);
}
