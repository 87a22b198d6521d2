#include <gtest/gtest.h>
#include <vector>

#include "crypto/random.hpp"
#include "tally/encrypted_tally.hpp"
#include "tally/error.hpp"

using namespace Ballot;
using namespace Ballot::Tally;

class EncryptedTallyTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        auto s = Scalar::random(rng_);
        ASSERT_TRUE(s.has_value());
        secret_ = *s;
        key_ = EncryptingPublicKey(Crypto::bls::mul_generator(*s));
    }

    // 单一私钥下解出 g·m
    P1 decrypt_option(const EncryptedTally& tally, size_t option) const
    {
        const auto& ct = tally.ciphertexts()[option];
        return Crypto::Elgamal::message_point(ct, Crypto::Elgamal::decrypt_share(secret_, ct).value);
    }

    Crypto::SeededRandom rng_ { 31 };
    Scalar secret_;
    EncryptingPublicKey key_;
};

TEST_F(EncryptedTallyTest, BlobIsConcatenatedCiphertexts)
{
    auto ballot = encrypt_vote(key_, 1, 3, rng_);
    ASSERT_TRUE(ballot.has_value());

    Bytes blob = ballot->to_bytes();
    EXPECT_EQ(blob.size(), 3 * Ciphertext::SERIALIZED_SIZE);

    auto parsed = EncryptedTally::from_bytes(blob);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->options(), 3u);
    EXPECT_EQ(parsed->to_bytes(), blob);

    auto via_text = EncryptedTally::from_base64(ballot->to_base64());
    ASSERT_TRUE(via_text.has_value());
    EXPECT_EQ(via_text->to_bytes(), blob);
}

TEST_F(EncryptedTallyTest, MalformedBlobsAreRejected)
{
    auto ballot = encrypt_vote(key_, 0, 2, rng_);
    ASSERT_TRUE(ballot.has_value());
    Bytes blob = ballot->to_bytes();

    EXPECT_EQ(EncryptedTally::from_bytes({}).error(), Error::MalformedEncryptedTally);

    Bytes truncated(blob.begin(), blob.end() - 1);
    EXPECT_EQ(EncryptedTally::from_bytes(truncated).error(), Error::MalformedEncryptedTally);

    Bytes garbage(Ciphertext::SERIALIZED_SIZE, 0x11);
    EXPECT_EQ(EncryptedTally::from_bytes(garbage).error(), Error::MalformedEncryptedTally);

    EXPECT_EQ(EncryptedTally::from_base64("%%%%").error(), Error::MalformedEncryptedTally);
}

TEST_F(EncryptedTallyTest, AggregationIsHomomorphic)
{
    EncryptedTally tally = EncryptedTally::zero(2);
    auto yes = encrypt_vote(key_, 0, 2, rng_);
    auto no = encrypt_vote(key_, 1, 2, rng_);
    ASSERT_TRUE(yes && no);

    ASSERT_TRUE(tally.add(*yes, 3));
    ASSERT_TRUE(tally.add(*no, 1));

    EXPECT_EQ(decrypt_option(tally, 0), Crypto::bls::mul_generator(Scalar::from_uint64(3)));
    EXPECT_EQ(decrypt_option(tally, 1), Crypto::bls::mul_generator(Scalar::from_uint64(1)));

    auto mismatched = encrypt_vote(key_, 0, 3, rng_);
    ASSERT_TRUE(mismatched.has_value());
    EXPECT_EQ(tally.add(*mismatched, 1).error(), Error::MalformedEncryptedTally);
}

TEST_F(EncryptedTallyTest, ChoiceMustBeAnOption)
{
    EXPECT_FALSE(encrypt_vote(key_, 2, 2, rng_));
    EXPECT_FALSE(encrypt_vote(key_, 0, 0, rng_));
}
