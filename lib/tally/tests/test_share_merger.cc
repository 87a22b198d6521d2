#include <gtest/gtest.h>
#include <vector>

#include "crypto/random.hpp"
#include "tally/error.hpp"
#include "tally/share_merger.hpp"
#include "tally_test_utils.hpp"

using namespace Ballot;
using namespace Ballot::Tally;
using namespace Ballot::Tally::Testing;

class ShareMergerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        auto set = generate(roster_of(3), 2, rng_, EncryptingKeyMode::Committee);
        ASSERT_TRUE(set.has_value());
        for (const auto& member : roster_of(3))
            keys_.push_back(set->members.at(member.identity).member_secret_share);
        const auto& election_key = set->members.at("id-0").encrypting_public_key;

        p1_ = encrypted_proposal("P1", tally_with(election_key, { 1, 2 }, rng_));
        p2_ = encrypted_proposal("P2", tally_with(election_key, { 3, 0 }, rng_));
    }

    VotePlanShareBundle bundle_for(size_t member, std::vector<Proposal> proposals, std::string plan = "plan")
    {
        auto bundle = shares_for_vote_plan(proposals, keys_[member], std::move(plan));
        EXPECT_TRUE(bundle.has_value());
        return bundle.value_or(VotePlanShareBundle {});
    }

    Crypto::SeededRandom rng_ { 12 };
    std::vector<MemberSecretKey> keys_;
    Proposal p1_;
    Proposal p2_;
};

TEST_F(ShareMergerTest, PoolsSharesInBundleOrder)
{
    // A = {P1: [s1]}, B = {P1: [s2], P2: [s3]}
    VotePlanShareBundle a = bundle_for(0, { p1_ });
    VotePlanShareBundle b = bundle_for(1, { p1_, p2_ });
    const DecryptionShare s1 = a.proposals[0].shares[0];
    const DecryptionShare s2 = b.proposals[0].shares[0];
    const DecryptionShare s3 = b.proposals[1].shares[0];

    std::vector<VotePlanShareBundle> bundles = { a, b };
    auto merged = merge(bundles);
    ASSERT_TRUE(merged.has_value());

    EXPECT_EQ(merged->vote_plan_id, "plan");
    ASSERT_EQ(merged->members.size(), 2u);
    EXPECT_EQ(merged->members[0], keys_[0].to_public());
    EXPECT_EQ(merged->members[1], keys_[1].to_public());

    ASSERT_EQ(merged->proposals.size(), 2u);
    EXPECT_EQ(merged->proposals[0].proposal_id, "P1");
    EXPECT_EQ(merged->proposals[0].shares, (std::vector<DecryptionShare> { s1, s2 }));
    EXPECT_EQ(merged->proposals[1].proposal_id, "P2");
    EXPECT_EQ(merged->proposals[1].shares, (std::vector<DecryptionShare> { s3 }));
}

TEST_F(ShareMergerTest, ProposalOrderIsFirstAppearance)
{
    std::vector<VotePlanShareBundle> bundles = {
        bundle_for(2, { p2_ }),
        bundle_for(0, { p1_, p2_ }),
    };
    auto merged = merge(bundles);
    ASSERT_TRUE(merged.has_value());
    ASSERT_EQ(merged->proposals.size(), 2u);
    EXPECT_EQ(merged->proposals[0].proposal_id, "P2");
    EXPECT_EQ(merged->proposals[0].shares.size(), 2u);
    EXPECT_EQ(merged->proposals[0].shares[0].member_index, 3u);
    EXPECT_EQ(merged->proposals[0].shares[1].member_index, 1u);
    EXPECT_EQ(merged->proposals[1].proposal_id, "P1");
}

TEST_F(ShareMergerTest, SameMemberTwiceIsRejected)
{
    VotePlanShareBundle a = bundle_for(0, { p1_ });
    std::vector<VotePlanShareBundle> bundles = { a, bundle_for(1, { p1_ }), a };

    auto merged = merge(bundles);
    ASSERT_FALSE(merged.has_value());
    EXPECT_EQ(merged.error(), Error::DuplicateContribution);
}

TEST_F(ShareMergerTest, DifferentVotePlansAreRejected)
{
    std::vector<VotePlanShareBundle> bundles = {
        bundle_for(0, { p1_ }, "plan-a"),
        bundle_for(1, { p1_ }, "plan-b"),
    };
    auto merged = merge(bundles);
    ASSERT_FALSE(merged.has_value());
    EXPECT_EQ(merged.error(), Error::VotePlanMismatch);
}

TEST_F(ShareMergerTest, ShareFromAnotherMemberIsRejected)
{
    VotePlanShareBundle a = bundle_for(0, { p1_ });
    VotePlanShareBundle b = bundle_for(1, { p1_ });
    a.proposals[0].shares = b.proposals[0].shares;

    std::vector<VotePlanShareBundle> bundles = { a };
    auto merged = merge(bundles);
    ASSERT_FALSE(merged.has_value());
    EXPECT_EQ(merged.error(), Error::DeserializationError);
}

TEST_F(ShareMergerTest, EmptyInputIsRejected)
{
    auto merged = merge({});
    ASSERT_FALSE(merged.has_value());
    EXPECT_EQ(merged.error(), Error::DeserializationError);
}

TEST_F(ShareMergerTest, MemberWithoutEncryptedProposalsStillCounts)
{
    std::vector<VotePlanShareBundle> bundles = {
        bundle_for(0, { public_proposal("P0") }),
        bundle_for(1, { p1_ }),
    };
    auto merged = merge(bundles);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->members.size(), 2u);
    ASSERT_EQ(merged->proposals.size(), 1u);
    EXPECT_EQ(merged->proposals[0].shares.size(), 1u);
}
