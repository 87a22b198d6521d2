#include <gtest/gtest.h>
#include <cstdint>
#include <map>
#include <vector>

#include "crypto/random.hpp"
#include "tally/error.hpp"
#include "tally/tally_opening.hpp"
#include "tally_test_utils.hpp"

using namespace Ballot;
using namespace Ballot::Tally;
using namespace Ballot::Tally::Testing;

namespace {
OpeningParameters parameters_of(const CommitteeKeySet& set, const EncryptingPublicKey& encrypting_key)
{
    return OpeningParameters {
        .mode = set.mode,
        .threshold = set.threshold,
        .member_public_keys = set.member_public_keys,
        .encrypting_key = encrypting_key,
    };
}

std::vector<DecryptionShare> shares_from(const CommitteeKeySet& set, const CommitteeRoster& roster,
    std::initializer_list<size_t> members, const TallyState& tally)
{
    std::vector<DecryptionShare> shares;
    for (size_t m : members)
        shares.push_back(share_for_tally(tally, set.members.at(roster[m].identity).member_secret_share));
    return shares;
}
} // namespace

TEST(DiscreteLogTest, RecoversSmallValuesAndRespectsBound)
{
    for (uint64_t m : { 0, 1, 2, 15, 99, 100 }) {
        auto found = discrete_log(Crypto::bls::mul_generator(Scalar::from_uint64(m)), 100);
        ASSERT_TRUE(found.has_value()) << m;
        EXPECT_EQ(*found, m);
    }
    auto too_big = discrete_log(Crypto::bls::mul_generator(Scalar::from_uint64(101)), 100);
    ASSERT_FALSE(too_big.has_value());
    EXPECT_EQ(too_big.error(), Error::TallyOutOfRange);
}

TEST(DiscreteLogTest, BoundAboveLimitFailsImmediately)
{
    auto huge = discrete_log(P1::generator(), UINT64_MAX);
    ASSERT_FALSE(huge.has_value());
    EXPECT_EQ(huge.error(), Error::TallyOutOfRange);

    auto limit = discrete_log(P1::generator(), MAX_VOTES_LIMIT + 1);
    ASSERT_FALSE(limit.has_value());
    EXPECT_EQ(limit.error(), Error::TallyOutOfRange);
}

class CommitteeOpeningTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        auto set = generate(roster_, 3, rng_, EncryptingKeyMode::Committee);
        ASSERT_TRUE(set.has_value());
        set_ = std::move(*set);
        tally_ = tally_with(set_.members.at("id-0").encrypting_public_key, { 7, 0, 12 }, rng_);
    }

    CommitteeRoster roster_ = roster_of(5);
    Crypto::SeededRandom rng_ { 55 };
    CommitteeKeySet set_;
    EncryptedTally tally_;
};

TEST_F(CommitteeOpeningTest, AnyThresholdSubsetOpens)
{
    for (auto members : { std::initializer_list<size_t> { 0, 1, 2 },
             std::initializer_list<size_t> { 4, 2, 0 },
             std::initializer_list<size_t> { 1, 2, 3, 4 } }) {
        auto shares = shares_from(set_, roster_, members, tally_);
        auto results = open_tally(tally_, shares, parameters_of(set_, set_.members.at("id-0").encrypting_public_key), 100);
        ASSERT_TRUE(results.has_value());
        EXPECT_EQ(*results, (std::vector<uint64_t> { 7, 0, 12 }));
    }
}

TEST_F(CommitteeOpeningTest, BelowThresholdFails)
{
    auto shares = shares_from(set_, roster_, { 0, 3 }, tally_);
    auto results = open_tally(tally_, shares, parameters_of(set_, set_.members.at("id-0").encrypting_public_key), 100);
    ASSERT_FALSE(results.has_value());
    EXPECT_EQ(results.error(), Error::NotEnoughShares);
}

TEST_F(CommitteeOpeningTest, ForgedShareFails)
{
    auto shares = shares_from(set_, roster_, { 0, 1, 2 }, tally_);
    shares[1].partials[0].value.add(P1::generator());

    auto results = open_tally(tally_, shares, parameters_of(set_, set_.members.at("id-0").encrypting_public_key), 100);
    ASSERT_FALSE(results.has_value());
    EXPECT_EQ(results.error(), Error::ShareVerificationFailed);
}

TEST_F(CommitteeOpeningTest, DuplicateShareFails)
{
    auto shares = shares_from(set_, roster_, { 0, 1, 1 }, tally_);
    auto results = open_tally(tally_, shares, parameters_of(set_, set_.members.at("id-0").encrypting_public_key), 100);
    ASSERT_FALSE(results.has_value());
    EXPECT_EQ(results.error(), Error::DuplicateContribution);
}

TEST_F(CommitteeOpeningTest, CountAboveBoundFails)
{
    auto shares = shares_from(set_, roster_, { 0, 1, 2 }, tally_);
    auto results = open_tally(tally_, shares, parameters_of(set_, set_.members.at("id-0").encrypting_public_key), 10);
    ASSERT_FALSE(results.has_value());
    EXPECT_EQ(results.error(), Error::TallyOutOfRange);
}

TEST_F(CommitteeOpeningTest, OpensMergedVotePlan)
{
    EncryptedTally second = tally_with(set_.members.at("id-0").encrypting_public_key, { 1, 1, 1 }, rng_);
    std::vector<Proposal> proposals = {
        encrypted_proposal("P1", tally_),
        public_proposal("P2"),
        encrypted_proposal("P3", second),
    };

    std::vector<VotePlanShareBundle> bundles;
    for (size_t m : { 3, 1, 4 }) {
        auto bundle = shares_for_vote_plan(proposals, set_.members.at(roster_[m].identity).member_secret_share, "plan");
        ASSERT_TRUE(bundle.has_value());
        bundles.push_back(std::move(*bundle));
    }
    auto merged = merge(bundles);
    ASSERT_TRUE(merged.has_value());

    std::map<std::string, TallyState> tallies = { { "P1", tally_ }, { "P3", second } };
    auto results = open_vote_plan(*merged, tallies, parameters_of(set_, set_.members.at("id-0").encrypting_public_key), 50);
    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->size(), 2u);
    EXPECT_EQ((*results)[0].proposal_id, "P1");
    EXPECT_EQ((*results)[0].results, (std::vector<uint64_t> { 7, 0, 12 }));
    EXPECT_EQ((*results)[1].proposal_id, "P3");
    EXPECT_EQ((*results)[1].results, (std::vector<uint64_t> { 1, 1, 1 }));

    tallies.erase("P3");
    auto missing = open_vote_plan(*merged, tallies, parameters_of(set_, set_.members.at("id-0").encrypting_public_key), 50);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), Error::VotePlanMismatch);
}

TEST(PerMemberOpeningTest, SingleMemberOpensTallyUnderOwnKey)
{
    const auto roster = roster_of(3);
    Crypto::SeededRandom rng(66);
    auto set = generate(roster, 2, rng, EncryptingKeyMode::PerMember);
    ASSERT_TRUE(set.has_value());

    const auto& member = set->members.at("id-2");
    EncryptedTally tally = tally_with(member.encrypting_public_key, { 4, 9 }, rng);

    const auto params = parameters_of(*set, member.encrypting_public_key);
    std::vector<DecryptionShare> shares = { share_for_tally(tally, member.member_secret_share) };
    auto results = open_tally(tally, shares, params, 20);
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(*results, (std::vector<uint64_t> { 4, 9 }));

    // 其他成员的份额对这个密钥无效
    std::vector<DecryptionShare> wrong = {
        share_for_tally(tally, set->members.at("id-0").member_secret_share),
    };
    auto rejected = open_tally(tally, wrong, params, 20);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), Error::ShareVerificationFailed);
}

TEST(PerMemberOpeningTest, MergedBundlesOpenWithTheKeyOwnersShare)
{
    const auto roster = roster_of(3);
    Crypto::SeededRandom rng(68);
    auto set = generate(roster, 2, rng);
    ASSERT_TRUE(set.has_value());

    const auto& owner = set->members.at("id-0");
    EncryptedTally tally = tally_with(owner.encrypting_public_key, { 3, 0, 5 }, rng);
    std::vector<Proposal> proposals = { encrypted_proposal("P1", tally) };

    std::vector<VotePlanShareBundle> bundles;
    for (const auto& member : roster) {
        auto bundle = shares_for_vote_plan(proposals, set->members.at(member.identity).member_secret_share, "plan");
        ASSERT_TRUE(bundle.has_value());
        bundles.push_back(std::move(*bundle));
    }
    auto merged = merge(bundles);
    ASSERT_TRUE(merged.has_value());
    ASSERT_EQ(merged->proposals.front().shares.size(), 3u);

    std::map<std::string, TallyState> tallies = { { "P1", tally } };
    auto results = open_vote_plan(*merged, tallies, parameters_of(*set, owner.encrypting_public_key), 20);
    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->size(), 1u);
    EXPECT_EQ(results->front().results, (std::vector<uint64_t> { 3, 0, 5 }));
}

TEST(PerMemberOpeningTest, KeyOfSeveralParticipantsNeedsAllOfThem)
{
    const auto roster = roster_of(3);
    Crypto::SeededRandom rng(69);
    auto set = generate(roster, 2, rng);
    ASSERT_TRUE(set.has_value());

    std::vector<MemberPublicKey> participants = {
        set->members.at("id-0").member_public_key,
        set->members.at("id-2").member_public_key,
    };
    const auto joint_key = EncryptingPublicKey::from_participants(participants);
    EncryptedTally tally = tally_with(joint_key, { 2, 6 }, rng);
    const auto params = parameters_of(*set, joint_key);

    std::vector<DecryptionShare> both = {
        share_for_tally(tally, set->members.at("id-0").member_secret_share),
        share_for_tally(tally, set->members.at("id-2").member_secret_share),
    };
    auto results = open_tally(tally, both, params, 20);
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(*results, (std::vector<uint64_t> { 2, 6 }));

    std::vector<DecryptionShare> one = { both[0] };
    auto partial = open_tally(tally, one, params, 20);
    ASSERT_FALSE(partial.has_value());
    EXPECT_EQ(partial.error(), Error::ShareVerificationFailed);
}

TEST(PerMemberOpeningTest, NoSharesFails)
{
    const auto roster = roster_of(1);
    Crypto::SeededRandom rng(67);
    auto set = generate(roster, 1, rng);
    ASSERT_TRUE(set.has_value());

    EncryptedTally tally = EncryptedTally::zero(2);
    auto results = open_tally(tally, {}, parameters_of(*set, set->members.at("id-0").encrypting_public_key), 20);
    ASSERT_FALSE(results.has_value());
    EXPECT_EQ(results.error(), Error::NotEnoughShares);
}
