#include <gtest/gtest.h>
#include <filesystem>
#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "cli.hpp"
#include "crypto/random.hpp"
#include "tally/decryption_share.hpp"
#include "tally/documents.hpp"
#include "tally/encrypted_tally.hpp"
#include "tally/keys.hpp"
#include "tally/log.hpp"
#include "tally/tally_opening.hpp"

using namespace Ballot;
using namespace Ballot::Tally;

namespace fs = std::filesystem;

class CliTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        saved_level_ = logger().level();
        dir_ = fs::temp_directory_path()
            / ("ballot_cli_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        fs::remove_all(dir_);
        logger().set_level(saved_level_);
    }

    struct Outcome {
        int code;
        std::string out;
        std::string err;
    };

    static Outcome invoke(const std::vector<std::string>& args, const std::string& stdin_text = "")
    {
        std::istringstream in(stdin_text);
        std::ostringstream out;
        std::ostringstream err;
        const int code = Cli::run(args, in, out, err);
        return { code, out.str(), err.str() };
    }

    fs::path write(const std::string& name, const std::string& text) const
    {
        const fs::path path = dir_ / name;
        std::ofstream(path) << text;
        return path;
    }

    template <EncodableKey K>
    K read_key(const std::string& identity, std::string_view file) const
    {
        std::ifstream in(dir_ / "keys" / identity / file);
        std::string line;
        std::getline(in, line);
        auto key = decode_key<K>(line);
        EXPECT_TRUE(key.has_value()) << identity << '/' << file;
        return key.value_or(K {});
    }

    // 生成三人委员会（per_member，门限 2）的密钥目录
    void generate_committee()
    {
        const auto config = write("committee.json", R"({
            "threshold": 2,
            "encrypting_key_mode": "per_member",
            "members": [
                {"alias": "alice", "identity": "id-0"},
                {"alias": "bob", "identity": "id-1"},
                {"alias": "carol", "identity": "id-2"}
            ]
        })");
        auto r = invoke({ "committee", "generate", "--config", config.string(), "--output-dir",
            (dir_ / "keys").string(), "--seed", "7" });
        ASSERT_EQ(r.code, 0) << r.err;
        EXPECT_EQ(std::count(r.out.begin(), r.out.end(), '\n'), 3);
        EXPECT_TRUE(r.out.starts_with("alice id-0 bls_memberpk1"));
    }

    std::string key_path(const std::string& identity) const
    {
        return (dir_ / "keys" / identity / "member_secret_key.sk").string();
    }

    fs::path dir_;
    Logger::Level saved_level_ = Logger::Level::Warning;
};

TEST_F(CliTest, HelpGoesToStdout)
{
    auto r = invoke({ "--help" });
    EXPECT_EQ(r.code, 0);
    EXPECT_NE(r.out.find("merge-shares"), std::string::npos);
}

TEST_F(CliTest, MissingCommandFailsWithoutStdout)
{
    auto r = invoke({});
    EXPECT_EQ(r.code, 1);
    EXPECT_TRUE(r.out.empty());
    EXPECT_NE(r.err.find("Usage"), std::string::npos);
}

TEST_F(CliTest, UnknownCommandFails)
{
    auto r = invoke({ "tally", "open-everything" });
    EXPECT_EQ(r.code, 1);
    EXPECT_TRUE(r.out.empty());
    EXPECT_NE(r.err.find("unknown command 'tally open-everything'"), std::string::npos);
}

TEST_F(CliTest, FailureNamesTheFile)
{
    const auto missing = (dir_ / "absent.json").string();
    auto r = invoke({ "committee", "generate", "--config", missing, "--output-dir", dir_.string() });
    EXPECT_EQ(r.code, 1);
    EXPECT_TRUE(r.out.empty());
    EXPECT_TRUE(r.err.starts_with("Error: " + missing + ": "));
}

TEST_F(CliTest, MissingRequiredOptionIsReported)
{
    auto r = invoke({ "tally", "decryption-share" });
    EXPECT_EQ(r.code, 1);
    EXPECT_TRUE(r.out.empty());
    EXPECT_NE(r.err.find("key"), std::string::npos);
}

TEST_F(CliTest, DecryptionShareFromStdin)
{
    generate_committee();
    const auto election_key = read_key<EncryptingPublicKey>("id-1", "encrypting_vote_key.sk");

    Crypto::SeededRandom rng(5);
    EncryptedTally tally = EncryptedTally::zero(2);
    auto ballot = encrypt_vote(election_key, 1, 2, rng);
    ASSERT_TRUE(ballot.has_value());
    ASSERT_TRUE(tally.add(*ballot, 4).has_value());

    // 全局选项在组名之前，子命令参数仍然被正确转发
    auto r = invoke({ "--verbose", "tally", "decryption-share", "--key", key_path("id-1") }, tally.to_base64() + "\n");
    ASSERT_EQ(r.code, 0) << r.err;

    std::string text = r.out;
    ASSERT_FALSE(text.empty());
    text.pop_back();
    auto share = DecryptionShare::from_base64(text);
    ASSERT_TRUE(share.has_value());
    EXPECT_EQ(share->member_index, 2u);
    EXPECT_EQ(share->partials.size(), 2u);

    auto bad = invoke({ "tally", "decryption-share", "--key", key_path("id-1") }, "not base64!");
    EXPECT_EQ(bad.code, 1);
    EXPECT_TRUE(bad.out.empty());
    EXPECT_TRUE(bad.err.starts_with("Error: <stdin>: "));
}

TEST_F(CliTest, VotePlanSharesMergeAndOpen)
{
    generate_committee();
    const auto election_key = read_key<EncryptingPublicKey>("id-0", "encrypting_vote_key.sk");

    Crypto::SeededRandom rng(6);
    EncryptedTally tally = EncryptedTally::zero(3);
    const std::vector<std::pair<size_t, uint64_t>> votes = { { 0, 2 }, { 2, 5 } };
    for (const auto& [choice, weight] : votes) {
        auto ballot = encrypt_vote(election_key, choice, 3, rng);
        ASSERT_TRUE(ballot.has_value());
        ASSERT_TRUE(tally.add(*ballot, weight).has_value());
    }

    const auto plan = write("plan.json", R"({"id": "fund-9", "proposals": [
        {"proposal_id": "p-pub", "index": 0, "options": 2, "tally": {"public": {"results": [1, 1]}}},
        {"proposal_id": "p-priv", "index": 1, "options": 3,
         "tally": {"private": {"state": {"encrypted": {"encrypted_tally": ")"
            + tally.to_base64() + R"("}}}}}
    ]})");

    std::vector<std::string> bundle_files;
    for (const std::string identity : { "id-2", "id-0", "id-1" }) {
        auto r = invoke({ "tally", "vote-plan-shares", "--key", key_path(identity), "--vote-plan", plan.string() });
        ASSERT_EQ(r.code, 0) << r.err;
        bundle_files.push_back(write("bundle-" + identity + ".json", r.out).string());
    }

    auto dup = invoke({ "tally", "merge-shares", bundle_files[0], bundle_files[1], bundle_files[0] });
    EXPECT_EQ(dup.code, 1);
    EXPECT_TRUE(dup.out.empty());

    auto merged_run = invoke({ "tally", "merge-shares", bundle_files[0], bundle_files[1], bundle_files[2] });
    ASSERT_EQ(merged_run.code, 0) << merged_run.err;
    auto merged = parse_merged(merged_run.out);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->vote_plan_id, "fund-9");
    ASSERT_EQ(merged->proposals.size(), 1u);
    EXPECT_EQ(merged->proposals[0].shares.size(), 3u);

    OpeningParameters params {
        .mode = EncryptingKeyMode::PerMember,
        .threshold = 2,
        .member_public_keys = {
            read_key<MemberPublicKey>("id-0", "member_public_key.pk"),
            read_key<MemberPublicKey>("id-1", "member_public_key.pk"),
            read_key<MemberPublicKey>("id-2", "member_public_key.pk"),
        },
        .encrypting_key = election_key,
    };
    std::map<std::string, TallyState> tallies = { { "p-priv", tally } };
    auto results = open_vote_plan(*merged, tallies, params, 100);
    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->size(), 1u);
    EXPECT_EQ(results->front().results, (std::vector<uint64_t> { 2, 0, 5 }));
}

TEST_F(CliTest, AmbiguousVotePlanNeedsAnId)
{
    generate_committee();
    const auto plans = write("plans.json", R"([{"id": "a", "proposals": []}, {"id": "b", "proposals": []}])");

    auto r = invoke({ "tally", "vote-plan-shares", "--key", key_path("id-0"), "--vote-plan", plans.string() });
    EXPECT_EQ(r.code, 1);
    EXPECT_TRUE(r.out.empty());

    auto picked = invoke({ "tally", "vote-plan-shares", "--key", key_path("id-0"), "--vote-plan", plans.string(),
        "--vote-plan-id", "b" });
    ASSERT_EQ(picked.code, 0) << picked.err;
    auto bundle = parse_bundle(picked.out);
    ASSERT_TRUE(bundle.has_value());
    EXPECT_EQ(bundle->vote_plan_id, "b");
    EXPECT_TRUE(bundle->proposals.empty());
}
