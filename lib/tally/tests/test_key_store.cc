#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "crypto/random.hpp"
#include "tally/error.hpp"
#include "tally/key_store.hpp"
#include "tally_test_utils.hpp"

using namespace Ballot;
using namespace Ballot::Tally;
using namespace Ballot::Tally::Testing;

namespace fs = std::filesystem;

class KeyStoreTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path()
            / ("ballot_key_store_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);

        auto set = generate(roster_of(2), 2, rng_, EncryptingKeyMode::Committee);
        ASSERT_TRUE(set.has_value());
        set_ = std::move(*set);
    }

    void TearDown() override { fs::remove_all(dir_); }

    static std::string first_line_of(const fs::path& path)
    {
        std::ifstream in(path);
        std::string line;
        std::getline(in, line);
        return line;
    }

    fs::path dir_;
    Crypto::SeededRandom rng_ { 31 };
    CommitteeKeySet set_;
};

TEST_F(KeyStoreTest, WritesFourTaggedFilesPerMember)
{
    ASSERT_TRUE(write_key_set(set_, dir_).has_value());

    for (const auto& [identity, material] : set_.members) {
        const fs::path member_dir = dir_ / identity;
        EXPECT_TRUE(first_line_of(member_dir / KeyFiles::COMMUNICATION_KEY).starts_with("bls_vcommsk1"));
        EXPECT_TRUE(first_line_of(member_dir / KeyFiles::MEMBER_SECRET_KEY).starts_with("bls_membersk1"));
        EXPECT_TRUE(first_line_of(member_dir / KeyFiles::ENCRYPTING_VOTE_KEY).starts_with("bls_votepk1"));
        EXPECT_EQ(first_line_of(member_dir / KeyFiles::MEMBER_PUBLIC_KEY), encode_key(material.member_public_key).value());
    }
}

TEST_F(KeyStoreTest, MemberSecretKeyRoundTrip)
{
    ASSERT_TRUE(write_key_set(set_, dir_).has_value());

    auto key = read_member_secret_key(dir_ / "id-1" / KeyFiles::MEMBER_SECRET_KEY);
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, set_.members.at("id-1").member_secret_share);
    EXPECT_EQ(key->index(), 2u);
}

TEST_F(KeyStoreTest, WrongKeyFileIsTagMismatch)
{
    ASSERT_TRUE(write_key_set(set_, dir_).has_value());

    auto key = read_member_secret_key(dir_ / "id-0" / KeyFiles::COMMUNICATION_KEY);
    ASSERT_FALSE(key.has_value());
    EXPECT_EQ(key.error(), Error::TagMismatch);
}

TEST_F(KeyStoreTest, MissingFileIsIoError)
{
    auto key = read_member_secret_key(dir_ / "nope.sk");
    ASSERT_FALSE(key.has_value());
    EXPECT_EQ(key.error(), Error::IoError);
}

TEST_F(KeyStoreTest, TrailingWhitespaceIsIgnored)
{
    fs::create_directories(dir_);
    const auto text = encode_key(set_.members.at("id-0").member_secret_share);
    ASSERT_TRUE(text.has_value());
    {
        std::ofstream out(dir_ / "key.sk");
        out << "  " << *text << "  \r\n";
    }
    auto key = read_member_secret_key(dir_ / "key.sk");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, set_.members.at("id-0").member_secret_share);
}

TEST_F(KeyStoreTest, IdentityEscapingTheDirectoryIsRejected)
{
    for (const char* bad : { "../escaped", "/tmp/ballot_abs_identity", "a/b", "..", "." }) {
        CommitteeRoster roster = {
            { .alias = "ok", .identity = "plain-id" },
            { .alias = "bad", .identity = bad },
        };
        auto set = generate(roster, 1, rng_);
        ASSERT_TRUE(set.has_value()) << bad;

        auto written = write_key_set(*set, dir_);
        ASSERT_FALSE(written.has_value()) << bad;
        EXPECT_EQ(written.error(), Error::IoError) << bad;
        EXPECT_FALSE(fs::exists(dir_ / "plain-id")) << bad;
    }
    EXPECT_FALSE(fs::exists(dir_.parent_path() / "escaped"));
}
