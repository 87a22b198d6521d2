#pragma once

#include "crypto/threshold/key_gen.hpp"
#include "tally/keys.hpp"
#include <cstdint>
#include <expected>
#include <iosfwd>
#include <map>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace Ballot::Crypto {
class RandomSource;
}

namespace Ballot::Tally {

struct CommitteeMember {
    std::string alias;
    std::string identity; // 在名册中唯一
};

// 名册顺序决定 VSS 下标：位置 i 对应参与者 i + 1
using CommitteeRoster = std::vector<CommitteeMember>;

/**
 * How the election (encrypting) key relates to the member shares.
 *
 * PerMember: each member's secret is its own polynomial's constant term and
 * its encrypting key aggregates only its own public key. Any single member can
 * open a tally encrypted under its key; the threshold has no effect on opening.
 *
 * Committee: each member holds Σ_i f_i(j), all members share the encrypting
 * key Σ_i g·f_i(0), and opening needs `threshold` shares.
 */
enum class EncryptingKeyMode {
    PerMember,
    Committee
};

struct MemberKeyMaterial {
    std::string alias;
    std::string identity;
    uint32_t index; // 1-based
    CommunicationSecretKey communication_key;
    MemberSecretKey member_secret_share;
    MemberPublicKey member_public_key;
    EncryptingPublicKey encrypting_public_key;
};

/**
 * @struct CommitteeKeySet
 * @brief Result of one key generation run.
 *
 * `members` is keyed by identity. `member_public_keys` lists the public keys
 * in roster order and is what a tally opener needs to verify shares.
 */
struct CommitteeKeySet {
    std::map<std::string, MemberKeyMaterial> members;
    Crypto::Threshold::CommonReferenceString crs;
    int threshold = 0;
    EncryptingKeyMode mode = EncryptingKeyMode::PerMember;
    std::vector<MemberPublicKey> member_public_keys;
};

// 默认 PerMember，与既有部署保持一致
[[nodiscard]]
auto generate(const CommitteeRoster& roster, int threshold, Crypto::RandomSource& rng)
    -> std::expected<CommitteeKeySet, std::error_code>;

[[nodiscard]]
auto generate(const CommitteeRoster& roster, int threshold, Crypto::RandomSource& rng, EncryptingKeyMode mode)
    -> std::expected<CommitteeKeySet, std::error_code>;

[[nodiscard]] std::string_view to_string(EncryptingKeyMode mode);

// 只输出公开部分
std::ostream& operator<<(std::ostream& os, const MemberKeyMaterial& material);

} // namespace Ballot::Tally
