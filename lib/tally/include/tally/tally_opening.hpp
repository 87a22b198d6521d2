#pragma once

#include "tally/committee.hpp"
#include "tally/decryption_share.hpp"
#include "tally/encrypted_tally.hpp"
#include "tally/share_merger.hpp"
#include <cstdint>
#include <expected>
#include <map>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace Ballot::Tally {

/**
 * @struct OpeningParameters
 * @brief Public context needed to open a tally.
 *
 * `encrypting_key` is the election key the tally was encrypted under. In
 * PerMember mode it decides which of the supplied shares take part in the
 * combination: a single member whose public key equals it, otherwise all
 * supplied members whose keys sum to it.
 */
struct OpeningParameters {
    EncryptingKeyMode mode = EncryptingKeyMode::PerMember;
    int threshold = 1;
    std::vector<MemberPublicKey> member_public_keys; // 用于验证份额
    EncryptingPublicKey encrypting_key;
};

// discrete_log 支持的最大票数，超过直接 TallyOutOfRange
inline constexpr uint64_t MAX_VOTES_LIMIT = uint64_t { 1 } << 40;

struct ProposalResult {
    std::string proposal_id;
    std::vector<uint64_t> results;
};

// 在 [0, max_votes] 内求 m 使 g·m == point（小步大步）；max_votes 不得超过 MAX_VOTES_LIMIT
[[nodiscard]]
auto discrete_log(const P1& point, uint64_t max_votes) -> std::expected<uint64_t, std::error_code>;

/**
 * Opens one tally from the members' decryption shares.
 *
 * Every share is checked against the public key registered for its index
 * (ShareVerificationFailed). Committee mode combines at least `threshold`
 * shares by Lagrange interpolation at zero (NotEnoughShares below that);
 * PerMember mode adds the shares of the participant set whose public keys
 * make up `params.encrypting_key` and ignores the rest; if no such set is
 * found among the shares the result is ShareVerificationFailed.
 */
[[nodiscard]]
auto open_tally(const TallyState& tally,
    std::span<const DecryptionShare> shares,
    const OpeningParameters& params,
    uint64_t max_votes)
    -> std::expected<std::vector<uint64_t>, std::error_code>;

// 逐个提案开票；缺少对应密文时 VotePlanMismatch
[[nodiscard]]
auto open_vote_plan(const MergedVotePlanShares& merged,
    const std::map<std::string, TallyState>& tallies,
    const OpeningParameters& params,
    uint64_t max_votes)
    -> std::expected<std::vector<ProposalResult>, std::error_code>;

} // namespace Ballot::Tally
