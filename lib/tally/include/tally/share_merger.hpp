#pragma once

#include "tally/decryption_share.hpp"
#include "tally/keys.hpp"
#include <expected>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace Ballot::Tally {

/**
 * @struct MergedVotePlanShares
 * @brief Shares pooled across members for one vote plan.
 *
 * `members` lists the contributors in the order their bundles were merged.
 * Within each proposal the share order follows the same bundle order and is
 * never reshuffled afterwards.
 */
struct MergedVotePlanShares {
    std::string vote_plan_id;
    std::vector<MemberPublicKey> members;
    std::vector<ProposalShares> proposals;
};

/**
 * Pools member bundles. Proposals appear in order of first appearance; a
 * member may have contributed to a subset of proposals only.
 *
 * Fails with DeserializationError on an empty input or a share whose index
 * differs from its bundle's member, DuplicateContribution when two bundles
 * come from the same member, and VotePlanMismatch when bundles name different
 * vote plans.
 */
[[nodiscard]]
auto merge(std::span<const VotePlanShareBundle> bundles) -> std::expected<MergedVotePlanShares, std::error_code>;

} // namespace Ballot::Tally
