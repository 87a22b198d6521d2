#include "tally/share_merger.hpp"
#include "tally/error.hpp"
#include "tally/log.hpp"
#include <algorithm>
#include <format>
#include <unordered_map>
#include <unordered_set>

namespace Ballot::Tally {

auto merge(std::span<const VotePlanShareBundle> bundles) -> std::expected<MergedVotePlanShares, std::error_code>
{
    if (bundles.empty()) {
        logger().error("merge: no share bundles given");
        return std::unexpected(Error::DeserializationError);
    }

    MergedVotePlanShares merged {
        .vote_plan_id = bundles.front().vote_plan_id,
        .members = {},
        .proposals = {},
    };

    std::unordered_set<uint32_t> seen_indices;
    std::unordered_map<std::string, size_t> position; // proposal_id -> 下标

    for (const auto& bundle : bundles) {
        if (bundle.vote_plan_id != merged.vote_plan_id) {
            logger().error(std::format("merge: bundle for vote plan {} does not match {}",
                bundle.vote_plan_id, merged.vote_plan_id));
            return std::unexpected(Error::VotePlanMismatch);
        }

        const uint32_t index = bundle.member.index();
        const bool same_key = std::ranges::find(merged.members, bundle.member) != merged.members.end();
        if (same_key || !seen_indices.insert(index).second) {
            logger().error(std::format("merge: member {} contributed more than once", index));
            return std::unexpected(Error::DuplicateContribution);
        }
        merged.members.push_back(bundle.member);

        for (const auto& proposal : bundle.proposals) {
            for (const auto& share : proposal.shares) {
                if (share.member_index != index) {
                    logger().error(std::format("merge: proposal {}: share index {} in bundle of member {}",
                        proposal.proposal_id, share.member_index, index));
                    return std::unexpected(Error::DeserializationError);
                }
            }

            auto [it, inserted] = position.try_emplace(proposal.proposal_id, merged.proposals.size());
            if (inserted) {
                merged.proposals.push_back(ProposalShares { .proposal_id = proposal.proposal_id, .shares = {} });
            }
            auto& pooled = merged.proposals[it->second].shares;
            pooled.insert(pooled.end(), proposal.shares.begin(), proposal.shares.end());
        }
    }

    logger().info(std::format("merged {} bundle(s) for vote plan {} into {} proposal(s)",
        bundles.size(), merged.vote_plan_id, merged.proposals.size()));
    return merged;
}

} // namespace Ballot::Tally
