#include "tally/tally_opening.hpp"
#include "crypto/blst/P1.hpp"
#include "crypto/elgamal.hpp"
#include "crypto/threshold/math.hpp"
#include "tally/error.hpp"
#include "tally/log.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <map>
#include <unordered_set>

namespace Ballot::Tally {

namespace {
    // 供 Math::interpolate_at_zero 使用
    struct IndexedPoint {
        int player_id;
        P1 value;
    };

    auto verify_shares(const TallyState& tally,
        std::span<const DecryptionShare> shares,
        const OpeningParameters& params)
        -> std::expected<void, std::error_code>
    {
        std::unordered_set<uint32_t> seen;
        for (const auto& share : shares) {
            if (!seen.insert(share.member_index).second) {
                logger().error(std::format("open: duplicate share from member {}", share.member_index));
                return std::unexpected(Error::DuplicateContribution);
            }

            auto pk = std::ranges::find(params.member_public_keys, share.member_index, &MemberPublicKey::index);
            if (pk == params.member_public_keys.end() || share.partials.size() != tally.options()) {
                logger().error(std::format("open: share of member {} does not fit the tally", share.member_index));
                return std::unexpected(Error::ShareVerificationFailed);
            }

            for (size_t i = 0; i < tally.options(); ++i) {
                if (!Crypto::Elgamal::verify_share(pk->point(), share.partials[i], tally.ciphertexts()[i])) {
                    logger().error(std::format("open: invalid proof from member {} on option {}",
                        share.member_index, i));
                    return std::unexpected(Error::ShareVerificationFailed);
                }
            }
        }
        return {};
    }

    auto public_key_of(const OpeningParameters& params, uint32_t index) -> const MemberPublicKey&
    {
        // verify_shares 已保证存在
        return *std::ranges::find(params.member_public_keys, index, &MemberPublicKey::index);
    }

    // PerMember：只取加密密钥所属的参与者
    auto select_participants(std::span<const DecryptionShare> shares, const OpeningParameters& params)
        -> std::expected<std::vector<DecryptionShare>, std::error_code>
    {
        const P1& target = params.encrypting_key.point();
        for (const auto& share : shares) {
            if (public_key_of(params, share.member_index).point() == target) {
                if (shares.size() > 1)
                    logger().debug(std::format("open: using the share of member {} only", share.member_index));
                return std::vector<DecryptionShare> { share };
            }
        }

        P1 sum = P1::identity();
        for (const auto& share : shares)
            sum.add(public_key_of(params, share.member_index).point());
        if (sum == target)
            return std::vector<DecryptionShare>(shares.begin(), shares.end());

        logger().error("open: no supplied member set matches the encrypting key");
        return std::unexpected(Error::ShareVerificationFailed);
    }

    auto combine(std::span<const DecryptionShare> shares, size_t option, EncryptingKeyMode mode)
        -> std::expected<P1, std::error_code>
    {
        if (mode == EncryptingKeyMode::PerMember) {
            P1 sum = P1::identity();
            for (const auto& share : shares)
                sum.add(share.partials[option].value);
            return sum;
        }

        std::vector<IndexedPoint> points;
        points.reserve(shares.size());
        for (const auto& share : shares) {
            points.push_back({ .player_id = static_cast<int>(share.member_index),
                .value = share.partials[option].value });
        }
        auto combined = Crypto::Math::interpolate_at_zero(std::span<const IndexedPoint>(points));
        if (!combined) {
            logger().error(std::format("open: interpolation failed: {}", combined.error().message()));
            return std::unexpected(Error::CryptoError);
        }
        return *combined;
    }
} // namespace

auto discrete_log(const P1& point, uint64_t max_votes) -> std::expected<uint64_t, std::error_code>
{
    if (max_votes > MAX_VOTES_LIMIT) {
        logger().error(std::format("discrete log: bound {} above {}", max_votes, MAX_VOTES_LIMIT));
        return std::unexpected(Error::TallyOutOfRange);
    }
    const auto step = static_cast<uint64_t>(std::ceil(std::sqrt(static_cast<double>(max_votes) + 1.0)));

    // baby steps: g·j, j ∈ [0, step)
    std::map<std::array<Byte, P1::COMPRESSED_SIZE>, uint64_t> table;
    P1 acc = P1::identity();
    const P1 g = P1::generator();
    for (uint64_t j = 0; j < step; ++j) {
        table.emplace(acc.compress(), j);
        acc.add(g);
    }

    // giant steps: point - g·(step·i)
    const P1 giant = -Crypto::bls::mul_generator(Scalar::from_uint64(step));
    P1 current = point;
    for (uint64_t i = 0; i <= step; ++i) {
        if (auto it = table.find(current.compress()); it != table.end()) {
            const uint64_t m = i * step + it->second;
            if (m <= max_votes)
                return m;
            break;
        }
        current.add(giant);
    }
    return std::unexpected(Error::TallyOutOfRange);
}

auto open_tally(const TallyState& tally,
    std::span<const DecryptionShare> shares,
    const OpeningParameters& params,
    uint64_t max_votes)
    -> std::expected<std::vector<uint64_t>, std::error_code>
{
    const size_t required = params.mode == EncryptingKeyMode::Committee ? static_cast<size_t>(params.threshold) : 1;
    if (shares.empty() || shares.size() < required) {
        logger().error(std::format("open: {} share(s) given, {} required", shares.size(), required));
        return std::unexpected(Error::NotEnoughShares);
    }

    if (auto verified = verify_shares(tally, shares, params); !verified)
        return std::unexpected(verified.error());

    std::vector<DecryptionShare> selected;
    if (params.mode == EncryptingKeyMode::PerMember) {
        auto participants = select_participants(shares, params);
        if (!participants)
            return std::unexpected(participants.error());
        selected = std::move(*participants);
        shares = selected;
    }

    std::vector<uint64_t> results;
    results.reserve(tally.options());
    for (size_t i = 0; i < tally.options(); ++i) {
        auto combined = combine(shares, i, params.mode);
        if (!combined)
            return std::unexpected(combined.error());

        P1 m = Crypto::Elgamal::message_point(tally.ciphertexts()[i], *combined);
        auto count = discrete_log(m, max_votes);
        if (!count) {
            logger().error(std::format("open: option {} exceeds {} votes", i, max_votes));
            return std::unexpected(count.error());
        }
        results.push_back(*count);
    }
    return results;
}

auto open_vote_plan(const MergedVotePlanShares& merged,
    const std::map<std::string, TallyState>& tallies,
    const OpeningParameters& params,
    uint64_t max_votes)
    -> std::expected<std::vector<ProposalResult>, std::error_code>
{
    std::vector<ProposalResult> out;
    out.reserve(merged.proposals.size());
    for (const auto& proposal : merged.proposals) {
        auto it = tallies.find(proposal.proposal_id);
        if (it == tallies.end()) {
            logger().error(std::format("open: no encrypted tally for proposal {}", proposal.proposal_id));
            return std::unexpected(Error::VotePlanMismatch);
        }
        auto results = open_tally(it->second, proposal.shares, params, max_votes);
        if (!results) {
            logger().error(std::format("open: proposal {} failed", proposal.proposal_id));
            return std::unexpected(results.error());
        }
        out.push_back({ .proposal_id = proposal.proposal_id, .results = std::move(*results) });
    }
    return out;
}

} // namespace Ballot::Tally
