#include "tally/decryption_share.hpp"
#include "crypto/text_codec.hpp"
#include "tally/error.hpp"
#include "tally/log.hpp"
#include <format>

namespace Ballot::Tally {

using Crypto::Elgamal::PartialDecryption;

// --- DecryptionShare 编解码 ---

Bytes DecryptionShare::to_bytes() const
{
    Bytes out;
    out.reserve(4 + partials.size() * PartialDecryption::SERIALIZED_SIZE);
    Crypto::put_u32_be(out, member_index);
    for (const auto& partial : partials) {
        auto b = partial.to_bytes();
        out.insert(out.end(), b.begin(), b.end());
    }
    return out;
}

std::string DecryptionShare::to_base64() const
{
    return Crypto::Base64::encode(to_bytes());
}

auto DecryptionShare::from_bytes(BytesSpan bytes) -> std::expected<DecryptionShare, std::error_code>
{
    constexpr size_t PD = PartialDecryption::SERIALIZED_SIZE;
    if (bytes.size() <= 4 || (bytes.size() - 4) % PD != 0) {
        return std::unexpected(Error::DeserializationError);
    }

    DecryptionShare share;
    share.member_index = Crypto::get_u32_be(bytes);
    if (share.member_index == 0) {
        return std::unexpected(Error::DeserializationError);
    }

    BytesSpan body = bytes.subspan(4);
    share.partials.reserve(body.size() / PD);
    for (size_t offset = 0; offset < body.size(); offset += PD) {
        auto partial = PartialDecryption::from_bytes(body.subspan(offset, PD));
        if (!partial) {
            return std::unexpected(Error::DeserializationError);
        }
        share.partials.push_back(*partial);
    }
    return share;
}

auto DecryptionShare::from_base64(std::string_view text) -> std::expected<DecryptionShare, std::error_code>
{
    auto bytes = Crypto::Base64::decode(text);
    if (!bytes) {
        return std::unexpected(Error::DeserializationError);
    }
    return from_bytes(*bytes);
}

// --- 份额生成 ---

DecryptionShare share_for_tally(const TallyState& tally, const MemberSecretKey& key)
{
    DecryptionShare share { .member_index = key.index(), .partials = {} };
    share.partials.reserve(tally.options());
    for (const auto& ct : tally.ciphertexts()) {
        share.partials.push_back(Crypto::Elgamal::decrypt_share(key.scalar(), ct));
    }
    return share;
}

auto share_for_tally(BytesSpan encrypted_tally_bytes, const MemberSecretKey& key)
    -> std::expected<std::pair<TallyState, DecryptionShare>, std::error_code>
{
    auto tally = EncryptedTally::from_bytes(encrypted_tally_bytes);
    if (!tally) {
        return std::unexpected(tally.error());
    }
    DecryptionShare share = share_for_tally(*tally, key);
    return std::pair { std::move(*tally), std::move(share) };
}

auto shares_for_vote_plan(std::span<const Proposal> proposals,
    const MemberSecretKey& key,
    std::string vote_plan_id)
    -> std::expected<VotePlanShareBundle, std::error_code>
{
    VotePlanShareBundle bundle {
        .vote_plan_id = std::move(vote_plan_id),
        .member = key.to_public(),
        .proposals = {},
    };

    for (const auto& proposal : proposals) {
        const EncryptedPrivateTally* encrypted = encrypted_tally_of(proposal);
        if (encrypted == nullptr) {
            logger().debug(std::format("proposal {}: tally not private/encrypted, skipped", proposal.proposal_id));
            continue;
        }

        auto tally = EncryptedTally::from_base64(encrypted->encrypted_tally);
        if (!tally) {
            logger().error(std::format("proposal {}: malformed encrypted tally", proposal.proposal_id));
            return std::unexpected(tally.error());
        }

        bundle.proposals.push_back(ProposalShares {
            .proposal_id = proposal.proposal_id,
            .shares = { share_for_tally(*tally, key) },
        });
    }

    logger().info(std::format("vote plan {}: {} decryption share(s) from member {}",
        bundle.vote_plan_id, bundle.proposals.size(), key.index()));
    return bundle;
}

auto shares_for_vote_plan(const VotePlan& plan, const MemberSecretKey& key)
    -> std::expected<VotePlanShareBundle, std::error_code>
{
    return shares_for_vote_plan(plan.proposals, key, plan.id);
}

} // namespace Ballot::Tally
