#pragma once

#include "crypto/elgamal.hpp"
#include "tally/encrypted_tally.hpp"
#include "tally/keys.hpp"
#include "tally/vote_plan.hpp"
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace Ballot::Tally {

/**
 * @struct DecryptionShare
 * @brief One member's partial decryption of every option ciphertext of one
 *        tally, each with a DLEQ proof against the member public key.
 *
 * Wire form: u32be member_index || per option compress(d) || c || z.
 */
struct DecryptionShare {
    uint32_t member_index = 0;
    std::vector<Crypto::Elgamal::PartialDecryption> partials;

    [[nodiscard]] Bytes to_bytes() const;
    [[nodiscard]] std::string to_base64() const;

    // DeserializationError
    static auto from_bytes(BytesSpan bytes) -> std::expected<DecryptionShare, std::error_code>;
    static auto from_base64(std::string_view text) -> std::expected<DecryptionShare, std::error_code>;

    friend bool operator==(const DecryptionShare& a, const DecryptionShare& b)
    {
        return a.to_bytes() == b.to_bytes();
    }
};

struct ProposalShares {
    std::string proposal_id;
    std::vector<DecryptionShare> shares;
};

/**
 * @struct VotePlanShareBundle
 * @brief Everything one member contributes for one vote plan, proposals kept
 *        in vote plan order.
 */
struct VotePlanShareBundle {
    std::string vote_plan_id;
    MemberPublicKey member;
    std::vector<ProposalShares> proposals;
};

/**
 * Computes this member's share for one encrypted tally blob. Also returns the
 * parsed tally, which the opening step needs again.
 *
 * Deterministic: the same (tally, key) always yields the same share bytes.
 * MalformedEncryptedTally if the blob does not parse.
 */
[[nodiscard]]
auto share_for_tally(BytesSpan encrypted_tally_bytes, const MemberSecretKey& key)
    -> std::expected<std::pair<TallyState, DecryptionShare>, std::error_code>;

[[nodiscard]]
DecryptionShare share_for_tally(const TallyState& tally, const MemberSecretKey& key);

/**
 * Shares for all proposals of a vote plan whose tally is private and still
 * encrypted, in proposal order. Other proposals are skipped. One malformed
 * tally fails the whole bundle with MalformedEncryptedTally.
 */
[[nodiscard]]
auto shares_for_vote_plan(std::span<const Proposal> proposals,
    const MemberSecretKey& key,
    std::string vote_plan_id)
    -> std::expected<VotePlanShareBundle, std::error_code>;

[[nodiscard]]
auto shares_for_vote_plan(const VotePlan& plan, const MemberSecretKey& key)
    -> std::expected<VotePlanShareBundle, std::error_code>;

} // namespace Ballot::Tally
