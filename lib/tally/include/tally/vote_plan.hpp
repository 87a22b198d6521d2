#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace Ballot::Tally {

struct PublicTally {
    std::vector<uint64_t> results;
};

struct EncryptedPrivateTally {
    std::string encrypted_tally; // base64
};

struct DecryptedPrivateTally {
    std::vector<uint64_t> results;
};

using ProposalTally = std::variant<PublicTally, EncryptedPrivateTally, DecryptedPrivateTally>;

struct Proposal {
    std::string proposal_id;
    uint32_t index = 0;
    uint32_t options = 0;
    std::optional<ProposalTally> tally; // 尚未开始计票时为空
};

struct VotePlan {
    std::string id;
    std::vector<Proposal> proposals;
};

/**
 * Parses a vote plan status document: either one vote plan object or an array
 * of them.
 *
 * {"id": "...", "proposals": [{"proposal_id": "...", "index": 0, "options": 3,
 *   "tally": {"public": {"results": [..]}}
 *          | {"private": {"state": {"encrypted": {"encrypted_tally": "<base64>"}}}}
 *          | {"private": {"state": {"decrypted": {"results": [..]}}}}}]}
 *
 * DeserializationError on any structural problem.
 */
[[nodiscard]]
auto parse_vote_plans(std::string_view json_text) -> std::expected<std::vector<VotePlan>, std::error_code>;

// IoError 如果文件不可读
[[nodiscard]]
auto load_vote_plans(const std::filesystem::path& path) -> std::expected<std::vector<VotePlan>, std::error_code>;

/**
 * With `id`, returns the plan carrying it (VotePlanNotFound otherwise). Without
 * one, the document must contain exactly one plan (AmbiguousVotePlan if more,
 * VotePlanNotFound if none).
 */
[[nodiscard]]
auto select_vote_plan(std::span<const VotePlan> plans, std::optional<std::string_view> id)
    -> std::expected<VotePlan, std::error_code>;

// 只有私有且仍处于加密状态的计票才需要解密份额
[[nodiscard]] const EncryptedPrivateTally* encrypted_tally_of(const Proposal& proposal);

} // namespace Ballot::Tally
