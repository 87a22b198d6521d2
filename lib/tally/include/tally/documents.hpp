#pragma once

#include "tally/decryption_share.hpp"
#include "tally/share_merger.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace Ballot::Tally {

// JSON 文档：份额以 base64 编码，成员公钥以 bech32 编码

[[nodiscard]]
auto serialize_bundle(const VotePlanShareBundle& bundle) -> std::expected<std::string, std::error_code>;

// DeserializationError on any malformed field
[[nodiscard]]
auto parse_bundle(std::string_view json_text) -> std::expected<VotePlanShareBundle, std::error_code>;

[[nodiscard]]
auto load_bundle(const std::filesystem::path& path) -> std::expected<VotePlanShareBundle, std::error_code>;

[[nodiscard]]
auto serialize_merged(const MergedVotePlanShares& merged) -> std::expected<std::string, std::error_code>;

[[nodiscard]]
auto parse_merged(std::string_view json_text) -> std::expected<MergedVotePlanShares, std::error_code>;

} // namespace Ballot::Tally
