#pragma once

#include "tally/committee.hpp"
#include <expected>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace Ballot::Tally {

/**
 * @struct CommitteeConfig
 * @brief Election setup read from a JSON file:
 *
 * {"threshold": 2, "encrypting_key_mode": "committee",
 *  "members": [{"alias": "alice", "identity": "..."}]}
 *
 * `encrypting_key_mode` is mandatory ("per_member" or "committee").
 */
struct CommitteeConfig {
    CommitteeRoster roster;
    int threshold = 0;
    EncryptingKeyMode mode = EncryptingKeyMode::PerMember;
};

// ConfigError，错误原因写入日志
[[nodiscard]]
auto parse_committee_config(std::string_view json_text) -> std::expected<CommitteeConfig, std::error_code>;

[[nodiscard]]
auto load_committee_config(const std::filesystem::path& path) -> std::expected<CommitteeConfig, std::error_code>;

} // namespace Ballot::Tally
