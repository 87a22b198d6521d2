#pragma once

#include "tally/committee.hpp"
#include "tally/keys.hpp"
#include <expected>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace Ballot::Tally {

namespace KeyFiles {
    inline constexpr std::string_view COMMUNICATION_KEY = "communication_key.sk";
    inline constexpr std::string_view MEMBER_SECRET_KEY = "member_secret_key.sk";
    inline constexpr std::string_view ENCRYPTING_VOTE_KEY = "encrypting_vote_key.sk";
    inline constexpr std::string_view MEMBER_PUBLIC_KEY = "member_public_key.pk";
} // namespace KeyFiles

/**
 * Writes one directory per identity under `directory`, each file holding a
 * single tagged key line. Existing files are overwritten. IoError on any
 * filesystem failure, and before anything is written when an identity is not
 * a single plain path component (empty, ".", "..", a separator, a root).
 */
[[nodiscard]]
auto write_key_set(const CommitteeKeySet& set, const std::filesystem::path& directory)
    -> std::expected<void, std::error_code>;

// 读取第一行并按成员私钥标签解码
[[nodiscard]]
auto read_member_secret_key(const std::filesystem::path& path) -> std::expected<MemberSecretKey, std::error_code>;

} // namespace Ballot::Tally
