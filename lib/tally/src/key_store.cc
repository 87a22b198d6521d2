#include "tally/key_store.hpp"
#include "io_util.hpp"
#include "tally/error.hpp"
#include "tally/log.hpp"
#include <format>

namespace Ballot::Tally {

namespace fs = std::filesystem;

namespace {
    template <EncodableKey K>
    auto write_key(const fs::path& dir, std::string_view file, const K& key) -> std::expected<void, std::error_code>
    {
        auto text = encode_key(key);
        if (!text) {
            logger().error(std::format("cannot encode {}", file));
            return std::unexpected(text.error());
        }
        return detail::write_text_file(dir / file, *text + "\n");
    }

    // 身份直接作为目录名，只允许单个普通路径分量
    bool is_plain_component(std::string_view name)
    {
        if (name.empty() || name == "." || name == "..")
            return false;
        if (name.find_first_of("/\\") != std::string_view::npos || name.find('\0') != std::string_view::npos)
            return false;
        const fs::path p(name);
        return !p.has_root_path() && p.filename() == p;
    }
} // namespace

auto write_key_set(const CommitteeKeySet& set, const fs::path& directory)
    -> std::expected<void, std::error_code>
{
    for (const auto& [identity, material] : set.members) {
        if (!is_plain_component(identity)) {
            logger().error(std::format("identity '{}' of '{}' cannot be used as a directory name", identity,
                material.alias));
            return std::unexpected(Error::IoError);
        }
    }

    for (const auto& [identity, material] : set.members) {
        const fs::path dir = directory / identity;
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            logger().error(std::format("cannot create '{}': {}", dir.string(), ec.message()));
            return std::unexpected(Error::IoError);
        }

        if (auto r = write_key(dir, KeyFiles::COMMUNICATION_KEY, material.communication_key); !r)
            return r;
        if (auto r = write_key(dir, KeyFiles::MEMBER_SECRET_KEY, material.member_secret_share); !r)
            return r;
        if (auto r = write_key(dir, KeyFiles::ENCRYPTING_VOTE_KEY, material.encrypting_public_key); !r)
            return r;
        if (auto r = write_key(dir, KeyFiles::MEMBER_PUBLIC_KEY, material.member_public_key); !r)
            return r;

        logger().info(std::format("wrote keys of '{}' to {}", material.alias, dir.string()));
    }
    return {};
}

auto read_member_secret_key(const fs::path& path) -> std::expected<MemberSecretKey, std::error_code>
{
    auto text = detail::read_text_file(path);
    if (!text)
        return std::unexpected(text.error());

    auto key = decode_key<MemberSecretKey>(detail::first_line(*text));
    if (!key) {
        logger().error(std::format("'{}': {}", path.string(), key.error().message()));
        return std::unexpected(key.error());
    }
    return key;
}

} // namespace Ballot::Tally
