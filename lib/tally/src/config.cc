#include "tally/config.hpp"
#include "io_util.hpp"
#include "tally/error.hpp"
#include "tally/log.hpp"
#include <cstdint>
#include <format>
#include <limits>
#include <nlohmann/json.hpp>

namespace Ballot::Tally {

using nlohmann::json;

namespace {
    std::unexpected<std::error_code> config_error(std::string_view reason)
    {
        logger().error(std::format("committee config: {}", reason));
        return std::unexpected(make_error_code(Error::ConfigError));
    }
} // namespace

auto parse_committee_config(std::string_view json_text) -> std::expected<CommitteeConfig, std::error_code>
{
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return config_error(e.what());
    }
    if (!doc.is_object())
        return config_error("top level must be an object");

    CommitteeConfig config;

    auto threshold = doc.find("threshold");
    if (threshold == doc.end() || !threshold->is_number_integer())
        return config_error("'threshold' must be an integer");
    // 先按 64 位读，避免 get<int>() 截断
    if (threshold->is_number_unsigned()) {
        const auto value = threshold->get<uint64_t>();
        if (value < 1 || value > static_cast<uint64_t>(std::numeric_limits<int>::max()))
            return config_error(std::format("'threshold' {} out of range", value));
        config.threshold = static_cast<int>(value);
    } else {
        const auto value = threshold->get<int64_t>();
        if (value < 1 || value > std::numeric_limits<int>::max())
            return config_error(std::format("'threshold' {} out of range", value));
        config.threshold = static_cast<int>(value);
    }

    auto mode = doc.find("encrypting_key_mode");
    if (mode == doc.end() || !mode->is_string())
        return config_error("'encrypting_key_mode' is required");
    const auto mode_name = mode->get<std::string>();
    if (mode_name == to_string(EncryptingKeyMode::PerMember)) {
        config.mode = EncryptingKeyMode::PerMember;
    } else if (mode_name == to_string(EncryptingKeyMode::Committee)) {
        config.mode = EncryptingKeyMode::Committee;
    } else {
        return config_error(std::format("unknown encrypting_key_mode '{}'", mode_name));
    }

    auto members = doc.find("members");
    if (members == doc.end() || !members->is_array() || members->empty())
        return config_error("'members' must be a non-empty array");
    for (const auto& m : *members) {
        if (!m.is_object() || !m.contains("alias") || !m.contains("identity")
            || !m["alias"].is_string() || !m["identity"].is_string()) {
            return config_error("every member needs string 'alias' and 'identity'");
        }
        config.roster.push_back({
            .alias = m["alias"].get<std::string>(),
            .identity = m["identity"].get<std::string>(),
        });
    }

    return config;
}

auto load_committee_config(const std::filesystem::path& path) -> std::expected<CommitteeConfig, std::error_code>
{
    auto text = detail::read_text_file(path);
    if (!text)
        return std::unexpected(text.error());
    return parse_committee_config(*text);
}

} // namespace Ballot::Tally
