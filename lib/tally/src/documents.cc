#include "tally/documents.hpp"
#include "io_util.hpp"
#include "tally/error.hpp"
#include "tally/keys.hpp"
#include "tally/log.hpp"
#include <format>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace Ballot::Tally {

using nlohmann::ordered_json;

namespace {
    // 解析失败统一抛出，由外层转换为 DeserializationError
    struct DocumentError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    ordered_json proposals_to_json(const std::vector<ProposalShares>& proposals)
    {
        ordered_json out = ordered_json::array();
        for (const auto& proposal : proposals) {
            ordered_json shares = ordered_json::array();
            for (const auto& share : proposal.shares)
                shares.push_back(share.to_base64());
            out.push_back(ordered_json { { "proposal_id", proposal.proposal_id }, { "shares", std::move(shares) } });
        }
        return out;
    }

    std::vector<ProposalShares> proposals_from_json(const ordered_json& j)
    {
        std::vector<ProposalShares> proposals;
        for (const auto& p : j.at("proposals")) {
            ProposalShares entry { .proposal_id = p.at("proposal_id").get<std::string>(), .shares = {} };
            for (const auto& s : p.at("shares")) {
                auto share = DecryptionShare::from_base64(s.get<std::string>());
                if (!share)
                    throw DocumentError(std::format("proposal {}: invalid share", entry.proposal_id));
                entry.shares.push_back(std::move(*share));
            }
            proposals.push_back(std::move(entry));
        }
        return proposals;
    }

    MemberPublicKey member_from_json(const ordered_json& j)
    {
        auto key = decode_key<MemberPublicKey>(j.get<std::string>());
        if (!key)
            throw DocumentError(std::format("invalid member public key: {}", key.error().message()));
        return *key;
    }

    auto encode_member(const MemberPublicKey& member) -> std::expected<std::string, std::error_code>
    {
        auto text = encode_key(member);
        if (!text)
            logger().error(std::format("cannot encode member public key {}", member.index()));
        return text;
    }

    template <typename Fn>
    auto parse_document(std::string_view kind, std::string_view json_text, Fn&& build)
        -> std::expected<decltype(build(ordered_json {})), std::error_code>
    {
        try {
            return build(ordered_json::parse(json_text));
        } catch (const ordered_json::exception& e) {
            logger().error(std::format("{} document: {}", kind, e.what()));
        } catch (const DocumentError& e) {
            logger().error(std::format("{} document: {}", kind, e.what()));
        }
        return std::unexpected(make_error_code(Error::DeserializationError));
    }
} // namespace

auto serialize_bundle(const VotePlanShareBundle& bundle) -> std::expected<std::string, std::error_code>
{
    auto member = encode_member(bundle.member);
    if (!member)
        return std::unexpected(member.error());

    ordered_json doc;
    doc["vote_plan_id"] = bundle.vote_plan_id;
    doc["member_public_key"] = *member;
    doc["proposals"] = proposals_to_json(bundle.proposals);
    return doc.dump();
}

auto parse_bundle(std::string_view json_text) -> std::expected<VotePlanShareBundle, std::error_code>
{
    return parse_document("share bundle", json_text, [](const ordered_json& doc) {
        return VotePlanShareBundle {
            .vote_plan_id = doc.at("vote_plan_id").get<std::string>(),
            .member = member_from_json(doc.at("member_public_key")),
            .proposals = proposals_from_json(doc),
        };
    });
}

auto load_bundle(const std::filesystem::path& path) -> std::expected<VotePlanShareBundle, std::error_code>
{
    auto text = detail::read_text_file(path);
    if (!text)
        return std::unexpected(text.error());
    auto bundle = parse_bundle(*text);
    if (!bundle)
        logger().error(std::format("'{}' is not a valid share bundle", path.string()));
    return bundle;
}

auto serialize_merged(const MergedVotePlanShares& merged) -> std::expected<std::string, std::error_code>
{
    ordered_json members = ordered_json::array();
    for (const auto& member : merged.members) {
        auto text = encode_member(member);
        if (!text)
            return std::unexpected(text.error());
        members.push_back(*text);
    }

    ordered_json doc;
    doc["vote_plan_id"] = merged.vote_plan_id;
    doc["members"] = std::move(members);
    doc["proposals"] = proposals_to_json(merged.proposals);
    return doc.dump();
}

auto parse_merged(std::string_view json_text) -> std::expected<MergedVotePlanShares, std::error_code>
{
    return parse_document("merged shares", json_text, [](const ordered_json& doc) {
        MergedVotePlanShares merged {
            .vote_plan_id = doc.at("vote_plan_id").get<std::string>(),
            .members = {},
            .proposals = proposals_from_json(doc),
        };
        for (const auto& m : doc.at("members"))
            merged.members.push_back(member_from_json(m));
        return merged;
    });
}

} // namespace Ballot::Tally
