#include "tally/vote_plan.hpp"
#include "io_util.hpp"
#include "tally/error.hpp"
#include "tally/log.hpp"
#include <algorithm>
#include <format>
#include <nlohmann/json.hpp>

namespace Ballot::Tally {

using nlohmann::json;

namespace {
    ProposalTally parse_tally(const json& j)
    {
        if (j.contains("public")) {
            return PublicTally { .results = j.at("public").at("results").get<std::vector<uint64_t>>() };
        }
        const json& state = j.at("private").at("state");
        if (state.contains("encrypted")) {
            return EncryptedPrivateTally {
                .encrypted_tally = state.at("encrypted").at("encrypted_tally").get<std::string>(),
            };
        }
        return DecryptedPrivateTally {
            .results = state.at("decrypted").at("results").get<std::vector<uint64_t>>(),
        };
    }

    VotePlan parse_plan(const json& j)
    {
        VotePlan plan { .id = j.at("id").get<std::string>(), .proposals = {} };
        for (const json& p : j.at("proposals")) {
            Proposal proposal {
                .proposal_id = p.at("proposal_id").get<std::string>(),
                .index = p.value("index", static_cast<uint32_t>(plan.proposals.size())),
                .options = p.value("options", 0u),
                .tally = std::nullopt,
            };
            if (auto it = p.find("tally"); it != p.end() && !it->is_null()) {
                proposal.tally = parse_tally(*it);
            }
            plan.proposals.push_back(std::move(proposal));
        }
        return plan;
    }
} // namespace

auto parse_vote_plans(std::string_view json_text) -> std::expected<std::vector<VotePlan>, std::error_code>
{
    try {
        json doc = json::parse(json_text);
        std::vector<VotePlan> plans;
        if (doc.is_array()) {
            for (const json& j : doc)
                plans.push_back(parse_plan(j));
        } else {
            plans.push_back(parse_plan(doc));
        }
        return plans;
    } catch (const json::exception& e) {
        logger().error(std::format("vote plan document: {}", e.what()));
        return std::unexpected(Error::DeserializationError);
    }
}

auto load_vote_plans(const std::filesystem::path& path) -> std::expected<std::vector<VotePlan>, std::error_code>
{
    auto text = detail::read_text_file(path);
    if (!text)
        return std::unexpected(text.error());
    return parse_vote_plans(*text);
}

auto select_vote_plan(std::span<const VotePlan> plans, std::optional<std::string_view> id)
    -> std::expected<VotePlan, std::error_code>
{
    if (id) {
        auto it = std::ranges::find(plans, *id, &VotePlan::id);
        if (it == plans.end()) {
            logger().error(std::format("vote plan '{}' not found", *id));
            return std::unexpected(Error::VotePlanNotFound);
        }
        return *it;
    }
    if (plans.empty())
        return std::unexpected(Error::VotePlanNotFound);
    if (plans.size() > 1) {
        logger().error(std::format("{} vote plans in document, an id is required", plans.size()));
        return std::unexpected(Error::AmbiguousVotePlan);
    }
    return plans.front();
}

const EncryptedPrivateTally* encrypted_tally_of(const Proposal& proposal)
{
    if (!proposal.tally)
        return nullptr;
    return std::get_if<EncryptedPrivateTally>(&*proposal.tally);
}

} // namespace Ballot::Tally
