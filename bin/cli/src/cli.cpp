#include "cli.hpp"
#include "crypto/random.hpp"
#include "crypto/text_codec.hpp"
#include "tally/committee.hpp"
#include "tally/config.hpp"
#include "tally/decryption_share.hpp"
#include "tally/documents.hpp"
#include "tally/key_store.hpp"
#include "tally/log.hpp"
#include "tally/share_merger.hpp"
#include "tally/vote_plan.hpp"

#include <boost/program_options.hpp>

#include <algorithm>
#include <cstdint>
#include <expected>
#include <fstream>
#include <istream>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <system_error>

namespace Ballot::Cli {

namespace po = boost::program_options;

namespace {

// 失败时携带上下文（文件名、提案等），由 run 统一输出
struct CommandError {
    std::string context;
    std::error_code code;
};

using CommandResult = std::expected<std::string, CommandError>;

CommandError fail(std::string context, std::error_code code)
{
    return CommandError { .context = std::move(context), .code = code };
}

std::expected<std::string, CommandError> read_input(const std::optional<std::string>& path, std::istream& stdin_stream)
{
    if (!path) {
        std::string text((std::istreambuf_iterator<char>(stdin_stream)), std::istreambuf_iterator<char>());
        return text;
    }
    std::ifstream in(*path, std::ios::binary);
    if (!in)
        return std::unexpected(fail(*path, Tally::Error::IoError));
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return text;
}

std::optional<std::string> optional_arg(const po::variables_map& vm, const char* name)
{
    if (vm.count(name))
        return vm[name].as<std::string>();
    return std::nullopt;
}

po::variables_map parse_command(const po::options_description& desc,
    const std::vector<std::string>& args,
    const po::positional_options_description* positional = nullptr)
{
    po::variables_map vm;
    po::command_line_parser parser(args);
    parser.options(desc);
    if (positional)
        parser.positional(*positional);
    po::store(parser.run(), vm);
    po::notify(vm);
    return vm;
}

// committee generate --config F --output-dir D [--seed N]
CommandResult committee_generate(const std::vector<std::string>& args)
{
    po::options_description desc("committee generate");
    // clang-format off
    desc.add_options()
        ("config", po::value<std::string>()->required(), "Committee configuration (JSON).")
        ("output-dir", po::value<std::string>()->required(), "Directory receiving one key directory per member.")
        ("seed", po::value<std::uint64_t>(), "Deterministic RNG seed (testing only).");
    // clang-format on
    auto vm = parse_command(desc, args);

    const auto config_path = vm["config"].as<std::string>();
    auto config = Tally::load_committee_config(config_path);
    if (!config)
        return std::unexpected(fail(config_path, config.error()));

    std::unique_ptr<Crypto::RandomSource> rng;
    if (vm.count("seed")) {
        Tally::logger().warning("using a seeded RNG, keys are reproducible");
        rng = std::make_unique<Crypto::SeededRandom>(vm["seed"].as<std::uint64_t>());
    } else {
        rng = std::make_unique<Crypto::SystemRandom>();
    }

    auto set = Tally::generate(config->roster, config->threshold, *rng, config->mode);
    if (!set)
        return std::unexpected(fail("key generation", set.error()));

    const auto output_dir = vm["output-dir"].as<std::string>();
    if (auto written = Tally::write_key_set(*set, output_dir); !written)
        return std::unexpected(fail(output_dir, written.error()));

    std::ostringstream out;
    for (const auto& member : config->roster) {
        const auto& material = set->members.at(member.identity);
        out << material.alias << ' ' << material.identity << ' ' << material.member_public_key << ' '
            << material.encrypting_public_key << '\n';
    }
    return out.str();
}

// tally decryption-share --key F [--tally F]
CommandResult tally_decryption_share(const std::vector<std::string>& args, std::istream& in)
{
    po::options_description desc("tally decryption-share");
    // clang-format off
    desc.add_options()
        ("key", po::value<std::string>()->required(), "Member secret key file.")
        ("tally", po::value<std::string>(), "Base64 encrypted tally file, stdin if omitted.");
    // clang-format on
    auto vm = parse_command(desc, args);

    const auto key_path = vm["key"].as<std::string>();
    auto key = Tally::read_member_secret_key(key_path);
    if (!key)
        return std::unexpected(fail(key_path, key.error()));

    auto tally_path = optional_arg(vm, "tally");
    auto text = read_input(tally_path, in);
    if (!text)
        return std::unexpected(text.error());

    auto bytes = Crypto::Base64::decode(*text);
    if (!bytes)
        return std::unexpected(fail(tally_path.value_or("<stdin>"), Tally::Error::MalformedEncryptedTally));

    auto result = Tally::share_for_tally(*bytes, *key);
    if (!result)
        return std::unexpected(fail(tally_path.value_or("<stdin>"), result.error()));

    return result->second.to_base64() + "\n";
}

// tally vote-plan-shares --key F [--vote-plan F] [--vote-plan-id ID]
CommandResult tally_vote_plan_shares(const std::vector<std::string>& args, std::istream& in)
{
    po::options_description desc("tally vote-plan-shares");
    // clang-format off
    desc.add_options()
        ("key", po::value<std::string>()->required(), "Member secret key file.")
        ("vote-plan", po::value<std::string>(), "Vote plan status (JSON), stdin if omitted.")
        ("vote-plan-id", po::value<std::string>(), "Vote plan to use when the document holds several.");
    // clang-format on
    auto vm = parse_command(desc, args);

    const auto key_path = vm["key"].as<std::string>();
    auto key = Tally::read_member_secret_key(key_path);
    if (!key)
        return std::unexpected(fail(key_path, key.error()));

    auto plan_path = optional_arg(vm, "vote-plan");
    auto text = read_input(plan_path, in);
    if (!text)
        return std::unexpected(text.error());

    auto plans = Tally::parse_vote_plans(*text);
    if (!plans)
        return std::unexpected(fail(plan_path.value_or("<stdin>"), plans.error()));

    auto id = optional_arg(vm, "vote-plan-id");
    auto plan = Tally::select_vote_plan(*plans, id ? std::optional<std::string_view>(*id) : std::nullopt);
    if (!plan)
        return std::unexpected(fail(id.value_or("vote plan"), plan.error()));

    auto bundle = Tally::shares_for_vote_plan(*plan, *key);
    if (!bundle)
        return std::unexpected(fail("vote plan " + plan->id, bundle.error()));

    auto json = Tally::serialize_bundle(*bundle);
    if (!json)
        return std::unexpected(fail("bundle", json.error()));
    return *json + "\n";
}

// tally merge-shares F...
CommandResult tally_merge_shares(const std::vector<std::string>& args)
{
    po::options_description desc("tally merge-shares");
    // clang-format off
    desc.add_options()
        ("shares", po::value<std::vector<std::string>>()->multitoken(), "Member share bundles (JSON), in member order.");
    // clang-format on
    po::positional_options_description positional;
    positional.add("shares", -1);
    auto vm = parse_command(desc, args, &positional);

    std::vector<Tally::VotePlanShareBundle> bundles;
    if (vm.count("shares")) {
        for (const auto& path : vm["shares"].as<std::vector<std::string>>()) {
            auto bundle = Tally::load_bundle(path);
            if (!bundle)
                return std::unexpected(fail(path, bundle.error()));
            bundles.push_back(std::move(*bundle));
        }
    }

    auto merged = Tally::merge(bundles);
    if (!merged)
        return std::unexpected(fail("merge", merged.error()));

    auto json = Tally::serialize_merged(*merged);
    if (!json)
        return std::unexpected(fail("merged shares", json.error()));
    return *json + "\n";
}

} // namespace

int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err)
{
    po::options_description desc("Committee threshold decryption of private ballot tallies.\n"
                                 "Usage: ballot-cli [--verbose] <committee|tally> <command> [options]\n"
                                 "  committee generate      --config F --output-dir D [--seed N]\n"
                                 "  tally decryption-share  --key F [--tally F]\n"
                                 "  tally vote-plan-shares  --key F [--vote-plan F] [--vote-plan-id ID]\n"
                                 "  tally merge-shares      F...\n"
                                 "Options");
    // clang-format off
    desc.add_options()
        ("help,h", "Display help message.")
        ("verbose,v", "Log progress to stderr.")
        ("group", po::value<std::string>(), "Command group.")
        ("command", po::value<std::string>(), "Command.")
        ("args", po::value<std::vector<std::string>>(), "Command arguments.");
    // clang-format on

    po::positional_options_description positional;
    positional.add("group", 1).add("command", 1).add("args", -1);

    try {
        auto parsed = po::command_line_parser(args).options(desc).positional(positional).allow_unregistered().run();
        po::variables_map vm;
        po::store(parsed, vm);
        po::notify(vm);

        if (vm.count("help")) {
            out << desc << std::endl;
            return 0;
        }
        // 失败时 stdout 保持为空，用法写到 stderr
        if (!vm.count("group") || !vm.count("command")) {
            err << desc << std::endl;
            return 1;
        }

        Tally::logger().set_level(vm.count("verbose") ? Tally::Logger::Level::Info : Tally::Logger::Level::Warning);

        // 组名与命令之后的全部参数交给子命令解析
        std::vector<std::string> rest = po::collect_unrecognized(parsed.options, po::include_positional);
        const auto group = vm["group"].as<std::string>();
        const auto command = vm["command"].as<std::string>();
        rest.erase(rest.begin(), rest.begin() + std::min<size_t>(2, rest.size()));

        CommandResult result;
        if (group == "committee" && command == "generate") {
            result = committee_generate(rest);
        } else if (group == "tally" && command == "decryption-share") {
            result = tally_decryption_share(rest, in);
        } else if (group == "tally" && command == "vote-plan-shares") {
            result = tally_vote_plan_shares(rest, in);
        } else if (group == "tally" && command == "merge-shares") {
            result = tally_merge_shares(rest);
        } else {
            err << "Error: unknown command '" << group << ' ' << command << "'" << std::endl;
            return 1;
        }

        if (!result) {
            err << "Error: " << result.error().context << ": " << result.error().code.message() << std::endl;
            return 1;
        }
        out << *result;
        return 0;
    } catch (const po::error& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace Ballot::Cli
