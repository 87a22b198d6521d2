#include "tally/committee.hpp"
#include "crypto/aes.hpp"
#include "crypto/blst/P1.hpp"
#include "crypto/random.hpp"
#include "crypto/threshold/key_gen.hpp"
#include "tally/error.hpp"
#include "tally/log.hpp"
#include <format>
#include <ostream>
#include <ranges>
#include <unordered_set>

namespace Ballot::Tally {

namespace Threshold = Crypto::Threshold;

namespace {
    std::unexpected<std::error_code> crypto_failure(std::string_view step, std::error_code ec)
    {
        logger().error(std::format("committee key generation: {} failed: {}", step, ec.message()));
        return std::unexpected(make_error_code(Error::CryptoError));
    }
} // namespace

std::string_view to_string(EncryptingKeyMode mode)
{
    switch (mode) {
    case EncryptingKeyMode::PerMember:
        return "per_member";
    case EncryptingKeyMode::Committee:
        return "committee";
    }
    return "unknown";
}

auto generate(const CommitteeRoster& roster, int threshold, Crypto::RandomSource& rng)
    -> std::expected<CommitteeKeySet, std::error_code>
{
    return generate(roster, threshold, rng, EncryptingKeyMode::PerMember);
}

auto generate(const CommitteeRoster& roster, int threshold, Crypto::RandomSource& rng, EncryptingKeyMode mode)
    -> std::expected<CommitteeKeySet, std::error_code>
{
    const int n = static_cast<int>(roster.size());
    if (threshold < 1 || threshold > n) {
        logger().error(std::format("committee key generation: threshold {} not in [1, {}]", threshold, n));
        return std::unexpected(Error::InvalidThreshold);
    }

    std::unordered_set<std::string> identities;
    for (const auto& member : roster) {
        if (!identities.insert(member.identity).second) {
            logger().error(std::format("committee key generation: duplicate identity '{}'", member.identity));
            return std::unexpected(Error::DuplicateIdentity);
        }
    }

    logger().info(std::format("generating committee keys: {} members, threshold {}, mode {}",
        n, threshold, to_string(mode)));

    // --- 1. 公共参考串 ---
    auto crs = Threshold::CommonReferenceString::random(rng);
    if (!crs)
        return crypto_failure("common reference string", crs.error());

    // --- 2. 按名册顺序生成通信密钥 ---
    std::vector<CommunicationSecretKey> comm_secrets;
    std::vector<P1> comm_publics;
    comm_secrets.reserve(n);
    comm_publics.reserve(n);
    for (int i = 0; i < n; ++i) {
        auto sk = CommunicationSecretKey::generate(rng);
        if (!sk)
            return crypto_failure("communication key", sk.error());
        comm_publics.push_back(sk->to_public().point());
        comm_secrets.push_back(*sk);
    }

    // --- 3. 每个成员作为 dealer 运行一次 Pedersen VSS ---
    Crypto::Aes::Context ctx;
    std::vector<Threshold::DealerState> dealers;
    dealers.reserve(n);
    for (int i = 0; i < n; ++i) {
        auto state = Threshold::deal(ctx, rng, threshold, *crs, comm_publics, i);
        if (!state)
            return crypto_failure(std::format("dealing of member {}", i + 1), state.error());
        dealers.push_back(std::move(*state));
    }

    // --- 4. 每个接收方解密并验证收到的全部份额 ---
    std::vector<Scalar> aggregated(n, Scalar::from_uint64(0));
    for (int j = 0; j < n; ++j) {
        const int recipient_id = j + 1;
        for (const auto& dealer : dealers) {
            auto share = Threshold::open_share(ctx, dealer.dealing, recipient_id, comm_secrets[j].scalar());
            if (!share)
                return crypto_failure(std::format("opening share {} -> {}", dealer.dealing.dealer_id, recipient_id),
                    share.error());
            if (!Threshold::verify_share(*crs, dealer.dealing, recipient_id, *share)) {
                return crypto_failure(std::format("verifying share {} -> {}", dealer.dealing.dealer_id, recipient_id),
                    make_error_code(Crypto::Error::ShareVerificationFailed));
            }
            aggregated[j] += share->value;
        }
    }

    // --- 5. 组装各成员的密钥材料 ---
    P1 committee_key = P1::identity();
    for (const auto& dealer : dealers)
        committee_key.add(dealer.public_key);

    CommitteeKeySet set {
        .members = {},
        .crs = *crs,
        .threshold = threshold,
        .mode = mode,
        .member_public_keys = {},
    };
    set.member_public_keys.reserve(n);

    for (const auto& [j, member] : std::views::enumerate(roster)) {
        const auto index = static_cast<uint32_t>(j + 1);
        const Scalar& secret = mode == EncryptingKeyMode::Committee ? aggregated[j] : dealers[j].secret;

        MemberSecretKey member_secret(index, secret);
        MemberPublicKey member_public = member_secret.to_public();
        EncryptingPublicKey encrypting_key = mode == EncryptingKeyMode::Committee
            ? EncryptingPublicKey(committee_key)
            : EncryptingPublicKey::from_participants(std::span(&member_public, 1));

        set.member_public_keys.push_back(member_public);
        set.members.emplace(member.identity,
            MemberKeyMaterial {
                .alias = member.alias,
                .identity = member.identity,
                .index = index,
                .communication_key = comm_secrets[j],
                .member_secret_share = member_secret,
                .member_public_key = member_public,
                .encrypting_public_key = encrypting_key,
            });
        logger().debug(std::format("member {} ('{}') key material ready", index, member.alias));
    }

    return set;
}

std::ostream& operator<<(std::ostream& os, const MemberKeyMaterial& material)
{
    return os << "MemberKeyMaterial{alias=" << material.alias
              << ", identity=" << material.identity
              << ", index=" << material.index
              << ", communication_key=" << material.communication_key
              << ", member_secret_share=" << material.member_secret_share
              << ", member_public_key=" << material.member_public_key
              << ", encrypting_public_key=" << material.encrypting_public_key << "}";
}

} // namespace Ballot::Tally
