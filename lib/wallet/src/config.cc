#include "wallet/config.hpp"
#include "crypto/field_hasher.hpp"
#include "wallet/error.hpp"

#include <algorithm>

namespace Tessera::Wallet {

namespace {

    size_t key_size(Crypto::KeyPlacement placement)
    {
        return placement == Crypto::KeyPlacement::PublicKeyOnG1 ? Crypto::G1_SIZE : Crypto::G2_SIZE;
    }

    size_t signature_size(Crypto::KeyPlacement placement)
    {
        return placement == Crypto::KeyPlacement::PublicKeyOnG1 ? Crypto::G2_SIZE : Crypto::G1_SIZE;
    }

    // The ciphersuite tag that hashes to the wrong curve for this placement.
    std::string_view other_placement_dst(Crypto::KeyPlacement placement)
    {
        return placement == Crypto::KeyPlacement::PublicKeyOnG1 ? Crypto::PublicKeyOnG2::default_dst
                                                                : Crypto::PublicKeyOnG1::default_dst;
    }

    bool valid_dst(const std::string& dst)
    {
        return !dst.empty() && dst.size() <= Crypto::FieldHasher::MAX_DST_SIZE;
    }

} // namespace

std::error_code validate_config(const LedgerConfig& config)
{
    if (config.placement != Crypto::KeyPlacement::PublicKeyOnG1
        && config.placement != Crypto::KeyPlacement::PublicKeyOnG2)
        return Error::InvalidConfig;
    if (config.mode != GovernanceMode::Aggregate && config.mode != GovernanceMode::Threshold)
        return Error::InvalidConfig;

    if (config.public_keys.empty())
        return Error::EmptyMemberSet;

    const size_t pk_size = key_size(config.placement);
    if (!std::ranges::all_of(config.public_keys, [&](const Bytes& pk) { return pk.size() == pk_size; }))
        return Error::InvalidConfig;

    if (config.mode == GovernanceMode::Threshold) {
        if (config.threshold == 0 || config.threshold > config.public_keys.size())
            return Error::InvalidThreshold;
        if (config.member_ids.size() != config.public_keys.size())
            return Error::InvalidConfig;

        const size_t id_size = signature_size(config.placement);
        if (!std::ranges::all_of(config.member_ids, [&](const Bytes& id) { return id.size() == id_size; }))
            return Error::InvalidConfig;
    }

    const Crypto::Domain domain = resolved_domain(config);
    if (config.mode == GovernanceMode::Threshold && !valid_dst(domain.weight_dst))
        return Error::InvalidConfig;
    if (!valid_dst(domain.signature_dst))
        return Error::InvalidConfig;
    if (domain.signature_dst == other_placement_dst(config.placement))
        return Error::InvalidConfig;
    if (config.max_payload_size == 0)
        return Error::InvalidConfig;

    return {};
}

Crypto::Domain resolved_domain(const LedgerConfig& config)
{
    return config.domain ? *config.domain : Crypto::default_domain(config.placement);
}

} // namespace Tessera::Wallet
