#include "wallet/verifier.hpp"
#include "crypto/error.hpp"
#include "crypto/group_ops.hpp"
#include "wallet/error.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <vector>

namespace Tessera::Wallet {

using Crypto::GroupOps;
using Crypto::PublicKeyOnG1;
using Crypto::PublicKeyOnG2;
using Crypto::SignatureAggregator;
using Crypto::Threshold::ThresholdScheme;

namespace {

    template <Crypto::CurvePoint P>
    std::optional<P> to_point(BytesSpan raw)
    {
        if (raw.size() != sizeof(P))
            return std::nullopt;
        P out {};
        std::copy(raw.begin(), raw.end(), out.begin());
        return out;
    }

    // Size, canonical encoding, curve and subgroup membership.
    template <Crypto::Placement Keys>
    std::optional<typename Keys::Signature> decode_signature(const GroupOps& ops, BytesSpan raw)
    {
        using Signature = typename Keys::Signature;
        auto sig = to_point<Signature>(raw);
        if (!sig)
            return std::nullopt;
        if (!ops.add(*sig, GroupOps::identity<Signature>()))
            return std::nullopt;
        return sig;
    }

    template <Crypto::Placement Keys>
    auto parse_points(const std::vector<Bytes>& raw) -> std::expected<std::vector<typename Keys::PublicKey>, std::error_code>
    {
        std::vector<typename Keys::PublicKey> out;
        out.reserve(raw.size());
        for (const auto& r : raw) {
            auto p = to_point<typename Keys::PublicKey>(r);
            if (!p)
                return std::unexpected(Crypto::Error::InvalidPublicKey);
            out.push_back(*p);
        }
        return out;
    }

    template <Crypto::Placement Keys>
    auto parse_ids(const std::vector<Bytes>& raw) -> std::expected<std::vector<typename Keys::Signature>, std::error_code>
    {
        std::vector<typename Keys::Signature> out;
        out.reserve(raw.size());
        for (const auto& r : raw) {
            auto p = to_point<typename Keys::Signature>(r);
            if (!p)
                return std::unexpected(Crypto::Error::InvalidSignature);
            out.push_back(*p);
        }
        return out;
    }

} // namespace

/* ---------- AggregateVerifier ---------- */

template <Crypto::Placement Keys>
auto AggregateVerifier<Keys>::create(const Crypto::CurveBackend& backend, const LedgerConfig& config)
    -> std::expected<std::unique_ptr<AggregateVerifier>, std::error_code>
{
    auto keys = parse_points<Keys>(config.public_keys);
    if (!keys)
        return std::unexpected(keys.error());

    SignatureAggregator<Keys> signer(backend, resolved_domain(config).signature_dst);

    std::set<PublicKey> seen;
    for (const auto& pk : *keys) {
        if (auto err = signer.validate_public_key(pk); err)
            return std::unexpected(err);
        if (!seen.insert(pk).second)
            return std::unexpected(Crypto::Error::DuplicateMember);
    }

    auto apk = signer.aggregate_public_keys(*keys);
    if (!apk)
        return std::unexpected(apk.error());
    // Keys that cancel out would accept the identity signature for every message.
    if (Crypto::is_identity(*apk))
        return std::unexpected(Crypto::Error::InvalidPublicKey);

    return std::make_unique<AggregateVerifier>(Token {}, std::move(signer), *apk, keys->size());
}

template <Crypto::Placement Keys>
auto AggregateVerifier<Keys>::verify(BytesSpan signature, std::span<const Bytes>, const Hash& message) const
    -> std::expected<bool, std::error_code>
{
    auto sig = decode_signature<Keys>(signer_.ops(), signature);
    if (!sig)
        return false;
    return signer_.verify(*sig, aggregated_pk_, message);
}

/* ---------- ThresholdVerifier ---------- */

template <Crypto::Placement Keys>
auto ThresholdVerifier<Keys>::create(const Crypto::CurveBackend& backend, const LedgerConfig& config)
    -> std::expected<std::unique_ptr<ThresholdVerifier>, std::error_code>
{
    auto keys = parse_points<Keys>(config.public_keys);
    if (!keys)
        return std::unexpected(keys.error());
    auto ids = parse_ids<Keys>(config.member_ids);
    if (!ids)
        return std::unexpected(ids.error());

    const Crypto::Domain domain = resolved_domain(config);
    SignatureAggregator<Keys> signer(backend, domain.signature_dst);
    auto scheme = ThresholdScheme<Keys>::create(signer, domain, *keys, *ids);
    if (!scheme)
        return std::unexpected(scheme.error());

    return std::make_unique<ThresholdVerifier>(Token {}, std::move(*scheme), config.threshold);
}

template <Crypto::Placement Keys>
Bytes ThresholdVerifier<Keys>::aggregated_public_key() const
{
    const auto& apk = scheme_.aggregated_public_key();
    return { apk.begin(), apk.end() };
}

template <Crypto::Placement Keys>
std::error_code ThresholdVerifier<Keys>::check_signers(std::span<const Bytes> signers) const
{
    std::set<size_t> seen;
    for (const auto& raw : signers) {
        const auto* record = scheme_.find_member(raw);
        if (record == nullptr)
            return Crypto::Error::UnrecognizedSigner;
        if (!seen.insert(record->index).second)
            return Crypto::Error::DuplicateSigner;
    }
    return {};
}

template <Crypto::Placement Keys>
auto ThresholdVerifier<Keys>::verify(BytesSpan signature, std::span<const Bytes> signers, const Hash& message) const
    -> std::expected<bool, std::error_code>
{
    if (auto err = check_signers(signers); err)
        return std::unexpected(err);
    if (signers.size() < threshold_)
        return false;

    auto sig = decode_signature<Keys>(scheme_.signer().ops(), signature);
    if (!sig)
        return false;

    std::vector<PublicKey> keys;
    keys.reserve(signers.size());
    for (const auto& raw : signers)
        keys.push_back(scheme_.find_member(raw)->public_key);

    return scheme_.verify(*sig, keys, message);
}

/* ---------- factory ---------- */

namespace {

    template <Crypto::Placement Keys>
    auto build(const Crypto::CurveBackend& backend, const LedgerConfig& config)
        -> std::expected<std::unique_ptr<SignatureVerifier>, std::error_code>
    {
        if (config.mode == GovernanceMode::Threshold) {
            auto v = ThresholdVerifier<Keys>::create(backend, config);
            if (!v)
                return std::unexpected(v.error());
            return std::move(*v);
        }
        auto v = AggregateVerifier<Keys>::create(backend, config);
        if (!v)
            return std::unexpected(v.error());
        return std::move(*v);
    }

} // namespace

auto make_verifier(const Crypto::CurveBackend& backend, const LedgerConfig& config)
    -> std::expected<std::unique_ptr<SignatureVerifier>, std::error_code>
{
    if (auto err = validate_config(config); err)
        return std::unexpected(err);

    if (config.placement == Crypto::KeyPlacement::PublicKeyOnG1)
        return build<PublicKeyOnG1>(backend, config);
    return build<PublicKeyOnG2>(backend, config);
}

template class AggregateVerifier<PublicKeyOnG1>;
template class AggregateVerifier<PublicKeyOnG2>;
template class ThresholdVerifier<PublicKeyOnG1>;
template class ThresholdVerifier<PublicKeyOnG2>;

} // namespace Tessera::Wallet
