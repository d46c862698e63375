#include "crypto/threshold/scheme.hpp"
#include "crypto/error.hpp"
#include "crypto/field_hasher.hpp"

#include <algorithm>
#include <array>
#include <set>

namespace Tessera::Crypto::Threshold {

/* ---------- MembershipPlan ---------- */

template <Placement Keys>
auto MembershipPlan<Keys>::compute(const SignatureAggregator<Keys>& signer, const Domain& domain,
    std::span<const PublicKey> public_keys) -> std::expected<MembershipPlan, std::error_code>
{
    if (public_keys.empty())
        return std::unexpected(Error::EmptyMemberSet);

    std::set<Hash256> seen;
    Bytes all_keys;
    all_keys.reserve(public_keys.size() * sizeof(PublicKey));
    for (const auto& pk : public_keys) {
        if (auto err = signer.validate_public_key(pk); err)
            return std::unexpected(err);
        if (!seen.insert(Utils::sha256(pk)).second)
            return std::unexpected(Error::DuplicateMember);
        all_keys.insert(all_keys.end(), pk.begin(), pk.end());
    }

    MembershipPlan plan(signer);
    plan.public_keys_.assign(public_keys.begin(), public_keys.end());
    plan.weights_.reserve(public_keys.size());
    plan.helpers_.reserve(public_keys.size());

    const auto& ops = signer.ops();
    for (const auto& pk : public_keys) {
        // Binding each weight to the full key set keeps it from being reused in another group.
        auto input = Utils::concat({ pk, all_keys });
        auto expanded = FieldHasher::expand_message_xmd(input, as_span(domain.weight_dst), SCALAR_SIZE);
        if (!expanded)
            return std::unexpected(expanded.error());

        ScalarBytes weight {};
        std::copy(expanded->begin(), expanded->end(), weight.begin());

        auto base = signer.hash_message(weight);
        if (!base)
            return std::unexpected(base.error());
        auto helper = ops.mul(*base, weight);
        if (!helper)
            return std::unexpected(helper.error());

        plan.weights_.push_back(weight);
        plan.helpers_.push_back(*helper);
    }

    auto apk = ops.multi_scalar_mul(std::span<const PublicKey>(plan.public_keys_),
        std::span<const ScalarBytes>(plan.weights_));
    if (!apk)
        return std::unexpected(apk.error());
    if (is_identity(*apk))
        return std::unexpected(Error::InvalidPublicKey);
    plan.aggregated_pk_ = *apk;

    return plan;
}

template <Placement Keys>
auto MembershipPlan<Keys>::membership_share(const ScalarBytes& secret_key, size_t signer_index,
    size_t member_index) const -> std::expected<Signature, std::error_code>
{
    if (signer_index >= size() || member_index >= size())
        return std::unexpected(Error::InvalidMemberIndex);

    const auto& ops = signer_.ops();
    auto weighted = ops.mul(helpers_[member_index], weights_[signer_index]);
    if (!weighted)
        return std::unexpected(weighted.error());
    return ops.mul(*weighted, secret_key);
}

template <Placement Keys>
auto MembershipPlan<Keys>::combine_shares(std::span<const Signature> shares) const
    -> std::expected<Signature, std::error_code>
{
    return signer_.aggregate(shares);
}

/* ---------- ThresholdScheme ---------- */

template <Placement Keys>
auto ThresholdScheme<Keys>::create(const SignatureAggregator<Keys>& signer, const Domain& domain,
    std::span<const PublicKey> public_keys, std::span<const Signature> member_ids)
    -> std::expected<ThresholdScheme, std::error_code>
{
    auto plan = MembershipPlan<Keys>::compute(signer, domain, public_keys);
    if (!plan)
        return std::unexpected(plan.error());
    if (member_ids.size() != plan->size())
        return std::unexpected(Error::LengthMismatch);

    auto neg_g = signer.negated_generator();
    if (!neg_g)
        return std::unexpected(neg_g.error());

    ThresholdScheme scheme(signer);
    scheme.aggregated_pk_ = plan->aggregated_public_key();

    for (size_t i = 0; i < plan->size(); ++i) {
        const std::array<PublicKey, 2> keys { *neg_g, scheme.aggregated_pk_ };
        const std::array<Signature, 2> sigs { member_ids[i], plan->helper_points()[i] };

        auto ok = signer.pairing_check(keys, sigs);
        if (!ok || !*ok)
            return std::unexpected(Error::InvalidSignature);

        const auto& pk = plan->public_keys()[i];
        scheme.members_.emplace(Utils::sha256(pk),
            Record {
                .index = i,
                .public_key = pk,
                .weight = plan->weights()[i],
                .helper_point = plan->helper_points()[i],
                .id_point = member_ids[i],
            });
    }
    return scheme;
}

template <Placement Keys>
auto ThresholdScheme<Keys>::sign_share(const ScalarBytes& secret_key, const Signature& member_id,
    BytesSpan msg) const -> std::expected<Signature, std::error_code>
{
    auto sig = signer_.sign(secret_key, msg);
    if (!sig)
        return std::unexpected(sig.error());
    return signer_.ops().add(*sig, member_id);
}

template <Placement Keys>
auto ThresholdScheme<Keys>::aggregate(std::span<const Signature> shares) const
    -> std::expected<Signature, std::error_code>
{
    return signer_.aggregate(shares);
}

template <Placement Keys>
auto ThresholdScheme<Keys>::find_member(BytesSpan public_key) const -> const Record*
{
    auto it = members_.find(Utils::sha256(public_key));
    if (it == members_.end())
        return nullptr;
    return &it->second;
}

template <Placement Keys>
auto ThresholdScheme<Keys>::verify(const Signature& signature, std::span<const PublicKey> signers,
    BytesSpan msg) const -> std::expected<bool, std::error_code>
{
    if (signers.empty())
        return std::unexpected(Error::EmptyPointsToSum);

    std::vector<PublicKey> keys;
    std::vector<Signature> helpers;
    std::set<size_t> seen;
    keys.reserve(signers.size());
    helpers.reserve(signers.size());

    for (const auto& pk : signers) {
        const Record* record = find_member(pk);
        if (record == nullptr)
            return std::unexpected(Error::UnrecognizedSigner);
        if (!seen.insert(record->index).second)
            return std::unexpected(Error::DuplicateSigner);
        keys.push_back(record->public_key);
        helpers.push_back(record->helper_point);
    }

    const auto& ops = signer_.ops();
    auto key_sum = ops.sum(std::span<const PublicKey>(keys));
    if (!key_sum)
        return std::unexpected(key_sum.error());
    auto helper_sum = ops.sum(std::span<const Signature>(helpers));
    if (!helper_sum)
        return std::unexpected(helper_sum.error());
    auto h = signer_.hash_message(msg);
    if (!h)
        return std::unexpected(h.error());
    auto neg_g = signer_.negated_generator();
    if (!neg_g)
        return std::unexpected(neg_g.error());

    const std::array<PublicKey, 3> key_side { *neg_g, *key_sum, aggregated_pk_ };
    const std::array<Signature, 3> sig_side { signature, *h, *helper_sum };
    return signer_.pairing_check(key_side, sig_side);
}

template class MembershipPlan<PublicKeyOnG1>;
template class MembershipPlan<PublicKeyOnG2>;
template class ThresholdScheme<PublicKeyOnG1>;
template class ThresholdScheme<PublicKeyOnG2>;

} // namespace Tessera::Crypto::Threshold
