#include "crypto/signature.hpp"
#include "crypto/error.hpp"

#include <array>

namespace Tessera::Crypto {

template <Placement Keys>
auto SignatureAggregator<Keys>::public_key(const ScalarBytes& secret_key) const
    -> std::expected<PublicKey, std::error_code>
{
    return ops_.mul(ops_.generator<PublicKey>(), secret_key);
}

template <Placement Keys>
auto SignatureAggregator<Keys>::hash_message(BytesSpan msg) const -> std::expected<Signature, std::error_code>
{
    return mapper_.hash_to_curve<Signature>(msg, as_span(dst_));
}

template <Placement Keys>
auto SignatureAggregator<Keys>::sign(const ScalarBytes& secret_key, BytesSpan msg) const
    -> std::expected<Signature, std::error_code>
{
    auto h = hash_message(msg);
    if (!h)
        return std::unexpected(h.error());
    return ops_.mul(*h, secret_key);
}

template <Placement Keys>
auto SignatureAggregator<Keys>::aggregate(std::span<const Signature> signatures) const
    -> std::expected<Signature, std::error_code>
{
    return ops_.sum(signatures);
}

template <Placement Keys>
auto SignatureAggregator<Keys>::aggregate_public_keys(std::span<const PublicKey> public_keys) const
    -> std::expected<PublicKey, std::error_code>
{
    return ops_.sum(public_keys);
}

template <Placement Keys>
auto SignatureAggregator<Keys>::negated_generator() const -> std::expected<PublicKey, std::error_code>
{
    return ops_.negate(ops_.generator<PublicKey>());
}

template <Placement Keys>
std::error_code SignatureAggregator<Keys>::validate_public_key(const PublicKey& public_key) const
{
    if (is_identity(public_key))
        return Error::InvalidPublicKey;
    if (!ops_.add(public_key, GroupOps::identity<PublicKey>()))
        return Error::InvalidPublicKey;
    return {};
}

template <Placement Keys>
auto SignatureAggregator<Keys>::pairing_check(std::span<const PublicKey> key_side,
    std::span<const Signature> signature_side) const -> std::expected<bool, std::error_code>
{
    if constexpr (std::same_as<PublicKey, G1Point>)
        return ops_.pairing_check(key_side, signature_side);
    else
        return ops_.pairing_check(signature_side, key_side);
}

template <Placement Keys>
auto SignatureAggregator<Keys>::verify(const Signature& signature, const PublicKey& public_key, BytesSpan msg) const
    -> std::expected<bool, std::error_code>
{
    if (auto err = validate_public_key(public_key); err)
        return std::unexpected(err);

    auto neg_g = negated_generator();
    if (!neg_g)
        return std::unexpected(neg_g.error());
    auto h = hash_message(msg);
    if (!h)
        return std::unexpected(h.error());

    const std::array<PublicKey, 2> keys { *neg_g, public_key };
    const std::array<Signature, 2> sigs { signature, *h };
    return pairing_check(keys, sigs);
}

template class SignatureAggregator<PublicKeyOnG1>;
template class SignatureAggregator<PublicKeyOnG2>;

} // namespace Tessera::Crypto
