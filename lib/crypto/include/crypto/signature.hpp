#pragma once

#include "crypto/curve_backend.hpp"
#include "crypto/curve_mapper.hpp"
#include "crypto/group_ops.hpp"
#include "crypto/types.hpp"

#include <expected>
#include <span>
#include <string>
#include <system_error>

namespace Tessera::Crypto {

/**
 * @class SignatureAggregator
 * @brief BLS sign / aggregate / verify with keys on one curve and signatures on the other.
 *
 * @tparam Keys PublicKeyOnG1 or PublicKeyOnG2.
 */
template <Placement Keys>
class SignatureAggregator {
public:
    using PublicKey = typename Keys::PublicKey;
    using Signature = typename Keys::Signature;

    SignatureAggregator(const CurveBackend& backend, std::string dst)
        : ops_(backend)
        , mapper_(backend)
        , dst_(std::move(dst))
    {
    }

    // sk * G on the key curve.
    [[nodiscard]] auto public_key(const ScalarBytes& secret_key) const -> std::expected<PublicKey, std::error_code>;

    // hash_to_curve(msg, dst) on the signature curve.
    [[nodiscard]] auto hash_message(BytesSpan msg) const -> std::expected<Signature, std::error_code>;

    [[nodiscard]] auto sign(const ScalarBytes& secret_key, BytesSpan msg) const
        -> std::expected<Signature, std::error_code>;

    [[nodiscard]] auto aggregate(std::span<const Signature> signatures) const
        -> std::expected<Signature, std::error_code>;

    [[nodiscard]] auto aggregate_public_keys(std::span<const PublicKey> public_keys) const
        -> std::expected<PublicKey, std::error_code>;

    /**
     * @brief Two-party check e(-G, sig) * e(pk, H(msg)) == 1 (oriented by placement).
     *
     * Returns InvalidPublicKey for a malformed or identity key; a malformed
     * signature surfaces as the backend's decoding error.
     */
    [[nodiscard]] auto verify(const Signature& signature, const PublicKey& public_key, BytesSpan msg) const
        -> std::expected<bool, std::error_code>;

    // prod e(keys[i], sigs[i]) == 1, each pair oriented into (G1, G2).
    [[nodiscard]] auto pairing_check(std::span<const PublicKey> key_side, std::span<const Signature> signature_side) const
        -> std::expected<bool, std::error_code>;

    // -G on the key curve.
    [[nodiscard]] auto negated_generator() const -> std::expected<PublicKey, std::error_code>;

    // InvalidPublicKey unless the key decodes to a non-identity subgroup point.
    [[nodiscard]] std::error_code validate_public_key(const PublicKey& public_key) const;

    [[nodiscard]] const GroupOps& ops() const { return ops_; }
    [[nodiscard]] const CurveMapper& mapper() const { return mapper_; }
    [[nodiscard]] const std::string& dst() const { return dst_; }

private:
    GroupOps ops_;
    CurveMapper mapper_;
    std::string dst_;
};

extern template class SignatureAggregator<PublicKeyOnG1>;
extern template class SignatureAggregator<PublicKeyOnG2>;

} // namespace Tessera::Crypto
