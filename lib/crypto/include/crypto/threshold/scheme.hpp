#pragma once

#include "crypto/common.hpp"
#include "crypto/signature.hpp"
#include "crypto/threshold/types.hpp"
#include "crypto/types.hpp"

#include <expected>
#include <map>
#include <span>
#include <system_error>
#include <vector>

namespace Tessera::Crypto::Threshold {

/**
 * @class MembershipPlan
 * @brief Weights and helper points derived from the member public keys alone.
 *
 * weight_i = expand_message_xmd(pk_i || pk_1 || ... || pk_n, weight_dst, 32)
 * helper_i = weight_i * hash_to_curve(weight_i)
 * aggregated public key = sum_i weight_i * pk_i
 *
 * The plan is what members need before their membership keys exist: member j
 * hands member i the share sk_j * (weight_j * helper_i), and member i's key is
 * the sum of the shares it received.
 */
template <Placement Keys>
class MembershipPlan {
public:
    using PublicKey = typename Keys::PublicKey;
    using Signature = typename Keys::Signature;

    [[nodiscard]]
    static auto compute(const SignatureAggregator<Keys>& signer, const Domain& domain,
        std::span<const PublicKey> public_keys) -> std::expected<MembershipPlan, std::error_code>;

    [[nodiscard]]
    auto membership_share(const ScalarBytes& secret_key, size_t signer_index, size_t member_index) const
        -> std::expected<Signature, std::error_code>;

    [[nodiscard]]
    auto combine_shares(std::span<const Signature> shares) const -> std::expected<Signature, std::error_code>;

    [[nodiscard]] size_t size() const { return public_keys_.size(); }
    [[nodiscard]] const std::vector<PublicKey>& public_keys() const { return public_keys_; }
    [[nodiscard]] const std::vector<ScalarBytes>& weights() const { return weights_; }
    [[nodiscard]] const std::vector<Signature>& helper_points() const { return helpers_; }
    [[nodiscard]] const PublicKey& aggregated_public_key() const { return aggregated_pk_; }

private:
    explicit MembershipPlan(const SignatureAggregator<Keys>& signer)
        : signer_(signer)
    {
    }

    SignatureAggregator<Keys> signer_;
    std::vector<PublicKey> public_keys_;
    std::vector<ScalarBytes> weights_;
    std::vector<Signature> helpers_;
    PublicKey aggregated_pk_ {};
};

/**
 * @class ThresholdScheme
 * @brief m-of-n verification over a weighted member set.
 *
 * A member signs s_i = sk_i * H(m) + id_i. An aggregate over signer subset S
 * verifies when
 *   e(-G, sigma) * e(sum_S pk_i, H(m)) * e(apk, sum_S helper_i) == 1
 * (pairs oriented by placement). The subset size is not checked here.
 */
template <Placement Keys>
class ThresholdScheme {
public:
    using PublicKey = typename Keys::PublicKey;
    using Signature = typename Keys::Signature;
    using Record = MemberRecord<Keys>;

    /**
     * @brief Builds the member table and runs the one-time integrity check.
     *
     * Every id_i must satisfy e(-G, id_i) * e(apk, helper_i) == 1.
     * InvalidPublicKey / DuplicateMember / EmptyMemberSet for a bad key set,
     * LengthMismatch if the id list does not match, InvalidSignature if a
     * member id fails the check.
     */
    [[nodiscard]]
    static auto create(const SignatureAggregator<Keys>& signer, const Domain& domain,
        std::span<const PublicKey> public_keys, std::span<const Signature> member_ids)
        -> std::expected<ThresholdScheme, std::error_code>;

    [[nodiscard]]
    auto sign_share(const ScalarBytes& secret_key, const Signature& member_id, BytesSpan msg) const
        -> std::expected<Signature, std::error_code>;

    [[nodiscard]]
    auto aggregate(std::span<const Signature> shares) const -> std::expected<Signature, std::error_code>;

    /**
     * @brief Verifies an aggregate against the claimed signer keys.
     *
     * UnrecognizedSigner if a key is not a member, DuplicateSigner if a key
     * repeats, EmptyPointsToSum for an empty signer list.
     */
    [[nodiscard]]
    auto verify(const Signature& signature, std::span<const PublicKey> signers, BytesSpan msg) const
        -> std::expected<bool, std::error_code>;

    [[nodiscard]] const Record* find_member(BytesSpan public_key) const;

    [[nodiscard]] size_t size() const { return members_.size(); }
    [[nodiscard]] const PublicKey& aggregated_public_key() const { return aggregated_pk_; }
    [[nodiscard]] const SignatureAggregator<Keys>& signer() const { return signer_; }

private:
    explicit ThresholdScheme(const SignatureAggregator<Keys>& signer)
        : signer_(signer)
    {
    }

    SignatureAggregator<Keys> signer_;
    PublicKey aggregated_pk_ {};
    // Keyed by SHA-256 of the raw public key bytes.
    std::map<Hash256, Record> members_;
};

extern template class MembershipPlan<PublicKeyOnG1>;
extern template class MembershipPlan<PublicKeyOnG2>;
extern template class ThresholdScheme<PublicKeyOnG1>;
extern template class ThresholdScheme<PublicKeyOnG2>;

} // namespace Tessera::Crypto::Threshold
