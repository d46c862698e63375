#pragma once

#include "crypto/curve_backend.hpp"
#include "crypto/signature.hpp"
#include "crypto/threshold/scheme.hpp"
#include "crypto/types.hpp"
#include "wallet/common.hpp"
#include "wallet/config.hpp"

#include <expected>
#include <memory>
#include <span>
#include <system_error>

namespace Tessera::Wallet {

/**
 * @class SignatureVerifier
 * @brief Approval check of an operation hash, in one placement and governance mode.
 *
 * Signatures and signer keys arrive as raw bytes. A signature of the wrong
 * size or one that does not decode to a subgroup point is a failed check,
 * not an error.
 */
class SignatureVerifier {
public:
    virtual ~SignatureVerifier() = default;

    [[nodiscard]] virtual Crypto::KeyPlacement placement() const = 0;
    [[nodiscard]] virtual GovernanceMode mode() const = 0;
    [[nodiscard]] virtual size_t threshold() const = 0;
    [[nodiscard]] virtual Bytes aggregated_public_key() const = 0;

    // UnrecognizedSigner or DuplicateSigner for a bad signer list.
    [[nodiscard]] virtual std::error_code check_signers(std::span<const Bytes> signers) const = 0;

    [[nodiscard]] virtual auto verify(BytesSpan signature, std::span<const Bytes> signers, const Hash& message) const
        -> std::expected<bool, std::error_code>
        = 0;
};

/**
 * @brief All n members sign; the aggregate verifies under sum_i pk_i.
 *
 * Signer lists are not consulted.
 */
template <Crypto::Placement Keys>
class AggregateVerifier final : public SignatureVerifier {
public:
    using PublicKey = typename Keys::PublicKey;
    using Signature = typename Keys::Signature;

private:
    struct Token {
        explicit Token() = default;
    };

public:
    [[nodiscard]]
    static auto create(const Crypto::CurveBackend& backend, const LedgerConfig& config)
        -> std::expected<std::unique_ptr<AggregateVerifier>, std::error_code>;

    AggregateVerifier(Token, Crypto::SignatureAggregator<Keys> signer, const PublicKey& aggregated_pk, size_t n)
        : signer_(std::move(signer))
        , aggregated_pk_(aggregated_pk)
        , member_count_(n)
    {
    }

    Crypto::KeyPlacement placement() const override { return Keys::placement; }
    GovernanceMode mode() const override { return GovernanceMode::Aggregate; }
    size_t threshold() const override { return member_count_; }
    Bytes aggregated_public_key() const override { return { aggregated_pk_.begin(), aggregated_pk_.end() }; }

    std::error_code check_signers(std::span<const Bytes>) const override { return {}; }

    auto verify(BytesSpan signature, std::span<const Bytes> signers, const Hash& message) const
        -> std::expected<bool, std::error_code> override;

private:
    Crypto::SignatureAggregator<Keys> signer_;
    PublicKey aggregated_pk_;
    size_t member_count_;
};

/**
 * @brief Any subset of at least threshold members signs.
 *
 * A signer list below the threshold fails without running the pairing.
 */
template <Crypto::Placement Keys>
class ThresholdVerifier final : public SignatureVerifier {
public:
    using PublicKey = typename Keys::PublicKey;
    using Signature = typename Keys::Signature;

private:
    struct Token {
        explicit Token() = default;
    };

public:
    [[nodiscard]]
    static auto create(const Crypto::CurveBackend& backend, const LedgerConfig& config)
        -> std::expected<std::unique_ptr<ThresholdVerifier>, std::error_code>;

    ThresholdVerifier(Token, Crypto::Threshold::ThresholdScheme<Keys> scheme, size_t threshold)
        : scheme_(std::move(scheme))
        , threshold_(threshold)
    {
    }

    Crypto::KeyPlacement placement() const override { return Keys::placement; }
    GovernanceMode mode() const override { return GovernanceMode::Threshold; }
    size_t threshold() const override { return threshold_; }
    Bytes aggregated_public_key() const override;

    std::error_code check_signers(std::span<const Bytes> signers) const override;

    auto verify(BytesSpan signature, std::span<const Bytes> signers, const Hash& message) const
        -> std::expected<bool, std::error_code> override;

private:
    Crypto::Threshold::ThresholdScheme<Keys> scheme_;
    size_t threshold_;
};

/**
 * @brief Builds the verifier for config.placement and config.mode.
 *
 * Runs validate_config first. Crypto setup errors (InvalidPublicKey,
 * DuplicateMember, InvalidSignature for a bad member id) pass through.
 * The backend must outlive the verifier.
 */
[[nodiscard]]
auto make_verifier(const Crypto::CurveBackend& backend, const LedgerConfig& config)
    -> std::expected<std::unique_ptr<SignatureVerifier>, std::error_code>;

extern template class AggregateVerifier<Crypto::PublicKeyOnG1>;
extern template class AggregateVerifier<Crypto::PublicKeyOnG2>;
extern template class ThresholdVerifier<Crypto::PublicKeyOnG1>;
extern template class ThresholdVerifier<Crypto::PublicKeyOnG2>;

} // namespace Tessera::Wallet
