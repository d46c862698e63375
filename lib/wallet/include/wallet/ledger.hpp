#pragma once

#include "crypto/curve_backend.hpp"
#include "wallet/access.hpp"
#include "wallet/clock.hpp"
#include "wallet/common.hpp"
#include "wallet/config.hpp"
#include "wallet/dispatcher.hpp"
#include "wallet/operation.hpp"
#include "wallet/verifier.hpp"

#include <atomic>
#include <expected>
#include <map>
#include <memory>
#include <set>
#include <span>
#include <system_error>
#include <vector>

namespace Tessera::Wallet {

/**
 * @class OperationLedger
 * @brief Governed operation lifecycle: submit, approve by signature, execute.
 *
 *   NONE -> PENDING -> APPROVED | REJECTED
 *   APPROVED -> EXECUTING -> EXECUTED | FAILED
 *   APPROVED -> EXPIRED (late execute attempt)
 *
 * Every mutating entry point checks the caller's role and holds the
 * reentrancy guard for its whole duration. A call that returns an error
 * leaves the ledger unchanged, except execute on expired operations, which
 * records EXPIRED before failing.
 *
 * The access control, dispatcher and clock are not owned and must outlive
 * the ledger.
 */
class OperationLedger {
    struct Token {
        explicit Token() = default;
    };

public:
    [[nodiscard]]
    static auto create(const LedgerConfig& config, const AccessControl& access, CallDispatcher& dispatcher,
        const Clock& clock) -> std::expected<std::unique_ptr<OperationLedger>, std::error_code>;

    // Same, with a caller-provided curve backend.
    [[nodiscard]]
    static auto create(const LedgerConfig& config, std::unique_ptr<Crypto::CurveBackend> backend,
        const AccessControl& access, CallDispatcher& dispatcher, const Clock& clock)
        -> std::expected<std::unique_ptr<OperationLedger>, std::error_code>;

    OperationLedger(Token, LedgerConfig config, std::unique_ptr<Crypto::CurveBackend> backend,
        std::unique_ptr<SignatureVerifier> verifier, const AccessControl& access, CallDispatcher& dispatcher,
        const Clock& clock);

    OperationLedger(const OperationLedger&) = delete;
    OperationLedger& operator=(const OperationLedger&) = delete;

    /**
     * @brief Records a batch of operations; requires Role::Proposer.
     *
     * The batch is validated as a whole before anything is written. Each
     * entry consumes one nonce. Returns the content hashes in batch order.
     */
    [[nodiscard]]
    auto submit(const Address& caller, std::span<const OperationRequest> batch)
        -> std::expected<std::vector<Hash>, std::error_code>;

    /**
     * @brief One approval attempt per PENDING operation; requires Role::Verifier.
     *
     * Returns one result per hash. An operation that is not PENDING yields
     * false and keeps its status. Signer lookup errors abort the whole call.
     */
    [[nodiscard]]
    auto verify(const Address& caller, std::span<const Hash> hashes, std::span<const Bytes> signatures,
        std::span<const std::vector<Bytes>> signer_sets) -> std::expected<std::vector<bool>, std::error_code>;

    /**
     * @brief Calls the targets of APPROVED, effective operations; requires Role::Executor.
     *
     * A failed target call marks its operation FAILED and does not stop the batch.
     */
    [[nodiscard]] std::error_code execute(const Address& caller, std::span<const Hash> hashes);

    /* ---------- accessors ---------- */

    [[nodiscard]] Crypto::KeyPlacement placement() const { return verifier_->placement(); }
    [[nodiscard]] GovernanceMode governance() const { return verifier_->mode(); }
    [[nodiscard]] size_t threshold() const { return verifier_->threshold(); }
    [[nodiscard]] Bytes aggregated_public_key() const { return verifier_->aggregated_public_key(); }
    [[nodiscard]] uint64_t nonce() const { return nonce_; }
    [[nodiscard]] const Hash& ledger_id() const { return config_.ledger_id; }

    // NONE for unknown hashes.
    [[nodiscard]] OperationStatus status(const Hash& hash) const;
    [[nodiscard]] const Operation* operation(const Hash& hash) const;
    [[nodiscard]] size_t operation_count() const { return operations_.size(); }

private:
    class ReentrancyGuard;

    [[nodiscard]] std::error_code validate_request(const OperationRequest& request, uint64_t expected_nonce,
        Timestamp now, const Hash& hash, const std::set<Hash>& staged) const;

    Operation* find(const Hash& hash);
    void set_status(Operation& op, OperationStatus status);

    LedgerConfig config_;
    std::unique_ptr<Crypto::CurveBackend> backend_;
    std::unique_ptr<SignatureVerifier> verifier_;
    const AccessControl* access_;
    CallDispatcher* dispatcher_;
    const Clock* clock_;

    uint64_t nonce_ = 0;
    std::vector<Operation> operations_;
    std::map<Hash, size_t> index_;
    std::atomic<bool> entered_ { false };
};

} // namespace Tessera::Wallet
