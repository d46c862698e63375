#include "wallet/ledger.hpp"
#include "crypto/blst_backend.hpp"
#include "wallet/error.hpp"
#include "wallet/logging.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <set>

namespace Tessera::Wallet {

namespace {

    constexpr std::string_view LOG_COMPONENT = "ledger";

    std::string short_hex(const Hash& hash)
    {
        return Crypto::Utils::to_hex(BytesSpan(hash).first(8));
    }

} // namespace

class OperationLedger::ReentrancyGuard {
public:
    explicit ReentrancyGuard(std::atomic<bool>& flag)
        : flag_(flag)
        , acquired_(!flag.exchange(true, std::memory_order_acq_rel))
    {
    }

    ~ReentrancyGuard()
    {
        if (acquired_)
            flag_.store(false, std::memory_order_release);
    }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    [[nodiscard]] bool acquired() const { return acquired_; }

private:
    std::atomic<bool>& flag_;
    bool acquired_;
};

/* ---------- construction ---------- */

OperationLedger::OperationLedger(Token, LedgerConfig config, std::unique_ptr<Crypto::CurveBackend> backend,
    std::unique_ptr<SignatureVerifier> verifier, const AccessControl& access, CallDispatcher& dispatcher,
    const Clock& clock)
    : config_(std::move(config))
    , backend_(std::move(backend))
    , verifier_(std::move(verifier))
    , access_(&access)
    , dispatcher_(&dispatcher)
    , clock_(&clock)
{
}

auto OperationLedger::create(const LedgerConfig& config, const AccessControl& access, CallDispatcher& dispatcher,
    const Clock& clock) -> std::expected<std::unique_ptr<OperationLedger>, std::error_code>
{
    return create(config, std::make_unique<Crypto::BlstBackend>(), access, dispatcher, clock);
}

auto OperationLedger::create(const LedgerConfig& config, std::unique_ptr<Crypto::CurveBackend> backend,
    const AccessControl& access, CallDispatcher& dispatcher, const Clock& clock)
    -> std::expected<std::unique_ptr<OperationLedger>, std::error_code>
{
    if (!backend)
        return std::unexpected(Error::InvalidConfig);

    auto verifier = make_verifier(*backend, config);
    if (!verifier) {
        TESSERA_LOG_ERROR(LOG_COMPONENT, "ledger setup failed: " << verifier.error().message());
        return std::unexpected(verifier.error());
    }

    auto ledger = std::make_unique<OperationLedger>(
        Token {}, config, std::move(backend), std::move(*verifier), access, dispatcher, clock);

    TESSERA_LOG_INFO(LOG_COMPONENT, "ledger " << short_hex(config.ledger_id) << " ready: "
                                              << config.public_keys.size() << " members, threshold "
                                              << ledger->threshold());
    return ledger;
}

/* ---------- lookup ---------- */

OperationStatus OperationLedger::status(const Hash& hash) const
{
    const Operation* op = operation(hash);
    return op == nullptr ? OperationStatus::None : op->status;
}

const Operation* OperationLedger::operation(const Hash& hash) const
{
    auto it = index_.find(hash);
    if (it == index_.end())
        return nullptr;
    return &operations_[it->second];
}

Operation* OperationLedger::find(const Hash& hash)
{
    auto it = index_.find(hash);
    if (it == index_.end())
        return nullptr;
    return &operations_[it->second];
}

void OperationLedger::set_status(Operation& op, OperationStatus status)
{
    TESSERA_LOG_DEBUG(LOG_COMPONENT, "operation " << short_hex(op.hash) << ": " << to_string(op.status)
                                                  << " -> " << to_string(status));
    op.status = status;
}

/* ---------- submit ---------- */

std::error_code OperationLedger::validate_request(const OperationRequest& request, uint64_t expected_nonce,
    Timestamp now, const Hash& hash, const std::set<Hash>& staged) const
{
    if (std::ranges::all_of(request.target, [](Byte b) { return b == 0; }))
        return Error::ZeroTarget;
    if (request.expiration_time <= request.effective_time)
        return Error::InvalidTimeWindow;
    if (request.expiration_time <= now)
        return Error::OperationExpired;
    if (request.gas_limit < config_.min_gas_limit)
        return Error::GasLimitTooLow;
    if (std::ranges::all_of(request.hash_check_code, [](Byte b) { return b == 0; }))
        return Error::ZeroHashCheckCode;
    if (request.hash_check_code != hash_check_code(hash))
        return Error::HashCheckCodeMismatch;
    if (request.payload.size() > config_.max_payload_size)
        return Error::PayloadTooLarge;
    // Identical content carries the nonce it was first accepted with, so it is caught here.
    if (index_.contains(hash) || staged.contains(hash))
        return Error::OperationExists;
    if (request.nonce != expected_nonce)
        return Error::NonceMismatch;
    return {};
}

auto OperationLedger::submit(const Address& caller, std::span<const OperationRequest> batch)
    -> std::expected<std::vector<Hash>, std::error_code>
{
    ReentrancyGuard guard(entered_);
    if (!guard.acquired())
        return std::unexpected(Error::ReentrantCall);
    if (!access_->has_role(Role::Proposer, caller))
        return std::unexpected(Error::MissingRole);

    const Timestamp now = clock_->now();
    uint64_t expected_nonce = nonce_;
    std::vector<Operation> staged;
    std::set<Hash> batch_hashes;
    staged.reserve(batch.size());

    for (const auto& request : batch) {
        const Hash hash = operation_hash(config_.ledger_id, request);

        if (auto err = validate_request(request, expected_nonce, now, hash, batch_hashes); err) {
            TESSERA_LOG_INFO(LOG_COMPONENT, "submit rejected at nonce " << expected_nonce << ": " << err.message());
            return std::unexpected(err);
        }

        Operation op {
            .hash = hash,
            .target = request.target,
            .value = request.value,
            .effective_time = request.effective_time,
            .expiration_time = request.expiration_time,
            .gas_limit = request.gas_limit,
            .nonce = request.nonce,
            .hash_check_code = request.hash_check_code,
            .status = OperationStatus::Pending,
            .payload = request.payload,
        };

        if (!request.signature.empty()) {
            auto approved = verifier_->verify(request.signature, request.signers, hash);
            if (!approved) {
                TESSERA_LOG_INFO(LOG_COMPONENT, "submit rejected at nonce " << expected_nonce << ": "
                                                                          << approved.error().message());
                return std::unexpected(approved.error());
            }
            if (*approved) {
                op.status = OperationStatus::Approved;
                op.aggregated_signature = request.signature;
                op.signer_set = request.signers;
            }
        }

        batch_hashes.insert(hash);
        staged.push_back(std::move(op));
        ++expected_nonce;
    }

    std::vector<Hash> hashes;
    hashes.reserve(staged.size());
    for (auto& op : staged) {
        TESSERA_LOG_DEBUG(LOG_COMPONENT, "operation " << short_hex(op.hash) << ": NONE -> " << to_string(op.status)
                                                      << " (nonce " << op.nonce << ")");
        hashes.push_back(op.hash);
        index_.emplace(op.hash, operations_.size());
        operations_.push_back(std::move(op));
    }
    nonce_ = expected_nonce;
    return hashes;
}

/* ---------- verify ---------- */

auto OperationLedger::verify(const Address& caller, std::span<const Hash> hashes, std::span<const Bytes> signatures,
    std::span<const std::vector<Bytes>> signer_sets) -> std::expected<std::vector<bool>, std::error_code>
{
    ReentrancyGuard guard(entered_);
    if (!guard.acquired())
        return std::unexpected(Error::ReentrantCall);
    if (!access_->has_role(Role::Verifier, caller))
        return std::unexpected(Error::MissingRole);
    if (hashes.size() != signatures.size() || hashes.size() != signer_sets.size())
        return std::unexpected(Error::LengthMismatch);

    for (const auto& signers : signer_sets) {
        if (auto err = verifier_->check_signers(signers); err) {
            TESSERA_LOG_INFO(LOG_COMPONENT, "verify aborted: " << err.message());
            return std::unexpected(err);
        }
    }

    // Outcomes are computed for the whole call before any status changes.
    std::vector<std::optional<bool>> outcomes(hashes.size());
    std::set<Hash> attempted;
    for (size_t i = 0; i < hashes.size(); ++i) {
        const Operation* op = operation(hashes[i]);
        if (op == nullptr || op->status != OperationStatus::Pending || !attempted.insert(hashes[i]).second)
            continue;

        auto ok = verifier_->verify(signatures[i], signer_sets[i], hashes[i]);
        if (!ok) {
            TESSERA_LOG_INFO(LOG_COMPONENT, "verify aborted: " << ok.error().message());
            return std::unexpected(ok.error());
        }
        outcomes[i] = *ok;
    }

    std::vector<bool> results(hashes.size(), false);
    for (size_t i = 0; i < hashes.size(); ++i) {
        if (!outcomes[i]) {
            TESSERA_LOG_WARN(LOG_COMPONENT, "verify: operation " << short_hex(hashes[i]) << " is "
                                                                 << to_string(status(hashes[i]))
                                                                 << ", expected PENDING");
            continue;
        }

        Operation* op = find(hashes[i]);
        op->aggregated_signature = signatures[i];
        op->signer_set = signer_sets[i];
        set_status(*op, *outcomes[i] ? OperationStatus::Approved : OperationStatus::Rejected);
        results[i] = *outcomes[i];
    }
    return results;
}

/* ---------- execute ---------- */

std::error_code OperationLedger::execute(const Address& caller, std::span<const Hash> hashes)
{
    ReentrancyGuard guard(entered_);
    if (!guard.acquired())
        return Error::ReentrantCall;
    if (!access_->has_role(Role::Executor, caller))
        return Error::MissingRole;

    const Timestamp now = clock_->now();
    std::vector<size_t> batch;
    batch.reserve(hashes.size());

    for (const auto& hash : hashes) {
        auto it = index_.find(hash);
        // A hash listed twice would find itself no longer APPROVED on its second turn.
        const bool repeated = it != index_.end() && std::ranges::find(batch, it->second) != batch.end();
        if (it == index_.end() || repeated || operations_[it->second].status != OperationStatus::Approved) {
            TESSERA_LOG_INFO(LOG_COMPONENT, "execute: operation " << short_hex(hash) << " is "
                                                                  << to_string(status(hash)));
            return Error::ExecuteUnapprovedOperation;
        }
        if (now < operations_[it->second].effective_time) {
            TESSERA_LOG_INFO(LOG_COMPONENT, "execute: operation " << short_hex(hash) << " effective at "
                                                                  << operations_[it->second].effective_time
                                                                  << ", now " << now);
            return Error::ExecuteUneffectiveOperation;
        }
        batch.push_back(it->second);
    }

    bool expired = false;
    for (size_t idx : batch) {
        Operation& op = operations_[idx];
        if (now >= op.expiration_time) {
            TESSERA_LOG_WARN(LOG_COMPONENT, "execute: operation " << short_hex(op.hash) << " expired at "
                                                                  << op.expiration_time);
            set_status(op, OperationStatus::Expired);
            expired = true;
        }
    }
    if (expired)
        return Error::ExecuteExpiredOperation;

    for (size_t idx : batch) {
        set_status(operations_[idx], OperationStatus::Executing);

        const Operation& op = operations_[idx];
        const CallRequest request {
            .operation = op.hash,
            .target = op.target,
            .value = op.value,
            .gas_limit = op.gas_limit,
            .payload = op.payload,
        };
        std::error_code err;
        try {
            err = dispatcher_->call(request);
        } catch (const std::exception& e) {
            TESSERA_LOG_WARN(LOG_COMPONENT, "execute: dispatcher threw: " << e.what());
            err = Error::CallReverted;
        }

        if (err) {
            TESSERA_LOG_WARN(LOG_COMPONENT, "execute: target call for " << short_hex(op.hash)
                                                                      << " failed: " << err.message());
            set_status(operations_[idx], OperationStatus::Failed);
        } else {
            set_status(operations_[idx], OperationStatus::Executed);
        }
    }
    return {};
}

} // namespace Tessera::Wallet
