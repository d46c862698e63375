#pragma once

#include "wallet/common.hpp"

#include <string_view>
#include <vector>

namespace Tessera::Wallet {

enum class OperationStatus : uint8_t {
    None = 0,
    Pending,
    Approved,
    Rejected,
    Executing,
    Executed,
    Failed,
    Expired,
};

[[nodiscard]] std::string_view to_string(OperationStatus status);

// Terminal states never change again.
[[nodiscard]] constexpr bool is_terminal(OperationStatus status)
{
    return status == OperationStatus::Rejected || status == OperationStatus::Executed
        || status == OperationStatus::Failed || status == OperationStatus::Expired;
}

/**
 * @struct OperationRequest
 * @brief One entry of a submit batch.
 *
 * signature and signers are optional inline approval: an empty signature
 * leaves the operation PENDING. signers carries raw member public keys
 * (threshold mode only).
 */
struct OperationRequest {
    Address target {};
    uint64_t value = 0;
    Timestamp effective_time = 0;
    Timestamp expiration_time = 0;
    uint64_t gas_limit = 0;
    uint64_t nonce = 0;
    HashCheckCode hash_check_code {};
    Bytes payload;

    Bytes signature;
    std::vector<Bytes> signers;
};

/**
 * @struct Operation
 * @brief Ledger record of a submitted operation.
 */
struct Operation {
    Hash hash {};
    Address target {};
    uint64_t value = 0;
    Timestamp effective_time = 0;
    Timestamp expiration_time = 0;
    uint64_t gas_limit = 0;
    uint64_t nonce = 0;
    HashCheckCode hash_check_code {};
    OperationStatus status = OperationStatus::None;
    Bytes payload;

    // Signature and signer set that approved (or were rejected for) this operation.
    Bytes aggregated_signature;
    std::vector<Bytes> signer_set;
};

/**
 * @brief Content hash signed by the members.
 *
 * SHA-256("TESSERA_OPERATION_V1" || ledger_id || target || value || effective_time
 * || expiration_time || gas_limit || nonce || len(payload) || payload), integers
 * big-endian (length as 4 bytes, the rest as 8). Status, signature and hash
 * check code are not covered.
 */
[[nodiscard]] Hash operation_hash(const Hash& ledger_id, const OperationRequest& request);

// Bytes 24..31 of the content hash.
[[nodiscard]] HashCheckCode hash_check_code(const Hash& hash);

} // namespace Tessera::Wallet
