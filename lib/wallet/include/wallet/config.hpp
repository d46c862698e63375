#pragma once

#include "crypto/types.hpp"
#include "wallet/common.hpp"

#include <optional>
#include <system_error>
#include <vector>

namespace Tessera::Wallet {

enum class GovernanceMode : uint8_t {
    // Every member signs; the signature verifies under the sum of all member keys.
    Aggregate = 1,
    // Any threshold-sized subset of members signs.
    Threshold = 2,
};

/**
 * @struct LedgerConfig
 * @brief Construction parameters of an OperationLedger.
 *
 * public_keys and member_ids are raw encodings for the chosen placement
 * (128 or 256 bytes each). member_ids and threshold only apply in
 * threshold mode.
 */
struct LedgerConfig {
    Crypto::KeyPlacement placement = Crypto::KeyPlacement::PublicKeyOnG1;
    GovernanceMode mode = GovernanceMode::Aggregate;
    std::vector<Bytes> public_keys;
    std::vector<Bytes> member_ids;
    size_t threshold = 0;

    uint64_t min_gas_limit = 21000;
    size_t max_payload_size = 64 * 1024;

    Hash ledger_id {};
    // Unset means default_domain(placement).
    std::optional<Crypto::Domain> domain;
};

/**
 * @brief Structural checks that need no curve arithmetic.
 *
 * EmptyMemberSet without keys, InvalidThreshold unless 1 <= threshold <= n
 * in threshold mode, InvalidConfig for wrong key or id sizes, a missing or
 * mismatched id list, an empty or oversized DST, a signature DST that is
 * the standard tag of the other placement, or a zero payload limit.
 */
[[nodiscard]] std::error_code validate_config(const LedgerConfig& config);

[[nodiscard]] Crypto::Domain resolved_domain(const LedgerConfig& config);

} // namespace Tessera::Wallet
