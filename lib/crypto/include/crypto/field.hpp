#pragma once

#include "crypto/types.hpp"

#include <expected>
#include <system_error>

/**
 * Arithmetic helpers for the BLS12-381 base field over the 64-byte encoding.
 */
namespace Tessera::Crypto::Field {

// p = 0x1a0111ea...ffffaaab, 48 significant bytes.
const FieldElement& modulus();

// True iff the value is < p (top 16 bytes zero and the remainder below p).
[[nodiscard]] bool is_canonical(const FieldElement& fe);

// Interprets an arbitrary big-endian byte string as an integer and reduces it mod p.
[[nodiscard]]
auto reduce(BytesSpan big_endian) -> std::expected<FieldElement, std::error_code>;

// p - x for x != 0, zero for zero. Rejects non-canonical input.
[[nodiscard]]
auto negate(const FieldElement& fe) -> std::expected<FieldElement, std::error_code>;

} // namespace Tessera::Crypto::Field
