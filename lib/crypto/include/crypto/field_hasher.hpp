#pragma once

#include "crypto/types.hpp"

#include <expected>
#include <system_error>
#include <vector>

/**
 * RFC 9380 hashing to the BLS12-381 base field, SHA-256 based.
 */
namespace Tessera::Crypto::FieldHasher {

constexpr size_t HASH_OUTPUT_SIZE = 32;
constexpr size_t HASH_BLOCK_SIZE = 64;
constexpr size_t MAX_DST_SIZE = 255;
constexpr size_t MAX_ELL = 255;
constexpr size_t MAX_OUTPUT_SIZE = 65535;

/**
 * @brief expand_message_xmd (RFC 9380 §5.3.1).
 *
 * Fails with LengthTooLarge if len_in_bytes > 65535, EllTooLarge if
 * ceil(len_in_bytes / 32) > 255 and DSTTooLong if |dst| > 255.
 */
[[nodiscard]]
auto expand_message_xmd(BytesSpan message, BytesSpan dst, size_t len_in_bytes)
    -> std::expected<Bytes, std::error_code>;

/**
 * @brief hash_to_field with m = 1, L = 64: count elements of Fp.
 */
[[nodiscard]]
auto hash_to_field(BytesSpan message, BytesSpan dst, size_t count)
    -> std::expected<std::vector<FieldElement>, std::error_code>;

/**
 * @brief hash_to_field with m = 2, L = 64: count elements of Fp2.
 */
[[nodiscard]]
auto hash_to_field2(BytesSpan message, BytesSpan dst, size_t count)
    -> std::expected<std::vector<Fp2Element>, std::error_code>;

} // namespace Tessera::Crypto::FieldHasher
