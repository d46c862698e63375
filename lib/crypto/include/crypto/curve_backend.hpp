#pragma once

#include "crypto/types.hpp"

#include <expected>
#include <span>
#include <system_error>

namespace Tessera::Crypto {

/**
 * @class CurveBackend
 * @brief BLS12-381 arithmetic over the 64-byte-per-coordinate encoding.
 *
 * Mirrors the primitive set a host exposes for the curve (EIP-2537): point
 * addition, multi-scalar multiplication, the pairing check and the two
 * field-to-curve maps. Every operand is validated by the implementation;
 * points off the curve or outside the prime-order subgroup are rejected.
 */
class CurveBackend {
public:
    virtual ~CurveBackend() = default;

    [[nodiscard]] virtual auto g1_add(const G1Point& a, const G1Point& b) const
        -> std::expected<G1Point, std::error_code> = 0;

    [[nodiscard]] virtual auto g2_add(const G2Point& a, const G2Point& b) const
        -> std::expected<G2Point, std::error_code> = 0;

    [[nodiscard]] virtual auto g1_msm(std::span<const G1Point> points, std::span<const ScalarBytes> scalars) const
        -> std::expected<G1Point, std::error_code> = 0;

    [[nodiscard]] virtual auto g2_msm(std::span<const G2Point> points, std::span<const ScalarBytes> scalars) const
        -> std::expected<G2Point, std::error_code> = 0;

    // True iff prod e(g1[i], g2[i]) == 1 in GT.
    [[nodiscard]] virtual auto pairing_check(std::span<const G1Point> g1, std::span<const G2Point> g2) const
        -> std::expected<bool, std::error_code> = 0;

    [[nodiscard]] virtual auto map_fp_to_g1(const FieldElement& u) const
        -> std::expected<G1Point, std::error_code> = 0;

    [[nodiscard]] virtual auto map_fp2_to_g2(const Fp2Element& u) const
        -> std::expected<G2Point, std::error_code> = 0;

    [[nodiscard]] virtual G1Point g1_generator() const = 0;
    [[nodiscard]] virtual G2Point g2_generator() const = 0;
};

} // namespace Tessera::Crypto
