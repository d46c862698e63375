#pragma once

#include "crypto/curve_backend.hpp"

namespace Tessera::Crypto {

/**
 * @class BlstBackend
 * @brief Software CurveBackend built on supranational/blst.
 */
class BlstBackend final : public CurveBackend {
public:
    BlstBackend() = default;

    auto g1_add(const G1Point& a, const G1Point& b) const
        -> std::expected<G1Point, std::error_code> override;

    auto g2_add(const G2Point& a, const G2Point& b) const
        -> std::expected<G2Point, std::error_code> override;

    auto g1_msm(std::span<const G1Point> points, std::span<const ScalarBytes> scalars) const
        -> std::expected<G1Point, std::error_code> override;

    auto g2_msm(std::span<const G2Point> points, std::span<const ScalarBytes> scalars) const
        -> std::expected<G2Point, std::error_code> override;

    auto pairing_check(std::span<const G1Point> g1, std::span<const G2Point> g2) const
        -> std::expected<bool, std::error_code> override;

    auto map_fp_to_g1(const FieldElement& u) const
        -> std::expected<G1Point, std::error_code> override;

    auto map_fp2_to_g2(const Fp2Element& u) const
        -> std::expected<G2Point, std::error_code> override;

    G1Point g1_generator() const override;
    G2Point g2_generator() const override;
};

} // namespace Tessera::Crypto
