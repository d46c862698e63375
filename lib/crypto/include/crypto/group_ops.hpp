#pragma once

#include "crypto/curve_backend.hpp"
#include "crypto/types.hpp"

#include <expected>
#include <span>
#include <system_error>

namespace Tessera::Crypto {

/**
 * @class GroupOps
 * @brief Group law and pairing checks over a CurveBackend.
 *
 * Holds a non-owning pointer; the backend must outlive every GroupOps copy.
 */
class GroupOps {
public:
    explicit GroupOps(const CurveBackend& backend)
        : backend_(&backend)
    {
    }

    template <CurvePoint P>
    [[nodiscard]] auto add(const P& a, const P& b) const -> std::expected<P, std::error_code>;

    /**
     * @brief Left fold of add over the input.
     *
     * EmptyPointsToSum on empty input, SumPointsFailed if any operand is rejected.
     */
    template <CurvePoint P>
    [[nodiscard]] auto sum(std::span<const P> points) const -> std::expected<P, std::error_code>;

    // sum_i scalars[i] * points[i]; LengthMismatch unless the sizes agree.
    template <CurvePoint P>
    [[nodiscard]] auto multi_scalar_mul(std::span<const P> points, std::span<const ScalarBytes> scalars) const
        -> std::expected<P, std::error_code>;

    template <CurvePoint P>
    [[nodiscard]] auto mul(const P& point, const ScalarBytes& scalar) const -> std::expected<P, std::error_code>
    {
        return multi_scalar_mul<P>(std::span(&point, 1), std::span(&scalar, 1));
    }

    // (x, y) -> (x, -y). Identity stays identity.
    template <CurvePoint P>
    [[nodiscard]] auto negate(const P& point) const -> std::expected<P, std::error_code>;

    template <CurvePoint P>
    [[nodiscard]] P generator() const;

    template <CurvePoint P>
    [[nodiscard]] static constexpr P identity() { return P {}; }

    // True iff prod e(g1[i], g2[i]) == 1.
    [[nodiscard]] auto pairing_check(std::span<const G1Point> g1, std::span<const G2Point> g2) const
        -> std::expected<bool, std::error_code>;

    [[nodiscard]] const CurveBackend& backend() const { return *backend_; }

private:
    const CurveBackend* backend_;
};

} // namespace Tessera::Crypto
