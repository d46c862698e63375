#pragma once

#include "crypto/curve_backend.hpp"
#include "crypto/group_ops.hpp"
#include "crypto/types.hpp"

#include <expected>
#include <system_error>

namespace Tessera::Crypto {

/**
 * @class CurveMapper
 * @brief RFC 9380 hash_to_curve for G1 and G2 on top of a CurveBackend.
 *
 * hash_to_curve(msg) = map(u0) + map(u1) with (u0, u1) = hash_to_field(msg, dst, 2).
 * The backend maps clear the cofactor, which is a homomorphism, so the sum
 * equals the standard construction.
 */
class CurveMapper {
public:
    explicit CurveMapper(const CurveBackend& backend)
        : ops_(backend)
    {
    }

    [[nodiscard]] auto map_to_curve_g1(const FieldElement& u) const -> std::expected<G1Point, std::error_code>;
    [[nodiscard]] auto map_to_curve_g2(const Fp2Element& u) const -> std::expected<G2Point, std::error_code>;

    [[nodiscard]] auto hash_to_curve_g1(BytesSpan msg, BytesSpan dst) const -> std::expected<G1Point, std::error_code>;
    [[nodiscard]] auto hash_to_curve_g2(BytesSpan msg, BytesSpan dst) const -> std::expected<G2Point, std::error_code>;

    template <CurvePoint P>
    [[nodiscard]] auto hash_to_curve(BytesSpan msg, BytesSpan dst) const -> std::expected<P, std::error_code>
    {
        if constexpr (std::same_as<P, G1Point>)
            return hash_to_curve_g1(msg, dst);
        else
            return hash_to_curve_g2(msg, dst);
    }

private:
    GroupOps ops_;
};

} // namespace Tessera::Crypto
