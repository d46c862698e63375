#include "crypto/curve_mapper.hpp"
#include "crypto/error.hpp"
#include "crypto/field.hpp"
#include "crypto/field_hasher.hpp"

#include <array>

namespace Tessera::Crypto {

auto CurveMapper::map_to_curve_g1(const FieldElement& u) const -> std::expected<G1Point, std::error_code>
{
    if (!Field::is_canonical(u))
        return std::unexpected(Error::InvalidFieldElement);
    auto p = ops_.backend().map_fp_to_g1(u);
    if (!p)
        return std::unexpected(Error::MapToCurveFailed);
    return *p;
}

auto CurveMapper::map_to_curve_g2(const Fp2Element& u) const -> std::expected<G2Point, std::error_code>
{
    if (!Field::is_canonical(u.c0) || !Field::is_canonical(u.c1))
        return std::unexpected(Error::InvalidFieldElement);
    auto p = ops_.backend().map_fp2_to_g2(u);
    if (!p)
        return std::unexpected(Error::MapToCurveFailed);
    return *p;
}

auto CurveMapper::hash_to_curve_g1(BytesSpan msg, BytesSpan dst) const -> std::expected<G1Point, std::error_code>
{
    auto u = FieldHasher::hash_to_field(msg, dst, 2);
    if (!u) {
        // Input-validation errors (DST length) are reported as such.
        if (u.error() == Error::DSTTooLong)
            return std::unexpected(u.error());
        return std::unexpected(Error::HashToFpFailed);
    }
    if (u->size() != 2)
        return std::unexpected(Error::HashToFpFailed);

    auto q0 = map_to_curve_g1((*u)[0]);
    if (!q0)
        return std::unexpected(q0.error());
    auto q1 = map_to_curve_g1((*u)[1]);
    if (!q1)
        return std::unexpected(q1.error());

    return ops_.add(*q0, *q1);
}

auto CurveMapper::hash_to_curve_g2(BytesSpan msg, BytesSpan dst) const -> std::expected<G2Point, std::error_code>
{
    auto u = FieldHasher::hash_to_field2(msg, dst, 2);
    if (!u) {
        if (u.error() == Error::DSTTooLong)
            return std::unexpected(u.error());
        return std::unexpected(Error::HashToFp2Failed);
    }
    if (u->size() != 2)
        return std::unexpected(Error::HashToFp2Failed);

    auto q0 = map_to_curve_g2((*u)[0]);
    if (!q0)
        return std::unexpected(q0.error());
    auto q1 = map_to_curve_g2((*u)[1]);
    if (!q1)
        return std::unexpected(q1.error());

    return ops_.add(*q0, *q1);
}

} // namespace Tessera::Crypto
