#include "crypto/group_ops.hpp"
#include "crypto/error.hpp"
#include "crypto/field.hpp"

#include <algorithm>

namespace Tessera::Crypto {

template <CurvePoint P>
auto GroupOps::add(const P& a, const P& b) const -> std::expected<P, std::error_code>
{
    if constexpr (std::same_as<P, G1Point>)
        return backend_->g1_add(a, b);
    else
        return backend_->g2_add(a, b);
}

template <CurvePoint P>
auto GroupOps::sum(std::span<const P> points) const -> std::expected<P, std::error_code>
{
    if (points.empty())
        return std::unexpected(Error::EmptyPointsToSum);

    P acc = points.front();
    if (points.size() == 1) {
        // A lone operand still goes through validation.
        auto checked = add(acc, identity<P>());
        if (!checked)
            return std::unexpected(Error::SumPointsFailed);
        return *checked;
    }

    for (const auto& p : points.subspan(1)) {
        auto next = add(acc, p);
        if (!next)
            return std::unexpected(Error::SumPointsFailed);
        acc = *next;
    }
    return acc;
}

template <CurvePoint P>
auto GroupOps::multi_scalar_mul(std::span<const P> points, std::span<const ScalarBytes> scalars) const
    -> std::expected<P, std::error_code>
{
    if (points.size() != scalars.size())
        return std::unexpected(Error::LengthMismatch);
    if (points.empty())
        return identity<P>();

    if constexpr (std::same_as<P, G1Point>)
        return backend_->g1_msm(points, scalars);
    else
        return backend_->g2_msm(points, scalars);
}

template <CurvePoint P>
auto GroupOps::negate(const P& point) const -> std::expected<P, std::error_code>
{
    if (is_identity(point))
        return point;

    // y occupies the second half of the encoding: one Fp for G1, two (c0, c1) for G2.
    P out = point;
    constexpr size_t y_offset = sizeof(P) / 2;
    for (size_t off = y_offset; off < sizeof(P); off += FP_SIZE) {
        FieldElement coord {};
        std::copy_n(point.begin() + off, FP_SIZE, coord.begin());
        auto neg = Field::negate(coord);
        if (!neg)
            return std::unexpected(Error::InvalidPointEncoding);
        std::copy(neg->begin(), neg->end(), out.begin() + off);
    }
    return out;
}

template <CurvePoint P>
P GroupOps::generator() const
{
    if constexpr (std::same_as<P, G1Point>)
        return backend_->g1_generator();
    else
        return backend_->g2_generator();
}

auto GroupOps::pairing_check(std::span<const G1Point> g1, std::span<const G2Point> g2) const
    -> std::expected<bool, std::error_code>
{
    if (g1.size() != g2.size())
        return std::unexpected(Error::LengthMismatch);
    return backend_->pairing_check(g1, g2);
}

template auto GroupOps::add<G1Point>(const G1Point&, const G1Point&) const -> std::expected<G1Point, std::error_code>;
template auto GroupOps::add<G2Point>(const G2Point&, const G2Point&) const -> std::expected<G2Point, std::error_code>;
template auto GroupOps::sum<G1Point>(std::span<const G1Point>) const -> std::expected<G1Point, std::error_code>;
template auto GroupOps::sum<G2Point>(std::span<const G2Point>) const -> std::expected<G2Point, std::error_code>;
template auto GroupOps::multi_scalar_mul<G1Point>(std::span<const G1Point>, std::span<const ScalarBytes>) const
    -> std::expected<G1Point, std::error_code>;
template auto GroupOps::multi_scalar_mul<G2Point>(std::span<const G2Point>, std::span<const ScalarBytes>) const
    -> std::expected<G2Point, std::error_code>;
template auto GroupOps::negate<G1Point>(const G1Point&) const -> std::expected<G1Point, std::error_code>;
template auto GroupOps::negate<G2Point>(const G2Point&) const -> std::expected<G2Point, std::error_code>;
template G1Point GroupOps::generator<G1Point>() const;
template G2Point GroupOps::generator<G2Point>() const;

} // namespace Tessera::Crypto
