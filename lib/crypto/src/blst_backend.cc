#include "crypto/blst_backend.hpp"
#include "crypto/blst/P1.hpp"
#include "crypto/blst/P2.hpp"
#include "crypto/blst/PT.hpp"
#include "crypto/blst/Scalar.hpp"
#include "crypto/error.hpp"

#include <ranges>

namespace Tessera::Crypto {

using bls::P1;
using bls::P1_Affine;
using bls::P2;
using bls::P2_Affine;
using bls::PT;
using bls::Scalar;

namespace {

    template <typename PointT, typename EncodedT>
    auto add_points(const EncodedT& a, const EncodedT& b) -> std::expected<EncodedT, std::error_code>
    {
        auto pa = PointT::decode(a);
        if (!pa)
            return std::unexpected(pa.error());
        auto pb = PointT::decode(b);
        if (!pb)
            return std::unexpected(pb.error());
        return pa->add(*pb).encode();
    }

    template <typename PointT, typename EncodedT>
    auto msm(std::span<const EncodedT> points, std::span<const ScalarBytes> scalars)
        -> std::expected<EncodedT, std::error_code>
    {
        if (points.size() != scalars.size())
            return std::unexpected(Error::LengthMismatch);

        auto acc = PointT::identity();
        for (const auto& [encoded, scalar] : std::views::zip(points, scalars)) {
            auto p = PointT::decode(encoded);
            if (!p)
                return std::unexpected(p.error());
            acc.add(p->mult(Scalar::from_bendian(scalar)));
        }
        return acc.encode();
    }

} // namespace

auto BlstBackend::g1_add(const G1Point& a, const G1Point& b) const
    -> std::expected<G1Point, std::error_code>
{
    return add_points<P1>(a, b);
}

auto BlstBackend::g2_add(const G2Point& a, const G2Point& b) const
    -> std::expected<G2Point, std::error_code>
{
    return add_points<P2>(a, b);
}

auto BlstBackend::g1_msm(std::span<const G1Point> points, std::span<const ScalarBytes> scalars) const
    -> std::expected<G1Point, std::error_code>
{
    return msm<P1>(points, scalars);
}

auto BlstBackend::g2_msm(std::span<const G2Point> points, std::span<const ScalarBytes> scalars) const
    -> std::expected<G2Point, std::error_code>
{
    return msm<P2>(points, scalars);
}

auto BlstBackend::pairing_check(std::span<const G1Point> g1, std::span<const G2Point> g2) const
    -> std::expected<bool, std::error_code>
{
    if (g1.size() != g2.size())
        return std::unexpected(Error::LengthMismatch);

    PT acc = PT::one();
    for (const auto& [a, b] : std::views::zip(g1, g2)) {
        auto p = P1::decode(a);
        if (!p)
            return std::unexpected(p.error());
        auto q = P2::decode(b);
        if (!q)
            return std::unexpected(q.error());

        // e(O, Q) = e(P, O) = 1
        if (p->is_inf() || q->is_inf())
            continue;

        acc.mul(PT(P1_Affine::from_P1(*p), P2_Affine::from_P2(*q)));
    }
    return acc.final_exp().is_one();
}

auto BlstBackend::map_fp_to_g1(const FieldElement& u) const
    -> std::expected<G1Point, std::error_code>
{
    auto p = P1::map_from(u);
    if (!p)
        return std::unexpected(p.error());
    return p->encode();
}

auto BlstBackend::map_fp2_to_g2(const Fp2Element& u) const
    -> std::expected<G2Point, std::error_code>
{
    auto p = P2::map_from(u);
    if (!p)
        return std::unexpected(p.error());
    return p->encode();
}

G1Point BlstBackend::g1_generator() const
{
    return P1::generator().encode();
}

G2Point BlstBackend::g2_generator() const
{
    return P2::generator().encode();
}

} // namespace Tessera::Crypto
