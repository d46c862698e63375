extern "C" {
#include <blst.h>
}

#include "crypto/blst/P1.hpp"
#include "crypto/blst/P2.hpp"
#include "crypto/error.hpp"
#include "crypto/field.hpp"
#include "encoding.hpp"

#include <algorithm>

namespace Tessera::Crypto::bls {
using impl::read_fp;
using impl::write_fp;

/* ---------- P1_Affine ---------- */

P1_Affine P1_Affine::from_P1(const P1& jac)
{
    blst_p1_affine a;
    blst_p1_to_affine(&a, &jac.point);
    return P1_Affine(a);
}

std::error_code P1_Affine::core_verify(const P2_Affine& pk, BytesSpan msg, BytesSpan dst) const
{
    BLST_ERROR err = blst_core_verify_pk_in_g2(
        pk,
        &point,
        true,
        msg.data(), msg.size(),
        dst.data(), dst.size(),
        nullptr, 0);

    if (err != BLST_SUCCESS)
        return Error::InvalidSignature;
    return {};
}

/* ---------- P1 ---------- */

P1 P1::generator()
{
    return P1(*blst_p1_generator());
}

P1 P1::identity()
{
    // blst treats Z = 0 as the point at infinity.
    P1 ret;
    std::memset(&ret.point, 0, sizeof(ret.point));
    return ret;
}

P1 P1::from_affine(const P1_Affine& a)
{
    blst_p1 p;
    blst_p1_from_affine(&p, a);
    return P1(p);
}

std::expected<P1, std::error_code> P1::decode(const G1Point& in)
{
    if (is_identity(in))
        return identity();

    blst_p1_affine a;
    BytesSpan bytes(in);
    if (auto err = read_fp(a.x, bytes.subspan(0, FP_SIZE)); err)
        return std::unexpected(err);
    if (auto err = read_fp(a.y, bytes.subspan(FP_SIZE, FP_SIZE)); err)
        return std::unexpected(err);

    if (!blst_p1_affine_on_curve(&a))
        return std::unexpected(Error::PointNotOnCurve);
    if (!blst_p1_affine_in_g1(&a))
        return std::unexpected(Error::PointNotInSubgroup);

    blst_p1 p;
    blst_p1_from_affine(&p, &a);
    return P1(p);
}

std::expected<P1, std::error_code> P1::map_from(const FieldElement& u)
{
    blst_fp fp;
    if (auto err = read_fp(fp, u); err)
        return std::unexpected(err);

    blst_p1 p;
    blst_map_to_g1(&p, &fp, nullptr);
    return P1(p);
}

P1 P1::from_hash(BytesSpan msg, BytesSpan dst)
{
    blst_p1 p;
    blst_hash_to_g1(
        &p,
        msg.data(), msg.size(),
        dst.data(), dst.size(),
        nullptr, 0);
    return P1(p);
}

G1Point P1::encode() const
{
    G1Point out {};
    if (is_inf())
        return out;

    blst_p1_affine a;
    blst_p1_to_affine(&a, &point);
    write_fp(std::span<Byte, FP_SIZE>(out.data(), FP_SIZE), a.x);
    write_fp(std::span<Byte, FP_SIZE>(out.data() + FP_SIZE, FP_SIZE), a.y);
    return out;
}

bool operator==(const P1& a, const P1& b)
{
    return blst_p1_is_equal(&a.point, &b.point);
}

P1& P1::add(const P1& a)
{
    blst_p1_add_or_double(&point, &point, &a.point);
    return *this;
}

P1& P1::mult(const Scalar& s)
{
    if (s.is_zero()) {
        *this = identity();
        return *this;
    }
    blst_p1_mult(&point, &point, s.val.b, Scalar::BIT_LENGTH);
    return *this;
}

P1& P1::neg()
{
    blst_p1_cneg(&point, true);
    return *this;
}

P1& P1::sign_with(const Scalar& s)
{
    blst_sign_pk_in_g2(&point, &point, &s.val);
    return *this;
}

} // namespace Tessera::Crypto::bls
