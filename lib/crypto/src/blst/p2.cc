extern "C" {
#include <blst.h>
}

#include "crypto/blst/P1.hpp"
#include "crypto/blst/P2.hpp"
#include "crypto/error.hpp"
#include "encoding.hpp"

namespace Tessera::Crypto::bls {
using impl::read_fp2;
using impl::write_fp2;

/* ---------- P2_Affine ---------- */

P2_Affine P2_Affine::from_P2(const P2& jac)
{
    blst_p2_affine a;
    blst_p2_to_affine(&a, &jac.point);
    return P2_Affine(a);
}

std::error_code P2_Affine::core_verify(const P1_Affine& pk, BytesSpan msg, BytesSpan dst) const
{
    // Key on G1, signature (this) on G2.
    BLST_ERROR err = blst_core_verify_pk_in_g1(
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

/* ---------- P2 ---------- */

P2 P2::generator()
{
    return P2(*blst_p2_generator());
}

P2 P2::identity()
{
    P2 ret;
    std::memset(&ret.point, 0, sizeof(ret.point));
    return ret;
}

P2 P2::from_affine(const P2_Affine& a)
{
    blst_p2 p;
    blst_p2_from_affine(&p, a);
    return P2(p);
}

std::expected<P2, std::error_code> P2::decode(const G2Point& in)
{
    if (is_identity(in))
        return identity();

    blst_p2_affine a;
    BytesSpan bytes(in);
    if (auto err = read_fp2(a.x, bytes.subspan(0, 2 * FP_SIZE)); err)
        return std::unexpected(err);
    if (auto err = read_fp2(a.y, bytes.subspan(2 * FP_SIZE, 2 * FP_SIZE)); err)
        return std::unexpected(err);

    if (!blst_p2_affine_on_curve(&a))
        return std::unexpected(Error::PointNotOnCurve);
    if (!blst_p2_affine_in_g2(&a))
        return std::unexpected(Error::PointNotInSubgroup);

    blst_p2 p;
    blst_p2_from_affine(&p, &a);
    return P2(p);
}

std::expected<P2, std::error_code> P2::map_from(const Fp2Element& u)
{
    blst_fp2 fp2;
    if (auto err = impl::read_fp(fp2.fp[0], u.c0); err)
        return std::unexpected(err);
    if (auto err = impl::read_fp(fp2.fp[1], u.c1); err)
        return std::unexpected(err);

    blst_p2 p;
    blst_map_to_g2(&p, &fp2, nullptr);
    return P2(p);
}

P2 P2::from_hash(BytesSpan msg, BytesSpan dst)
{
    blst_p2 p;
    blst_hash_to_g2(
        &p,
        msg.data(), msg.size(),
        dst.data(), dst.size(),
        nullptr, 0);
    return P2(p);
}

G2Point P2::encode() const
{
    G2Point out {};
    if (is_inf())
        return out;

    blst_p2_affine a;
    blst_p2_to_affine(&a, &point);
    write_fp2(std::span<Byte, 2 * FP_SIZE>(out.data(), 2 * FP_SIZE), a.x);
    write_fp2(std::span<Byte, 2 * FP_SIZE>(out.data() + 2 * FP_SIZE, 2 * FP_SIZE), a.y);
    return out;
}

bool operator==(const P2& a, const P2& b)
{
    return blst_p2_is_equal(&a.point, &b.point);
}

P2& P2::add(const P2& a)
{
    blst_p2_add_or_double(&point, &point, &a.point);
    return *this;
}

P2& P2::mult(const Scalar& s)
{
    if (s.is_zero()) {
        *this = identity();
        return *this;
    }
    blst_p2_mult(&point, &point, s.val.b, Scalar::BIT_LENGTH);
    return *this;
}

P2& P2::neg()
{
    blst_p2_cneg(&point, true);
    return *this;
}

P2& P2::sign_with(const Scalar& s)
{
    // Signature on G2, key on G1.
    blst_sign_pk_in_g1(&point, &point, &s.val);
    return *this;
}

} // namespace Tessera::Crypto::bls
