#pragma once

#include <cstddef>
#include <cstring>
#include <expected>
#include <system_error>

extern "C" {
#include <blst.h>
}
#include "Scalar.hpp"
#include "crypto/types.hpp"

namespace Tessera::Crypto::bls {

class P1;
class P2_Affine;

class P1_Affine {
private:
    ::blst_p1_affine point {};

    explicit P1_Affine(const blst_p1_affine& p)
        : point(p)
    {
    }

public:
    P1_Affine() = default;

    /* ---------- factories ---------- */

    static P1_Affine from_P1(const P1& jac);

    /* ---------- observers ---------- */

    [[nodiscard]] bool is_inf() const { return blst_p1_affine_is_inf(&point); }

    // Standard BLS verification with the signature (this) on G1 and the key on G2.
    [[nodiscard]] std::error_code core_verify(
        const P2_Affine& pk,
        BytesSpan msg,
        BytesSpan dst) const;

private:
    friend class P2_Affine;
    friend class P1;
    friend class PT;

    operator const blst_p1_affine*() const { return &point; }
};

class P1 {
private:
    blst_p1 point {};

    explicit P1(const blst_p1& p)
        : point(p)
    {
    }

public:
    P1() = default;

    /* ---------- factories ---------- */

    static P1 generator();
    static P1 identity();
    static P1 from_affine(const P1_Affine& a);

    // 128-byte encoding; rejects non-canonical coordinates, off-curve and non-subgroup points.
    static std::expected<P1, std::error_code> decode(const G1Point& in);

    // SSWU + isogeny + cofactor clearing of a single field element.
    static std::expected<P1, std::error_code> map_from(const FieldElement& u);

    // RFC 9380 hash_to_curve as implemented by blst.
    static P1 from_hash(BytesSpan msg, BytesSpan dst);

    /* ---------- observers ---------- */

    [[nodiscard]] G1Point encode() const;
    [[nodiscard]] bool is_inf() const { return blst_p1_is_inf(&point); }

    friend bool operator==(const P1& a, const P1& b);

    /* ---------- mutators ---------- */

    P1& add(const P1& a);
    P1& mult(const Scalar& s);
    P1& neg();

    // Multiplies a hash point by a secret key.
    P1& sign_with(const Scalar& s);

    friend class P1_Affine;
    operator const blst_p1*() const { return &point; }
};

} // namespace Tessera::Crypto::bls
