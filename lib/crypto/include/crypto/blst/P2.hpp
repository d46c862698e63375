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

class P1_Affine;
class P2;

class P2_Affine {
private:
    ::blst_p2_affine point {};

    explicit P2_Affine(const blst_p2_affine& p)
        : point(p)
    {
    }

public:
    P2_Affine() = default;

    /* ---------- factories ---------- */

    static P2_Affine from_P2(const P2& jac);

    /* ---------- observers ---------- */

    [[nodiscard]] bool is_inf() const { return blst_p2_affine_is_inf(&point); }

    // Standard BLS verification with the signature (this) on G2 and the key on G1.
    [[nodiscard]] std::error_code core_verify(
        const P1_Affine& pk,
        BytesSpan msg,
        BytesSpan dst) const;

private:
    friend class P1_Affine;
    friend class P2;
    friend class PT;

    operator const blst_p2_affine*() const { return &point; }
};

class P2 {
private:
    blst_p2 point {};

    explicit P2(const blst_p2& p)
        : point(p)
    {
    }

public:
    P2() = default;

    /* ---------- factories ---------- */

    static P2 generator();
    static P2 identity();
    static P2 from_affine(const P2_Affine& a);

    // 256-byte encoding (x.c0, x.c1, y.c0, y.c1); same checks as P1::decode.
    static std::expected<P2, std::error_code> decode(const G2Point& in);

    static std::expected<P2, std::error_code> map_from(const Fp2Element& u);

    static P2 from_hash(BytesSpan msg, BytesSpan dst);

    /* ---------- observers ---------- */

    [[nodiscard]] G2Point encode() const;
    [[nodiscard]] bool is_inf() const { return blst_p2_is_inf(&point); }

    friend bool operator==(const P2& a, const P2& b);

    /* ---------- mutators ---------- */

    P2& add(const P2& a);
    P2& mult(const Scalar& s);
    P2& neg();

    P2& sign_with(const Scalar& s);

private:
    friend class P2_Affine;
    operator const blst_p2*() const { return &point; }
};

} // namespace Tessera::Crypto::bls
