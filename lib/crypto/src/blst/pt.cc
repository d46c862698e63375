#include "crypto/blst/PT.hpp"

extern "C" {
#include <blst.h>
}

namespace Tessera::Crypto::bls {

static_assert(sizeof(PT) == sizeof(blst_fp12), "PT size mismatch");

PT::PT(const P1_Affine& p, const P2_Affine& q)
{
    blst_miller_loop(&value, q, p);
}

PT PT::one()
{
    return PT(blst_fp12_one());
}

PT& PT::mul(const PT& p)
{
    blst_fp12_mul(&value, &value, p);
    return *this;
}

PT& PT::final_exp()
{
    blst_final_exp(&value, &value);
    return *this;
}

bool PT::is_one() const
{
    return blst_fp12_is_one(&value);
}

} // namespace Tessera::Crypto::bls
