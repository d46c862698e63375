#pragma once

#include <cstddef>
#include <cstring>

extern "C" {
#include <blst.h>
}

#include "P1.hpp"
#include "P2.hpp"

namespace Tessera::Crypto::bls {

class PT {
private:
    blst_fp12 value {};

    explicit PT(const blst_fp12* v) { value = *v; }

public:
    // Miller loop only; call final_exp() before comparing.
    PT(const P1_Affine& p, const P2_Affine& q);

    static PT one();

    PT& mul(const PT& p);
    PT& final_exp();
    [[nodiscard]] bool is_one() const;

private:
    operator const blst_fp12*() const { return &value; }
};

} // namespace Tessera::Crypto::bls
