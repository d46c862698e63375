#pragma once

extern "C" {
#include <blst.h>
}

#include "crypto/error.hpp"
#include "crypto/field.hpp"
#include "crypto/types.hpp"

#include <algorithm>
#include <span>
#include <system_error>

namespace Tessera::Crypto::bls::impl {

// 64-byte EIP-2537 coordinate <-> blst_fp (48-byte big-endian payload).
inline std::error_code read_fp(blst_fp& out, BytesSpan in)
{
    if (in.size() != FP_SIZE)
        return Error::InvalidPointEncoding;

    FieldElement fe {};
    std::copy(in.begin(), in.end(), fe.begin());
    if (!Field::is_canonical(fe))
        return Error::InvalidFieldElement;

    blst_fp_from_bendian(&out, fe.data() + (FP_SIZE - FP_VALUE_SIZE));
    return {};
}

inline void write_fp(std::span<Byte, FP_SIZE> out, const blst_fp& in)
{
    std::fill(out.begin(), out.end(), Byte { 0 });
    blst_bendian_from_fp(out.data() + (FP_SIZE - FP_VALUE_SIZE), &in);
}

inline std::error_code read_fp2(blst_fp2& out, BytesSpan in)
{
    if (in.size() != 2 * FP_SIZE)
        return Error::InvalidPointEncoding;
    if (auto err = read_fp(out.fp[0], in.subspan(0, FP_SIZE)); err)
        return err;
    return read_fp(out.fp[1], in.subspan(FP_SIZE, FP_SIZE));
}

inline void write_fp2(std::span<Byte, 2 * FP_SIZE> out, const blst_fp2& in)
{
    write_fp(out.subspan<0, FP_SIZE>(), in.fp[0]);
    write_fp(out.subspan<FP_SIZE, FP_SIZE>(), in.fp[1]);
}

} // namespace Tessera::Crypto::bls::impl
