#include <algorithm>
#include <array>
#include <cstring>
#include <openssl/rand.h>

extern "C" {
#include <blst.h>
}
#include "crypto/blst/Scalar.hpp"
#include "crypto/common.hpp"
#include "crypto/error.hpp"

namespace Tessera::Crypto::bls {
static_assert(sizeof(blst_scalar) == SCALAR_SIZE, "Scalar size mismatch with blst_scalar");

using Crypto::u8ptr;

Scalar Scalar::from_bendian(const ScalarBytes& bytes)
{
    Scalar s;
    blst_scalar_from_bendian(&s.val, bytes.data());
    return s;
}

std::expected<Scalar, std::error_code> Scalar::random(std::string_view dst)
{
    uint8_t ikm[32];
    if (RAND_bytes(ikm, sizeof(ikm)) != 1) {
        return std::unexpected(Error::OpenSSLError);
    }

    // 48 uniform bytes reduced mod r keep the modular bias negligible.
    uint8_t out[48];
    blst_expand_message_xmd(out, sizeof(out),
        ikm, sizeof(ikm),
        u8ptr(dst.data()), dst.size());

    Scalar s;
    blst_scalar_from_be_bytes(&s.val, out, sizeof(out));
    return s;
}

ScalarBytes Scalar::to_be_bytes() const
{
    ScalarBytes out {};
    blst_bendian_from_scalar(out.data(), &val);
    return out;
}

bool Scalar::is_zero() const
{
    return std::all_of(std::begin(val.b), std::end(val.b), [](uint8_t b) { return b == 0; });
}

} // namespace Tessera::Crypto::bls
