#include "crypto/field.hpp"
#include "crypto/error.hpp"
#include "impl/openssl.hpp"

#include <algorithm>
#include <cstring>
#include <openssl/bn.h>

namespace Tessera::Crypto::Field {
using Crypto::impl::BnCtxPtr;
using Crypto::impl::BnPtr;

namespace {

    constexpr std::array<Byte, FP_VALUE_SIZE> P_BYTES {
        0x1a, 0x01, 0x11, 0xea, 0x39, 0x7f, 0xe6, 0x9a, 0x4b, 0x1b, 0xa7, 0xb6,
        0x43, 0x4b, 0xac, 0xd7, 0x64, 0x77, 0x4b, 0x84, 0xf3, 0x85, 0x12, 0xbf,
        0x67, 0x30, 0xd2, 0xa0, 0xf6, 0xb0, 0xf6, 0x24, 0x1e, 0xab, 0xff, 0xfe,
        0xb1, 0x53, 0xff, 0xff, 0xb9, 0xfe, 0xff, 0xff, 0xff, 0xff, 0xaa, 0xab
    };

    constexpr size_t PAD = FP_SIZE - FP_VALUE_SIZE;

    FieldElement make_modulus()
    {
        FieldElement p {};
        std::copy(P_BYTES.begin(), P_BYTES.end(), p.begin() + PAD);
        return p;
    }

    BnPtr to_bn(BytesSpan be)
    {
        return BnPtr(BN_bin2bn(be.data(), static_cast<int>(be.size()), nullptr));
    }

    auto from_bn(const BIGNUM* bn) -> std::expected<FieldElement, std::error_code>
    {
        FieldElement out {};
        if (BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) != static_cast<int>(out.size()))
            return std::unexpected(Error::OpenSSLError);
        return out;
    }

} // namespace

const FieldElement& modulus()
{
    static const FieldElement p = make_modulus();
    return p;
}

bool is_canonical(const FieldElement& fe)
{
    if (!std::all_of(fe.begin(), fe.begin() + PAD, [](Byte b) { return b == 0; }))
        return false;
    // Big-endian byte order makes lexicographic comparison numeric.
    return std::lexicographical_compare(fe.begin() + PAD, fe.end(), P_BYTES.begin(), P_BYTES.end());
}

auto reduce(BytesSpan big_endian) -> std::expected<FieldElement, std::error_code>
{
    BnCtxPtr ctx(BN_CTX_new());
    BnPtr value = to_bn(big_endian);
    BnPtr p = to_bn(P_BYTES);
    BnPtr rem(BN_new());
    if (!ctx || !value || !p || !rem)
        return std::unexpected(Error::OpenSSLError);

    if (1 != BN_nnmod(rem.get(), value.get(), p.get(), ctx.get()))
        return std::unexpected(Error::OpenSSLError);

    return from_bn(rem.get());
}

auto negate(const FieldElement& fe) -> std::expected<FieldElement, std::error_code>
{
    if (!is_canonical(fe))
        return std::unexpected(Error::InvalidFieldElement);
    if (std::all_of(fe.begin(), fe.end(), [](Byte b) { return b == 0; }))
        return fe;

    BnPtr value = to_bn(fe);
    BnPtr p = to_bn(P_BYTES);
    BnPtr diff(BN_new());
    if (!value || !p || !diff)
        return std::unexpected(Error::OpenSSLError);

    if (1 != BN_sub(diff.get(), p.get(), value.get()))
        return std::unexpected(Error::OpenSSLError);

    return from_bn(diff.get());
}

} // namespace Tessera::Crypto::Field
