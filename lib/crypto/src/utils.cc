#include "crypto/common.hpp"
#include "impl/openssl.hpp"

#include <openssl/evp.h>
#include <stdexcept>

namespace Tessera::Crypto::Utils {
using Crypto::impl::EvpMdCtxPtr;

Hash256 sha256(BytesSpan data)
{
    Hash256 hash {};
    unsigned int len = 0;

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx
        || 1 != EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)
        || 1 != EVP_DigestUpdate(ctx.get(), u8ptr(data), data.size())
        || 1 != EVP_DigestFinal_ex(ctx.get(), u8ptr(hash.data()), &len)) {
        // Only allocation failure gets here; there is no usable digest to return.
        throw std::runtime_error("EVP SHA-256 failed");
    }
    return hash;
}

std::string to_hex(BytesSpan data)
{
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (Byte b : data) {
        out.push_back(DIGITS[b >> 4]);
        out.push_back(DIGITS[b & 0x0f]);
    }
    return out;
}

} // namespace Tessera::Crypto::Utils
