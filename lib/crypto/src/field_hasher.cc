#include "crypto/field_hasher.hpp"
#include "crypto/error.hpp"
#include "crypto/field.hpp"
#include "impl/openssl.hpp"

#include <array>
#include <initializer_list>
#include <openssl/evp.h>

namespace Tessera::Crypto::FieldHasher {
using Crypto::impl::EvpMdCtxPtr;

namespace {

    using Block = std::array<Byte, HASH_OUTPUT_SIZE>;

    auto digest(std::initializer_list<BytesSpan> parts) -> std::expected<Block, std::error_code>
    {
        Block out {};
        unsigned int len = 0;

        EvpMdCtxPtr ctx(EVP_MD_CTX_new());
        if (!ctx || 1 != EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr))
            return std::unexpected(Error::OpenSSLError);

        for (auto part : parts) {
            if (part.empty())
                continue;
            if (1 != EVP_DigestUpdate(ctx.get(), part.data(), part.size()))
                return std::unexpected(Error::OpenSSLError);
        }

        if (1 != EVP_DigestFinal_ex(ctx.get(), out.data(), &len))
            return std::unexpected(Error::OpenSSLError);
        return out;
    }

} // namespace

auto expand_message_xmd(BytesSpan message, BytesSpan dst, size_t len_in_bytes)
    -> std::expected<Bytes, std::error_code>
{
    if (len_in_bytes > MAX_OUTPUT_SIZE)
        return std::unexpected(Error::LengthTooLarge);

    const size_t ell = (len_in_bytes + HASH_OUTPUT_SIZE - 1) / HASH_OUTPUT_SIZE;
    if (ell > MAX_ELL)
        return std::unexpected(Error::EllTooLarge);
    if (dst.size() > MAX_DST_SIZE)
        return std::unexpected(Error::DSTTooLong);

    Bytes dst_prime(dst.begin(), dst.end());
    dst_prime.push_back(static_cast<Byte>(dst.size()));

    static constexpr std::array<Byte, HASH_BLOCK_SIZE> Z_PAD {};
    const std::array<Byte, 2> l_i_b_str {
        static_cast<Byte>(len_in_bytes >> 8),
        static_cast<Byte>(len_in_bytes & 0xff),
    };
    static constexpr std::array<Byte, 1> ZERO { 0x00 };

    auto b0 = digest({ Z_PAD, message, l_i_b_str, ZERO, dst_prime });
    if (!b0)
        return std::unexpected(b0.error());

    Bytes uniform;
    uniform.reserve(ell * HASH_OUTPUT_SIZE);

    Block prev {};
    for (size_t i = 1; i <= ell; ++i) {
        Block mixed = *b0;
        if (i > 1) {
            for (size_t k = 0; k < mixed.size(); ++k)
                mixed[k] ^= prev[k];
        }
        const std::array<Byte, 1> counter { static_cast<Byte>(i) };
        auto bi = digest({ mixed, counter, dst_prime });
        if (!bi)
            return std::unexpected(bi.error());
        prev = *bi;
        uniform.insert(uniform.end(), prev.begin(), prev.end());
    }

    uniform.resize(len_in_bytes);
    return uniform;
}

auto hash_to_field(BytesSpan message, BytesSpan dst, size_t count)
    -> std::expected<std::vector<FieldElement>, std::error_code>
{
    auto uniform = expand_message_xmd(message, dst, count * FP_SIZE);
    if (!uniform)
        return std::unexpected(uniform.error());

    std::vector<FieldElement> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto fe = Field::reduce(BytesSpan(*uniform).subspan(i * FP_SIZE, FP_SIZE));
        if (!fe)
            return std::unexpected(fe.error());
        out.push_back(*fe);
    }
    return out;
}

auto hash_to_field2(BytesSpan message, BytesSpan dst, size_t count)
    -> std::expected<std::vector<Fp2Element>, std::error_code>
{
    auto uniform = expand_message_xmd(message, dst, count * 2 * FP_SIZE);
    if (!uniform)
        return std::unexpected(uniform.error());

    BytesSpan bytes(*uniform);
    std::vector<Fp2Element> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto c0 = Field::reduce(bytes.subspan((2 * i) * FP_SIZE, FP_SIZE));
        auto c1 = Field::reduce(bytes.subspan((2 * i + 1) * FP_SIZE, FP_SIZE));
        if (!c0)
            return std::unexpected(c0.error());
        if (!c1)
            return std::unexpected(c1.error());
        out.push_back(Fp2Element { .c0 = *c0, .c1 = *c1 });
    }
    return out;
}

} // namespace Tessera::Crypto::FieldHasher
