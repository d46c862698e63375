#pragma once

#include <cstddef>
#include <expected>
#include <string_view>
#include <system_error>

extern "C" {
#include <blst.h>
}
#include "crypto/types.hpp"

namespace Tessera::Crypto::bls {

struct Scalar {
    blst_scalar val {};

    friend class P1;
    friend class P2;

    // Keeps all 256 bits; scalar multiplication uses the raw value.
    static Scalar from_bendian(const ScalarBytes& bytes);

    static std::expected<Scalar, std::error_code> random(std::string_view dst = "TESSERA_KEYGEN_SALT");

    // ===== serialization =====

    [[nodiscard]] ScalarBytes to_be_bytes() const;

    [[nodiscard]] bool is_zero() const;

    static constexpr size_t BIT_LENGTH = 256;
};

} // namespace Tessera::Crypto::bls
