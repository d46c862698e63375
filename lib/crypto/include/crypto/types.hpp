#pragma once

#include "crypto/common.hpp"

#include <array>
#include <concepts>
#include <string>
#include <string_view>
#include <utility>

namespace Tessera::Crypto {

constexpr size_t FP_SIZE = 64;
constexpr size_t FP_VALUE_SIZE = 48; // significant bytes of a canonical Fp encoding
constexpr size_t G1_SIZE = 2 * FP_SIZE;
constexpr size_t G2_SIZE = 4 * FP_SIZE;
constexpr size_t SCALAR_SIZE = 32;

using FieldElement = std::array<Byte, FP_SIZE>;

struct Fp2Element {
    FieldElement c0 {};
    FieldElement c1 {};

    bool operator==(const Fp2Element&) const = default;
};

// EIP-2537 layout: every coordinate is a 64-byte big-endian Fp, identity is all zero.
using G1Point = std::array<Byte, G1_SIZE>;
using G2Point = std::array<Byte, G2_SIZE>;

// Big-endian, not necessarily reduced mod r.
using ScalarBytes = std::array<Byte, SCALAR_SIZE>;

template <typename T>
concept CurvePoint = std::same_as<T, G1Point> || std::same_as<T, G2Point>;

enum class KeyPlacement : uint8_t {
    PublicKeyOnG1 = 1,
    PublicKeyOnG2 = 2,
};

/**
 * @brief Public keys on G1, signatures and message hashes on G2.
 */
struct PublicKeyOnG1 {
    using PublicKey = G1Point;
    using Signature = G2Point;
    static constexpr KeyPlacement placement = KeyPlacement::PublicKeyOnG1;
    static constexpr std::string_view default_dst = "BLS_SIG_BLS12381G2_XMD:SHA-256_SSWU_RO_NUL_";
};

/**
 * @brief Public keys on G2, signatures and message hashes on G1.
 */
struct PublicKeyOnG2 {
    using PublicKey = G2Point;
    using Signature = G1Point;
    static constexpr KeyPlacement placement = KeyPlacement::PublicKeyOnG2;
    static constexpr std::string_view default_dst = "BLS_SIG_BLS12381G1_XMD:SHA-256_SSWU_RO_NUL_";
};

template <typename T>
concept Placement = std::same_as<T, PublicKeyOnG1> || std::same_as<T, PublicKeyOnG2>;

/**
 * @brief Domain separation tags shared by every hash in one deployment.
 */
struct Domain {
    std::string signature_dst;
    std::string weight_dst;
};

inline Domain default_domain(KeyPlacement placement)
{
    std::string sig { placement == KeyPlacement::PublicKeyOnG1 ? PublicKeyOnG1::default_dst
                                                               : PublicKeyOnG2::default_dst };
    return Domain {
        .signature_dst = std::move(sig),
        .weight_dst = "TESSERA_THRESHOLD_WEIGHT_XMD:SHA-256_",
    };
}

template <CurvePoint P>
constexpr bool is_identity(const P& p)
{
    return std::ranges::all_of(p, [](Byte b) { return b == 0; });
}

} // namespace Tessera::Crypto
