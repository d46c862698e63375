#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Tessera::Crypto {

enum class Error : std::uint8_t {
    Success = 0,
    // field hashing
    EllTooLarge,
    LengthTooLarge,
    DSTTooLong,
    HashToFpFailed,
    HashToFp2Failed,
    // encodings
    InvalidFieldElement,
    InvalidPointEncoding,
    PointNotOnCurve,
    PointNotInSubgroup,
    // group / pairing
    EmptyPointsToSum,
    SumPointsFailed,
    LengthMismatch,
    MapToCurveFailed,
    // schemes
    InvalidPublicKey,
    InvalidSignature,
    UnrecognizedSigner,
    DuplicateMember,
    DuplicateSigner,
    EmptyMemberSet,
    InvalidMemberIndex,
    OpenSSLError,
};

class CryptoErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "tessera.crypto"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::EllTooLarge:
            return "expand_message_xmd: ell exceeds 255";
        case Error::LengthTooLarge:
            return "expand_message_xmd: requested length exceeds 65535";
        case Error::DSTTooLong:
            return "Domain separation tag longer than 255 bytes";
        case Error::HashToFpFailed:
            return "hash_to_field did not yield two Fp elements";
        case Error::HashToFp2Failed:
            return "hash_to_field2 did not yield two Fp2 elements";
        case Error::InvalidFieldElement:
            return "Field element is not canonical";
        case Error::InvalidPointEncoding:
            return "Malformed point encoding";
        case Error::PointNotOnCurve:
            return "Point is not on the curve";
        case Error::PointNotInSubgroup:
            return "Point is not in the prime-order subgroup";
        case Error::EmptyPointsToSum:
            return "No points to sum";
        case Error::SumPointsFailed:
            return "Point summation rejected an operand";
        case Error::LengthMismatch:
            return "Input lists differ in length";
        case Error::MapToCurveFailed:
            return "Map to curve failed";
        case Error::InvalidPublicKey:
            return "Invalid public key";
        case Error::InvalidSignature:
            return "Invalid signature";
        case Error::UnrecognizedSigner:
            return "Signer is not a registered member";
        case Error::DuplicateMember:
            return "Public key registered twice";
        case Error::DuplicateSigner:
            return "Signer listed twice";
        case Error::EmptyMemberSet:
            return "Member set is empty";
        case Error::InvalidMemberIndex:
            return "Member index out of range";
        case Error::OpenSSLError:
            return "OpenSSL failure";
        default:
            return "Unknown crypto error";
        }
    }
};

inline const std::error_category& crypto_category()
{
    static CryptoErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), crypto_category() };
}

} // namespace Tessera::Crypto

namespace std {
template <>
struct is_error_code_enum<Tessera::Crypto::Error> : true_type { };
} // namespace std
