#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Tessera::Wallet {

enum class Error : std::uint8_t {
    Success = 0,
    // submit validation
    ZeroTarget,
    InvalidTimeWindow,
    OperationExpired,
    GasLimitTooLow,
    NonceMismatch,
    ZeroHashCheckCode,
    HashCheckCodeMismatch,
    PayloadTooLarge,
    OperationExists,
    // state machine
    ExecuteUnapprovedOperation,
    ExecuteUneffectiveOperation,
    ExecuteExpiredOperation,
    LengthMismatch,
    ReentrantCall,
    // authorization
    MissingRole,
    // configuration
    InvalidConfig,
    InvalidThreshold,
    EmptyMemberSet,
    // target calls
    UnknownTarget,
    EmptyHandler,
    CallReverted,
};

class WalletErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "tessera.wallet"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::ZeroTarget:
            return "Operation target is the zero address";
        case Error::InvalidTimeWindow:
            return "Expiration time must be after effective time";
        case Error::OperationExpired:
            return "Operation already expired";
        case Error::GasLimitTooLow:
            return "Gas limit below the configured minimum";
        case Error::NonceMismatch:
            return "Nonce does not match the ledger nonce";
        case Error::ZeroHashCheckCode:
            return "Hash check code is zero";
        case Error::HashCheckCodeMismatch:
            return "Hash check code does not match the operation hash";
        case Error::PayloadTooLarge:
            return "Payload exceeds the configured maximum";
        case Error::OperationExists:
            return "Operation already recorded";
        case Error::ExecuteUnapprovedOperation:
            return "Operation is not approved";
        case Error::ExecuteUneffectiveOperation:
            return "Operation is not yet effective";
        case Error::ExecuteExpiredOperation:
            return "Operation expired before execution";
        case Error::LengthMismatch:
            return "Argument lists differ in length";
        case Error::ReentrantCall:
            return "Reentrant call into the ledger";
        case Error::MissingRole:
            return "Caller lacks the required role";
        case Error::InvalidConfig:
            return "Invalid ledger configuration";
        case Error::InvalidThreshold:
            return "Threshold out of range";
        case Error::EmptyMemberSet:
            return "No members configured";
        case Error::UnknownTarget:
            return "No handler registered for target";
        case Error::EmptyHandler:
            return "Target handler is empty";
        case Error::CallReverted:
            return "Target call reverted";
        default:
            return "Unknown wallet error";
        }
    }
};

inline const std::error_category& wallet_category()
{
    static WalletErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), wallet_category() };
}

} // namespace Tessera::Wallet

namespace std {
template <>
struct is_error_code_enum<Tessera::Wallet::Error> : true_type { };
} // namespace std
