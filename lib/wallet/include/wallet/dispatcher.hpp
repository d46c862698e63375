#pragma once

#include "wallet/common.hpp"

#include <functional>
#include <map>
#include <system_error>

namespace Tessera::Wallet {

struct CallRequest {
    Hash operation {};
    Address target {};
    uint64_t value = 0;
    uint64_t gas_limit = 0;
    BytesSpan payload;
};

class CallDispatcher {
public:
    virtual ~CallDispatcher() = default;

    // An error means the target call failed; the ledger records it and moves on.
    [[nodiscard]] virtual std::error_code call(const CallRequest& request) = 0;
};

/**
 * @class TargetRegistry
 * @brief Routes calls to handlers registered per target address.
 *
 * Calls to an unregistered target fail with UnknownTarget. A handler that
 * throws is reported as CallReverted.
 */
class TargetRegistry final : public CallDispatcher {
public:
    using Handler = std::function<std::error_code(const CallRequest&)>;

    [[nodiscard]] std::error_code register_target(const Address& target, Handler handler);
    void unregister_target(const Address& target);

    std::error_code call(const CallRequest& request) override;

private:
    std::map<Address, Handler> handlers_;
};

} // namespace Tessera::Wallet
