#include "wallet/dispatcher.hpp"
#include "wallet/error.hpp"
#include "wallet/logging.hpp"

#include <exception>

namespace Tessera::Wallet {

std::error_code TargetRegistry::register_target(const Address& target, Handler handler)
{
    if (!handler)
        return Error::EmptyHandler;
    handlers_[target] = std::move(handler);
    return {};
}

void TargetRegistry::unregister_target(const Address& target)
{
    handlers_.erase(target);
}

std::error_code TargetRegistry::call(const CallRequest& request)
{
    auto it = handlers_.find(request.target);
    if (it == handlers_.end())
        return Error::UnknownTarget;
    // The handler may re-register targets while it runs.
    Handler handler = it->second;
    try {
        return handler(request);
    } catch (const std::exception& e) {
        TESSERA_LOG_WARN("dispatch", "handler threw: " << e.what());
        return Error::CallReverted;
    }
}

} // namespace Tessera::Wallet
