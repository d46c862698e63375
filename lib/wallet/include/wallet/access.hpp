#pragma once

#include "wallet/common.hpp"

#include <map>
#include <set>

namespace Tessera::Wallet {

enum class Role : uint8_t {
    Proposer = 1,
    Verifier = 2,
    Executor = 3,
};

class AccessControl {
public:
    virtual ~AccessControl() = default;

    [[nodiscard]] virtual bool has_role(Role role, const Address& account) const = 0;
};

/**
 * @class RoleRegistry
 * @brief In-memory AccessControl.
 */
class RoleRegistry final : public AccessControl {
public:
    void grant(Role role, const Address& account);
    void revoke(Role role, const Address& account);

    bool has_role(Role role, const Address& account) const override;

private:
    std::map<Role, std::set<Address>> members_;
};

} // namespace Tessera::Wallet
