#include "wallet/access.hpp"

namespace Tessera::Wallet {

void RoleRegistry::grant(Role role, const Address& account)
{
    members_[role].insert(account);
}

void RoleRegistry::revoke(Role role, const Address& account)
{
    auto it = members_.find(role);
    if (it != members_.end())
        it->second.erase(account);
}

bool RoleRegistry::has_role(Role role, const Address& account) const
{
    auto it = members_.find(role);
    return it != members_.end() && it->second.contains(account);
}

} // namespace Tessera::Wallet
