#include <algorithm>
#include <escrowit/ledger/access_control.hpp>
#include <iostream>
#include <mutex>

namespace escrowit::ledger {

    AccessControlRegistry::AccessControlRegistry(const Identity &admin) {
        if (!isZeroAddress(admin)) {
            roles_[admin].push_back(Role::Admin);
        }
    }

    dp::Result<void, dp::Error> AccessControlRegistry::grant(const Identity &identity, Role role) {
        if (isZeroAddress(identity)) {
            return dp::Result<void, dp::Error>::err(invalid_address("Cannot grant role to zero address"));
        }

        std::unique_lock lock(mutex_);
        auto &roles = roles_[identity];
        if (std::find(roles.begin(), roles.end(), role) == roles.end()) {
            roles.push_back(role);
            std::cout << "Role " << roleToString(role) << " granted to " << identity << std::endl;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> AccessControlRegistry::revoke(const Identity &identity, Role role) {
        if (isZeroAddress(identity)) {
            return dp::Result<void, dp::Error>::err(invalid_address("Cannot revoke role from zero address"));
        }

        std::unique_lock lock(mutex_);
        auto it = roles_.find(identity);
        if (it == roles_.end())
            return dp::Result<void, dp::Error>::ok();

        auto &roles = it->second;
        auto before = roles.size();
        roles.erase(std::remove(roles.begin(), roles.end(), role), roles.end());
        if (roles.size() != before) {
            std::cout << "Role " << roleToString(role) << " revoked from " << identity << std::endl;
        }
        if (roles.empty()) {
            roles_.erase(it);
        }
        return dp::Result<void, dp::Error>::ok();
    }

    bool AccessControlRegistry::hasRole(const Identity &identity, Role role) const {
        std::shared_lock lock(mutex_);
        auto it = roles_.find(identity);
        if (it == roles_.end())
            return false;

        const auto &roles = it->second;
        return std::find(roles.begin(), roles.end(), role) != roles.end();
    }

    dp::Result<void, dp::Error> AccessControlRegistry::requireRole(const Identity &identity, Role role) const {
        if (!hasRole(identity, role)) {
            return dp::Result<void, dp::Error>::err(
                unauthorized_access(dp::String(("Missing role " + roleToString(role)).c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    std::vector<Role> AccessControlRegistry::rolesOf(const Identity &identity) const {
        std::shared_lock lock(mutex_);
        auto it = roles_.find(identity);
        return (it != roles_.end()) ? it->second : std::vector<Role>{};
    }

    std::vector<Identity> AccessControlRegistry::members(Role role) const {
        std::shared_lock lock(mutex_);
        std::vector<Identity> result;
        for (const auto &[identity, roles] : roles_) {
            if (std::find(roles.begin(), roles.end(), role) != roles.end()) {
                result.push_back(identity);
            }
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    size_t AccessControlRegistry::memberCount(Role role) const { return members(role).size(); }

    std::vector<std::pair<Identity, Role>> AccessControlRegistry::assignments() const {
        std::shared_lock lock(mutex_);
        std::vector<std::pair<Identity, Role>> result;
        for (const auto &[identity, roles] : roles_) {
            for (auto role : roles) {
                result.emplace_back(identity, role);
            }
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    void AccessControlRegistry::clear() {
        std::unique_lock lock(mutex_);
        roles_.clear();
    }

    void AccessControlRegistry::printSummary() const {
        std::shared_lock lock(mutex_);
        std::cout << "=== Access Control Summary ===" << std::endl;
        std::cout << "Identities (" << roles_.size() << "):" << std::endl;
        for (const auto &[identity, roles] : roles_) {
            std::cout << "  " << identity << ": ";
            for (auto role : roles) {
                std::cout << roleToString(role) << " ";
            }
            std::cout << std::endl;
        }
    }

} // namespace escrowit::ledger
