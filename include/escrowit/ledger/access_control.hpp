#pragma once

#include <escrowit/common/error.hpp>
#include <escrowit/common/types.hpp>

#include <datapod/datapod.hpp>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace escrowit::ledger {

    /// Identity -> role-set store.
    /// Grants and revokes here are unconditional; the ADMIN gate for explicit
    /// calls lives in DonationLedger::grantRole / revokeRole.
    class AccessControlRegistry {
      public:
        AccessControlRegistry() = default;

        /// Registry with the initial ADMIN assigned
        explicit AccessControlRegistry(const Identity &admin);

        AccessControlRegistry(const AccessControlRegistry &) = delete;
        AccessControlRegistry &operator=(const AccessControlRegistry &) = delete;

        dp::Result<void, dp::Error> grant(const Identity &identity, Role role);

        dp::Result<void, dp::Error> revoke(const Identity &identity, Role role);

        bool hasRole(const Identity &identity, Role role) const;

        /// Capability check consulted at the top of gated operations
        dp::Result<void, dp::Error> requireRole(const Identity &identity, Role role) const;

        std::vector<Role> rolesOf(const Identity &identity) const;

        std::vector<Identity> members(Role role) const;

        size_t memberCount(Role role) const;

        /// Flat (identity, role) list, used for snapshots
        std::vector<std::pair<Identity, Role>> assignments() const;

        void clear();

        void printSummary() const;

      private:
        std::unordered_map<std::string, std::vector<Role>> roles_;
        mutable std::shared_mutex mutex_;
    };

} // namespace escrowit::ledger
