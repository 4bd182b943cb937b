#pragma once

#include <escrowit/common/error.hpp>
#include <escrowit/common/types.hpp>

#include <datapod/datapod.hpp>
#include <limits>
#include <shared_mutex>
#include <unordered_map>

namespace escrowit::ledger {

    // ===========================================
    // Extension Interface - host ledger implements this
    // ===========================================

    /// Outbound value transfer to an account on the hosting ledger.
    /// Implementations may call back into the ledger before returning.
    class FundsTransport {
      public:
        virtual ~FundsTransport() = default;

        /// Pay `amount` to `to`. An error aborts the enclosing ledger operation.
        virtual dp::Result<void, dp::Error> transfer(const Identity &to, Amount amount) = 0;
    };

    /// In-memory account balances credited by outbound transfers
    class BalanceBook : public FundsTransport {
      public:
        BalanceBook() = default;

        inline dp::Result<void, dp::Error> transfer(const Identity &to, Amount amount) override {
            if (isZeroAddress(to)) {
                return dp::Result<void, dp::Error>::err(transfer_failed("Transfer to zero address"));
            }

            std::unique_lock lock(mutex_);
            auto it = balances_.find(to);
            Amount current = (it != balances_.end()) ? it->second : 0;
            if (current > std::numeric_limits<Amount>::max() - amount) {
                return dp::Result<void, dp::Error>::err(transfer_failed("Recipient balance overflow"));
            }
            if (it != balances_.end()) {
                it->second += amount;
            } else {
                balances_.emplace(to, amount);
            }
            total_paid_out_ += amount;
            return dp::Result<void, dp::Error>::ok();
        }

        inline Amount balanceOf(const Identity &identity) const {
            std::shared_lock lock(mutex_);
            auto it = balances_.find(identity);
            return (it != balances_.end()) ? it->second : 0;
        }

        inline size_t accountCount() const {
            std::shared_lock lock(mutex_);
            return balances_.size();
        }

        inline Amount totalPaidOut() const {
            std::shared_lock lock(mutex_);
            return total_paid_out_;
        }

      private:
        std::unordered_map<Identity, Amount> balances_;
        Amount total_paid_out_ = 0;
        mutable std::shared_mutex mutex_;
    };

} // namespace escrowit::ledger
