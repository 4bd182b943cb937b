#pragma once

#include <escrowit/common/error.hpp>
#include <escrowit/common/types.hpp>
#include <escrowit/ledger/funds_transport.hpp>

#include <datapod/datapod.hpp>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace escrowit::ledger {

    /// Custodied balance of one donation
    struct EscrowEntry {
        dp::u64 donation_id{0};
        dp::u64 balance{0};
        dp::u8 swept{0}; // 1 once an emergency sweep took the funds behind this entry

        EscrowEntry() = default;
        EscrowEntry(dp::u64 id, Amount amount, bool was_swept = false)
            : donation_id(id), balance(amount), swept(was_swept ? 1 : 0) {}

        inline bool isSwept() const { return swept != 0; }

        auto members() { return std::tie(donation_id, balance, swept); }
        auto members() const { return std::tie(donation_id, balance, swept); }
    };

    /// Donation id -> custodied balance.
    ///
    /// Release and refund commit the zeroed balance before the outbound
    /// transfer and restore it if the transfer fails. No lock is held while
    /// the transport runs, so a callback may query the vault and will see the
    /// balance already zero.
    class EscrowVault {
      public:
        EscrowVault() = default;

        EscrowVault(const EscrowVault &) = delete;
        EscrowVault &operator=(const EscrowVault &) = delete;

        /// Place `amount` in custody for `donation_id`
        dp::Result<void, dp::Error> deposit(dp::u64 donation_id, Amount amount);

        /// Pay the full balance of `donation_id` to `recipient`
        dp::Result<Amount, dp::Error> release(dp::u64 donation_id, const Identity &recipient,
                                              FundsTransport &transport);

        /// Return the full balance of `donation_id` to `recipient`
        dp::Result<Amount, dp::Error> refund(dp::u64 donation_id, const Identity &recipient,
                                             FundsTransport &transport);

        /// Drain the whole custody total to `recipient` in one transfer.
        /// Per-donation entries are kept but marked swept; a swept entry can
        /// never be paid out again, whatever the custody total later becomes.
        dp::Result<Amount, dp::Error> sweep(const Identity &recipient, FundsTransport &transport);

        Amount balanceOf(dp::u64 donation_id) const;

        bool isSwept(dp::u64 donation_id) const;

        /// Funds actually held
        Amount totalCustodied() const;

        /// Sum of per-donation entries, swept ones included
        Amount sumOfBalances() const;

        /// Sum of entries not yet swept; always equals totalCustodied()
        Amount sumOfLiveBalances() const;

        std::vector<EscrowEntry> entries() const;

        void restore(const std::vector<EscrowEntry> &entries, Amount total_custodied);

        void clear();

      private:
        dp::Result<Amount, dp::Error> payout(dp::u64 donation_id, const Identity &recipient,
                                             FundsTransport &transport);

        std::unordered_map<dp::u64, Amount> balances_;
        std::unordered_set<dp::u64> swept_;
        Amount total_ = 0;
        mutable std::shared_mutex mutex_;
    };

} // namespace escrowit::ledger
