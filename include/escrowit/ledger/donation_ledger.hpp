#pragma once

#include <escrowit/common/error.hpp>
#include <escrowit/common/types.hpp>
#include <escrowit/events/event_log.hpp>
#include <escrowit/ledger/access_control.hpp>
#include <escrowit/ledger/donation.hpp>
#include <escrowit/ledger/escrow_vault.hpp>
#include <escrowit/ledger/funds_transport.hpp>
#include <escrowit/reputation/reputation_store.hpp>

#include <datapod/datapod.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace escrowit::ledger {

    /// Donation ledger configuration
    struct LedgerConfig {
        Identity admin; // Holds ADMIN from construction

        // Amount bounds, inclusive
        Amount min_donation_amount = COIN / 10;
        Amount max_donation_amount = 10 * COIN;

        // Equity percentage bounds, inclusive
        dp::u8 min_equity_percentage = 1;
        dp::u8 max_equity_percentage = 10;

        // Timing
        Timestamp funding_period_s = 30 * SECONDS_PER_DAY;
        Timestamp max_extension_period_s = 90 * SECONDS_PER_DAY; // Cumulative, per donation
    };

    /// Per-identity count of created donations
    struct DonorCounter {
        Identity identity;
        dp::u64 count{0};
    };

    /// Complete ledger state, as persisted by storage::LedgerStore
    struct LedgerSnapshot {
        std::vector<Donation> donations; // Ordered by id
        std::vector<EscrowEntry> escrow;
        Amount total_custodied = 0;
        std::vector<ReputationEntry> reputations;
        std::vector<RatingKey> rating_keys;
        std::vector<std::pair<Identity, Role>> roles;
        std::vector<DonorCounter> donor_counters;
        bool paused = false;
    };

    /// Donation lifecycle state machine with escrow custody and reputation.
    ///
    /// Operations are applied one at a time by the host. Every mutating entry
    /// point checks the pause flag, takes the reentrancy lock, validates, then
    /// mutates, moves funds and emits exactly one event. Nested mutating calls
    /// made from inside a transfer fail with ERR_REENTRANT_CALL; queries are
    /// always allowed.
    class DonationLedger {
      public:
        DonationLedger(const LedgerConfig &config, Clock &clock, FundsTransport &transport, EventSink &events);

        DonationLedger(const DonationLedger &) = delete;
        DonationLedger &operator=(const DonationLedger &) = delete;

        // ===========================================
        // Donation lifecycle
        // ===========================================

        /// Open a donation offer. Returns the new donation id.
        dp::Result<dp::u64, dp::Error> createDonation(const Identity &donor, Amount amount, dp::u8 equity_percentage,
                                                      const std::string &nonprofit_name,
                                                      const std::string &description, dp::u64 valuation);

        /// Claim an active offer by attaching exactly its amount
        dp::Result<void, dp::Error> fundDonation(dp::u64 donation_id, const Identity &funder, Amount supplied_value);

        /// Release escrow to the nonprofit. Donor only.
        dp::Result<void, dp::Error> distributeDonation(dp::u64 donation_id, const Identity &caller);

        /// Withdraw an active offer. Donor only. Allowed after the deadline.
        dp::Result<void, dp::Error> cancelDonation(dp::u64 donation_id, const Identity &caller);

        /// Push the funding deadline back by whole days. Donor only.
        dp::Result<void, dp::Error> extendFundingPeriod(dp::u64 donation_id, const Identity &caller,
                                                        dp::u64 extension_days);

        // ===========================================
        // Reputation
        // ===========================================

        dp::Result<RatingOutcome, dp::Error> updateReputation(const Identity &rater, const Identity &subject,
                                                              dp::u8 rating, const std::string &review);

        // ===========================================
        // Administration (ADMIN only)
        // ===========================================

        dp::Result<void, dp::Error> pause(const Identity &caller);

        dp::Result<void, dp::Error> unpause(const Identity &caller);

        /// Sweep all custodied funds to the calling admin. Works while paused.
        dp::Result<Amount, dp::Error> emergencyWithdraw(const Identity &caller);

        dp::Result<void, dp::Error> grantRole(const Identity &caller, const Identity &identity, Role role);

        dp::Result<void, dp::Error> revokeRole(const Identity &caller, const Identity &identity, Role role);

        // ===========================================
        // Queries
        // ===========================================

        dp::Result<Donation, dp::Error> getDonation(dp::u64 donation_id) const;

        ReputationProfile getReputation(const Identity &identity) const;

        dp::u64 getDonationCount() const;

        std::vector<dp::u64> getDonationsByDonor(const Identity &donor) const;

        std::vector<dp::u64> getDonationsByNonprofit(const Identity &nonprofit) const;

        /// Donations created by `identity`; the rating deduplication epoch
        dp::u64 getUserDonationCount(const Identity &identity) const;

        Amount escrowBalance(dp::u64 donation_id) const;

        Amount totalEscrowed() const;

        bool isPaused() const;

        bool hasRole(const Identity &identity, Role role) const;

        const LedgerConfig &getConfig() const;

        const AccessControlRegistry &getAccessControl() const;

        // ===========================================
        // Snapshots
        // ===========================================

        LedgerSnapshot snapshot() const;

        /// Replace all state with `snapshot`
        dp::Result<void, dp::Error> restore(const LedgerSnapshot &snapshot);

        void printSummary() const;

      private:
        /// Holds the reentrancy lock for the lifetime of one mutating call
        class CallGuard {
          public:
            explicit CallGuard(bool &flag) : flag_(flag) { flag_ = true; }
            ~CallGuard() { flag_ = false; }

            CallGuard(const CallGuard &) = delete;
            CallGuard &operator=(const CallGuard &) = delete;

          private:
            bool &flag_;
        };

        dp::Result<void, dp::Error> checkEntry(bool allow_paused) const;

        Donation *findDonation(dp::u64 donation_id);
        const Donation *findDonation(dp::u64 donation_id) const;

        void emitDonationEvent(EventKind kind, const Identity &actor, const Identity &subject,
                               const Donation &donation, Amount amount);

        void emitEvent(LedgerEvent event);

        LedgerConfig config_;
        Clock &clock_;
        FundsTransport &transport_;
        EventSink &events_;

        AccessControlRegistry access_;
        EscrowVault vault_;
        ReputationStore reputation_;

        std::vector<Donation> donations_; // Index == id
        std::unordered_map<Identity, dp::u64> donor_counters_;

        bool paused_ = false;
        bool in_call_ = false;
    };

} // namespace escrowit::ledger
