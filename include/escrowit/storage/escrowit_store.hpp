#pragma once

#include <escrowit/events/event_log.hpp>
#include <escrowit/ledger/donation_ledger.hpp>
#include <escrowit/storage/ledger_store_impl.hpp>

#include <datapod/datapod.hpp>
#include <memory>
#include <string>

namespace escrowit {

    // ===========================================
    // EscrowitStore - Donation ledger + persistence
    // ===========================================

    /// Ledger, event journal and SQLite store managed together.
    /// This is the recommended way to run a ledger that survives restarts.
    class EscrowitStore {
      public:
        EscrowitStore(const ledger::LedgerConfig &config, Clock &clock, ledger::FundsTransport &transport)
            : events_(std::make_unique<EventLog>()),
              ledger_(std::make_unique<ledger::DonationLedger>(config, clock, transport, *events_)) {}

        EscrowitStore(const EscrowitStore &) = delete;
        EscrowitStore &operator=(const EscrowitStore &) = delete;

        /// Open storage and load any previously committed state
        /// @param db_path Database file path
        /// @param opts Storage options
        dp::Result<void, dp::Error> initialize(const std::string &db_path,
                                               const storage::OpenOptions &opts = storage::OpenOptions{});

        /// Persist the current ledger state and any new events
        dp::Result<void, dp::Error> commit();

        /// Event chain verifies and escrow bookkeeping adds up
        dp::Result<bool, dp::Error> verifyConsistency() const;

        ledger::DonationLedger &ledger() { return *ledger_; }
        const ledger::DonationLedger &ledger() const { return *ledger_; }

        EventLog &events() { return *events_; }
        const EventLog &events() const { return *events_; }

        storage::LedgerStore &store() { return store_; }

        bool isInitialized() const { return initialized_; }

      private:
        std::unique_ptr<EventLog> events_;
        std::unique_ptr<ledger::DonationLedger> ledger_;
        storage::LedgerStore store_;
        bool initialized_ = false;
    };

    // ===========================================
    // Implementation
    // ===========================================

    inline dp::Result<void, dp::Error> EscrowitStore::initialize(const std::string &db_path,
                                                                 const storage::OpenOptions &opts) {
        auto open_result = store_.open(db_path, opts);
        if (!open_result.is_ok()) {
            return open_result;
        }

        auto schema_result = store_.initializeSchema();
        if (!schema_result.is_ok()) {
            return schema_result;
        }

        auto snapshot = store_.loadSnapshot();
        if (!snapshot.is_ok()) {
            return dp::Result<void, dp::Error>::err(snapshot.error());
        }

        auto events = store_.loadEvents();
        if (!events.is_ok()) {
            return dp::Result<void, dp::Error>::err(events.error());
        }

        // A fresh database keeps the constructor's state (initial ADMIN)
        if (store_.getDonationCount() > 0 || !snapshot.value().roles.empty()) {
            auto restored = ledger_->restore(snapshot.value());
            if (!restored.is_ok()) {
                return restored;
            }
        }

        events_->restore(events.value());
        auto chain = events_->verifyChain();
        if (!chain.is_ok()) {
            return dp::Result<void, dp::Error>::err(
                storage_failed(dp::String(("Stored event chain invalid: " + std::string(chain.error().message.c_str()))
                                              .c_str())));
        }

        initialized_ = true;
        return dp::Result<void, dp::Error>::ok();
    }

    inline dp::Result<void, dp::Error> EscrowitStore::commit() {
        if (!initialized_)
            return dp::Result<void, dp::Error>::err(store_not_open("Store not initialized"));

        auto saved = store_.saveSnapshot(ledger_->snapshot());
        if (!saved.is_ok()) {
            return saved;
        }

        auto synced = store_.syncEvents(events_->events());
        if (!synced.is_ok()) {
            return dp::Result<void, dp::Error>::err(synced.error());
        }

        return dp::Result<void, dp::Error>::ok();
    }

    inline dp::Result<bool, dp::Error> EscrowitStore::verifyConsistency() const {
        auto chain = events_->verifyChain();
        if (!chain.is_ok()) {
            return dp::Result<bool, dp::Error>::err(chain.error());
        }

        // Swept entries stay on the books but no longer count toward custody
        auto snap = ledger_->snapshot();
        Amount sum = 0;
        for (const auto &entry : snap.escrow) {
            if (!entry.isSwept()) {
                sum += entry.balance;
            }
        }
        return dp::Result<bool, dp::Error>::ok(sum == snap.total_custodied);
    }

} // namespace escrowit
