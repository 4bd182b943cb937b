#pragma once

#include <escrowit/common/error.hpp>
#include <escrowit/common/types.hpp>
#include <escrowit/events/event_log.hpp>
#include <escrowit/ledger/donation_ledger.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace escrowit::storage {

    /// SQLite database configuration
    struct OpenOptions {
        bool enable_wal = true;
        bool enable_foreign_keys = true;
        int32_t busy_timeout_ms = 5000;
        int32_t cache_size_kb = 20000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;

        OpenOptions() = default;
    };

    // ===========================================
    // LedgerStore - persisted donation ledger state
    // ===========================================

    /// Stores DonationLedger snapshots and the event journal.
    ///
    /// Donation rows are append-only: a snapshot holding fewer donations than
    /// the store already has is rejected. All other state tables are replaced
    /// wholesale inside one transaction.
    class LedgerStore {
      public:
        LedgerStore();
        ~LedgerStore();

        // Non-copyable, movable
        LedgerStore(const LedgerStore &) = delete;
        LedgerStore &operator=(const LedgerStore &) = delete;
        LedgerStore(LedgerStore &&) noexcept;
        LedgerStore &operator=(LedgerStore &&) noexcept;

        /// Open or create database at given path (":memory:" for a private in-memory db)
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        void close();

        bool isOpen() const;

        /// Create tables and run migrations
        dp::Result<void, dp::Error> initializeSchema();

        int32_t schemaVersion();

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        class TxGuard {
          public:
            explicit TxGuard(LedgerStore &store);
            ~TxGuard();

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            bool isActive() const { return active_; }

            bool commit();
            void rollback();

          private:
            LedgerStore &store_;
            bool active_;
            bool committed_;
        };

        std::unique_ptr<TxGuard> beginTransaction();

        // ===========================================
        // Ledger state
        // ===========================================

        /// Persist a full ledger snapshot atomically
        dp::Result<void, dp::Error> saveSnapshot(const ledger::LedgerSnapshot &snapshot);

        /// Read back the last saved snapshot (empty ledger if nothing saved)
        dp::Result<ledger::LedgerSnapshot, dp::Error> loadSnapshot();

        // ===========================================
        // Event journal
        // ===========================================

        /// Append one event; sequences must arrive in order
        dp::Result<void, dp::Error> appendEvent(const LedgerEvent &event);

        /// Append every event past the stored tail
        dp::Result<size_t, dp::Error> syncEvents(const std::vector<LedgerEvent> &events);

        dp::Result<std::vector<LedgerEvent>, dp::Error> loadEvents();

        // ===========================================
        // Statistics & Diagnostics
        // ===========================================

        int64_t getDonationCount();

        int64_t getEventCount();

        /// Run SQLite integrity check
        bool quickCheck();

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;

        void applyPragmas(const OpenOptions &opts);
        bool createSchemaV1();
        bool tableExists(const std::string &table_name);
        bool setSchemaVersion(int32_t version);

        bool executeSql(const std::string &sql);
        int64_t countRows(const char *sql);
        dp::Error lastError(const std::string &context) const;

        bool insertDonation(const ledger::Donation &donation);
        bool insertEscrow(const ledger::EscrowEntry &entry);
        bool insertReputation(const ReputationEntry &entry);
        bool insertRole(const Identity &identity, Role role);
        bool insertRatingKey(const RatingKey &key);
        bool insertDonorCounter(const ledger::DonorCounter &counter);
        bool setMeta(const char *key, int64_t value);
        int64_t getMeta(const char *key, int64_t fallback);

        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *DONATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS donations (
                id INTEGER PRIMARY KEY,
                donor TEXT NOT NULL,
                nonprofit TEXT NOT NULL,
                amount INTEGER NOT NULL,
                equity_percentage INTEGER NOT NULL,
                funding_deadline INTEGER NOT NULL,
                valuation INTEGER NOT NULL,
                nonprofit_name TEXT NOT NULL,
                description TEXT NOT NULL,
                active INTEGER NOT NULL,
                distributed INTEGER NOT NULL,
                cancelled INTEGER NOT NULL,
                created_at INTEGER NOT NULL,
                total_extension INTEGER NOT NULL
            )
        )";

        static constexpr const char *ESCROW_BALANCES_TABLE = R"(
            CREATE TABLE IF NOT EXISTS escrow_balances (
                donation_id INTEGER PRIMARY KEY,
                balance INTEGER NOT NULL,
                swept INTEGER NOT NULL DEFAULT 0,
                FOREIGN KEY(donation_id) REFERENCES donations(id)
            )
        )";

        static constexpr const char *REPUTATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS reputations (
                identity TEXT NOT NULL,
                role INTEGER NOT NULL,
                rating INTEGER NOT NULL,
                total_ratings INTEGER NOT NULL,
                last_updated INTEGER NOT NULL,
                review TEXT NOT NULL,
                PRIMARY KEY(identity, role)
            )
        )";

        static constexpr const char *ROLE_MEMBERSHIPS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS role_memberships (
                identity TEXT NOT NULL,
                role INTEGER NOT NULL,
                PRIMARY KEY(identity, role)
            )
        )";

        static constexpr const char *RATING_KEYS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS rating_keys (
                rater TEXT NOT NULL,
                subject TEXT NOT NULL,
                epoch INTEGER NOT NULL,
                PRIMARY KEY(rater, subject, epoch)
            )
        )";

        static constexpr const char *DONOR_COUNTERS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS donor_counters (
                identity TEXT PRIMARY KEY,
                count INTEGER NOT NULL
            )
        )";

        static constexpr const char *LEDGER_META_TABLE = R"(
            CREATE TABLE IF NOT EXISTS ledger_meta (
                key TEXT PRIMARY KEY,
                value INTEGER NOT NULL
            )
        )";

        static constexpr const char *EVENTS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS events (
                sequence INTEGER PRIMARY KEY,
                kind INTEGER NOT NULL,
                donation_id INTEGER NOT NULL,
                actor TEXT NOT NULL,
                subject TEXT NOT NULL,
                amount INTEGER NOT NULL,
                detail INTEGER NOT NULL,
                timestamp INTEGER NOT NULL,
                payload BLOB NOT NULL,
                prev_hash TEXT NOT NULL,
                hash TEXT NOT NULL
            )
        )";

        static constexpr const char *IDX_DONATIONS_DONOR =
            "CREATE INDEX IF NOT EXISTS idx_donations_donor ON donations(donor)";
        static constexpr const char *IDX_DONATIONS_NONPROFIT =
            "CREATE INDEX IF NOT EXISTS idx_donations_nonprofit ON donations(nonprofit)";
        static constexpr const char *IDX_EVENTS_DONATION =
            "CREATE INDEX IF NOT EXISTS idx_events_donation ON events(donation_id)";
        static constexpr const char *IDX_EVENTS_KIND = "CREATE INDEX IF NOT EXISTS idx_events_kind ON events(kind)";
    };

} // namespace escrowit::storage
