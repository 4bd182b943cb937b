#pragma once

#include "ledger_store.hpp"
#include <chrono>
#include <sqlite3.h>

namespace escrowit::storage {

    namespace detail {

        inline int64_t currentTimestamp() {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        inline std::string columnText(sqlite3_stmt *stmt, int col) {
            const unsigned char *text = sqlite3_column_text(stmt, col);
            return text ? reinterpret_cast<const char *>(text) : "";
        }

        // u64 values are stored bit-for-bit in SQLite's signed 64-bit integers
        inline sqlite3_int64 toDb(dp::u64 value) { return static_cast<sqlite3_int64>(value); }

        inline dp::u64 fromDb(sqlite3_int64 value) { return static_cast<dp::u64>(value); }

    } // namespace detail

    // ===========================================
    // LedgerStore implementation
    // ===========================================

    inline LedgerStore::LedgerStore() : db_(nullptr), is_open_(false) {}

    inline LedgerStore::~LedgerStore() { close(); }

    inline LedgerStore::LedgerStore(LedgerStore &&other) noexcept
        : db_(other.db_), db_path_(std::move(other.db_path_)), is_open_(other.is_open_) {
        other.db_ = nullptr;
        other.is_open_ = false;
    }

    inline LedgerStore &LedgerStore::operator=(LedgerStore &&other) noexcept {
        if (this != &other) {
            close();
            db_ = other.db_;
            db_path_ = std::move(other.db_path_);
            is_open_ = other.is_open_;
            other.db_ = nullptr;
            other.is_open_ = false;
        }
        return *this;
    }

    inline dp::Result<void, dp::Error> LedgerStore::open(const std::string &path, const OpenOptions &opts) {
        close();
        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            std::string msg = "Cannot open " + path;
            if (db_) {
                msg += ": " + std::string(sqlite3_errmsg(db_));
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(storage_failed(dp::String(msg.c_str())));
        }

        db_path_ = path;
        is_open_ = true;
        applyPragmas(opts);
        return dp::Result<void, dp::Error>::ok();
    }

    inline void LedgerStore::close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
        }
    }

    inline bool LedgerStore::isOpen() const { return is_open_; }

    inline void LedgerStore::applyPragmas(const OpenOptions &opts) {
        if (!db_)
            return;

        if (opts.enable_wal) {
            executeSql("PRAGMA journal_mode=WAL;");
        }

        if (opts.enable_foreign_keys) {
            executeSql("PRAGMA foreign_keys=ON;");
        }

        executeSql("PRAGMA busy_timeout=" + std::to_string(opts.busy_timeout_ms) + ";");
        executeSql("PRAGMA cache_size=-" + std::to_string(opts.cache_size_kb) + ";");

        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            executeSql("PRAGMA synchronous=OFF;");
            break;
        case OpenOptions::Synchronous::NORMAL:
            executeSql("PRAGMA synchronous=NORMAL;");
            break;
        case OpenOptions::Synchronous::FULL:
            executeSql("PRAGMA synchronous=FULL;");
            break;
        }
    }

    inline dp::Result<void, dp::Error> LedgerStore::initializeSchema() {
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(store_not_open());

        auto tx = beginTransaction();
        if (!tx->isActive())
            return dp::Result<void, dp::Error>::err(lastError("Begin transaction"));

        if (!executeSql(SCHEMA_MIGRATIONS_TABLE)) {
            return dp::Result<void, dp::Error>::err(lastError("Create schema_migrations"));
        }

        if (schemaVersion() < 1) {
            if (!createSchemaV1())
                return dp::Result<void, dp::Error>::err(lastError("Create schema v1"));
            if (!setSchemaVersion(1))
                return dp::Result<void, dp::Error>::err(lastError("Record schema version"));
        }

        if (!tx->commit())
            return dp::Result<void, dp::Error>::err(lastError("Commit schema"));
        return dp::Result<void, dp::Error>::ok();
    }

    inline bool LedgerStore::createSchemaV1() {
        return executeSql(DONATIONS_TABLE) && executeSql(ESCROW_BALANCES_TABLE) && executeSql(REPUTATIONS_TABLE) &&
               executeSql(ROLE_MEMBERSHIPS_TABLE) && executeSql(RATING_KEYS_TABLE) &&
               executeSql(DONOR_COUNTERS_TABLE) && executeSql(LEDGER_META_TABLE) && executeSql(EVENTS_TABLE) &&
               executeSql(IDX_DONATIONS_DONOR) && executeSql(IDX_DONATIONS_NONPROFIT) &&
               executeSql(IDX_EVENTS_DONATION) && executeSql(IDX_EVENTS_KIND);
    }

    inline bool LedgerStore::tableExists(const std::string &table_name) {
        if (!db_)
            return false;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_text(stmt, 1, table_name.c_str(), -1, SQLITE_TRANSIENT);

        bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
        sqlite3_finalize(stmt);

        return exists;
    }

    inline int32_t LedgerStore::schemaVersion() {
        if (!tableExists("schema_migrations"))
            return 0;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT MAX(version) FROM schema_migrations";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        int32_t version = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            version = sqlite3_column_int(stmt, 0);
        }

        sqlite3_finalize(stmt);
        return version;
    }

    inline bool LedgerStore::setSchemaVersion(int32_t version) {
        sqlite3_stmt *stmt;
        const char *sql = "INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_int(stmt, 1, version);
        sqlite3_bind_int64(stmt, 2, detail::currentTimestamp());

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        return success;
    }

    // ===========================================
    // Transaction Guard
    // ===========================================

    inline LedgerStore::TxGuard::TxGuard(LedgerStore &store) : store_(store), active_(false), committed_(false) {
        if (store_.db_) {
            active_ = (sqlite3_exec(store_.db_, "BEGIN TRANSACTION", nullptr, nullptr, nullptr) == SQLITE_OK);
        }
    }

    inline LedgerStore::TxGuard::~TxGuard() {
        if (active_ && !committed_) {
            sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    inline bool LedgerStore::TxGuard::commit() {
        if (!active_ || committed_)
            return false;
        if (sqlite3_exec(store_.db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK)
            return false;
        committed_ = true;
        active_ = false;
        return true;
    }

    inline void LedgerStore::TxGuard::rollback() {
        if (active_ && !committed_) {
            sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
            committed_ = true;
            active_ = false;
        }
    }

    inline std::unique_ptr<LedgerStore::TxGuard> LedgerStore::beginTransaction() {
        return std::make_unique<TxGuard>(*this);
    }

    // ===========================================
    // Ledger state
    // ===========================================

    inline dp::Result<void, dp::Error> LedgerStore::saveSnapshot(const ledger::LedgerSnapshot &snapshot) {
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(store_not_open());

        int64_t stored = getDonationCount();
        if (stored > static_cast<int64_t>(snapshot.donations.size())) {
            return dp::Result<void, dp::Error>::err(
                storage_failed("Snapshot would drop persisted donations"));
        }

        auto tx = beginTransaction();
        if (!tx->isActive())
            return dp::Result<void, dp::Error>::err(lastError("Begin transaction"));

        if (!executeSql("DELETE FROM escrow_balances") || !executeSql("DELETE FROM reputations") ||
            !executeSql("DELETE FROM role_memberships") || !executeSql("DELETE FROM rating_keys") ||
            !executeSql("DELETE FROM donor_counters")) {
            return dp::Result<void, dp::Error>::err(lastError("Clear state tables"));
        }

        // Children of donations were cleared above, so rows can be replaced
        for (const auto &donation : snapshot.donations) {
            if (!insertDonation(donation))
                return dp::Result<void, dp::Error>::err(lastError("Write donation " + std::to_string(donation.id)));
        }

        for (const auto &entry : snapshot.escrow) {
            if (!insertEscrow(entry))
                return dp::Result<void, dp::Error>::err(lastError("Write escrow balance"));
        }
        for (const auto &entry : snapshot.reputations) {
            if (!insertReputation(entry))
                return dp::Result<void, dp::Error>::err(lastError("Write reputation"));
        }
        for (const auto &[identity, role] : snapshot.roles) {
            if (!insertRole(identity, role))
                return dp::Result<void, dp::Error>::err(lastError("Write role membership"));
        }
        for (const auto &key : snapshot.rating_keys) {
            if (!insertRatingKey(key))
                return dp::Result<void, dp::Error>::err(lastError("Write rating key"));
        }
        for (const auto &counter : snapshot.donor_counters) {
            if (!insertDonorCounter(counter))
                return dp::Result<void, dp::Error>::err(lastError("Write donor counter"));
        }

        if (!setMeta("next_donation_id", static_cast<int64_t>(snapshot.donations.size())) ||
            !setMeta("paused", snapshot.paused ? 1 : 0) ||
            !setMeta("total_custodied", detail::toDb(snapshot.total_custodied))) {
            return dp::Result<void, dp::Error>::err(lastError("Write ledger meta"));
        }

        if (!tx->commit())
            return dp::Result<void, dp::Error>::err(lastError("Commit snapshot"));
        return dp::Result<void, dp::Error>::ok();
    }

    inline dp::Result<ledger::LedgerSnapshot, dp::Error> LedgerStore::loadSnapshot() {
        using SnapshotResult = dp::Result<ledger::LedgerSnapshot, dp::Error>;
        if (!db_ || !is_open_)
            return SnapshotResult::err(store_not_open());

        ledger::LedgerSnapshot snapshot;
        sqlite3_stmt *stmt;

        const char *donations_sql =
            "SELECT id, donor, nonprofit, amount, equity_percentage, funding_deadline, valuation, nonprofit_name, "
            "description, active, distributed, cancelled, created_at, total_extension FROM donations ORDER BY id";
        if (sqlite3_prepare_v2(db_, donations_sql, -1, &stmt, nullptr) != SQLITE_OK)
            return SnapshotResult::err(lastError("Read donations"));
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            ledger::Donation donation;
            donation.id = detail::fromDb(sqlite3_column_int64(stmt, 0));
            donation.donor = dp::String(detail::columnText(stmt, 1).c_str());
            donation.nonprofit = dp::String(detail::columnText(stmt, 2).c_str());
            donation.amount = detail::fromDb(sqlite3_column_int64(stmt, 3));
            donation.equity_percentage = static_cast<dp::u8>(sqlite3_column_int(stmt, 4));
            donation.funding_deadline = sqlite3_column_int64(stmt, 5);
            donation.valuation = detail::fromDb(sqlite3_column_int64(stmt, 6));
            donation.nonprofit_name = dp::String(detail::columnText(stmt, 7).c_str());
            donation.description = dp::String(detail::columnText(stmt, 8).c_str());
            donation.active = sqlite3_column_int(stmt, 9) != 0;
            donation.distributed = sqlite3_column_int(stmt, 10) != 0;
            donation.cancelled = sqlite3_column_int(stmt, 11) != 0;
            donation.created_at = sqlite3_column_int64(stmt, 12);
            donation.total_extension = sqlite3_column_int64(stmt, 13);
            snapshot.donations.push_back(donation);
        }
        sqlite3_finalize(stmt);

        const char *escrow_sql = "SELECT donation_id, balance, swept FROM escrow_balances ORDER BY donation_id";
        if (sqlite3_prepare_v2(db_, escrow_sql, -1, &stmt, nullptr) != SQLITE_OK)
            return SnapshotResult::err(lastError("Read escrow balances"));
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            snapshot.escrow.emplace_back(detail::fromDb(sqlite3_column_int64(stmt, 0)),
                                         detail::fromDb(sqlite3_column_int64(stmt, 1)),
                                         sqlite3_column_int(stmt, 2) != 0);
        }
        sqlite3_finalize(stmt);

        const char *reputations_sql = "SELECT identity, role, rating, total_ratings, last_updated, review "
                                      "FROM reputations ORDER BY identity, role";
        if (sqlite3_prepare_v2(db_, reputations_sql, -1, &stmt, nullptr) != SQLITE_OK)
            return SnapshotResult::err(lastError("Read reputations"));
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            ReputationEntry entry;
            entry.identity = detail::columnText(stmt, 0);
            entry.role = static_cast<ReputationRole>(sqlite3_column_int(stmt, 1));
            entry.reputation.rating = static_cast<dp::u8>(sqlite3_column_int(stmt, 2));
            entry.reputation.total_ratings = detail::fromDb(sqlite3_column_int64(stmt, 3));
            entry.reputation.last_updated = sqlite3_column_int64(stmt, 4);
            entry.reputation.review = dp::String(detail::columnText(stmt, 5).c_str());
            snapshot.reputations.push_back(entry);
        }
        sqlite3_finalize(stmt);

        const char *roles_sql = "SELECT identity, role FROM role_memberships ORDER BY identity, role";
        if (sqlite3_prepare_v2(db_, roles_sql, -1, &stmt, nullptr) != SQLITE_OK)
            return SnapshotResult::err(lastError("Read role memberships"));
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            snapshot.roles.emplace_back(detail::columnText(stmt, 0), static_cast<Role>(sqlite3_column_int(stmt, 1)));
        }
        sqlite3_finalize(stmt);

        const char *keys_sql = "SELECT rater, subject, epoch FROM rating_keys ORDER BY rater, subject, epoch";
        if (sqlite3_prepare_v2(db_, keys_sql, -1, &stmt, nullptr) != SQLITE_OK)
            return SnapshotResult::err(lastError("Read rating keys"));
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            snapshot.rating_keys.push_back(RatingKey{detail::columnText(stmt, 0), detail::columnText(stmt, 1),
                                                     detail::fromDb(sqlite3_column_int64(stmt, 2))});
        }
        sqlite3_finalize(stmt);

        const char *counters_sql = "SELECT identity, count FROM donor_counters ORDER BY identity";
        if (sqlite3_prepare_v2(db_, counters_sql, -1, &stmt, nullptr) != SQLITE_OK)
            return SnapshotResult::err(lastError("Read donor counters"));
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            snapshot.donor_counters.push_back(
                ledger::DonorCounter{detail::columnText(stmt, 0), detail::fromDb(sqlite3_column_int64(stmt, 1))});
        }
        sqlite3_finalize(stmt);

        snapshot.paused = getMeta("paused", 0) != 0;
        snapshot.total_custodied = detail::fromDb(getMeta("total_custodied", 0));

        if (getMeta("next_donation_id", 0) != static_cast<int64_t>(snapshot.donations.size())) {
            return SnapshotResult::err(storage_failed("Donation table does not match recorded next id"));
        }

        return SnapshotResult::ok(std::move(snapshot));
    }

    // ===========================================
    // Event journal
    // ===========================================

    inline dp::Result<void, dp::Error> LedgerStore::appendEvent(const LedgerEvent &event) {
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(store_not_open());

        if (static_cast<dp::u64>(getEventCount()) != event.sequence) {
            return dp::Result<void, dp::Error>::err(
                storage_failed(dp::String(("Out-of-order event " + std::to_string(event.sequence)).c_str())));
        }

        sqlite3_stmt *stmt;
        const char *sql = "INSERT INTO events (sequence, kind, donation_id, actor, subject, amount, detail, "
                          "timestamp, payload, prev_hash, hash) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(lastError("Prepare event insert"));
        }

        std::vector<uint8_t> payload = event.getPayloadBytes();
        sqlite3_bind_int64(stmt, 1, detail::toDb(event.sequence));
        sqlite3_bind_int(stmt, 2, event.kind);
        sqlite3_bind_int64(stmt, 3, detail::toDb(event.donation_id));
        sqlite3_bind_text(stmt, 4, event.actor.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, event.subject.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 6, detail::toDb(event.amount));
        sqlite3_bind_int(stmt, 7, event.detail);
        sqlite3_bind_int64(stmt, 8, event.timestamp);
        sqlite3_bind_blob(stmt, 9, payload.data(), static_cast<int>(payload.size()), SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 10, event.prev_hash.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 11, event.hash.c_str(), -1, SQLITE_TRANSIENT);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        if (!success)
            return dp::Result<void, dp::Error>::err(lastError("Insert event"));
        return dp::Result<void, dp::Error>::ok();
    }

    inline dp::Result<size_t, dp::Error> LedgerStore::syncEvents(const std::vector<LedgerEvent> &events) {
        if (!db_ || !is_open_)
            return dp::Result<size_t, dp::Error>::err(store_not_open());

        auto tx = beginTransaction();
        if (!tx->isActive())
            return dp::Result<size_t, dp::Error>::err(lastError("Begin transaction"));

        size_t appended = 0;
        for (size_t i = static_cast<size_t>(getEventCount()); i < events.size(); ++i) {
            auto result = appendEvent(events[i]);
            if (!result.is_ok())
                return dp::Result<size_t, dp::Error>::err(result.error());
            ++appended;
        }

        if (!tx->commit())
            return dp::Result<size_t, dp::Error>::err(lastError("Commit events"));
        return dp::Result<size_t, dp::Error>::ok(appended);
    }

    inline dp::Result<std::vector<LedgerEvent>, dp::Error> LedgerStore::loadEvents() {
        using EventsResult = dp::Result<std::vector<LedgerEvent>, dp::Error>;
        if (!db_ || !is_open_)
            return EventsResult::err(store_not_open());

        sqlite3_stmt *stmt;
        const char *sql = "SELECT sequence, kind, donation_id, actor, subject, amount, detail, timestamp, payload, "
                          "prev_hash, hash FROM events ORDER BY sequence";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return EventsResult::err(lastError("Read events"));
        }

        std::vector<LedgerEvent> events;
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            LedgerEvent event;
            event.sequence = detail::fromDb(sqlite3_column_int64(stmt, 0));
            event.kind = static_cast<dp::u8>(sqlite3_column_int(stmt, 1));
            event.donation_id = detail::fromDb(sqlite3_column_int64(stmt, 2));
            event.actor = dp::String(detail::columnText(stmt, 3).c_str());
            event.subject = dp::String(detail::columnText(stmt, 4).c_str());
            event.amount = detail::fromDb(sqlite3_column_int64(stmt, 5));
            event.detail = static_cast<dp::u8>(sqlite3_column_int(stmt, 6));
            event.timestamp = sqlite3_column_int64(stmt, 7);

            const void *blob = sqlite3_column_blob(stmt, 8);
            int blob_size = sqlite3_column_bytes(stmt, 8);
            if (blob && blob_size > 0) {
                const auto *bytes = static_cast<const uint8_t *>(blob);
                event.setPayload(std::vector<uint8_t>(bytes, bytes + blob_size));
            }

            event.prev_hash = dp::String(detail::columnText(stmt, 9).c_str());
            event.hash = dp::String(detail::columnText(stmt, 10).c_str());
            events.push_back(std::move(event));
        }

        sqlite3_finalize(stmt);
        return EventsResult::ok(std::move(events));
    }

    // ===========================================
    // Statistics & Diagnostics
    // ===========================================

    inline int64_t LedgerStore::getDonationCount() { return countRows("SELECT COUNT(*) FROM donations"); }

    inline int64_t LedgerStore::getEventCount() { return countRows("SELECT COUNT(*) FROM events"); }

    inline bool LedgerStore::quickCheck() {
        if (!db_ || !is_open_)
            return false;

        sqlite3_stmt *stmt;
        const char *sql = "PRAGMA quick_check";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        bool ok = false;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            ok = (detail::columnText(stmt, 0) == "ok");
        }

        sqlite3_finalize(stmt);
        return ok;
    }

    // ===========================================
    // Internals
    // ===========================================

    inline bool LedgerStore::executeSql(const std::string &sql) {
        if (!db_ || !is_open_)
            return false;

        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);

        if (rc != SQLITE_OK) {
            if (errmsg) {
                sqlite3_free(errmsg);
            }
            return false;
        }

        return true;
    }

    inline int64_t LedgerStore::countRows(const char *sql) {
        if (!db_ || !is_open_)
            return 0;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        int64_t count = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int64(stmt, 0);
        }

        sqlite3_finalize(stmt);
        return count;
    }

    inline dp::Error LedgerStore::lastError(const std::string &context) const {
        std::string msg = context;
        if (db_) {
            msg += ": " + std::string(sqlite3_errmsg(db_));
        }
        return storage_failed(dp::String(msg.c_str()));
    }

    inline bool LedgerStore::insertDonation(const ledger::Donation &donation) {
        sqlite3_stmt *stmt;
        const char *sql = "INSERT OR REPLACE INTO donations (id, donor, nonprofit, amount, equity_percentage, "
                          "funding_deadline, valuation, nonprofit_name, description, active, distributed, cancelled, "
                          "created_at, total_extension) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_int64(stmt, 1, detail::toDb(donation.id));
        sqlite3_bind_text(stmt, 2, donation.donor.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, donation.nonprofit.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 4, detail::toDb(donation.amount));
        sqlite3_bind_int(stmt, 5, donation.equity_percentage);
        sqlite3_bind_int64(stmt, 6, donation.funding_deadline);
        sqlite3_bind_int64(stmt, 7, detail::toDb(donation.valuation));
        sqlite3_bind_text(stmt, 8, donation.nonprofit_name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 9, donation.description.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 10, donation.active ? 1 : 0);
        sqlite3_bind_int(stmt, 11, donation.distributed ? 1 : 0);
        sqlite3_bind_int(stmt, 12, donation.cancelled ? 1 : 0);
        sqlite3_bind_int64(stmt, 13, donation.created_at);
        sqlite3_bind_int64(stmt, 14, donation.total_extension);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    inline bool LedgerStore::insertEscrow(const ledger::EscrowEntry &entry) {
        sqlite3_stmt *stmt;
        const char *sql = "INSERT INTO escrow_balances (donation_id, balance, swept) VALUES (?, ?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_int64(stmt, 1, detail::toDb(entry.donation_id));
        sqlite3_bind_int64(stmt, 2, detail::toDb(entry.balance));
        sqlite3_bind_int(stmt, 3, entry.isSwept() ? 1 : 0);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    inline bool LedgerStore::insertReputation(const ReputationEntry &entry) {
        sqlite3_stmt *stmt;
        const char *sql = "INSERT INTO reputations (identity, role, rating, total_ratings, last_updated, review) "
                          "VALUES (?, ?, ?, ?, ?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_text(stmt, 1, entry.identity.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 2, static_cast<int>(entry.role));
        sqlite3_bind_int(stmt, 3, entry.reputation.rating);
        sqlite3_bind_int64(stmt, 4, detail::toDb(entry.reputation.total_ratings));
        sqlite3_bind_int64(stmt, 5, entry.reputation.last_updated);
        sqlite3_bind_text(stmt, 6, entry.reputation.review.c_str(), -1, SQLITE_TRANSIENT);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    inline bool LedgerStore::insertRole(const Identity &identity, Role role) {
        sqlite3_stmt *stmt;
        const char *sql = "INSERT INTO role_memberships (identity, role) VALUES (?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_text(stmt, 1, identity.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 2, static_cast<int>(role));

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    inline bool LedgerStore::insertRatingKey(const RatingKey &key) {
        sqlite3_stmt *stmt;
        const char *sql = "INSERT INTO rating_keys (rater, subject, epoch) VALUES (?, ?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_text(stmt, 1, key.rater.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, key.subject.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, detail::toDb(key.epoch));

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    inline bool LedgerStore::insertDonorCounter(const ledger::DonorCounter &counter) {
        sqlite3_stmt *stmt;
        const char *sql = "INSERT INTO donor_counters (identity, count) VALUES (?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_text(stmt, 1, counter.identity.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, detail::toDb(counter.count));

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    inline bool LedgerStore::setMeta(const char *key, int64_t value) {
        sqlite3_stmt *stmt;
        const char *sql = "INSERT OR REPLACE INTO ledger_meta (key, value) VALUES (?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_text(stmt, 1, key, -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, value);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    inline int64_t LedgerStore::getMeta(const char *key, int64_t fallback) {
        sqlite3_stmt *stmt;
        const char *sql = "SELECT value FROM ledger_meta WHERE key = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return fallback;
        }

        sqlite3_bind_text(stmt, 1, key, -1, SQLITE_TRANSIENT);

        int64_t value = fallback;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            value = sqlite3_column_int64(stmt, 0);
        }

        sqlite3_finalize(stmt);
        return value;
    }

} // namespace escrowit::storage
