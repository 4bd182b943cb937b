#include "test_support.hpp"

using namespace escrowit::storage;

// ===========================================
// LedgerStore
// ===========================================

TEST_CASE("Store lifecycle") {
    TestDB db("test_store_lifecycle");
    LedgerStore store;

    CHECK_FALSE(store.isOpen());
    CHECK(failedWith(store.initializeSchema(), ERR_STORE_NOT_OPEN));
    CHECK(failedWith(store.loadSnapshot(), ERR_STORE_NOT_OPEN));

    REQUIRE(store.open(db.path).is_ok());
    CHECK(store.isOpen());
    REQUIRE(store.initializeSchema().is_ok());
    CHECK(store.schemaVersion() == 1);

    // Idempotent
    REQUIRE(store.initializeSchema().is_ok());
    CHECK(store.schemaVersion() == 1);
    CHECK(store.quickCheck());

    store.close();
    CHECK_FALSE(store.isOpen());
}

TEST_CASE("Empty database loads an empty snapshot") {
    TestDB db("test_store_empty");
    LedgerStore store;
    REQUIRE(store.open(db.path).is_ok());
    REQUIRE(store.initializeSchema().is_ok());

    auto snapshot = store.loadSnapshot();
    REQUIRE(snapshot.is_ok());
    CHECK(snapshot.value().donations.empty());
    CHECK(snapshot.value().roles.empty());
    CHECK_FALSE(snapshot.value().paused);
}

TEST_CASE("Snapshot round trip restores an equivalent ledger") {
    TestDB db("test_store_snapshot");
    LedgerFixture fx;
    auto &ledger = *fx.ledger;

    auto a = fx.createFunded("alice", "water-org");
    auto b = fx.create("bob", 2 * COIN);
    REQUIRE(ledger.extendFundingPeriod(b, "bob", 3).is_ok());
    REQUIRE(ledger.updateReputation("alice", "water-org", 4, "on time").is_ok());
    REQUIRE(ledger.pause("admin").is_ok());

    LedgerStore store;
    REQUIRE(store.open(db.path).is_ok());
    REQUIRE(store.initializeSchema().is_ok());
    REQUIRE(store.saveSnapshot(ledger.snapshot()).is_ok());
    CHECK(store.getDonationCount() == 2);

    auto loaded = store.loadSnapshot();
    REQUIRE(loaded.is_ok());

    ManualClock clock(TEST_EPOCH);
    BalanceBook book;
    EventLog log;
    DonationLedger copy(fx.config, clock, book, log);
    REQUIRE(copy.restore(loaded.value()).is_ok());

    CHECK(copy.getDonationCount() == 2);
    CHECK(copy.isPaused());
    CHECK(copy.escrowBalance(a) == COIN);
    CHECK(copy.totalEscrowed() == COIN);
    CHECK(copy.hasRole("water-org", Role::Nonprofit));
    CHECK(copy.hasRole("bob", Role::Donor));
    CHECK(copy.hasRole("admin", Role::Admin));
    CHECK(copy.getUserDonationCount("alice") == 1);
    CHECK(copy.getReputation("water-org").as_nonprofit.rating == 4);
    CHECK(copy.getReputation("water-org").as_nonprofit.getReview() == "on time");

    auto restored_b = copy.getDonation(b);
    REQUIRE(restored_b.is_ok());
    CHECK(restored_b.value().getNonprofitName() == "Clean Water Fund");
    CHECK(restored_b.value().amount == 2 * COIN);
    CHECK(restored_b.value().total_extension == 3 * SECONDS_PER_DAY);
    CHECK(restored_b.value().funding_deadline == fx.donation(b).funding_deadline);

    // Duplicate-rating protection survives the reload
    REQUIRE(copy.unpause("admin").is_ok());
    CHECK(failedWith(copy.updateReputation("alice", "water-org", 1, "again"), ERR_ALREADY_RATED));

    // The restored ledger keeps working
    REQUIRE(copy.distributeDonation(a, "alice").is_ok());
    CHECK(book.balanceOf("water-org") == COIN);
}

TEST_CASE("Donation rows are append-only") {
    TestDB db("test_store_append_only");
    LedgerFixture fx;
    fx.create("alice");
    fx.create("bob");

    LedgerStore store;
    REQUIRE(store.open(db.path).is_ok());
    REQUIRE(store.initializeSchema().is_ok());
    REQUIRE(store.saveSnapshot(fx.ledger->snapshot()).is_ok());

    LedgerFixture older;
    older.create("alice");
    CHECK(failedWith(store.saveSnapshot(older.ledger->snapshot()), ERR_STORAGE_FAILED));
    CHECK(store.getDonationCount() == 2);
}

TEST_CASE("Event journal") {
    TestDB db("test_store_events");
    LedgerFixture fx;
    auto id = fx.createFunded("alice", "water-org");
    REQUIRE(fx.ledger->distributeDonation(id, "alice").is_ok());

    LedgerStore store;
    REQUIRE(store.open(db.path).is_ok());
    REQUIRE(store.initializeSchema().is_ok());

    auto synced = store.syncEvents(fx.log.events());
    REQUIRE(synced.is_ok());
    CHECK(synced.value() == 3);
    CHECK(store.getEventCount() == 3);

    // Only new events are appended on the next sync
    REQUIRE(fx.ledger->updateReputation("alice", "water-org", 5, "great").is_ok());
    auto second = store.syncEvents(fx.log.events());
    REQUIRE(second.is_ok());
    CHECK(second.value() == 1);

    auto loaded = store.loadEvents();
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().size() == 4);
    CHECK(loaded.value()[1].getKind() == EventKind::DonationFunded);
    CHECK(loaded.value()[1].getPayloadBytes() == fx.log.events()[1].getPayloadBytes());

    EventLog reloaded;
    reloaded.restore(loaded.value());
    CHECK(reloaded.verifyChain().is_ok());
    CHECK(reloaded.lastHash() == fx.log.lastHash());

    // Gaps are rejected
    LedgerEvent stray(EventKind::Paused, "admin");
    stray.sequence = 10;
    CHECK(failedWith(store.appendEvent(stray), ERR_STORAGE_FAILED));
}

// ===========================================
// EscrowitStore
// ===========================================

TEST_CASE("Ledger survives a restart") {
    TestDB db("test_store_restart");
    ManualClock clock(TEST_EPOCH);
    BalanceBook book;
    LedgerConfig config;
    config.admin = "admin";
    dp::u64 id = 0;

    {
        EscrowitStore node(config, clock, book);
        REQUIRE(node.initialize(db.path).is_ok());
        CHECK(node.isInitialized());

        auto created = node.ledger().createDonation("alice", COIN, 5, "Clean Water Fund", "Wells", 10);
        REQUIRE(created.is_ok());
        id = created.value();
        REQUIRE(node.ledger().fundDonation(id, "water-org", COIN).is_ok());
        REQUIRE(node.commit().is_ok());

        auto consistent = node.verifyConsistency();
        REQUIRE(consistent.is_ok());
        CHECK(consistent.value());
    }

    {
        EscrowitStore node(config, clock, book);
        REQUIRE(node.initialize(db.path).is_ok());

        CHECK(node.ledger().getDonationCount() == 1);
        CHECK(node.ledger().escrowBalance(id) == COIN);
        CHECK(node.events().size() == 2);
        CHECK(node.events().verifyChain().is_ok());

        REQUIRE(node.ledger().distributeDonation(id, "alice").is_ok());
        REQUIRE(node.commit().is_ok());
        CHECK(node.store().getEventCount() == 3);
        CHECK(book.balanceOf("water-org") == COIN);
    }
}

TEST_CASE("Consistency after an emergency withdrawal") {
    TestDB db("test_store_emergency");
    ManualClock clock(TEST_EPOCH);
    BalanceBook book;
    LedgerConfig config;
    config.admin = "admin";

    EscrowitStore node(config, clock, book);
    REQUIRE(node.initialize(db.path).is_ok());
    CHECK(failedWith(EscrowitStore(config, clock, book).commit(), ERR_STORE_NOT_OPEN));

    auto created = node.ledger().createDonation("alice", COIN, 5, "n", "d", 1);
    REQUIRE(created.is_ok());
    REQUIRE(node.ledger().fundDonation(created.value(), "water-org", COIN).is_ok());
    REQUIRE(node.ledger().emergencyWithdraw("admin").is_ok());

    auto consistent = node.verifyConsistency();
    REQUIRE(consistent.is_ok());
    CHECK(consistent.value());
    REQUIRE(node.commit().is_ok());

    // After a reload the swept donation still cannot be paid from new escrow
    EscrowitStore reloaded(config, clock, book);
    REQUIRE(reloaded.initialize(db.path).is_ok());
    auto second = reloaded.ledger().createDonation("bob", COIN, 5, "n", "d", 1);
    REQUIRE(second.is_ok());
    REQUIRE(reloaded.ledger().fundDonation(second.value(), "school-org", COIN).is_ok());

    CHECK(failedWith(reloaded.ledger().distributeDonation(created.value(), "alice"), ERR_INSUFFICIENT_FUNDS));
    CHECK(book.balanceOf("water-org") == 0);

    auto after = reloaded.verifyConsistency();
    REQUIRE(after.is_ok());
    CHECK(after.value());

    REQUIRE(reloaded.ledger().distributeDonation(second.value(), "bob").is_ok());
    CHECK(book.balanceOf("school-org") == COIN);
}
