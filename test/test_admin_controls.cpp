#include "test_support.hpp"

TEST_SUITE("Admin Controls Tests") {
    TEST_CASE("Pause blocks every mutation") {
        LedgerFixture fx;
        auto &ledger = *fx.ledger;
        auto active = fx.create("alice");
        auto funded = fx.createFunded("bob", "water-org");

        REQUIRE(ledger.pause("admin").is_ok());
        CHECK(ledger.isPaused());

        CHECK(failedWith(ledger.createDonation("carol", COIN, 5, "n", "d", 1), ERR_PAUSED));
        CHECK(failedWith(ledger.fundDonation(active, "school-org", COIN), ERR_PAUSED));
        CHECK(failedWith(ledger.distributeDonation(funded, "bob"), ERR_PAUSED));
        CHECK(failedWith(ledger.cancelDonation(active, "alice"), ERR_PAUSED));
        CHECK(failedWith(ledger.extendFundingPeriod(active, "alice", 1), ERR_PAUSED));
        CHECK(failedWith(ledger.updateReputation("bob", "alice", 5, "nice"), ERR_PAUSED));

        // Reads still work
        CHECK(ledger.getDonation(active).is_ok());
        CHECK(ledger.getDonationCount() == 2);
        CHECK(ledger.escrowBalance(funded) == COIN);
        CHECK(ledger.getReputation("alice").as_donor.total_ratings == 0);

        REQUIRE(ledger.unpause("admin").is_ok());
        CHECK_FALSE(ledger.isPaused());
        CHECK(ledger.distributeDonation(funded, "bob").is_ok());
    }

    TEST_CASE("Pause and unpause are admin only") {
        LedgerFixture fx;

        CHECK(failedWith(fx.ledger->pause("alice"), ERR_UNAUTHORIZED_ACCESS));
        CHECK_FALSE(fx.ledger->isPaused());

        REQUIRE(fx.ledger->pause("admin").is_ok());
        CHECK(failedWith(fx.ledger->unpause("alice"), ERR_UNAUTHORIZED_ACCESS));
        CHECK(fx.ledger->isPaused());
    }

    TEST_CASE("Redundant pause transitions") {
        LedgerFixture fx;

        CHECK(failedWith(fx.ledger->unpause("admin"), ERR_NOT_PAUSED));
        REQUIRE(fx.ledger->pause("admin").is_ok());
        CHECK(failedWith(fx.ledger->pause("admin"), ERR_PAUSED));

        CHECK(fx.log.eventsOfKind(EventKind::Paused).size() == 1);
        CHECK(fx.log.eventsOfKind(EventKind::Unpaused).empty());
    }

    TEST_CASE("Emergency withdrawal drains the vault") {
        LedgerFixture fx;
        auto &ledger = *fx.ledger;
        auto a = fx.createFunded("alice", "water-org");
        auto b = fx.create("bob", 3 * COIN);
        REQUIRE(ledger.fundDonation(b, "school-org", 3 * COIN).is_ok());
        REQUIRE(ledger.pause("admin").is_ok());

        auto swept = ledger.emergencyWithdraw("admin");
        REQUIRE(swept.is_ok());
        CHECK(swept.value() == 4 * COIN);
        CHECK(ledger.totalEscrowed() == 0);
        CHECK(fx.book.balanceOf("admin") == 4 * COIN);

        // Per-donation bookkeeping is left as it was
        CHECK(ledger.escrowBalance(a) == COIN);
        CHECK(ledger.escrowBalance(b) == 3 * COIN);

        auto events = fx.log.eventsOfKind(EventKind::EmergencyWithdrawal);
        REQUIRE(events.size() == 1);
        CHECK(events[0].amount == 4 * COIN);

        // Stale balances cannot be paid out again
        REQUIRE(ledger.unpause("admin").is_ok());
        CHECK(failedWith(ledger.distributeDonation(a, "alice"), ERR_INSUFFICIENT_FUNDS));
        CHECK(fx.book.balanceOf("water-org") == 0);
        CHECK_FALSE(fx.donation(a).distributed);
    }

    TEST_CASE("Swept donations cannot drain escrow funded later") {
        LedgerFixture fx;
        auto &ledger = *fx.ledger;
        auto a = fx.createFunded("alice", "water-org");
        REQUIRE(ledger.emergencyWithdraw("admin").is_ok());
        CHECK(fx.book.balanceOf("admin") == COIN);

        auto b = fx.create("bob");
        REQUIRE(ledger.fundDonation(b, "school-org", COIN).is_ok());
        CHECK(ledger.totalEscrowed() == COIN);

        // The swept entry stays unpayable even though custody is back to one coin
        CHECK(failedWith(ledger.distributeDonation(a, "alice"), ERR_INSUFFICIENT_FUNDS));
        CHECK(fx.book.balanceOf("water-org") == 0);
        CHECK_FALSE(fx.donation(a).distributed);
        CHECK(ledger.totalEscrowed() == COIN);

        // Bob's deposit still reaches his own nonprofit
        auto released = ledger.distributeDonation(b, "bob");
        REQUIRE(released.is_ok());
        CHECK(fx.book.balanceOf("school-org") == COIN);
        CHECK(ledger.totalEscrowed() == 0);

        // A second sweep only takes what was funded since the first
        auto c = fx.create("carol", 2 * COIN);
        REQUIRE(ledger.fundDonation(c, "library-org", 2 * COIN).is_ok());
        auto again = ledger.emergencyWithdraw("admin");
        REQUIRE(again.is_ok());
        CHECK(again.value() == 2 * COIN);
        CHECK(fx.book.balanceOf("admin") == 3 * COIN);
    }

    TEST_CASE("Emergency withdrawal preconditions") {
        LedgerFixture fx;

        CHECK(failedWith(fx.ledger->emergencyWithdraw("admin"), ERR_INSUFFICIENT_FUNDS));

        fx.createFunded("alice", "water-org");
        CHECK(failedWith(fx.ledger->emergencyWithdraw("alice"), ERR_UNAUTHORIZED_ACCESS));
        CHECK(fx.ledger->totalEscrowed() == COIN);
    }

    TEST_CASE("Failed emergency withdrawal keeps custody") {
        FailingTransport failing;
        LedgerFixture fx(failing);
        fx.createFunded("alice", "water-org");

        CHECK(failedWith(fx.ledger->emergencyWithdraw("admin"), ERR_TRANSFER_FAILED));
        CHECK(fx.ledger->totalEscrowed() == COIN);
        CHECK(fx.log.eventsOfKind(EventKind::EmergencyWithdrawal).empty());
    }

    TEST_CASE("Role administration works while paused") {
        LedgerFixture fx;
        REQUIRE(fx.ledger->pause("admin").is_ok());

        CHECK(fx.ledger->grantRole("admin", "ops", Role::Admin).is_ok());
        CHECK(fx.ledger->unpause("ops").is_ok());
    }

    TEST_CASE("No admin configured") {
        ManualClock clock(TEST_EPOCH);
        BalanceBook book;
        EventLog log;
        LedgerConfig config;
        DonationLedger ledger(config, clock, book, log);

        CHECK(failedWith(ledger.pause(""), ERR_UNAUTHORIZED_ACCESS));
        CHECK(ledger.getAccessControl().memberCount(Role::Admin) == 0);
    }
}
