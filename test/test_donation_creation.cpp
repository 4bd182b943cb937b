#include "test_support.hpp"

TEST_SUITE("Donation Creation Tests") {
    TEST_CASE("Valid creation") {
        LedgerFixture fx;
        auto &ledger = *fx.ledger;

        auto result = ledger.createDonation("alice", COIN, 5, "Clean Water Fund", "Wells for three villages", 1000);
        REQUIRE(result.is_ok());
        CHECK(result.value() == 0);

        auto d = fx.donation(0);
        CHECK(d.id == 0);
        CHECK(d.getDonor() == "alice");
        CHECK(d.getNonprofit().empty());
        CHECK(d.amount == COIN);
        CHECK(d.equity_percentage == 5);
        CHECK(d.valuation == 1000);
        CHECK(d.getNonprofitName() == "Clean Water Fund");
        CHECK(d.getDescription() == "Wells for three villages");
        CHECK(d.active);
        CHECK_FALSE(d.distributed);
        CHECK_FALSE(d.cancelled);
        CHECK_FALSE(d.isFunded());
        CHECK(d.getState() == DonationState::Active);
        CHECK(d.created_at == TEST_EPOCH);
        CHECK(d.funding_deadline == TEST_EPOCH + 30 * SECONDS_PER_DAY);
        CHECK(d.total_extension == 0);

        CHECK(ledger.hasRole("alice", Role::Donor));
        CHECK(ledger.getUserDonationCount("alice") == 1);
        CHECK(ledger.getDonationCount() == 1);
        CHECK(ledger.escrowBalance(0) == 0);
        CHECK(ledger.totalEscrowed() == 0);
    }

    TEST_CASE("Ids are sequential") {
        LedgerFixture fx;
        CHECK(fx.create("alice") == 0);
        CHECK(fx.create("bob") == 1);
        CHECK(fx.create("alice") == 2);

        CHECK(fx.ledger->getDonationCount() == 3);
        CHECK(fx.ledger->getUserDonationCount("alice") == 2);
        CHECK(fx.ledger->getUserDonationCount("bob") == 1);
        CHECK(fx.ledger->getUserDonationCount("carol") == 0);

        auto alice_ids = fx.ledger->getDonationsByDonor("alice");
        REQUIRE(alice_ids.size() == 2);
        CHECK(alice_ids[0] == 0);
        CHECK(alice_ids[1] == 2);
    }

    TEST_CASE("Amount bounds") {
        LedgerFixture fx;
        auto &ledger = *fx.ledger;

        CHECK(ledger.createDonation("alice", COIN / 10, 5, "n", "d", 1).is_ok());
        CHECK(ledger.createDonation("alice", 10 * COIN, 5, "n", "d", 1).is_ok());

        CHECK(failedWith(ledger.createDonation("alice", COIN / 10 - 1, 5, "n", "d", 1), ERR_INVALID_AMOUNT));
        CHECK(failedWith(ledger.createDonation("alice", 10 * COIN + 1, 5, "n", "d", 1), ERR_INVALID_AMOUNT));
        CHECK(failedWith(ledger.createDonation("alice", 0, 5, "n", "d", 1), ERR_INVALID_AMOUNT));

        CHECK(ledger.getDonationCount() == 2);
    }

    TEST_CASE("Equity percentage bounds") {
        LedgerFixture fx;
        auto &ledger = *fx.ledger;

        CHECK(ledger.createDonation("alice", COIN, 1, "n", "d", 1).is_ok());
        CHECK(ledger.createDonation("alice", COIN, 10, "n", "d", 1).is_ok());

        CHECK(failedWith(ledger.createDonation("alice", COIN, 0, "n", "d", 1), ERR_INVALID_PERCENTAGE));
        CHECK(failedWith(ledger.createDonation("alice", COIN, 11, "n", "d", 1), ERR_INVALID_PERCENTAGE));
        CHECK(failedWith(ledger.createDonation("alice", COIN, 255, "n", "d", 1), ERR_INVALID_PERCENTAGE));
    }

    TEST_CASE("Text and valuation") {
        LedgerFixture fx;
        auto &ledger = *fx.ledger;

        CHECK(failedWith(ledger.createDonation("alice", COIN, 5, "", "d", 1), ERR_EMPTY_STRING));
        CHECK(failedWith(ledger.createDonation("alice", COIN, 5, "n", "", 1), ERR_EMPTY_STRING));
        CHECK(failedWith(ledger.createDonation("alice", COIN, 5, "n", "d", 0), ERR_ZERO_VALUE));
        CHECK(failedWith(ledger.createDonation("", COIN, 5, "n", "d", 1), ERR_INVALID_ADDRESS));
    }

    TEST_CASE("Failed creation changes nothing") {
        LedgerFixture fx;
        auto &ledger = *fx.ledger;

        CHECK(ledger.createDonation("alice", COIN, 0, "n", "d", 1).is_err());
        CHECK(ledger.getDonationCount() == 0);
        CHECK(ledger.getUserDonationCount("alice") == 0);
        CHECK_FALSE(ledger.hasRole("alice", Role::Donor));
        CHECK(fx.log.size() == 0);
        CHECK(failedWith(ledger.getDonation(0), ERR_DONATION_NOT_FOUND));
    }

    TEST_CASE("Creation emits one event with the record") {
        LedgerFixture fx;
        auto id = fx.create("alice");

        auto events = fx.log.events();
        REQUIRE(events.size() == 1);
        CHECK(events[0].getKind() == EventKind::DonationCreated);
        CHECK(events[0].donation_id == id);
        CHECK(events[0].getActor() == "alice");
        CHECK(events[0].amount == COIN);
        CHECK(events[0].timestamp == TEST_EPOCH);

        auto decoded = Donation::fromBytes(events[0].getPayloadBytes());
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value().getDonor() == "alice");
        CHECK(decoded.value().active);
    }

    TEST_CASE("Custom configuration") {
        ManualClock clock(0);
        BalanceBook book;
        EventLog log;
        LedgerConfig config;
        config.admin = "admin";
        config.min_donation_amount = 1;
        config.max_donation_amount = 100;
        config.funding_period_s = SECONDS_PER_DAY;
        DonationLedger ledger(config, clock, book, log);

        CHECK(ledger.createDonation("alice", 1, 5, "n", "d", 1).is_ok());
        CHECK(failedWith(ledger.createDonation("alice", COIN, 5, "n", "d", 1), ERR_INVALID_AMOUNT));
        CHECK(ledger.getDonation(0).value().funding_deadline == SECONDS_PER_DAY);
        CHECK(ledger.getConfig().max_donation_amount == 100);
    }
}
