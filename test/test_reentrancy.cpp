#include "test_support.hpp"

#include <vector>

TEST_SUITE("Reentrancy Tests") {
    TEST_CASE("Nested distribute is rejected and sees zero escrow") {
        CallbackTransport transport;
        LedgerFixture fx(transport);
        auto id = fx.createFunded("alice", "water-org");

        std::vector<dp::Result<void, dp::Error>> nested;
        Amount seen_balance = COIN;
        bool seen_distributed = false;
        transport.on_transfer = [&](const Identity &, Amount) {
            seen_balance = fx.ledger->escrowBalance(id);
            seen_distributed = fx.ledger->getDonation(id).value().distributed;
            nested.push_back(fx.ledger->distributeDonation(id, "alice"));
        };

        CHECK(fx.ledger->distributeDonation(id, "alice").is_ok());

        REQUIRE(nested.size() == 1);
        CHECK(failedWith(nested[0], ERR_REENTRANT_CALL));
        CHECK(seen_balance == 0);
        CHECK(seen_distributed);
        CHECK(transport.book.balanceOf("water-org") == COIN);
        CHECK(transport.book.totalPaidOut() == COIN);
        CHECK(fx.log.eventsOfKind(EventKind::DonationDistributed).size() == 1);
    }

    TEST_CASE("Every mutating entry point is locked during a transfer") {
        CallbackTransport transport;
        LedgerFixture fx(transport);
        auto id = fx.createFunded("alice", "water-org");
        auto other = fx.create("bob");

        std::vector<dp::u32> codes;
        transport.on_transfer = [&](const Identity &, Amount) {
            auto &ledger = *fx.ledger;
            auto code = [](const auto &result) { return result.is_err() ? result.error().code : 0u; };
            codes.push_back(code(ledger.createDonation("carol", COIN, 5, "n", "d", 1)));
            codes.push_back(code(ledger.fundDonation(other, "water-org", COIN)));
            codes.push_back(code(ledger.cancelDonation(other, "bob")));
            codes.push_back(code(ledger.extendFundingPeriod(other, "bob", 1)));
            codes.push_back(code(ledger.updateReputation("bob", "alice", 5, "great")));
            codes.push_back(code(ledger.pause("admin")));
            codes.push_back(code(ledger.emergencyWithdraw("admin")));
            codes.push_back(code(ledger.grantRole("admin", "eve", Role::Admin)));
        };

        REQUIRE(fx.ledger->distributeDonation(id, "alice").is_ok());

        REQUIRE(codes.size() == 8);
        for (auto c : codes) {
            CHECK(c == ERR_REENTRANT_CALL);
        }
        CHECK(fx.ledger->getDonationCount() == 2);
        CHECK(fx.donation(other).active);
        CHECK_FALSE(fx.ledger->isPaused());
        CHECK_FALSE(fx.ledger->hasRole("eve", Role::Admin));
    }

    TEST_CASE("Lock is released after a failed transfer") {
        CallbackTransport transport;
        transport.fail_after_callback = true;
        LedgerFixture fx(transport);
        auto id = fx.createFunded("alice", "water-org");

        CHECK(failedWith(fx.ledger->distributeDonation(id, "alice"), ERR_TRANSFER_FAILED));

        // The ledger accepts new calls again
        CHECK(fx.ledger->createDonation("bob", COIN, 5, "n", "d", 1).is_ok());
    }

    TEST_CASE("Reentrant refund attempt during emergency withdrawal") {
        CallbackTransport transport;
        LedgerFixture fx(transport);
        auto id = fx.createFunded("alice", "water-org");

        dp::Result<void, dp::Error> nested = dp::Result<void, dp::Error>::ok();
        transport.on_transfer = [&](const Identity &, Amount) { nested = fx.ledger->distributeDonation(id, "alice"); };

        auto swept = fx.ledger->emergencyWithdraw("admin");
        REQUIRE(swept.is_ok());
        CHECK(swept.value() == COIN);
        CHECK(failedWith(nested, ERR_REENTRANT_CALL));
        CHECK(transport.book.balanceOf("admin") == COIN);
        CHECK(transport.book.balanceOf("water-org") == 0);
    }

    TEST_CASE("Restore is refused during a transfer") {
        CallbackTransport transport;
        LedgerFixture fx(transport);
        auto id = fx.createFunded("alice", "water-org");
        auto snapshot = fx.ledger->snapshot();

        dp::Result<void, dp::Error> nested = dp::Result<void, dp::Error>::ok();
        transport.on_transfer = [&](const Identity &, Amount) { nested = fx.ledger->restore(snapshot); };

        REQUIRE(fx.ledger->distributeDonation(id, "alice").is_ok());
        CHECK(failedWith(nested, ERR_REENTRANT_CALL));
        CHECK(fx.donation(id).distributed);
    }
}
