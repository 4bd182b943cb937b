/**
 * Example: Conditional donation escrow, end to end
 *
 * This demo shows how to:
 * 1. Open a persistent ledger backed by SQLite
 * 2. Create, fund and distribute a donation through escrow
 * 3. Rate participants and inspect the hash-chained event journal
 * 4. Use the admin pause and emergency controls
 */

#include <escrowit.hpp>
#include <filesystem>
#include <iostream>

using namespace escrowit;
using namespace escrowit::ledger;

namespace {

    void report(const char *step, const dp::Result<void, dp::Error> &result) {
        if (result.is_ok()) {
            std::cout << "[ok]   " << step << std::endl;
        } else {
            std::cout << "[fail] " << step << ": " << result.error().message.c_str() << " (code "
                      << result.error().code << ")" << std::endl;
        }
    }

} // namespace

int main() {
    const std::string db_path = "escrow_demo.db";
    std::filesystem::remove(db_path);

    SystemClock clock;
    BalanceBook accounts;

    LedgerConfig config;
    config.admin = "treasury-admin";

    EscrowitStore node(config, clock, accounts);
    auto init = node.initialize(db_path);
    if (!init.is_ok()) {
        std::cerr << "Failed to open ledger: " << init.error().message.c_str() << std::endl;
        return 1;
    }

    auto &ledger = node.ledger();

    // ===========================================
    // Step 1: A donor opens an offer
    // ===========================================

    std::cout << "\n=== Step 1: Create donation ===" << std::endl;
    auto created = ledger.createDonation("donor-alice", 2 * COIN, 5, "Clean Water Initiative",
                                         "Drill and maintain three village wells", 250 * COIN);
    if (!created.is_ok()) {
        std::cerr << "Create failed: " << created.error().message.c_str() << std::endl;
        return 1;
    }
    dp::u64 id = created.value();
    std::cout << "Donation " << id << " open until " << ledger.getDonation(id).value().funding_deadline << std::endl;

    report("Extend funding period by 7 days", ledger.extendFundingPeriod(id, "donor-alice", 7));

    // ===========================================
    // Step 2: A nonprofit claims it
    // ===========================================

    std::cout << "\n=== Step 2: Fund donation ===" << std::endl;
    report("Self funding is refused", ledger.fundDonation(id, "donor-alice", 2 * COIN));
    report("Wrong value is refused", ledger.fundDonation(id, "water-charity", COIN));
    report("Fund with exact amount", ledger.fundDonation(id, "water-charity", 2 * COIN));
    std::cout << "Escrow balance: " << ledger.escrowBalance(id) << std::endl;

    // ===========================================
    // Step 3: The donor releases escrow
    // ===========================================

    std::cout << "\n=== Step 3: Distribute ===" << std::endl;
    report("Distribute to nonprofit", ledger.distributeDonation(id, "donor-alice"));
    report("Replay is refused", ledger.distributeDonation(id, "donor-alice"));
    std::cout << "water-charity balance: " << accounts.balanceOf("water-charity") << std::endl;

    // ===========================================
    // Step 4: Reputation
    // ===========================================

    std::cout << "\n=== Step 4: Reputation ===" << std::endl;
    auto rated = ledger.updateReputation("donor-alice", "water-charity", 5, "Wells delivered ahead of schedule");
    if (rated.is_ok()) {
        std::cout << "water-charity rated as " << reputationRoleToString(rated.value().role) << ": "
                  << static_cast<int>(rated.value().reputation.rating) << "/5" << std::endl;
    }
    auto again = ledger.updateReputation("donor-alice", "water-charity", 1, "changed my mind");
    std::cout << "Second rating accepted: " << (again.is_ok() ? "YES" : "NO") << std::endl;

    // ===========================================
    // Step 5: Admin controls
    // ===========================================

    std::cout << "\n=== Step 5: Admin controls ===" << std::endl;
    auto second = ledger.createDonation("donor-bob", COIN, 3, "School Meals", "A term of lunches", 40 * COIN);
    if (second.is_ok()) {
        report("Fund second donation", ledger.fundDonation(second.value(), "meal-program", COIN));
    }
    report("Pause by non-admin is refused", ledger.pause("donor-bob"));
    report("Pause", ledger.pause("treasury-admin"));
    auto blocked = ledger.createDonation("donor-carol", COIN, 1, "Library", "Books", 1);
    std::cout << "Create while paused refused: " << (failedWith(blocked, ERR_PAUSED) ? "YES" : "NO") << std::endl;

    auto swept = ledger.emergencyWithdraw("treasury-admin");
    if (swept.is_ok()) {
        std::cout << "Emergency withdrawal moved " << swept.value() << " to treasury-admin" << std::endl;
    }
    report("Unpause", ledger.unpause("treasury-admin"));

    // ===========================================
    // Step 6: Persist and inspect
    // ===========================================

    std::cout << "\n=== Step 6: Persist ===" << std::endl;
    report("Commit to SQLite", node.commit());

    auto consistent = node.verifyConsistency();
    std::cout << "Consistent: " << (consistent.is_ok() && consistent.value() ? "YES" : "NO") << std::endl;
    std::cout << "Stored events: " << node.store().getEventCount() << std::endl;
    std::cout << std::endl;

    ledger.printSummary();
    std::cout << std::endl;
    node.events().printSummary();

    return 0;
}
