#include <algorithm>
#include <escrowit/ledger/donation_ledger.hpp>
#include <iostream>
#include <limits>

namespace escrowit::ledger {

    DonationLedger::DonationLedger(const LedgerConfig &config, Clock &clock, FundsTransport &transport,
                                   EventSink &events)
        : config_(config), clock_(clock), transport_(transport), events_(events), access_(config.admin),
          reputation_(access_) {}

    // ===========================================
    // Donation lifecycle
    // ===========================================

    dp::Result<dp::u64, dp::Error> DonationLedger::createDonation(const Identity &donor, Amount amount,
                                                                  dp::u8 equity_percentage,
                                                                  const std::string &nonprofit_name,
                                                                  const std::string &description,
                                                                  dp::u64 valuation) {
        auto entry = checkEntry(false);
        if (!entry.is_ok())
            return dp::Result<dp::u64, dp::Error>::err(entry.error());
        CallGuard guard(in_call_);

        if (isZeroAddress(donor)) {
            return dp::Result<dp::u64, dp::Error>::err(invalid_address("Donor is the zero address"));
        }
        if (amount < config_.min_donation_amount || amount > config_.max_donation_amount) {
            return dp::Result<dp::u64, dp::Error>::err(invalid_amount("Amount outside allowed range"));
        }
        if (equity_percentage < config_.min_equity_percentage ||
            equity_percentage > config_.max_equity_percentage) {
            return dp::Result<dp::u64, dp::Error>::err(invalid_percentage());
        }
        if (nonprofit_name.empty() || description.empty()) {
            return dp::Result<dp::u64, dp::Error>::err(empty_string("Name and description are required"));
        }
        if (valuation == 0) {
            return dp::Result<dp::u64, dp::Error>::err(zero_value("Valuation must be greater than zero"));
        }

        Timestamp now = clock_.now();
        if (now > std::numeric_limits<Timestamp>::max() - config_.funding_period_s) {
            return dp::Result<dp::u64, dp::Error>::err(invalid_deadline("Funding deadline overflows"));
        }

        auto granted = access_.grant(donor, Role::Donor);
        if (!granted.is_ok())
            return dp::Result<dp::u64, dp::Error>::err(granted.error());

        Donation donation;
        donation.id = static_cast<dp::u64>(donations_.size());
        donation.donor = dp::String(donor.c_str());
        donation.amount = amount;
        donation.equity_percentage = equity_percentage;
        donation.funding_deadline = now + config_.funding_period_s;
        donation.valuation = valuation;
        donation.nonprofit_name = dp::String(nonprofit_name.c_str());
        donation.description = dp::String(description.c_str());
        donation.active = true;
        donation.created_at = now;

        donations_.push_back(donation);
        donor_counters_[donor] += 1;

        emitDonationEvent(EventKind::DonationCreated, donor, "", donation, amount);
        return dp::Result<dp::u64, dp::Error>::ok(donation.id);
    }

    dp::Result<void, dp::Error> DonationLedger::fundDonation(dp::u64 donation_id, const Identity &funder,
                                                             Amount supplied_value) {
        auto entry = checkEntry(false);
        if (!entry.is_ok())
            return entry;
        CallGuard guard(in_call_);

        Donation *donation = findDonation(donation_id);
        if (!donation)
            return dp::Result<void, dp::Error>::err(donation_not_found());

        if (isZeroAddress(funder)) {
            return dp::Result<void, dp::Error>::err(invalid_address("Funder is the zero address"));
        }
        if (!donation->active) {
            return dp::Result<void, dp::Error>::err(donation_not_active());
        }
        if (funder == donation->getDonor()) {
            return dp::Result<void, dp::Error>::err(unauthorized_access("Donor cannot fund own donation"));
        }
        if (supplied_value != donation->amount) {
            return dp::Result<void, dp::Error>::err(invalid_amount("Supplied value must equal donation amount"));
        }
        if (clock_.now() > donation->funding_deadline) {
            return dp::Result<void, dp::Error>::err(deadline_passed());
        }

        bool had_role = access_.hasRole(funder, Role::Nonprofit);
        auto granted = access_.grant(funder, Role::Nonprofit);
        if (!granted.is_ok())
            return granted;

        auto deposited = vault_.deposit(donation_id, supplied_value);
        if (!deposited.is_ok()) {
            if (!had_role) {
                auto revoked = access_.revoke(funder, Role::Nonprofit);
                if (!revoked.is_ok())
                    return revoked;
            }
            return deposited;
        }

        donation->nonprofit = dp::String(funder.c_str());
        donation->active = false;

        emitDonationEvent(EventKind::DonationFunded, funder, donation->getDonor(), *donation, supplied_value);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> DonationLedger::distributeDonation(dp::u64 donation_id, const Identity &caller) {
        auto entry = checkEntry(false);
        if (!entry.is_ok())
            return entry;
        CallGuard guard(in_call_);

        Donation *donation = findDonation(donation_id);
        if (!donation)
            return dp::Result<void, dp::Error>::err(donation_not_found());

        if (caller != donation->getDonor()) {
            return dp::Result<void, dp::Error>::err(unauthorized_access("Only the donor can distribute"));
        }
        if (donation->distributed) {
            return dp::Result<void, dp::Error>::err(already_distributed());
        }
        if (vault_.balanceOf(donation_id) == 0) {
            return dp::Result<void, dp::Error>::err(insufficient_funds());
        }

        // Effects before interaction; the vault zeroes the balance itself
        Identity recipient = donation->getNonprofit();
        donation->distributed = true;

        auto released = vault_.release(donation_id, recipient, transport_);
        if (!released.is_ok()) {
            donations_[donation_id].distributed = false;
            return dp::Result<void, dp::Error>::err(released.error());
        }

        const Donation &committed = donations_[donation_id];
        emitDonationEvent(EventKind::DonationDistributed, caller, recipient, committed, released.value());
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> DonationLedger::cancelDonation(dp::u64 donation_id, const Identity &caller) {
        auto entry = checkEntry(false);
        if (!entry.is_ok())
            return entry;
        CallGuard guard(in_call_);

        Donation *donation = findDonation(donation_id);
        if (!donation)
            return dp::Result<void, dp::Error>::err(donation_not_found());

        if (caller != donation->getDonor()) {
            return dp::Result<void, dp::Error>::err(unauthorized_access("Only the donor can cancel"));
        }
        if (!donation->active) {
            return dp::Result<void, dp::Error>::err(donation_not_active());
        }

        donation->active = false;
        donation->cancelled = true;

        Amount refunded = 0;
        if (vault_.balanceOf(donation_id) > 0) {
            auto refund = vault_.refund(donation_id, caller, transport_);
            if (!refund.is_ok()) {
                donations_[donation_id].active = true;
                donations_[donation_id].cancelled = false;
                return dp::Result<void, dp::Error>::err(refund.error());
            }
            refunded = refund.value();
        }

        const Donation &committed = donations_[donation_id];
        emitDonationEvent(EventKind::DonationCancelled, caller, "", committed, refunded);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> DonationLedger::extendFundingPeriod(dp::u64 donation_id, const Identity &caller,
                                                                    dp::u64 extension_days) {
        auto entry = checkEntry(false);
        if (!entry.is_ok())
            return entry;
        CallGuard guard(in_call_);

        Donation *donation = findDonation(donation_id);
        if (!donation)
            return dp::Result<void, dp::Error>::err(donation_not_found());

        if (caller != donation->getDonor()) {
            return dp::Result<void, dp::Error>::err(unauthorized_access("Only the donor can extend"));
        }
        if (!donation->active) {
            return dp::Result<void, dp::Error>::err(donation_not_active());
        }
        if (clock_.now() > donation->funding_deadline) {
            return dp::Result<void, dp::Error>::err(deadline_passed());
        }
        if (extension_days == 0) {
            return dp::Result<void, dp::Error>::err(zero_value("Extension must be at least one day"));
        }

        constexpr auto max_days = static_cast<dp::u64>(std::numeric_limits<Timestamp>::max() / SECONDS_PER_DAY);
        if (extension_days > max_days) {
            return dp::Result<void, dp::Error>::err(invalid_deadline("Extension overflows"));
        }
        Timestamp extension = static_cast<Timestamp>(extension_days) * SECONDS_PER_DAY;

        if (extension > config_.max_extension_period_s - donation->total_extension) {
            return dp::Result<void, dp::Error>::err(invalid_deadline("Maximum extension period exceeded"));
        }
        if (donation->funding_deadline > std::numeric_limits<Timestamp>::max() - extension) {
            return dp::Result<void, dp::Error>::err(invalid_deadline("Funding deadline overflows"));
        }

        donation->funding_deadline += extension;
        donation->total_extension += extension;

        emitDonationEvent(EventKind::FundingPeriodExtended, caller, "", *donation, 0);
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Reputation
    // ===========================================

    dp::Result<RatingOutcome, dp::Error> DonationLedger::updateReputation(const Identity &rater,
                                                                          const Identity &subject, dp::u8 rating,
                                                                          const std::string &review) {
        auto entry = checkEntry(false);
        if (!entry.is_ok())
            return dp::Result<RatingOutcome, dp::Error>::err(entry.error());
        CallGuard guard(in_call_);

        auto outcome =
            reputation_.rate(subject, rater, rating, review, getUserDonationCount(subject), clock_.now());
        if (!outcome.is_ok())
            return outcome;

        LedgerEvent event(EventKind::ReputationUpdated, rater, subject);
        event.detail = rating;
        event.amount = static_cast<dp::u64>(outcome.value().role);
        UserReputation aggregate = outcome.value().reputation;
        auto buf = dp::serialize<dp::Mode::WITH_VERSION>(aggregate);
        event.setPayload(std::vector<uint8_t>(buf.begin(), buf.end()));
        emitEvent(std::move(event));

        return outcome;
    }

    // ===========================================
    // Administration
    // ===========================================

    dp::Result<void, dp::Error> DonationLedger::pause(const Identity &caller) {
        auto entry = checkEntry(true);
        if (!entry.is_ok())
            return entry;
        CallGuard guard(in_call_);

        auto admin = access_.requireRole(caller, Role::Admin);
        if (!admin.is_ok())
            return admin;
        if (paused_)
            return dp::Result<void, dp::Error>::err(paused("Ledger is already paused"));

        paused_ = true;
        emitEvent(LedgerEvent(EventKind::Paused, caller));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> DonationLedger::unpause(const Identity &caller) {
        auto entry = checkEntry(true);
        if (!entry.is_ok())
            return entry;
        CallGuard guard(in_call_);

        auto admin = access_.requireRole(caller, Role::Admin);
        if (!admin.is_ok())
            return admin;
        if (!paused_)
            return dp::Result<void, dp::Error>::err(not_paused());

        paused_ = false;
        emitEvent(LedgerEvent(EventKind::Unpaused, caller));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Amount, dp::Error> DonationLedger::emergencyWithdraw(const Identity &caller) {
        auto entry = checkEntry(true);
        if (!entry.is_ok())
            return dp::Result<Amount, dp::Error>::err(entry.error());
        CallGuard guard(in_call_);

        auto admin = access_.requireRole(caller, Role::Admin);
        if (!admin.is_ok())
            return dp::Result<Amount, dp::Error>::err(admin.error());

        auto swept = vault_.sweep(caller, transport_);
        if (!swept.is_ok())
            return swept;

        LedgerEvent event(EventKind::EmergencyWithdrawal, caller, caller);
        event.amount = swept.value();
        emitEvent(std::move(event));
        return swept;
    }

    dp::Result<void, dp::Error> DonationLedger::grantRole(const Identity &caller, const Identity &identity,
                                                          Role role) {
        auto entry = checkEntry(true);
        if (!entry.is_ok())
            return entry;
        CallGuard guard(in_call_);

        auto admin = access_.requireRole(caller, Role::Admin);
        if (!admin.is_ok())
            return admin;
        if (access_.hasRole(identity, role))
            return dp::Result<void, dp::Error>::ok();

        auto granted = access_.grant(identity, role);
        if (!granted.is_ok())
            return granted;

        LedgerEvent event(EventKind::RoleGranted, caller, identity);
        event.detail = static_cast<dp::u8>(role);
        emitEvent(std::move(event));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> DonationLedger::revokeRole(const Identity &caller, const Identity &identity,
                                                           Role role) {
        auto entry = checkEntry(true);
        if (!entry.is_ok())
            return entry;
        CallGuard guard(in_call_);

        auto admin = access_.requireRole(caller, Role::Admin);
        if (!admin.is_ok())
            return admin;
        if (!access_.hasRole(identity, role))
            return dp::Result<void, dp::Error>::ok();
        if (role == Role::Admin && access_.memberCount(Role::Admin) == 1) {
            return dp::Result<void, dp::Error>::err(unauthorized_access("Cannot revoke the last admin"));
        }

        auto revoked = access_.revoke(identity, role);
        if (!revoked.is_ok())
            return revoked;

        LedgerEvent event(EventKind::RoleRevoked, caller, identity);
        event.detail = static_cast<dp::u8>(role);
        emitEvent(std::move(event));
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Queries
    // ===========================================

    dp::Result<Donation, dp::Error> DonationLedger::getDonation(dp::u64 donation_id) const {
        const Donation *donation = findDonation(donation_id);
        if (!donation)
            return dp::Result<Donation, dp::Error>::err(donation_not_found());
        return dp::Result<Donation, dp::Error>::ok(*donation);
    }

    ReputationProfile DonationLedger::getReputation(const Identity &identity) const {
        return reputation_.reputationOf(identity);
    }

    dp::u64 DonationLedger::getDonationCount() const { return static_cast<dp::u64>(donations_.size()); }

    std::vector<dp::u64> DonationLedger::getDonationsByDonor(const Identity &donor) const {
        std::vector<dp::u64> result;
        for (const auto &donation : donations_) {
            if (donation.getDonor() == donor)
                result.push_back(donation.id);
        }
        return result;
    }

    std::vector<dp::u64> DonationLedger::getDonationsByNonprofit(const Identity &nonprofit) const {
        std::vector<dp::u64> result;
        if (isZeroAddress(nonprofit))
            return result;
        for (const auto &donation : donations_) {
            if (donation.getNonprofit() == nonprofit)
                result.push_back(donation.id);
        }
        return result;
    }

    dp::u64 DonationLedger::getUserDonationCount(const Identity &identity) const {
        auto it = donor_counters_.find(identity);
        return (it != donor_counters_.end()) ? it->second : 0;
    }

    Amount DonationLedger::escrowBalance(dp::u64 donation_id) const { return vault_.balanceOf(donation_id); }

    Amount DonationLedger::totalEscrowed() const { return vault_.totalCustodied(); }

    bool DonationLedger::isPaused() const { return paused_; }

    bool DonationLedger::hasRole(const Identity &identity, Role role) const { return access_.hasRole(identity, role); }

    const LedgerConfig &DonationLedger::getConfig() const { return config_; }

    const AccessControlRegistry &DonationLedger::getAccessControl() const { return access_; }

    // ===========================================
    // Snapshots
    // ===========================================

    LedgerSnapshot DonationLedger::snapshot() const {
        LedgerSnapshot snap;
        snap.donations = donations_;
        snap.escrow = vault_.entries();
        snap.total_custodied = vault_.totalCustodied();
        snap.reputations = reputation_.entries();
        snap.rating_keys = reputation_.ratingKeys();
        snap.roles = access_.assignments();
        for (const auto &[identity, count] : donor_counters_) {
            snap.donor_counters.push_back(DonorCounter{identity, count});
        }
        std::sort(snap.donor_counters.begin(), snap.donor_counters.end(),
                  [](const DonorCounter &a, const DonorCounter &b) { return a.identity < b.identity; });
        snap.paused = paused_;
        return snap;
    }

    dp::Result<void, dp::Error> DonationLedger::restore(const LedgerSnapshot &snapshot) {
        if (in_call_)
            return dp::Result<void, dp::Error>::err(reentrant_call());

        for (size_t i = 0; i < snapshot.donations.size(); ++i) {
            if (snapshot.donations[i].id != i) {
                return dp::Result<void, dp::Error>::err(
                    storage_failed("Snapshot donation ids are not sequential from zero"));
            }
        }
        for (const auto &membership : snapshot.roles) {
            if (isZeroAddress(membership.first)) {
                return dp::Result<void, dp::Error>::err(invalid_address("Snapshot role held by zero address"));
            }
        }

        access_.clear();
        for (const auto &[identity, role] : snapshot.roles) {
            auto granted = access_.grant(identity, role);
            if (!granted.is_ok())
                return granted;
        }

        donations_ = snapshot.donations;
        vault_.restore(snapshot.escrow, snapshot.total_custodied);
        reputation_.restore(snapshot.reputations, snapshot.rating_keys);

        donor_counters_.clear();
        for (const auto &counter : snapshot.donor_counters) {
            donor_counters_[counter.identity] = counter.count;
        }
        paused_ = snapshot.paused;
        return dp::Result<void, dp::Error>::ok();
    }

    void DonationLedger::printSummary() const {
        size_t active = 0, funded = 0, distributed = 0, cancelled = 0;
        for (const auto &donation : donations_) {
            switch (donation.getState()) {
            case DonationState::Active:
                ++active;
                break;
            case DonationState::Funded:
                ++funded;
                break;
            case DonationState::Distributed:
                ++distributed;
                break;
            case DonationState::Cancelled:
                ++cancelled;
                break;
            }
        }

        std::cout << "=== Donation Ledger Summary ===" << std::endl;
        std::cout << "Admin: " << config_.admin << std::endl;
        std::cout << "Paused: " << (paused_ ? "YES" : "NO") << std::endl;
        std::cout << "Donations: " << donations_.size() << " (active " << active << ", funded " << funded
                  << ", distributed " << distributed << ", cancelled " << cancelled << ")" << std::endl;
        std::cout << "Escrow custody: " << vault_.totalCustodied() << " (per-donation sum " << vault_.sumOfBalances()
                  << ")" << std::endl;
        std::cout << std::endl;
        access_.printSummary();
    }

    // ===========================================
    // Internals
    // ===========================================

    dp::Result<void, dp::Error> DonationLedger::checkEntry(bool allow_paused) const {
        if (paused_ && !allow_paused)
            return dp::Result<void, dp::Error>::err(paused());
        if (in_call_)
            return dp::Result<void, dp::Error>::err(reentrant_call());
        return dp::Result<void, dp::Error>::ok();
    }

    Donation *DonationLedger::findDonation(dp::u64 donation_id) {
        if (donation_id >= donations_.size())
            return nullptr;
        return &donations_[donation_id];
    }

    const Donation *DonationLedger::findDonation(dp::u64 donation_id) const {
        if (donation_id >= donations_.size())
            return nullptr;
        return &donations_[donation_id];
    }

    void DonationLedger::emitDonationEvent(EventKind kind, const Identity &actor, const Identity &subject,
                                           const Donation &donation, Amount amount) {
        LedgerEvent event(kind, actor, subject);
        event.donation_id = donation.id;
        event.amount = amount;
        event.setPayload(donation.toBytes());
        emitEvent(std::move(event));
    }

    void DonationLedger::emitEvent(LedgerEvent event) {
        event.timestamp = clock_.now();
        EventKind kind = event.getKind();
        auto published = events_.publish(std::move(event));
        if (!published.is_ok()) {
            std::cerr << "Event " << eventKindToString(kind)
                      << " not recorded: " << published.error().message.c_str() << std::endl;
        }
    }

} // namespace escrowit::ledger
