#include <algorithm>
#include <escrowit/ledger/escrow_vault.hpp>
#include <limits>
#include <mutex>
#include <string>

namespace escrowit::ledger {

    dp::Result<void, dp::Error> EscrowVault::deposit(dp::u64 donation_id, Amount amount) {
        if (amount == 0) {
            return dp::Result<void, dp::Error>::err(zero_value("Deposit amount must be greater than zero"));
        }

        std::unique_lock lock(mutex_);

        auto it = balances_.find(donation_id);
        if (it != balances_.end() && it->second > 0) {
            return dp::Result<void, dp::Error>::err(invalid_amount("Escrow already funded for this donation"));
        }
        if (total_ > std::numeric_limits<Amount>::max() - amount) {
            return dp::Result<void, dp::Error>::err(amount_overflow("Vault custody total would overflow"));
        }

        balances_[donation_id] = amount;
        total_ += amount;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Amount, dp::Error> EscrowVault::release(dp::u64 donation_id, const Identity &recipient,
                                                       FundsTransport &transport) {
        return payout(donation_id, recipient, transport);
    }

    dp::Result<Amount, dp::Error> EscrowVault::refund(dp::u64 donation_id, const Identity &recipient,
                                                      FundsTransport &transport) {
        return payout(donation_id, recipient, transport);
    }

    dp::Result<Amount, dp::Error> EscrowVault::payout(dp::u64 donation_id, const Identity &recipient,
                                                      FundsTransport &transport) {
        if (isZeroAddress(recipient)) {
            return dp::Result<Amount, dp::Error>::err(invalid_address("Payout recipient is the zero address"));
        }

        Amount amount = 0;

        // Effects
        {
            std::unique_lock lock(mutex_);
            auto it = balances_.find(donation_id);
            if (it == balances_.end() || it->second == 0) {
                return dp::Result<Amount, dp::Error>::err(insufficient_funds());
            }
            if (swept_.count(donation_id) > 0) {
                return dp::Result<Amount, dp::Error>::err(
                    insufficient_funds("Escrow for this donation was taken by an emergency sweep"));
            }
            if (it->second > total_) {
                return dp::Result<Amount, dp::Error>::err(insufficient_funds("Vault custody has been swept"));
            }
            amount = it->second;
            balances_.erase(it);
            total_ -= amount;
        }

        // Interaction
        auto sent = transport.transfer(recipient, amount);
        if (!sent.is_ok()) {
            std::unique_lock lock(mutex_);
            balances_[donation_id] = amount;
            total_ += amount;
            std::string reason = "Transfer failed: " + std::string(sent.error().message.c_str());
            return dp::Result<Amount, dp::Error>::err(transfer_failed(dp::String(reason.c_str())));
        }

        return dp::Result<Amount, dp::Error>::ok(amount);
    }

    dp::Result<Amount, dp::Error> EscrowVault::sweep(const Identity &recipient, FundsTransport &transport) {
        if (isZeroAddress(recipient)) {
            return dp::Result<Amount, dp::Error>::err(invalid_address("Sweep recipient is the zero address"));
        }

        Amount amount = 0;
        std::vector<dp::u64> marked;
        {
            std::unique_lock lock(mutex_);
            if (total_ == 0) {
                return dp::Result<Amount, dp::Error>::err(insufficient_funds("Vault is empty"));
            }
            amount = total_;
            total_ = 0;
            for (const auto &[id, balance] : balances_) {
                if (balance > 0 && swept_.insert(id).second) {
                    marked.push_back(id);
                }
            }
        }

        auto sent = transport.transfer(recipient, amount);
        if (!sent.is_ok()) {
            std::unique_lock lock(mutex_);
            total_ += amount;
            for (auto id : marked) {
                swept_.erase(id);
            }
            std::string reason = "Transfer failed: " + std::string(sent.error().message.c_str());
            return dp::Result<Amount, dp::Error>::err(transfer_failed(dp::String(reason.c_str())));
        }

        return dp::Result<Amount, dp::Error>::ok(amount);
    }

    Amount EscrowVault::balanceOf(dp::u64 donation_id) const {
        std::shared_lock lock(mutex_);
        auto it = balances_.find(donation_id);
        return (it != balances_.end()) ? it->second : 0;
    }

    bool EscrowVault::isSwept(dp::u64 donation_id) const {
        std::shared_lock lock(mutex_);
        return swept_.count(donation_id) > 0;
    }

    Amount EscrowVault::totalCustodied() const {
        std::shared_lock lock(mutex_);
        return total_;
    }

    Amount EscrowVault::sumOfBalances() const {
        std::shared_lock lock(mutex_);
        Amount sum = 0;
        for (const auto &[id, balance] : balances_) {
            sum += balance;
        }
        return sum;
    }

    Amount EscrowVault::sumOfLiveBalances() const {
        std::shared_lock lock(mutex_);
        Amount sum = 0;
        for (const auto &[id, balance] : balances_) {
            if (swept_.count(id) == 0) {
                sum += balance;
            }
        }
        return sum;
    }

    std::vector<EscrowEntry> EscrowVault::entries() const {
        std::shared_lock lock(mutex_);
        std::vector<EscrowEntry> result;
        result.reserve(balances_.size());
        for (const auto &[id, balance] : balances_) {
            result.emplace_back(id, balance, swept_.count(id) > 0);
        }
        std::sort(result.begin(), result.end(),
                  [](const EscrowEntry &a, const EscrowEntry &b) { return a.donation_id < b.donation_id; });
        return result;
    }

    void EscrowVault::restore(const std::vector<EscrowEntry> &entries, Amount total_custodied) {
        std::unique_lock lock(mutex_);
        balances_.clear();
        swept_.clear();
        for (const auto &entry : entries) {
            if (entry.balance > 0) {
                balances_[entry.donation_id] = entry.balance;
                if (entry.isSwept()) {
                    swept_.insert(entry.donation_id);
                }
            }
        }
        total_ = total_custodied;
    }

    void EscrowVault::clear() {
        std::unique_lock lock(mutex_);
        balances_.clear();
        swept_.clear();
        total_ = 0;
    }

} // namespace escrowit::ledger
