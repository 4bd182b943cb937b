#pragma once

#include <escrowit/common/types.hpp>

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace escrowit::ledger {

    /// Lifecycle state derived from a donation's flags
    enum class DonationState : dp::u8 {
        Active = 0,
        Funded = 1,
        Distributed = 2,
        Cancelled = 3,
    };

    /// Get string name for donation state
    inline std::string donationStateToString(DonationState state) {
        switch (state) {
        case DonationState::Active:
            return "active";
        case DonationState::Funded:
            return "funded";
        case DonationState::Distributed:
            return "distributed";
        case DonationState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
        }
    }

    /// Donation record
    struct Donation {
        dp::u64 id{0};
        dp::String donor;             // Creator, immutable
        dp::String nonprofit;         // Funder, empty until funded
        dp::u64 amount{0};            // Base units
        dp::u8 equity_percentage{0};  // 1..10
        dp::i64 funding_deadline{0};  // Seconds since epoch
        dp::u64 valuation{0};
        dp::String nonprofit_name;
        dp::String description;
        bool active{false};
        bool distributed{false};
        bool cancelled{false};
        dp::i64 created_at{0};
        dp::i64 total_extension{0};   // Seconds added by extensions

        Donation() = default;

        inline std::string getDonor() const { return std::string(donor.c_str()); }

        inline std::string getNonprofit() const { return std::string(nonprofit.c_str()); }

        inline std::string getNonprofitName() const { return std::string(nonprofit_name.c_str()); }

        inline std::string getDescription() const { return std::string(description.c_str()); }

        inline bool isFunded() const { return !getNonprofit().empty(); }

        inline DonationState getState() const {
            if (distributed)
                return DonationState::Distributed;
            if (cancelled)
                return DonationState::Cancelled;
            if (active)
                return DonationState::Active;
            return DonationState::Funded;
        }

        /// For use as event or storage payload
        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<Donation &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        /// Deserialize from bytes
        inline static dp::Result<Donation, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, Donation>(buf);
                return dp::Result<Donation, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<Donation, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        auto members() {
            return std::tie(id, donor, nonprofit, amount, equity_percentage, funding_deadline, valuation,
                            nonprofit_name, description, active, distributed, cancelled, created_at, total_extension);
        }
        auto members() const {
            return std::tie(id, donor, nonprofit, amount, equity_percentage, funding_deadline, valuation,
                            nonprofit_name, description, active, distributed, cancelled, created_at, total_extension);
        }
    };

} // namespace escrowit::ledger
