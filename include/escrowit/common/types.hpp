#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <string>

namespace escrowit {

    /// Account identity on the hosting ledger. The empty string is the zero address.
    using Identity = std::string;

    /// Monetary value in base units
    using Amount = dp::u64;

    /// Seconds since the Unix epoch
    using Timestamp = dp::i64;

    /// Base units per whole coin
    constexpr Amount COIN = 1000000000ULL;

    constexpr Timestamp SECONDS_PER_DAY = 86400;

    /// Roles held by identities
    enum class Role : dp::u8 {
        Admin = 0,
        Nonprofit = 1,
        Donor = 2,
    };

    /// Get string name for role
    inline std::string roleToString(Role role) {
        switch (role) {
        case Role::Admin:
            return "ADMIN";
        case Role::Nonprofit:
            return "NONPROFIT";
        case Role::Donor:
            return "DONOR";
        default:
            return "UNKNOWN";
        }
    }

    inline bool isZeroAddress(const Identity &identity) { return identity.empty(); }

    // ===========================================
    // Clock
    // ===========================================

    /// Time source for deadline evaluation
    class Clock {
      public:
        virtual ~Clock() = default;

        /// Current time in seconds since epoch
        virtual Timestamp now() const = 0;
    };

    /// Wall clock
    class SystemClock : public Clock {
      public:
        inline Timestamp now() const override {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }
    };

    /// Clock that only moves when told to
    class ManualClock : public Clock {
      public:
        inline explicit ManualClock(Timestamp start = 0) : now_(start) {}

        inline Timestamp now() const override { return now_; }

        inline void set(Timestamp t) { now_ = t; }

        inline void advance(Timestamp seconds) { now_ += seconds; }

        inline void advanceDays(Timestamp days) { now_ += days * SECONDS_PER_DAY; }

      private:
        Timestamp now_;
    };

} // namespace escrowit
