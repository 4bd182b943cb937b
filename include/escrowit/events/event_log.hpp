#pragma once

#include <escrowit/common/error.hpp>
#include <escrowit/common/types.hpp>

#include <datapod/datapod.hpp>
#include <iostream>
#include <keylock/keylock.hpp>
#include <shared_mutex>
#include <string>
#include <vector>

namespace escrowit {

    /// Committed transition types
    enum class EventKind : dp::u8 {
        DonationCreated = 0,
        DonationFunded = 1,
        DonationDistributed = 2,
        DonationCancelled = 3,
        FundingPeriodExtended = 4,
        ReputationUpdated = 5,
        Paused = 6,
        Unpaused = 7,
        EmergencyWithdrawal = 8,
        RoleGranted = 9,
        RoleRevoked = 10,
    };

    /// Get string name for event kind
    inline std::string eventKindToString(EventKind kind) {
        switch (kind) {
        case EventKind::DonationCreated:
            return "DonationCreated";
        case EventKind::DonationFunded:
            return "DonationFunded";
        case EventKind::DonationDistributed:
            return "DonationDistributed";
        case EventKind::DonationCancelled:
            return "DonationCancelled";
        case EventKind::FundingPeriodExtended:
            return "FundingPeriodExtended";
        case EventKind::ReputationUpdated:
            return "ReputationUpdated";
        case EventKind::Paused:
            return "Paused";
        case EventKind::Unpaused:
            return "Unpaused";
        case EventKind::EmergencyWithdrawal:
            return "EmergencyWithdrawal";
        case EventKind::RoleGranted:
            return "RoleGranted";
        case EventKind::RoleRevoked:
            return "RoleRevoked";
        default:
            return "Unknown";
        }
    }

    /// Hash that precedes the first event
    inline const std::string &genesisEventHash() {
        static const std::string genesis(64, '0');
        return genesis;
    }

    /// One committed transition
    struct LedgerEvent {
        dp::u64 sequence{0};
        dp::u8 kind{0};              // EventKind
        dp::u64 donation_id{0};      // Donation events only
        dp::String actor;            // Caller
        dp::String subject;          // Counterparty, rated identity or role holder
        dp::u64 amount{0};           // Value moved or donation amount
        dp::u8 detail{0};            // Rating or role, by kind
        dp::i64 timestamp{0};
        dp::Vector<dp::u8> payload;  // Serialized Donation or UserReputation
        dp::String prev_hash;
        dp::String hash;

        LedgerEvent() = default;

        LedgerEvent(EventKind k, const Identity &actor_id, const Identity &subject_id = "")
            : kind(static_cast<dp::u8>(k)), actor(dp::String(actor_id.c_str())),
              subject(dp::String(subject_id.c_str())) {}

        inline EventKind getKind() const { return static_cast<EventKind>(kind); }

        inline std::string getActor() const { return std::string(actor.c_str()); }

        inline std::string getSubject() const { return std::string(subject.c_str()); }

        inline std::string getHash() const { return std::string(hash.c_str()); }

        inline std::string getPrevHash() const { return std::string(prev_hash.c_str()); }

        inline std::vector<uint8_t> getPayloadBytes() const {
            return std::vector<uint8_t>(payload.begin(), payload.end());
        }

        inline void setPayload(const std::vector<uint8_t> &bytes) {
            payload = dp::Vector<dp::u8>(bytes.begin(), bytes.end());
        }

        auto members() {
            return std::tie(sequence, kind, donation_id, actor, subject, amount, detail, timestamp, payload,
                            prev_hash, hash);
        }
        auto members() const {
            return std::tie(sequence, kind, donation_id, actor, subject, amount, detail, timestamp, payload,
                            prev_hash, hash);
        }
    };

    /// SHA-256 over the event with its own hash field cleared, hex encoded
    inline dp::Result<std::string, dp::Error> computeEventHash(const LedgerEvent &event) {
        LedgerEvent copy = event;
        copy.hash = dp::String();
        auto buf = dp::serialize<dp::Mode::WITH_VERSION>(copy);
        std::vector<uint8_t> input(buf.begin(), buf.end());

        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto result = crypto.hash(input);
        if (!result.success) {
            return dp::Result<std::string, dp::Error>::err(dp::Error::io_error("SHA256 hashing failed"));
        }
        return dp::Result<std::string, dp::Error>::ok(keylock::keylock::to_hex(result.data));
    }

    // ===========================================
    // Extension Interface - indexers implement this
    // ===========================================

    /// Receives one event per committed ledger transition
    class EventSink {
      public:
        virtual ~EventSink() = default;

        /// An error means the event was not recorded
        virtual dp::Result<void, dp::Error> publish(LedgerEvent event) = 0;
    };

    /// Append-only, hash-chained in-memory event journal
    class EventLog : public EventSink {
      public:
        EventLog() = default;

        EventLog(const EventLog &) = delete;
        EventLog &operator=(const EventLog &) = delete;

        /// Link and append `event`. An event that cannot be hashed is not
        /// appended; the refusal is counted and reported by verifyChain().
        inline dp::Result<void, dp::Error> publish(LedgerEvent event) override {
            std::unique_lock lock(mutex_);
            event.sequence = static_cast<dp::u64>(events_.size());
            event.prev_hash = dp::String(lastHashLocked().c_str());
            auto hashed = computeEventHash(event);
            if (!hashed.is_ok()) {
                if (rejected_ == 0) {
                    first_rejection_ = std::string(eventKindToString(event.getKind())) + ": " +
                                       std::string(hashed.error().message.c_str());
                }
                ++rejected_;
                return dp::Result<void, dp::Error>::err(hashed.error());
            }
            event.hash = dp::String(hashed.value().c_str());
            events_.push_back(std::move(event));
            return dp::Result<void, dp::Error>::ok();
        }

        inline std::vector<LedgerEvent> events() const {
            std::shared_lock lock(mutex_);
            return events_;
        }

        inline std::vector<LedgerEvent> eventsFor(dp::u64 donation_id) const {
            std::shared_lock lock(mutex_);
            std::vector<LedgerEvent> result;
            for (const auto &event : events_) {
                if (isDonationEvent(event.getKind()) && event.donation_id == donation_id) {
                    result.push_back(event);
                }
            }
            return result;
        }

        inline std::vector<LedgerEvent> eventsOfKind(EventKind kind) const {
            std::shared_lock lock(mutex_);
            std::vector<LedgerEvent> result;
            for (const auto &event : events_) {
                if (event.getKind() == kind) {
                    result.push_back(event);
                }
            }
            return result;
        }

        inline size_t size() const {
            std::shared_lock lock(mutex_);
            return events_.size();
        }

        inline std::string lastHash() const {
            std::shared_lock lock(mutex_);
            return lastHashLocked();
        }

        /// Recompute every hash and check the links
        inline dp::Result<void, dp::Error> verifyChain() const {
            std::shared_lock lock(mutex_);
            if (rejected_ > 0) {
                std::string msg = std::to_string(rejected_) + " event(s) could not be recorded, first was " +
                                  first_rejection_;
                return dp::Result<void, dp::Error>::err(dp::Error::io_error(dp::String(msg.c_str())));
            }
            std::string expected_prev = genesisEventHash();
            for (size_t i = 0; i < events_.size(); ++i) {
                const auto &event = events_[i];
                std::string at = " at sequence " + std::to_string(i);
                if (event.sequence != i) {
                    return dp::Result<void, dp::Error>::err(
                        dp::Error::invalid_argument(dp::String(("Sequence gap" + at).c_str())));
                }
                if (event.getPrevHash() != expected_prev) {
                    return dp::Result<void, dp::Error>::err(
                        dp::Error::invalid_argument(dp::String(("Broken link" + at).c_str())));
                }
                auto hashed = computeEventHash(event);
                if (!hashed.is_ok()) {
                    return dp::Result<void, dp::Error>::err(hashed.error());
                }
                const std::string &recomputed = hashed.value();
                if (event.getHash() != recomputed) {
                    return dp::Result<void, dp::Error>::err(
                        dp::Error::invalid_argument(dp::String(("Hash mismatch" + at).c_str())));
                }
                expected_prev = recomputed;
            }
            return dp::Result<void, dp::Error>::ok();
        }

        /// Replace the journal with previously persisted events
        inline void restore(std::vector<LedgerEvent> events) {
            std::unique_lock lock(mutex_);
            events_ = std::move(events);
            rejected_ = 0;
            first_rejection_.clear();
        }

        /// Events refused because they could not be hashed
        inline size_t rejectedCount() const {
            std::shared_lock lock(mutex_);
            return rejected_;
        }

        inline void printSummary() const {
            std::shared_lock lock(mutex_);
            std::cout << "=== Event Log Summary ===" << std::endl;
            std::cout << "Events: " << events_.size() << std::endl;
            for (const auto &event : events_) {
                std::cout << "  #" << event.sequence << " " << eventKindToString(event.getKind())
                          << " actor=" << event.getActor();
                if (isDonationEvent(event.getKind()))
                    std::cout << " donation=" << event.donation_id;
                if (event.amount > 0)
                    std::cout << " amount=" << event.amount;
                std::cout << std::endl;
            }
            if (!events_.empty()) {
                std::cout << "Head hash: " << events_.back().getHash().substr(0, 16) << "..." << std::endl;
            }
        }

        inline static bool isDonationEvent(EventKind kind) {
            return kind == EventKind::DonationCreated || kind == EventKind::DonationFunded ||
                   kind == EventKind::DonationDistributed || kind == EventKind::DonationCancelled ||
                   kind == EventKind::FundingPeriodExtended;
        }

      private:
        inline std::string lastHashLocked() const {
            return events_.empty() ? genesisEventHash() : events_.back().getHash();
        }

        std::vector<LedgerEvent> events_;
        size_t rejected_ = 0;
        std::string first_rejection_;
        mutable std::shared_mutex mutex_;
    };

} // namespace escrowit
