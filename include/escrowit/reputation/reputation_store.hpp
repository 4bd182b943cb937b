#pragma once

#include <escrowit/common/error.hpp>
#include <escrowit/common/types.hpp>
#include <escrowit/ledger/access_control.hpp>

#include <datapod/datapod.hpp>
#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <vector>

namespace escrowit {

    constexpr dp::u8 MIN_RATING = 1;
    constexpr dp::u8 MAX_RATING = 5;

    /// Which of an identity's two aggregates a rating lands in
    enum class ReputationRole : dp::u8 {
        Donor = 0,
        Nonprofit = 1,
    };

    /// Get string name for reputation role
    inline std::string reputationRoleToString(ReputationRole role) {
        switch (role) {
        case ReputationRole::Donor:
            return "donor";
        case ReputationRole::Nonprofit:
            return "nonprofit";
        default:
            return "unknown";
        }
    }

    /// Running rating aggregate
    struct UserReputation {
        dp::u8 rating{0};         // Integer average, 1..5 once rated
        dp::u64 total_ratings{0};
        dp::i64 last_updated{0};
        dp::String review;        // Latest review only

        inline std::string getReview() const { return std::string(review.c_str()); }

        auto members() { return std::tie(rating, total_ratings, last_updated, review); }
        auto members() const { return std::tie(rating, total_ratings, last_updated, review); }
    };

    /// Both aggregates of one identity
    struct ReputationProfile {
        UserReputation as_donor;
        UserReputation as_nonprofit;
    };

    /// Result of a successful rating
    struct RatingOutcome {
        ReputationRole role{ReputationRole::Donor};
        UserReputation reputation;
    };

    /// Aggregate row, used for snapshots
    struct ReputationEntry {
        Identity identity;
        ReputationRole role{ReputationRole::Donor};
        UserReputation reputation;
    };

    /// Deduplication key of a recorded rating
    struct RatingKey {
        Identity rater;
        Identity subject;
        dp::u64 epoch{0};

        inline bool operator<(const RatingKey &other) const {
            return std::tie(rater, subject, epoch) < std::tie(other.rater, other.subject, other.epoch);
        }
    };

    /// Identity -> rating aggregates.
    ///
    /// A rater may rate a subject once per epoch. The caller supplies the epoch;
    /// DonationLedger passes the subject's donation counter, so a new rating
    /// becomes possible each time the subject creates a donation.
    class ReputationStore {
      public:
        inline explicit ReputationStore(const ledger::AccessControlRegistry &access) : access_(access) {}

        ReputationStore(const ReputationStore &) = delete;
        ReputationStore &operator=(const ReputationStore &) = delete;

        /// Fold a rating into the subject's aggregate for its current role
        inline dp::Result<RatingOutcome, dp::Error> rate(const Identity &subject, const Identity &rater,
                                                         dp::u8 rating, const std::string &review, dp::u64 epoch,
                                                         Timestamp now) {
            if (isZeroAddress(subject) || isZeroAddress(rater)) {
                return dp::Result<RatingOutcome, dp::Error>::err(invalid_address());
            }
            if (rating < MIN_RATING || rating > MAX_RATING) {
                return dp::Result<RatingOutcome, dp::Error>::err(invalid_rating());
            }
            if (review.empty()) {
                return dp::Result<RatingOutcome, dp::Error>::err(empty_string("Review must not be empty"));
            }

            auto role = roleFor(subject);
            RatingKey key{rater, subject, epoch};

            std::unique_lock lock(mutex_);

            if (rated_.count(key) > 0) {
                return dp::Result<RatingOutcome, dp::Error>::err(already_rated());
            }

            auto &agg = aggregates_[{subject, role}];
            dp::u64 count = agg.total_ratings;
            agg.rating = static_cast<dp::u8>((static_cast<dp::u64>(agg.rating) * count + rating) / (count + 1));
            agg.total_ratings = count + 1;
            agg.last_updated = now;
            agg.review = dp::String(review.c_str());
            rated_.insert(key);

            return dp::Result<RatingOutcome, dp::Error>::ok(RatingOutcome{role, agg});
        }

        /// Aggregate a rating of `subject` would update right now
        inline ReputationRole roleFor(const Identity &subject) const {
            return access_.hasRole(subject, Role::Nonprofit) ? ReputationRole::Nonprofit : ReputationRole::Donor;
        }

        inline ReputationProfile reputationOf(const Identity &identity) const {
            std::shared_lock lock(mutex_);
            ReputationProfile profile;
            auto donor_it = aggregates_.find({identity, ReputationRole::Donor});
            if (donor_it != aggregates_.end())
                profile.as_donor = donor_it->second;
            auto np_it = aggregates_.find({identity, ReputationRole::Nonprofit});
            if (np_it != aggregates_.end())
                profile.as_nonprofit = np_it->second;
            return profile;
        }

        inline bool hasRated(const Identity &rater, const Identity &subject, dp::u64 epoch) const {
            std::shared_lock lock(mutex_);
            return rated_.count(RatingKey{rater, subject, epoch}) > 0;
        }

        // === Snapshot support ===

        inline std::vector<ReputationEntry> entries() const {
            std::shared_lock lock(mutex_);
            std::vector<ReputationEntry> result;
            for (const auto &[key, agg] : aggregates_) {
                result.push_back(ReputationEntry{key.first, key.second, agg});
            }
            return result;
        }

        inline std::vector<RatingKey> ratingKeys() const {
            std::shared_lock lock(mutex_);
            return std::vector<RatingKey>(rated_.begin(), rated_.end());
        }

        inline void restore(const std::vector<ReputationEntry> &entries, const std::vector<RatingKey> &keys) {
            std::unique_lock lock(mutex_);
            aggregates_.clear();
            rated_.clear();
            for (const auto &entry : entries) {
                aggregates_[{entry.identity, entry.role}] = entry.reputation;
            }
            rated_.insert(keys.begin(), keys.end());
        }

        inline void clear() {
            std::unique_lock lock(mutex_);
            aggregates_.clear();
            rated_.clear();
        }

      private:
        const ledger::AccessControlRegistry &access_;

        std::map<std::pair<Identity, ReputationRole>, UserReputation> aggregates_;
        std::set<RatingKey> rated_;

        mutable std::shared_mutex mutex_;
    };

} // namespace escrowit
