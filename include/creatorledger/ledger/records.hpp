#pragma once

#include <creatorledger/common/types.hpp>
#include <functional>
#include <string>

namespace creatorledger::ledger {

    // ===========================================
    // Table records
    // ===========================================

    /// Creator identity, written once at registration
    struct CreatorProfile {
        Address creator;
        std::string profile_data;
        Timestamp registered_at{0};

        CreatorProfile() = default;
        CreatorProfile(Address who, std::string data, Timestamp at)
            : creator(std::move(who)), profile_data(std::move(data)), registered_at(at) {}

        /// A profile exists once its data is set
        inline bool exists() const { return !profile_data.empty(); }
    };

    /// Aggregates kept 1:1 with a CreatorProfile. A zero subscription_fee disables subscriptions.
    struct CreatorStats {
        Amount total_subscribers{0};
        Amount total_content{0};
        Amount total_tips_received{0};
        Amount subscription_fee{0};
        Amount engagement_score{0}; // reserved, never written

        inline bool subscriptionsEnabled() const { return subscription_fee != 0; }

        inline bool operator==(const CreatorStats &other) const {
            return total_subscribers == other.total_subscribers && total_content == other.total_content &&
                   total_tips_received == other.total_tips_received && subscription_fee == other.subscription_fee &&
                   engagement_score == other.engagement_score;
        }
        inline bool operator!=(const CreatorStats &other) const { return !(*this == other); }
    };

    /// A posted content record. Only total_tips and total_engagements change after creation.
    struct Content {
        ContentId id{0};
        Address creator;
        std::string content_hash;
        Timestamp timestamp{0};
        bool is_premium{false};
        bool tip_enabled{false};
        Amount total_tips{0};
        Amount total_engagements{0};
    };

    /// Subscription of one address to one creator. Absence means inactive.
    struct Subscription {
        bool active{false};
        Timestamp expiry{0};

        /// Expiry is strict: a subscription expiring exactly at `now` is no longer active
        inline bool isActiveAt(Timestamp now) const { return active && expiry > now; }
    };

    // ===========================================
    // Composite keys
    // ===========================================

    struct SubscriptionKey {
        Address subscriber;
        Address creator;

        inline bool operator==(const SubscriptionKey &other) const {
            return subscriber == other.subscriber && creator == other.creator;
        }
    };

    struct EngagementKey {
        ContentId content_id{0};
        Address user;

        inline bool operator==(const EngagementKey &other) const {
            return content_id == other.content_id && user == other.user;
        }
    };

    struct SubscriptionKeyHash {
        inline size_t operator()(const SubscriptionKey &key) const {
            size_t h = std::hash<std::string>{}(key.subscriber);
            return h ^ (std::hash<std::string>{}(key.creator) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
        }
    };

    struct EngagementKeyHash {
        inline size_t operator()(const EngagementKey &key) const {
            size_t h = std::hash<ContentId>{}(key.content_id);
            return h ^ (std::hash<std::string>{}(key.user) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
        }
    };

} // namespace creatorledger::ledger
