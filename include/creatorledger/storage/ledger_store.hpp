#pragma once

#include <creatorledger/ledger/config.hpp>
#include <creatorledger/ledger/records.hpp>
#include <datapod/datapod.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace creatorledger::storage {

    using ledger::Content;
    using ledger::CreatorProfile;
    using ledger::CreatorStats;
    using ledger::EngagementKey;
    using ledger::PlatformConfig;
    using ledger::Subscription;
    using ledger::SubscriptionKey;

    // ===========================================
    // WriteBatch - staged writes of one call
    // ===========================================

    /// Every write one ledger call makes. Applied all-or-nothing by LedgerStore::apply.
    struct WriteBatch {
        std::optional<PlatformConfig> config;
        std::optional<ContentId> next_content_id;
        std::vector<CreatorProfile> profiles;
        std::vector<std::pair<Address, CreatorStats>> stats;
        std::vector<Content> contents;
        std::vector<std::pair<SubscriptionKey, Subscription>> subscriptions;
        std::vector<EngagementKey> engagements;
        std::vector<std::pair<Address, Amount>> user_scores;

        inline void putProfile(CreatorProfile profile) { profiles.push_back(std::move(profile)); }
        inline void putStats(const Address &creator, CreatorStats s) { stats.emplace_back(creator, std::move(s)); }
        inline void putContent(Content content) { contents.push_back(std::move(content)); }
        inline void putSubscription(SubscriptionKey key, Subscription sub) {
            subscriptions.emplace_back(std::move(key), sub);
        }
        inline void markEngaged(EngagementKey key) { engagements.push_back(std::move(key)); }
        inline void putUserScore(const Address &user, Amount score) { user_scores.emplace_back(user, score); }

        inline bool empty() const {
            return !config && !next_content_id && profiles.empty() && stats.empty() && contents.empty() &&
                   subscriptions.empty() && engagements.empty() && user_scores.empty();
        }
    };

    // ===========================================
    // LedgerStore - table storage interface
    // ===========================================

    /// Typed access to the ledger tables. Reads may throw std::runtime_error on backend failure;
    /// apply() reports failures through its result and leaves the store unchanged when it fails.
    class LedgerStore {
      public:
        virtual ~LedgerStore() = default;

        virtual std::optional<PlatformConfig> loadConfig() const = 0;

        virtual std::optional<CreatorProfile> getProfile(const Address &creator) const = 0;

        virtual std::optional<CreatorStats> getStats(const Address &creator) const = 0;

        virtual std::optional<Content> getContent(ContentId id) const = 0;

        virtual std::optional<Subscription> getSubscription(const Address &subscriber,
                                                            const Address &creator) const = 0;

        virtual bool hasEngaged(ContentId id, const Address &user) const = 0;

        /// Zero for addresses that never engaged
        virtual Amount getUserScore(const Address &user) const = 0;

        /// Id the next posted content receives (equals the number of contents)
        virtual ContentId nextContentId() const = 0;

        /// Commit every write in the batch, or none
        virtual dp::Result<void, dp::Error> apply(const WriteBatch &batch) = 0;
    };

} // namespace creatorledger::storage
