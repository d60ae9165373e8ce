#pragma once

#include "ledger_store.hpp"

#include <creatorledger/common/error.hpp>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace creatorledger::storage {

    // ===========================================
    // MemoryStore - in-memory ledger tables
    // ===========================================

    class MemoryStore : public LedgerStore {
      public:
        MemoryStore() = default;

        inline std::optional<PlatformConfig> loadConfig() const override {
            std::shared_lock lock(mutex_);
            return state_.config;
        }

        inline std::optional<CreatorProfile> getProfile(const Address &creator) const override {
            std::shared_lock lock(mutex_);
            auto it = state_.profiles.find(creator);
            if (it == state_.profiles.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        inline std::optional<CreatorStats> getStats(const Address &creator) const override {
            std::shared_lock lock(mutex_);
            auto it = state_.stats.find(creator);
            if (it == state_.stats.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        inline std::optional<Content> getContent(ContentId id) const override {
            std::shared_lock lock(mutex_);
            auto it = state_.contents.find(id);
            if (it == state_.contents.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        inline std::optional<Subscription> getSubscription(const Address &subscriber,
                                                           const Address &creator) const override {
            std::shared_lock lock(mutex_);
            auto it = state_.subscriptions.find(SubscriptionKey{subscriber, creator});
            if (it == state_.subscriptions.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        inline bool hasEngaged(ContentId id, const Address &user) const override {
            std::shared_lock lock(mutex_);
            return state_.engagements.find(EngagementKey{id, user}) != state_.engagements.end();
        }

        inline Amount getUserScore(const Address &user) const override {
            std::shared_lock lock(mutex_);
            auto it = state_.user_scores.find(user);
            return it == state_.user_scores.end() ? Amount(0) : it->second;
        }

        inline ContentId nextContentId() const override {
            std::shared_lock lock(mutex_);
            return state_.next_content_id;
        }

        /// Applies onto a copy and swaps it in, so a throw midway leaves the tables untouched
        inline dp::Result<void, dp::Error> apply(const WriteBatch &batch) override {
            if (batch.empty()) {
                return dp::Result<void, dp::Error>::ok();
            }

            std::unique_lock lock(mutex_);
            try {
                Tables next = state_;
                if (batch.config) {
                    next.config = batch.config;
                }
                if (batch.next_content_id) {
                    next.next_content_id = *batch.next_content_id;
                }
                for (const auto &profile : batch.profiles) {
                    next.profiles[profile.creator] = profile;
                }
                for (const auto &[creator, s] : batch.stats) {
                    next.stats[creator] = s;
                }
                for (const auto &content : batch.contents) {
                    next.contents[content.id] = content;
                }
                for (const auto &[key, sub] : batch.subscriptions) {
                    next.subscriptions[key] = sub;
                }
                for (const auto &key : batch.engagements) {
                    next.engagements.insert(key);
                }
                for (const auto &[user, score] : batch.user_scores) {
                    next.user_scores[user] = score;
                }
                state_ = std::move(next);
            } catch (const std::exception &e) {
                return dp::Result<void, dp::Error>::err(storage_failed(dp::String(e.what())));
            }
            return dp::Result<void, dp::Error>::ok();
        }

        // === Diagnostics ===

        inline size_t creatorCount() const {
            std::shared_lock lock(mutex_);
            return state_.profiles.size();
        }

        inline size_t subscriptionCount() const {
            std::shared_lock lock(mutex_);
            return state_.subscriptions.size();
        }

        inline size_t engagementCount() const {
            std::shared_lock lock(mutex_);
            return state_.engagements.size();
        }

        /// Clear all tables (for testing)
        inline void clear() {
            std::unique_lock lock(mutex_);
            state_ = Tables{};
        }

      private:
        struct Tables {
            std::optional<PlatformConfig> config;
            ContentId next_content_id = 0;
            std::unordered_map<Address, CreatorProfile> profiles;
            std::unordered_map<Address, CreatorStats> stats;
            std::unordered_map<ContentId, Content> contents;
            std::unordered_map<SubscriptionKey, Subscription, ledger::SubscriptionKeyHash> subscriptions;
            std::unordered_set<EngagementKey, ledger::EngagementKeyHash> engagements;
            std::unordered_map<Address, Amount> user_scores;
        };

        Tables state_;
        mutable std::shared_mutex mutex_;
    };

} // namespace creatorledger::storage
