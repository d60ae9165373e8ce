#pragma once

#include <creatorledger/common/error.hpp>
#include <creatorledger/common/types.hpp>
#include <creatorledger/ledger/config.hpp>
#include <creatorledger/ledger/events.hpp>
#include <creatorledger/ledger/payment.hpp>
#include <creatorledger/ledger/records.hpp>
#include <creatorledger/storage/ledger_store.hpp>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace creatorledger::ledger {

    /// The platform ledger: creator registry, content registry, subscriptions, tips and engagement.
    ///
    /// Every mutating operation checks all of its preconditions, invokes the payment collaborator
    /// (when one is attached), then commits its writes through a single LedgerStore::apply and emits
    /// one event. A failed call leaves no state change and emits nothing. Operations are serialized
    /// by an internal lock, so ContentId allocation and counters are linearizable.
    class Platform {
      public:
        /// @param store Table storage (required)
        /// @param events Notification sink, may be null
        /// @param payments Value-transfer collaborator. When null, subscribe and tip only update counters.
        explicit Platform(std::shared_ptr<storage::LedgerStore> store, std::shared_ptr<EventSink> events = nullptr,
                          std::shared_ptr<PaymentGateway> payments = nullptr);

        Platform(const Platform &) = delete;
        Platform &operator=(const Platform &) = delete;

        // === Setup ===

        /// Validate and persist the configuration. Fails if the store already holds one.
        dp::Result<void, dp::Error> initialize(const PlatformConfig &config);

        /// Load the configuration persisted by an earlier initialize()
        dp::Result<void, dp::Error> open();

        bool isInitialized() const;

        /// Current configuration (default-constructed before initialization)
        PlatformConfig config() const;

        // === Creator registration ===

        /// Register the caller as a creator. Exactly once per address.
        dp::Result<void, dp::Error> registerCreator(const CallContext &ctx, const std::string &profile_data);

        /// Set the caller's subscription fee. Zero disables subscriptions.
        dp::Result<void, dp::Error> updateSubscriptionFee(const CallContext &ctx, const Amount &new_fee);

        // === Content ===

        /// Publish a content record owned by the caller
        /// @return The assigned ContentId
        dp::Result<ContentId, dp::Error> postContent(const CallContext &ctx, const std::string &content_hash,
                                                     bool is_premium, bool tip_enabled);

        // === Subscriptions ===

        /// Subscribe the caller to `creator` for one subscription period starting now.
        /// Re-subscribing resets the window and counts again in total_subscribers.
        /// @return The new expiry
        dp::Result<Timestamp, dp::Error> subscribe(const CallContext &ctx, const Address &creator);

        /// True iff an active subscription exists with expiry strictly after `now`
        bool isSubscribed(const Address &user, const Address &creator, Timestamp now) const;

        std::optional<Subscription> getSubscription(const Address &user, const Address &creator) const;

        // === Tipping ===

        dp::Result<void, dp::Error> tipContent(const CallContext &ctx, ContentId id, const Amount &amount);

        // === Engagement ===

        /// Record one engagement by the caller. At most once per (content, caller).
        /// Premium content requires an active subscription to its creator.
        dp::Result<void, dp::Error> engage(const CallContext &ctx, ContentId id, const std::string &engagement_type);

        bool hasEngaged(ContentId id, const Address &user) const;

        // === Read accessors ===
        // Accessors without an error channel report storage failures to std::cerr and return the empty value.

        /// Zeroed stats for addresses that never registered
        CreatorStats getCreatorStats(const Address &creator) const;

        dp::Result<CreatorProfile, dp::Error> getCreatorProfile(const Address &creator) const;

        bool isCreator(const Address &address) const;

        /// ERR_NOT_FOUND for ids never assigned
        dp::Result<Content, dp::Error> getContent(ContentId id) const;

        Amount getUserEngagementScore(const Address &user) const;

        /// Number of contents posted so far (also the next ContentId)
        ContentId getContentCount() const;

        void printSummary() const;

      private:
        std::shared_ptr<storage::LedgerStore> store_;
        std::shared_ptr<EventSink> events_;
        std::shared_ptr<PaymentGateway> payments_;
        std::optional<PlatformConfig> config_;
        mutable std::shared_mutex mutex_;

        dp::Result<void, dp::Error> checkCall(const CallContext &ctx) const;
        bool isCreatorLocked(const Address &address) const;
        bool isSubscribedLocked(const Address &user, const Address &creator, Timestamp now) const;
        dp::Result<std::vector<PaymentLeg>, dp::Error> collectPayment(const Address &payer, const Address &payee,
                                                                      const Amount &amount);
        void refundPayment(const std::vector<PaymentLeg> &legs);
        dp::Result<void, dp::Error> commit(const storage::WriteBatch &batch, const LedgerEvent &event);
        /// Commit after payment; a failed commit hands the settled legs back
        dp::Result<void, dp::Error> commitPaid(const storage::WriteBatch &batch, const LedgerEvent &event,
                                               const std::vector<PaymentLeg> &legs);
        void log(const std::string &line) const;
    };

} // namespace creatorledger::ledger
