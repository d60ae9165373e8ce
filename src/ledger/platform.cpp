#include <creatorledger/ledger/platform.hpp>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace creatorledger::ledger {

    namespace {

        /// Run one operation body, turning exceptions from checked arithmetic and storage reads into errors
        template <typename T, typename Fn> dp::Result<T, dp::Error> guarded(Fn &&body) {
            try {
                return body();
            } catch (const std::overflow_error &e) {
                return dp::Result<T, dp::Error>::err(overflow(dp::String(e.what())));
            } catch (const std::range_error &e) {
                return dp::Result<T, dp::Error>::err(overflow(dp::String(e.what())));
            } catch (const std::exception &e) {
                return dp::Result<T, dp::Error>::err(storage_failed(dp::String(e.what())));
            }
        }

        /// Run a read whose signature has no error channel. Storage failures are reported and yield `fallback`.
        template <typename T, typename Fn> T readOr(const char *what, T fallback, Fn &&body) {
            try {
                return body();
            } catch (const std::exception &e) {
                std::cerr << what << " failed: " << e.what() << std::endl;
                return fallback;
            }
        }

    } // namespace

    Platform::Platform(std::shared_ptr<storage::LedgerStore> store, std::shared_ptr<EventSink> events,
                       std::shared_ptr<PaymentGateway> payments)
        : store_(std::move(store)), events_(std::move(events)), payments_(std::move(payments)) {
        if (!store_) {
            throw std::invalid_argument("Platform requires a ledger store");
        }
    }

    // ===========================================
    // Setup
    // ===========================================

    dp::Result<void, dp::Error> Platform::initialize(const PlatformConfig &config) {
        std::unique_lock lock(mutex_);
        if (config_) {
            return dp::Result<void, dp::Error>::err(already_initialized());
        }

        auto valid = config.validate();
        if (!valid.is_ok()) {
            return valid;
        }

        auto result = guarded<void>([&]() {
            if (store_->loadConfig()) {
                return dp::Result<void, dp::Error>::err(already_initialized("Store already holds a configuration"));
            }
            storage::WriteBatch batch;
            batch.config = config;
            return store_->apply(batch);
        });
        if (!result.is_ok()) {
            return result;
        }

        config_ = config;
        log("Platform initialized: " + config.toString());
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Platform::open() {
        std::unique_lock lock(mutex_);
        if (config_) {
            return dp::Result<void, dp::Error>::ok();
        }

        auto loaded = guarded<PlatformConfig>([&]() {
            auto stored = store_->loadConfig();
            if (!stored) {
                return dp::Result<PlatformConfig, dp::Error>::err(not_initialized("Store holds no configuration"));
            }
            return dp::Result<PlatformConfig, dp::Error>::ok(*stored);
        });
        if (!loaded.is_ok()) {
            return dp::Result<void, dp::Error>::err(loaded.error());
        }

        config_ = loaded.value();
        log("Platform opened: " + config_->toString());
        return dp::Result<void, dp::Error>::ok();
    }

    bool Platform::isInitialized() const {
        std::shared_lock lock(mutex_);
        return config_.has_value();
    }

    PlatformConfig Platform::config() const {
        std::shared_lock lock(mutex_);
        return config_.value_or(PlatformConfig{});
    }

    // ===========================================
    // Creator registration
    // ===========================================

    dp::Result<void, dp::Error> Platform::registerCreator(const CallContext &ctx, const std::string &profile_data) {
        std::unique_lock lock(mutex_);
        auto check = checkCall(ctx);
        if (!check.is_ok()) {
            return check;
        }
        if (profile_data.empty()) {
            return dp::Result<void, dp::Error>::err(invalid_profile());
        }

        auto result = guarded<void>([&]() {
            if (isCreatorLocked(ctx.caller)) {
                return dp::Result<void, dp::Error>::err(already_registered());
            }

            storage::WriteBatch batch;
            batch.putProfile(CreatorProfile(ctx.caller, profile_data, ctx.now));
            batch.putStats(ctx.caller, CreatorStats{});
            return commit(batch, LedgerEvent::creatorRegistered(ctx.caller, profile_data, ctx.now));
        });
        if (result.is_ok()) {
            log("Creator " + ctx.caller + " registered with profile: " + profile_data);
        }
        return result;
    }

    dp::Result<void, dp::Error> Platform::updateSubscriptionFee(const CallContext &ctx, const Amount &new_fee) {
        std::unique_lock lock(mutex_);
        auto check = checkCall(ctx);
        if (!check.is_ok()) {
            return check;
        }

        auto result = guarded<void>([&]() {
            if (!isCreatorLocked(ctx.caller)) {
                return dp::Result<void, dp::Error>::err(not_a_creator());
            }

            auto stats = store_->getStats(ctx.caller).value_or(CreatorStats{});
            stats.subscription_fee = new_fee;

            storage::WriteBatch batch;
            batch.putStats(ctx.caller, stats);
            return commit(batch, LedgerEvent::subscriptionFeeUpdated(ctx.caller, new_fee, ctx.now));
        });
        if (result.is_ok()) {
            log("Creator " + ctx.caller + " set subscription fee to " + amountToString(new_fee));
        }
        return result;
    }

    // ===========================================
    // Content
    // ===========================================

    dp::Result<ContentId, dp::Error> Platform::postContent(const CallContext &ctx, const std::string &content_hash,
                                                           bool is_premium, bool tip_enabled) {
        std::unique_lock lock(mutex_);
        auto check = checkCall(ctx);
        if (!check.is_ok()) {
            return dp::Result<ContentId, dp::Error>::err(check.error());
        }

        auto result = guarded<ContentId>([&]() {
            if (!isCreatorLocked(ctx.caller)) {
                return dp::Result<ContentId, dp::Error>::err(not_a_creator());
            }

            ContentId id = store_->nextContentId();
            if (id == std::numeric_limits<ContentId>::max()) {
                return dp::Result<ContentId, dp::Error>::err(overflow("Content id space exhausted"));
            }

            auto stats = store_->getStats(ctx.caller).value_or(CreatorStats{});
            stats.total_content += 1;

            Content content;
            content.id = id;
            content.creator = ctx.caller;
            content.content_hash = content_hash;
            content.timestamp = ctx.now;
            content.is_premium = is_premium;
            content.tip_enabled = tip_enabled;

            // Counter and stats land in the same batch
            storage::WriteBatch batch;
            batch.putContent(content);
            batch.next_content_id = id + 1;
            batch.putStats(ctx.caller, stats);

            auto committed =
                commit(batch, LedgerEvent::contentPosted(id, ctx.caller, content_hash, is_premium, ctx.now));
            if (!committed.is_ok()) {
                return dp::Result<ContentId, dp::Error>::err(committed.error());
            }
            return dp::Result<ContentId, dp::Error>::ok(id);
        });
        if (result.is_ok()) {
            log("Content " + std::to_string(result.value()) + " posted by " + ctx.caller +
                (is_premium ? " (premium)" : ""));
        }
        return result;
    }

    // ===========================================
    // Subscriptions
    // ===========================================

    dp::Result<Timestamp, dp::Error> Platform::subscribe(const CallContext &ctx, const Address &creator) {
        std::unique_lock lock(mutex_);
        auto check = checkCall(ctx);
        if (!check.is_ok()) {
            return dp::Result<Timestamp, dp::Error>::err(check.error());
        }

        auto result = guarded<Timestamp>([&]() {
            if (!isCreatorLocked(creator)) {
                return dp::Result<Timestamp, dp::Error>::err(not_a_creator());
            }

            auto stats = store_->getStats(creator).value_or(CreatorStats{});
            if (!stats.subscriptionsEnabled()) {
                return dp::Result<Timestamp, dp::Error>::err(subscriptions_not_enabled());
            }

            const Timestamp period = config_->subscription_period;
            if (ctx.now > std::numeric_limits<Timestamp>::max() - period) {
                return dp::Result<Timestamp, dp::Error>::err(overflow("Subscription expiry exceeds the clock range"));
            }
            const Timestamp expiry = ctx.now + period;

            // Counts subscription events, not distinct subscribers
            stats.total_subscribers += 1;

            auto paid = collectPayment(ctx.caller, creator, stats.subscription_fee);
            if (!paid.is_ok()) {
                return dp::Result<Timestamp, dp::Error>::err(paid.error());
            }

            Subscription sub;
            sub.active = true;
            sub.expiry = expiry;

            storage::WriteBatch batch;
            batch.putSubscription(SubscriptionKey{ctx.caller, creator}, sub);
            batch.putStats(creator, stats);

            auto committed =
                commitPaid(batch, LedgerEvent::subscribed(ctx.caller, creator, expiry, ctx.now), paid.value());
            if (!committed.is_ok()) {
                return dp::Result<Timestamp, dp::Error>::err(committed.error());
            }
            return dp::Result<Timestamp, dp::Error>::ok(expiry);
        });
        if (result.is_ok()) {
            log(ctx.caller + " subscribed to " + creator + " until " + std::to_string(result.value()));
        }
        return result;
    }

    bool Platform::isSubscribed(const Address &user, const Address &creator, Timestamp now) const {
        std::shared_lock lock(mutex_);
        if (!config_) {
            return false;
        }
        return readOr("isSubscribed", false, [&]() { return isSubscribedLocked(user, creator, now); });
    }

    std::optional<Subscription> Platform::getSubscription(const Address &user, const Address &creator) const {
        std::shared_lock lock(mutex_);
        return readOr("getSubscription", std::optional<Subscription>{},
                      [&]() { return store_->getSubscription(user, creator); });
    }

    // ===========================================
    // Tipping
    // ===========================================

    dp::Result<void, dp::Error> Platform::tipContent(const CallContext &ctx, ContentId id, const Amount &amount) {
        std::unique_lock lock(mutex_);
        auto check = checkCall(ctx);
        if (!check.is_ok()) {
            return check;
        }

        auto result = guarded<void>([&]() {
            auto content = store_->getContent(id);
            if (!content) {
                return dp::Result<void, dp::Error>::err(not_found("Content not found"));
            }
            if (!content->tip_enabled) {
                return dp::Result<void, dp::Error>::err(tipping_not_enabled());
            }
            if (amount == 0) {
                return dp::Result<void, dp::Error>::err(invalid_amount());
            }

            auto stats = store_->getStats(content->creator).value_or(CreatorStats{});
            content->total_tips += amount;
            stats.total_tips_received += amount;

            auto paid = collectPayment(ctx.caller, content->creator, amount);
            if (!paid.is_ok()) {
                return dp::Result<void, dp::Error>::err(paid.error());
            }

            storage::WriteBatch batch;
            batch.putContent(*content);
            batch.putStats(content->creator, stats);
            return commitPaid(batch, LedgerEvent::tipped(id, ctx.caller, amount, ctx.now), paid.value());
        });
        if (result.is_ok()) {
            log(ctx.caller + " tipped " + amountToString(amount) + " on content " + std::to_string(id));
        }
        return result;
    }

    // ===========================================
    // Engagement
    // ===========================================

    dp::Result<void, dp::Error> Platform::engage(const CallContext &ctx, ContentId id,
                                                 const std::string &engagement_type) {
        std::unique_lock lock(mutex_);
        auto check = checkCall(ctx);
        if (!check.is_ok()) {
            return check;
        }

        auto result = guarded<void>([&]() {
            auto content = store_->getContent(id);
            if (!content) {
                return dp::Result<void, dp::Error>::err(not_found("Content not found"));
            }
            if (store_->hasEngaged(id, ctx.caller)) {
                return dp::Result<void, dp::Error>::err(already_engaged());
            }
            if (content->is_premium && !isSubscribedLocked(ctx.caller, content->creator, ctx.now)) {
                return dp::Result<void, dp::Error>::err(not_subscribed());
            }

            content->total_engagements += 1;
            Amount score = store_->getUserScore(ctx.caller) + 1;

            storage::WriteBatch batch;
            batch.markEngaged(EngagementKey{id, ctx.caller});
            batch.putContent(*content);
            batch.putUserScore(ctx.caller, score);
            return commit(batch, LedgerEvent::engaged(id, ctx.caller, engagement_type, ctx.now));
        });
        if (result.is_ok()) {
            log(ctx.caller + " engaged (" + engagement_type + ") with content " + std::to_string(id));
        }
        return result;
    }

    bool Platform::hasEngaged(ContentId id, const Address &user) const {
        std::shared_lock lock(mutex_);
        return readOr("hasEngaged", false, [&]() { return store_->hasEngaged(id, user); });
    }

    // ===========================================
    // Read accessors
    // ===========================================

    CreatorStats Platform::getCreatorStats(const Address &creator) const {
        std::shared_lock lock(mutex_);
        return readOr("getCreatorStats", CreatorStats{},
                      [&]() { return store_->getStats(creator).value_or(CreatorStats{}); });
    }

    dp::Result<CreatorProfile, dp::Error> Platform::getCreatorProfile(const Address &creator) const {
        std::shared_lock lock(mutex_);
        return guarded<CreatorProfile>([&]() {
            auto profile = store_->getProfile(creator);
            if (!profile || !profile->exists()) {
                return dp::Result<CreatorProfile, dp::Error>::err(not_found("Creator not registered"));
            }
            return dp::Result<CreatorProfile, dp::Error>::ok(*profile);
        });
    }

    bool Platform::isCreator(const Address &address) const {
        std::shared_lock lock(mutex_);
        return readOr("isCreator", false, [&]() { return isCreatorLocked(address); });
    }

    dp::Result<Content, dp::Error> Platform::getContent(ContentId id) const {
        std::shared_lock lock(mutex_);
        return guarded<Content>([&]() {
            auto content = store_->getContent(id);
            if (!content) {
                return dp::Result<Content, dp::Error>::err(not_found("Content not found"));
            }
            return dp::Result<Content, dp::Error>::ok(*content);
        });
    }

    Amount Platform::getUserEngagementScore(const Address &user) const {
        std::shared_lock lock(mutex_);
        return readOr("getUserEngagementScore", Amount(0), [&]() { return store_->getUserScore(user); });
    }

    ContentId Platform::getContentCount() const {
        std::shared_lock lock(mutex_);
        return readOr("getContentCount", ContentId{0}, [&]() { return store_->nextContentId(); });
    }

    void Platform::printSummary() const {
        std::shared_lock lock(mutex_);
        std::cout << "=== Platform Summary ===" << std::endl;
        if (!config_) {
            std::cout << "Not initialized" << std::endl;
            return;
        }
        std::cout << "Config: " << config_->toString() << std::endl;
        std::cout << "Contents: " << readOr("printSummary", ContentId{0}, [&]() { return store_->nextContentId(); })
                  << std::endl;
        std::cout << "Payments: " << (payments_ ? "attached" : "counters only") << std::endl;
        std::cout << "Events: " << (events_ ? "attached" : "none") << std::endl;
    }

    // ===========================================
    // Internals (caller holds mutex_)
    // ===========================================

    dp::Result<void, dp::Error> Platform::checkCall(const CallContext &ctx) const {
        if (ctx.caller.empty()) {
            return dp::Result<void, dp::Error>::err(invalid_caller());
        }
        if (!config_) {
            return dp::Result<void, dp::Error>::err(not_initialized());
        }
        return dp::Result<void, dp::Error>::ok();
    }

    bool Platform::isCreatorLocked(const Address &address) const {
        auto profile = store_->getProfile(address);
        return profile && profile->exists();
    }

    bool Platform::isSubscribedLocked(const Address &user, const Address &creator, Timestamp now) const {
        auto sub = store_->getSubscription(user, creator);
        return sub && sub->isActiveAt(now);
    }

    dp::Result<std::vector<PaymentLeg>, dp::Error> Platform::collectPayment(const Address &payer,
                                                                            const Address &payee,
                                                                            const Amount &amount) {
        std::vector<PaymentLeg> legs;
        if (!payments_) {
            return dp::Result<std::vector<PaymentLeg>, dp::Error>::ok(legs);
        }

        auto [creator_share, platform_cut] = splitPlatformFee(amount, config_->platform_fee_bps);
        if (platform_cut > 0) {
            legs.emplace_back(payer, config_->treasury, platform_cut);
        }
        if (creator_share > 0) {
            legs.emplace_back(payer, payee, creator_share);
        }
        if (legs.empty()) {
            return dp::Result<std::vector<PaymentLeg>, dp::Error>::ok(legs);
        }

        try {
            auto settled = payments_->settle(config_->payment_token, legs);
            if (!settled.is_ok()) {
                return dp::Result<std::vector<PaymentLeg>, dp::Error>::err(payment_failed(settled.error().message));
            }
        } catch (const std::exception &e) {
            return dp::Result<std::vector<PaymentLeg>, dp::Error>::err(payment_failed(dp::String(e.what())));
        }
        return dp::Result<std::vector<PaymentLeg>, dp::Error>::ok(legs);
    }

    void Platform::refundPayment(const std::vector<PaymentLeg> &legs) {
        if (!payments_ || legs.empty()) {
            return;
        }

        std::vector<PaymentLeg> reversed;
        for (auto it = legs.rbegin(); it != legs.rend(); ++it) {
            reversed.emplace_back(it->to, it->from, it->amount);
        }
        try {
            auto refunded = payments_->settle(config_->payment_token, reversed);
            if (!refunded.is_ok()) {
                std::cerr << "Payment refund failed: " << refunded.error().message.c_str() << std::endl;
            }
        } catch (const std::exception &e) {
            std::cerr << "Payment refund failed: " << e.what() << std::endl;
        }
    }

    dp::Result<void, dp::Error> Platform::commitPaid(const storage::WriteBatch &batch, const LedgerEvent &event,
                                                     const std::vector<PaymentLeg> &legs) {
        try {
            auto committed = commit(batch, event);
            if (!committed.is_ok()) {
                refundPayment(legs);
            }
            return committed;
        } catch (const std::exception &e) {
            refundPayment(legs);
            return dp::Result<void, dp::Error>::err(storage_failed(dp::String(e.what())));
        }
    }

    dp::Result<void, dp::Error> Platform::commit(const storage::WriteBatch &batch, const LedgerEvent &event) {
        auto applied = store_->apply(batch);
        if (!applied.is_ok()) {
            return applied;
        }

        if (events_) {
            try {
                events_->emit(event);
            } catch (const std::exception &e) {
                std::cerr << "Event sink failed for " << eventTypeToString(event.getType()) << ": " << e.what()
                          << std::endl;
            }
        }
        return dp::Result<void, dp::Error>::ok();
    }

    void Platform::log(const std::string &line) const {
        if (config_ && config_->verbose) {
            std::cout << line << std::endl;
        }
    }

} // namespace creatorledger::ledger
