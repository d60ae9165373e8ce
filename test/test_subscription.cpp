#include "ledger_fixture.hpp"

TEST_SUITE("Subscription Tests") {

    TEST_CASE("Subscribe to a creator") {
        LedgerFixture fx;
        fx.registerCreator("alice", 100);

        auto expiry = fx.platform->subscribe(as("bob"), "alice");
        REQUIRE(expiry.is_ok());
        CHECK(expiry.value() == T0 + DEFAULT_SUBSCRIPTION_PERIOD);

        auto sub = fx.platform->getSubscription("bob", "alice");
        REQUIRE(sub.has_value());
        CHECK(sub->active);
        CHECK(sub->expiry == T0 + DEFAULT_SUBSCRIPTION_PERIOD);

        CHECK(fx.platform->isSubscribed("bob", "alice", T0));
        CHECK(fx.platform->getCreatorStats("alice").total_subscribers == 1);
    }

    TEST_CASE("Subscribing to a non-creator fails") {
        LedgerFixture fx;

        auto result = fx.platform->subscribe(as("bob"), "ghost");
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_NOT_A_CREATOR);
        CHECK_FALSE(fx.platform->getSubscription("bob", "ghost").has_value());
    }

    TEST_CASE("Subscribing with no fee set fails") {
        LedgerFixture fx;
        fx.registerCreator("alice");

        auto result = fx.platform->subscribe(as("bob"), "alice");
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_SUBSCRIPTIONS_NOT_ENABLED);
        CHECK(fx.platform->getCreatorStats("alice").total_subscribers == 0);
        CHECK_FALSE(fx.platform->isSubscribed("bob", "alice", T0));
    }

    TEST_CASE("Fee reset to zero disables new subscriptions") {
        LedgerFixture fx;
        fx.registerCreator("alice", 100);
        REQUIRE(fx.platform->subscribe(as("bob"), "alice").is_ok());
        REQUIRE(fx.platform->updateSubscriptionFee(as("alice"), 0).is_ok());

        auto result = fx.platform->subscribe(as("carol"), "alice");
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_SUBSCRIPTIONS_NOT_ENABLED);

        // Existing subscriptions keep running
        CHECK(fx.platform->isSubscribed("bob", "alice", T0 + 1));
    }

    TEST_CASE("Expiry is strict") {
        LedgerFixture fx;
        fx.registerCreator("alice", 100);
        auto expiry = fx.platform->subscribe(as("bob"), "alice");
        REQUIRE(expiry.is_ok());

        CHECK(fx.platform->isSubscribed("bob", "alice", expiry.value() - 1));
        CHECK_FALSE(fx.platform->isSubscribed("bob", "alice", expiry.value()));
        CHECK_FALSE(fx.platform->isSubscribed("bob", "alice", expiry.value() + 1));

        // The record stays; expiry is only evaluated on read
        auto sub = fx.platform->getSubscription("bob", "alice");
        REQUIRE(sub.has_value());
        CHECK(sub->active);
    }

    TEST_CASE("Re-subscribing resets the window and counts again") {
        LedgerFixture fx;
        fx.registerCreator("alice", 100);

        REQUIRE(fx.platform->subscribe(as("bob", T0), "alice").is_ok());
        auto renewed = fx.platform->subscribe(as("bob", T0 + 10), "alice");
        REQUIRE(renewed.is_ok());

        // Reset from the second call, not extended from the first expiry
        CHECK(renewed.value() == T0 + 10 + DEFAULT_SUBSCRIPTION_PERIOD);
        CHECK(fx.platform->getSubscription("bob", "alice")->expiry == T0 + 10 + DEFAULT_SUBSCRIPTION_PERIOD);

        // total_subscribers counts subscription events
        CHECK(fx.platform->getCreatorStats("alice").total_subscribers == 2);
    }

    TEST_CASE("Subscriptions are per (subscriber, creator) pair") {
        LedgerFixture fx;
        fx.registerCreator("alice", 100);
        fx.registerCreator("dave", 5);

        REQUIRE(fx.platform->subscribe(as("bob"), "alice").is_ok());

        CHECK(fx.platform->isSubscribed("bob", "alice", T0));
        CHECK_FALSE(fx.platform->isSubscribed("bob", "dave", T0));
        CHECK_FALSE(fx.platform->isSubscribed("carol", "alice", T0));
        CHECK(fx.platform->getCreatorStats("dave").total_subscribers == 0);
    }

    TEST_CASE("Custom subscription period") {
        PlatformConfig config;
        config.subscription_period = 3600;
        LedgerFixture fx(config);
        fx.registerCreator("alice", 1);

        auto expiry = fx.platform->subscribe(as("bob"), "alice");
        REQUIRE(expiry.is_ok());
        CHECK(expiry.value() == T0 + 3600);
    }

    TEST_CASE("Expiry past the clock range is rejected") {
        LedgerFixture fx;
        fx.registerCreator("alice", 1);

        auto result = fx.platform->subscribe(as("bob", std::numeric_limits<Timestamp>::max() - 5), "alice");
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_OVERFLOW);
        CHECK(fx.platform->getCreatorStats("alice").total_subscribers == 0);
    }

    TEST_CASE("Subscribe emits subscriber, creator and expiry") {
        LedgerFixture fx;
        fx.registerCreator("alice", 100);
        REQUIRE(fx.platform->subscribe(as("bob"), "alice").is_ok());

        auto subscribed = fx.events->eventsOfType(EventType::Subscribed);
        REQUIRE(subscribed.size() == 1);
        CHECK(subscribed[0].actor == "bob");
        CHECK(subscribed[0].creator == "alice");
        CHECK(subscribed[0].expiry == T0 + DEFAULT_SUBSCRIPTION_PERIOD);
    }
}
