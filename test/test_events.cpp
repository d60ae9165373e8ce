#include "ledger_fixture.hpp"

#include <stdexcept>

namespace {

    /// Sink that always throws
    class BrokenSink : public EventSink {
      public:
        void emit(const LedgerEvent &) override {
            ++attempts;
            throw std::runtime_error("sink offline");
        }
        int attempts = 0;
    };

} // namespace

TEST_SUITE("Event Tests") {

    TEST_CASE("One event per successful operation, in call order") {
        LedgerFixture fx;
        fx.registerCreator("alice", 10);
        auto id = fx.post("alice");
        REQUIRE(fx.platform->subscribe(as("bob"), "alice").is_ok());
        REQUIRE(fx.platform->tipContent(as("bob"), id, 5).is_ok());
        REQUIRE(fx.platform->engage(as("bob"), id, "LIKE").is_ok());

        auto events = fx.events->events();
        REQUIRE(events.size() == 6);
        CHECK(events[0].getType() == EventType::CreatorRegistered);
        CHECK(events[1].getType() == EventType::SubscriptionFeeUpdated);
        CHECK(events[2].getType() == EventType::ContentPosted);
        CHECK(events[3].getType() == EventType::Subscribed);
        CHECK(events[4].getType() == EventType::Tipped);
        CHECK(events[5].getType() == EventType::Engaged);
    }

    TEST_CASE("Registration event carries profile and timestamp") {
        LedgerFixture fx;
        REQUIRE(fx.platform->registerCreator(as("alice", T0 + 3), "alice.profile").is_ok());

        auto registered = fx.events->eventsOfType(EventType::CreatorRegistered);
        REQUIRE(registered.size() == 1);
        CHECK(registered[0].creator == "alice");
        CHECK(registered[0].data == "alice.profile");
        CHECK(registered[0].timestamp == T0 + 3);
    }

    TEST_CASE("Failed operations emit nothing") {
        LedgerFixture fx;
        fx.registerCreator("alice");
        auto id = fx.post("alice", true, false);
        auto before = fx.events->size();

        CHECK(fx.platform->registerCreator(as("alice"), "again").is_err());
        CHECK(fx.platform->postContent(as("bob"), "h", false, false).is_err());
        CHECK(fx.platform->subscribe(as("bob"), "alice").is_err());
        CHECK(fx.platform->tipContent(as("bob"), id, 5).is_err());
        CHECK(fx.platform->engage(as("bob"), id, "LIKE").is_err());

        CHECK(fx.events->size() == before);
    }

    TEST_CASE("Sink failure does not change the outcome") {
        auto store = std::make_shared<storage::MemoryStore>();
        auto sink = std::make_shared<BrokenSink>();
        Platform platform(store, sink);
        REQUIRE(platform.initialize(PlatformConfig{}).is_ok());

        REQUIRE(platform.registerCreator(as("alice"), "alice").is_ok());
        auto id = platform.postContent(as("alice"), "h", false, true);
        REQUIRE(id.is_ok());

        CHECK(sink->attempts == 2);
        CHECK(platform.isCreator("alice"));
        CHECK(platform.getContentCount() == 1);
    }

    TEST_CASE("Event descriptions") {
        auto ev = LedgerEvent::tipped(3, "bob", Amount(50), T0);
        CHECK(ev.toString() == "tipped{content_id=3, tipper=bob, amount=50}");

        auto sub = LedgerEvent::subscribed("bob", "alice", T0 + 10, T0);
        CHECK(sub.toString() == "subscribed{subscriber=bob, creator=alice, expiry=" + std::to_string(T0 + 10) + "}");

        CHECK(eventTypeToString(EventType::Engaged) == "engaged");
    }
}
