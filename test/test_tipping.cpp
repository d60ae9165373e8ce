#include "ledger_fixture.hpp"

TEST_SUITE("Tipping Tests") {

    TEST_CASE("Tip updates content and creator totals") {
        LedgerFixture fx;
        fx.registerCreator("alice");
        auto id = fx.post("alice");

        REQUIRE(fx.platform->tipContent(as("bob"), id, 50).is_ok());
        REQUIRE(fx.platform->tipContent(as("carol"), id, 25).is_ok());

        CHECK(fx.platform->getContent(id).value().total_tips == 75);
        CHECK(fx.platform->getCreatorStats("alice").total_tips_received == 75);
    }

    TEST_CASE("Tips accumulate per creator across contents") {
        LedgerFixture fx;
        fx.registerCreator("alice");
        fx.registerCreator("dave");
        auto a0 = fx.post("alice");
        auto d0 = fx.post("dave");
        auto a1 = fx.post("alice");

        REQUIRE(fx.platform->tipContent(as("bob"), a0, 10).is_ok());
        REQUIRE(fx.platform->tipContent(as("bob"), d0, 7).is_ok());
        REQUIRE(fx.platform->tipContent(as("bob"), a1, 5).is_ok());

        CHECK(fx.platform->getCreatorStats("alice").total_tips_received == 15);
        CHECK(fx.platform->getCreatorStats("dave").total_tips_received == 7);
        CHECK(fx.platform->getContent(a1).value().total_tips == 5);
    }

    TEST_CASE("Tipping disabled content always fails") {
        LedgerFixture fx;
        fx.registerCreator("alice");
        auto id = fx.post("alice", false, false);

        for (int amount : {0, 1, 1000}) {
            auto result = fx.platform->tipContent(as("bob"), id, amount);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_TIPPING_NOT_ENABLED);
        }

        CHECK(fx.platform->getContent(id).value().total_tips == 0);
        CHECK(fx.platform->getCreatorStats("alice").total_tips_received == 0);
        CHECK(fx.events->eventsOfType(EventType::Tipped).empty());
    }

    TEST_CASE("Zero amount is rejected") {
        LedgerFixture fx;
        fx.registerCreator("alice");
        auto id = fx.post("alice");

        auto result = fx.platform->tipContent(as("bob"), id, 0);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_INVALID_AMOUNT);
        CHECK(fx.platform->getContent(id).value().total_tips == 0);
    }

    TEST_CASE("Tipping unknown content is not found") {
        LedgerFixture fx;

        auto result = fx.platform->tipContent(as("bob"), 3, 10);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_NOT_FOUND);
    }

    TEST_CASE("Amounts beyond 64 bits") {
        LedgerFixture fx;
        fx.registerCreator("alice");
        auto id = fx.post("alice");

        Amount big("340282366920938463463374607431768211456"); // 2^128
        REQUIRE(fx.platform->tipContent(as("bob"), id, big).is_ok());
        REQUIRE(fx.platform->tipContent(as("bob"), id, big).is_ok());

        Amount expected("680564733841876926926749214863536422912"); // 2^129
        CHECK(fx.platform->getContent(id).value().total_tips == expected);
        CHECK(fx.platform->getCreatorStats("alice").total_tips_received == expected);
    }

    TEST_CASE("Overflowing tip leaves both totals unchanged") {
        LedgerFixture fx;
        fx.registerCreator("alice");
        auto id = fx.post("alice");

        Amount max = std::numeric_limits<Amount>::max();
        REQUIRE(fx.platform->tipContent(as("bob"), id, max).is_ok());

        auto result = fx.platform->tipContent(as("bob"), id, 1);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_OVERFLOW);
        CHECK(fx.platform->getContent(id).value().total_tips == max);
        CHECK(fx.platform->getCreatorStats("alice").total_tips_received == max);
        CHECK(fx.events->eventsOfType(EventType::Tipped).size() == 1);
    }

    TEST_CASE("Tip event") {
        LedgerFixture fx;
        fx.registerCreator("alice");
        auto id = fx.post("alice");
        REQUIRE(fx.platform->tipContent(as("bob"), id, 42).is_ok());

        auto tipped = fx.events->eventsOfType(EventType::Tipped);
        REQUIRE(tipped.size() == 1);
        CHECK(tipped[0].content_id == id);
        CHECK(tipped[0].actor == "bob");
        CHECK(tipped[0].amount == 42);
    }
}
