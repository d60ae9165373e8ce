#include "ledger_fixture.hpp"

#include <set>
#include <thread>
#include <vector>

TEST_SUITE("Concurrency Tests") {

    TEST_CASE("Concurrent posts get dense ids") {
        LedgerFixture fx;
        const size_t creators = 4;
        const size_t posts_each = 25;
        for (size_t i = 0; i < creators; ++i) {
            fx.registerCreator("creator" + std::to_string(i));
        }

        std::vector<std::vector<ContentId>> assigned(creators);
        std::vector<std::thread> threads;
        for (size_t i = 0; i < creators; ++i) {
            threads.emplace_back([&, i]() {
                Address who = "creator" + std::to_string(i);
                for (size_t n = 0; n < posts_each; ++n) {
                    auto id = fx.platform->postContent(as(who), "h", false, true);
                    if (id.is_ok()) {
                        assigned[i].push_back(id.value());
                    }
                }
            });
        }
        for (auto &t : threads) {
            t.join();
        }

        std::set<ContentId> ids;
        for (size_t i = 0; i < creators; ++i) {
            CHECK(assigned[i].size() == posts_each);
            ids.insert(assigned[i].begin(), assigned[i].end());
            CHECK(fx.platform->getCreatorStats("creator" + std::to_string(i)).total_content == posts_each);
        }

        CHECK(ids.size() == creators * posts_each);
        CHECK(*ids.begin() == 0);
        CHECK(*ids.rbegin() == creators * posts_each - 1);
        CHECK(fx.platform->getContentCount() == creators * posts_each);
    }

    TEST_CASE("Concurrent engagement is counted once per user") {
        LedgerFixture fx;
        fx.registerCreator("alice");
        auto id = fx.post("alice");

        const size_t users = 8;
        std::vector<std::thread> threads;
        for (size_t i = 0; i < users; ++i) {
            threads.emplace_back([&, i]() {
                Address who = "user" + std::to_string(i % (users / 2));
                auto result = fx.platform->engage(as(who), id, "LIKE");
                (void)result;
            });
        }
        for (auto &t : threads) {
            t.join();
        }

        CHECK(fx.platform->getContent(id).value().total_engagements == users / 2);
        CHECK(fx.store->engagementCount() == users / 2);
    }

    TEST_CASE("Concurrent tips sum exactly") {
        LedgerFixture fx;
        fx.registerCreator("alice");
        auto id = fx.post("alice");

        const size_t tippers = 6;
        const size_t tips_each = 20;
        std::vector<std::thread> threads;
        for (size_t i = 0; i < tippers; ++i) {
            threads.emplace_back([&, i]() {
                for (size_t n = 0; n < tips_each; ++n) {
                    auto result = fx.platform->tipContent(as("tipper" + std::to_string(i)), id, 3);
                    (void)result;
                }
            });
        }
        for (auto &t : threads) {
            t.join();
        }

        CHECK(fx.platform->getContent(id).value().total_tips == tippers * tips_each * 3);
        CHECK(fx.platform->getCreatorStats("alice").total_tips_received == tippers * tips_each * 3);
        CHECK(fx.events->size() == 2 + tippers * tips_each);
    }
}
