/**
 * Example: A creator platform ledger on SQLite with token payments
 *
 * This demo shows how to:
 * 1. Open a durable ledger store and initialize the platform
 * 2. Register a creator, price subscriptions and post premium content
 * 3. Subscribe, engage and tip while payments flow to creator and treasury
 * 4. Reopen the ledger and read the persisted state and event journal
 */

#include <creatorledger.hpp>
#include <filesystem>
#include <iostream>
#include <memory>

using namespace creatorledger;
using namespace creatorledger::ledger;
using namespace creatorledger::storage;

namespace {

    const std::string DB_PATH = "creator_demo.db";
    const std::string TOKEN = "USDC";

    void removeDatabase() {
        for (const auto &suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(DB_PATH + suffix);
        }
    }

    bool report(const dp::Result<void, dp::Error> &result, const std::string &what) {
        if (!result.is_ok()) {
            std::cerr << "  x " << what << " failed: " << result.error().message.c_str() << "\n";
            return false;
        }
        std::cout << "  ✓ " << what << "\n";
        return true;
    }

} // namespace

int main() {
    std::cout << "=== Creator Ledger Demo ===\n\n";
    removeDatabase();

    // 1. Storage, events and payments
    auto store = std::make_shared<SqliteLedgerStore>();
    OpenOptions opts;
    opts.sync_mode = OpenOptions::Synchronous::NORMAL;

    auto opened = store->open(DB_PATH, opts);
    if (!opened.is_ok()) {
        std::cerr << "Failed to open database: " << opened.error().message.c_str() << "\n";
        return 1;
    }
    std::cout << "✓ Database opened\n";

    auto journal = std::make_shared<SqliteEventJournal>(store);
    auto payments = std::make_shared<InMemoryPaymentGateway>();
    payments->credit(TOKEN, "bob", 1000);

    PlatformConfig config;
    config.payment_token = TOKEN;
    config.treasury = "treasury";
    config.platform_fee_bps = 500;
    config.verbose = true;

    {
        Platform platform(store, journal, payments);
        if (!report(platform.initialize(config), "Platform initialized")) {
            return 1;
        }

        // 2. Creator side
        std::cout << "\nCreator setup...\n";
        const Timestamp t0 = 1700000000;
        if (!report(platform.registerCreator(CallContext("alice", t0), "ipfs://alice-profile"), "Alice registered") ||
            !report(platform.updateSubscriptionFee(CallContext("alice", t0), 100), "Subscription fee set to 100")) {
            return 1;
        }

        auto hash = hashContent(std::string("episode one"));
        if (!hash.is_ok()) {
            std::cerr << "Failed to hash content\n";
            return 1;
        }
        auto posted = platform.postContent(CallContext("alice", t0 + 10), hash.value(), true, true);
        if (!posted.is_ok()) {
            std::cerr << "Failed to post content: " << posted.error().message.c_str() << "\n";
            return 1;
        }
        ContentId id = posted.value();
        std::cout << "  ✓ Premium content " << id << " posted (" << hash.value().substr(0, 16) << "...)\n";

        // 3. Fan side
        std::cout << "\nFan activity...\n";
        auto denied = platform.engage(CallContext("bob", t0 + 20), id, "LIKE");
        std::cout << "  Engage before subscribing: " << (denied.is_ok() ? "allowed" : denied.error().message.c_str())
                  << "\n";

        auto expiry = platform.subscribe(CallContext("bob", t0 + 30), "alice");
        if (!expiry.is_ok()) {
            std::cerr << "Failed to subscribe: " << expiry.error().message.c_str() << "\n";
            return 1;
        }
        std::cout << "  ✓ Bob subscribed until " << expiry.value() << "\n";

        report(platform.engage(CallContext("bob", t0 + 40), id, "LIKE"), "Bob liked the content");
        report(platform.tipContent(CallContext("bob", t0 + 50), id, 50), "Bob tipped 50");

        auto twice = platform.engage(CallContext("bob", t0 + 60), id, "SHARE");
        std::cout << "  Second engagement: " << (twice.is_ok() ? "allowed" : twice.error().message.c_str()) << "\n";

        std::cout << "\nBalances:\n";
        for (const auto &account : {"alice", "bob", "treasury"}) {
            std::cout << "  " << account << ": " << amountToString(payments->balanceOf(TOKEN, account)) << "\n";
        }
    }

    // 4. Reopen and inspect
    std::cout << "\nReopening ledger...\n";
    store->close();
    opened = store->open(DB_PATH, opts);
    if (!opened.is_ok()) {
        std::cerr << "Failed to reopen database: " << opened.error().message.c_str() << "\n";
        return 1;
    }

    Platform reopened(store);
    if (!report(reopened.open(), "Configuration loaded")) {
        return 1;
    }

    auto stats = reopened.getCreatorStats("alice");
    std::cout << "  alice: subscribers=" << amountToString(stats.total_subscribers)
              << " content=" << amountToString(stats.total_content)
              << " tips=" << amountToString(stats.total_tips_received)
              << " fee=" << amountToString(stats.subscription_fee) << "\n";
    std::cout << "  bob engagement score: " << amountToString(reopened.getUserEngagementScore("bob")) << "\n";

    std::cout << "\nEvent journal (" << journal->count() << " events):\n";
    for (const auto &event : journal->readAll()) {
        std::cout << "  " << event.toString() << "\n";
    }

    std::cout << "\n";
    reopened.printSummary();

    store->close();
    removeDatabase();
    std::cout << "\n=== Demo complete ===\n";
    return 0;
}
