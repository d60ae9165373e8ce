#pragma once

#include "ledger_store.hpp"

#include <creatorledger/ledger/events.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward declaration for sqlite3 C API
struct sqlite3;

namespace creatorledger::storage {

    /// SQLite database configuration
    struct OpenOptions {
        bool enable_wal = true;
        bool enable_foreign_keys = true;
        int32_t busy_timeout_ms = 5000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::FULL;

        OpenOptions() = default;
    };

    // ===========================================
    // SqliteLedgerStore - durable ledger tables
    // ===========================================

    class SqliteLedgerStore : public LedgerStore {
      public:
        SqliteLedgerStore();
        ~SqliteLedgerStore() override;

        // Non-copyable, non-movable (the journal keeps a reference)
        SqliteLedgerStore(const SqliteLedgerStore &) = delete;
        SqliteLedgerStore &operator=(const SqliteLedgerStore &) = delete;

        /// Open or create the database and bring the schema up to date
        /// @param path Database file path (e.g. "data/ledger.db")
        /// @param opts Configuration options
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        /// Close database connection
        void close();

        /// Check if database is open
        bool isOpen() const;

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        class TxGuard {
          public:
            explicit TxGuard(sqlite3 *db);
            ~TxGuard();

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            bool active() const { return active_; }
            bool commit();
            void rollback();

          private:
            sqlite3 *db_;
            bool active_;
        };

        // ===========================================
        // LedgerStore
        // ===========================================

        std::optional<PlatformConfig> loadConfig() const override;
        std::optional<CreatorProfile> getProfile(const Address &creator) const override;
        std::optional<CreatorStats> getStats(const Address &creator) const override;
        std::optional<Content> getContent(ContentId id) const override;
        std::optional<Subscription> getSubscription(const Address &subscriber, const Address &creator) const override;
        bool hasEngaged(ContentId id, const Address &user) const override;
        Amount getUserScore(const Address &user) const override;
        ContentId nextContentId() const override;
        dp::Result<void, dp::Error> apply(const WriteBatch &batch) override;

        // ===========================================
        // Event journal
        // ===========================================

        /// Append one event row
        dp::Result<void, dp::Error> appendEvent(const ledger::LedgerEvent &event);

        /// All events in append order
        std::vector<ledger::LedgerEvent> readEvents() const;

        int64_t eventCount() const;

        // ===========================================
        // Statistics & Diagnostics
        // ===========================================

        int64_t creatorCount() const;
        int64_t subscriptionCount() const;
        int64_t engagementCount() const;

        /// Run SQLite integrity check
        bool quickCheck() const;

        int32_t schemaVersion() const;

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;
        mutable std::mutex mutex_;

        void applyPragmas(const OpenOptions &opts);
        bool executeSql(const std::string &sql);
        bool migrate();
        int32_t currentSchemaVersionLocked() const;
        int64_t countRows(const char *table) const;
        void requireOpen() const;

        static constexpr int32_t SCHEMA_VERSION = 1;

        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *PLATFORM_CONFIG_TABLE = R"(
            CREATE TABLE IF NOT EXISTS platform_config (
                id INTEGER PRIMARY KEY CHECK (id = 0),
                payment_token TEXT NOT NULL,
                treasury TEXT NOT NULL,
                platform_fee_bps INTEGER NOT NULL,
                subscription_period INTEGER NOT NULL,
                verbose INTEGER NOT NULL
            )
        )";

        static constexpr const char *COUNTERS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS counters (
                name TEXT PRIMARY KEY,
                value INTEGER NOT NULL
            )
        )";

        static constexpr const char *CREATORS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS creators (
                address TEXT PRIMARY KEY,
                profile_data TEXT NOT NULL,
                registered_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *CREATOR_STATS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS creator_stats (
                address TEXT PRIMARY KEY,
                total_subscribers TEXT NOT NULL,
                total_content TEXT NOT NULL,
                total_tips_received TEXT NOT NULL,
                subscription_fee TEXT NOT NULL,
                engagement_score TEXT NOT NULL,
                FOREIGN KEY(address) REFERENCES creators(address)
            )
        )";

        static constexpr const char *CONTENTS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS contents (
                content_id INTEGER PRIMARY KEY,
                creator TEXT NOT NULL,
                content_hash TEXT NOT NULL,
                timestamp INTEGER NOT NULL,
                is_premium INTEGER NOT NULL,
                tip_enabled INTEGER NOT NULL,
                total_tips TEXT NOT NULL,
                total_engagements TEXT NOT NULL,
                FOREIGN KEY(creator) REFERENCES creators(address)
            )
        )";

        static constexpr const char *SUBSCRIPTIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS subscriptions (
                subscriber TEXT NOT NULL,
                creator TEXT NOT NULL,
                active INTEGER NOT NULL,
                expiry INTEGER NOT NULL,
                PRIMARY KEY (subscriber, creator)
            )
        )";

        static constexpr const char *ENGAGEMENTS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS engagements (
                content_id INTEGER NOT NULL,
                user_address TEXT NOT NULL,
                PRIMARY KEY (content_id, user_address),
                FOREIGN KEY(content_id) REFERENCES contents(content_id)
            )
        )";

        static constexpr const char *USER_SCORES_TABLE = R"(
            CREATE TABLE IF NOT EXISTS user_scores (
                address TEXT PRIMARY KEY,
                score TEXT NOT NULL
            )
        )";

        static constexpr const char *EVENTS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS events (
                seq INTEGER PRIMARY KEY AUTOINCREMENT,
                event_type INTEGER NOT NULL,
                creator TEXT NOT NULL,
                actor TEXT NOT NULL,
                content_id INTEGER NOT NULL,
                data TEXT NOT NULL,
                is_premium INTEGER NOT NULL,
                amount TEXT NOT NULL,
                timestamp INTEGER NOT NULL,
                expiry INTEGER NOT NULL
            )
        )";

        static constexpr const char *IDX_CONTENTS_CREATOR =
            "CREATE INDEX IF NOT EXISTS idx_contents_creator ON contents(creator)";
        static constexpr const char *IDX_SUBSCRIPTIONS_CREATOR =
            "CREATE INDEX IF NOT EXISTS idx_subscriptions_creator ON subscriptions(creator)";
        static constexpr const char *IDX_EVENTS_TYPE = "CREATE INDEX IF NOT EXISTS idx_events_type ON events(event_type)";
    };

    // ===========================================
    // SqliteEventJournal - EventSink over the events table
    // ===========================================

    class SqliteEventJournal : public ledger::EventSink {
      public:
        explicit SqliteEventJournal(std::shared_ptr<SqliteLedgerStore> store) : store_(std::move(store)) {}

        /// Throws std::runtime_error when the row cannot be written
        void emit(const ledger::LedgerEvent &event) override;

        std::vector<ledger::LedgerEvent> readAll() const { return store_->readEvents(); }

        int64_t count() const { return store_->eventCount(); }

      private:
        std::shared_ptr<SqliteLedgerStore> store_;
    };

} // namespace creatorledger::storage
