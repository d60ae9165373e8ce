#include <chrono>
#include <creatorledger/storage/sqlite_store.hpp>
#include <sqlite3.h>
#include <stdexcept>

namespace creatorledger::storage {

    namespace {

        /// Prepared statement, finalized on scope exit
        class Statement {
          public:
            Statement(sqlite3 *db, const char *sql) : stmt_(nullptr) {
                ok_ = (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) == SQLITE_OK);
            }

            ~Statement() {
                if (stmt_) {
                    sqlite3_finalize(stmt_);
                }
            }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            bool ok() const { return ok_; }

            void bindText(int index, const std::string &value) {
                sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
            }

            void bindInt64(int index, int64_t value) { sqlite3_bind_int64(stmt_, index, value); }

            void bindAmount(int index, const Amount &value) { bindText(index, amountToString(value)); }

            int step() { return sqlite3_step(stmt_); }

            /// Step a write statement; true when it ran to completion
            bool run() { return ok_ && step() == SQLITE_DONE; }

            std::string text(int col) const {
                const unsigned char *value = sqlite3_column_text(stmt_, col);
                return value ? reinterpret_cast<const char *>(value) : "";
            }

            int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }

            Amount amount(int col) const {
                auto parsed = parseAmount(text(col));
                if (!parsed.is_ok()) {
                    throw std::runtime_error("Corrupt amount column: " + text(col));
                }
                return parsed.value();
            }

          private:
            sqlite3_stmt *stmt_;
            bool ok_;
        };

        int64_t currentTimestamp() {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        std::string lastError(sqlite3 *db, const std::string &what) {
            return what + ": " + (db ? sqlite3_errmsg(db) : "no database");
        }

        // Timestamps and ids are unsigned; SQLite INTEGER is signed 64-bit. Round-trip the bits.
        int64_t toColumn(dp::u64 value) { return static_cast<int64_t>(value); }
        dp::u64 fromColumn(int64_t value) { return static_cast<dp::u64>(value); }

        constexpr const char *NEXT_CONTENT_ID = "next_content_id";

    } // namespace

    // ===========================================
    // Lifecycle
    // ===========================================

    SqliteLedgerStore::SqliteLedgerStore() : db_(nullptr), is_open_(false) {}

    SqliteLedgerStore::~SqliteLedgerStore() { close(); }

    dp::Result<void, dp::Error> SqliteLedgerStore::open(const std::string &path, const OpenOptions &opts) {
        std::lock_guard lock(mutex_);
        if (is_open_) {
            return dp::Result<void, dp::Error>::err(storage_failed("Store already open"));
        }

        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            auto msg = lastError(db_, "Failed to open " + path);
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            return dp::Result<void, dp::Error>::err(storage_failed(dp::String(msg.c_str())));
        }

        db_path_ = path;
        is_open_ = true;
        applyPragmas(opts);

        if (!migrate()) {
            auto msg = lastError(db_, "Schema migration failed");
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(storage_failed(dp::String(msg.c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteLedgerStore::close() {
        std::lock_guard lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        is_open_ = false;
    }

    bool SqliteLedgerStore::isOpen() const {
        std::lock_guard lock(mutex_);
        return is_open_;
    }

    void SqliteLedgerStore::applyPragmas(const OpenOptions &opts) {
        if (opts.enable_wal) {
            executeSql("PRAGMA journal_mode=WAL;");
        }
        if (opts.enable_foreign_keys) {
            executeSql("PRAGMA foreign_keys=ON;");
        }
        executeSql("PRAGMA busy_timeout=" + std::to_string(opts.busy_timeout_ms) + ";");

        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            executeSql("PRAGMA synchronous=OFF;");
            break;
        case OpenOptions::Synchronous::NORMAL:
            executeSql("PRAGMA synchronous=NORMAL;");
            break;
        case OpenOptions::Synchronous::FULL:
            executeSql("PRAGMA synchronous=FULL;");
            break;
        }
    }

    bool SqliteLedgerStore::executeSql(const std::string &sql) {
        if (!db_)
            return false;

        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (errmsg) {
            sqlite3_free(errmsg);
        }
        return rc == SQLITE_OK;
    }

    bool SqliteLedgerStore::migrate() {
        if (!executeSql(SCHEMA_MIGRATIONS_TABLE))
            return false;

        if (currentSchemaVersionLocked() >= SCHEMA_VERSION)
            return true;

        TxGuard tx(db_);
        if (!tx.active())
            return false;

        bool created = executeSql(PLATFORM_CONFIG_TABLE) && executeSql(COUNTERS_TABLE) &&
                       executeSql(CREATORS_TABLE) && executeSql(CREATOR_STATS_TABLE) && executeSql(CONTENTS_TABLE) &&
                       executeSql(SUBSCRIPTIONS_TABLE) && executeSql(ENGAGEMENTS_TABLE) &&
                       executeSql(USER_SCORES_TABLE) && executeSql(EVENTS_TABLE) && executeSql(IDX_CONTENTS_CREATOR) &&
                       executeSql(IDX_SUBSCRIPTIONS_CREATOR) && executeSql(IDX_EVENTS_TYPE);
        if (!created)
            return false;

        Statement st(db_, "INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)");
        st.bindInt64(1, SCHEMA_VERSION);
        st.bindInt64(2, currentTimestamp());
        if (!st.run())
            return false;

        return tx.commit();
    }

    int32_t SqliteLedgerStore::currentSchemaVersionLocked() const {
        Statement st(db_, "SELECT MAX(version) FROM schema_migrations");
        if (!st.ok())
            return 0;
        if (st.step() == SQLITE_ROW) {
            return static_cast<int32_t>(st.int64(0));
        }
        return 0;
    }

    int32_t SqliteLedgerStore::schemaVersion() const {
        std::lock_guard lock(mutex_);
        requireOpen();
        return currentSchemaVersionLocked();
    }

    void SqliteLedgerStore::requireOpen() const {
        if (!db_ || !is_open_) {
            throw std::runtime_error("Ledger store is not open");
        }
    }

    // ===========================================
    // Transaction Guard
    // ===========================================

    SqliteLedgerStore::TxGuard::TxGuard(sqlite3 *db) : db_(db), active_(false) {
        if (db_) {
            active_ = (sqlite3_exec(db_, "BEGIN IMMEDIATE TRANSACTION", nullptr, nullptr, nullptr) == SQLITE_OK);
        }
    }

    SqliteLedgerStore::TxGuard::~TxGuard() { rollback(); }

    bool SqliteLedgerStore::TxGuard::commit() {
        if (!active_)
            return false;
        if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
            return false;
        }
        active_ = false;
        return true;
    }

    void SqliteLedgerStore::TxGuard::rollback() {
        if (active_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            active_ = false;
        }
    }

    // ===========================================
    // Reads
    // ===========================================

    std::optional<PlatformConfig> SqliteLedgerStore::loadConfig() const {
        std::lock_guard lock(mutex_);
        requireOpen();

        Statement st(db_, "SELECT payment_token, treasury, platform_fee_bps, subscription_period, verbose "
                          "FROM platform_config WHERE id = 0");
        if (!st.ok())
            throw std::runtime_error(lastError(db_, "loadConfig"));

        int rc = st.step();
        if (rc == SQLITE_DONE)
            return std::nullopt;
        if (rc != SQLITE_ROW)
            throw std::runtime_error(lastError(db_, "loadConfig"));

        PlatformConfig config;
        config.payment_token = st.text(0);
        config.treasury = st.text(1);
        config.platform_fee_bps = static_cast<dp::u32>(st.int64(2));
        config.subscription_period = fromColumn(st.int64(3));
        config.verbose = st.int64(4) != 0;
        return config;
    }

    std::optional<CreatorProfile> SqliteLedgerStore::getProfile(const Address &creator) const {
        std::lock_guard lock(mutex_);
        requireOpen();

        Statement st(db_, "SELECT address, profile_data, registered_at FROM creators WHERE address = ?");
        if (!st.ok())
            throw std::runtime_error(lastError(db_, "getProfile"));
        st.bindText(1, creator);

        int rc = st.step();
        if (rc == SQLITE_DONE)
            return std::nullopt;
        if (rc != SQLITE_ROW)
            throw std::runtime_error(lastError(db_, "getProfile"));

        return CreatorProfile(st.text(0), st.text(1), fromColumn(st.int64(2)));
    }

    std::optional<CreatorStats> SqliteLedgerStore::getStats(const Address &creator) const {
        std::lock_guard lock(mutex_);
        requireOpen();

        Statement st(db_, "SELECT total_subscribers, total_content, total_tips_received, subscription_fee, "
                          "engagement_score FROM creator_stats WHERE address = ?");
        if (!st.ok())
            throw std::runtime_error(lastError(db_, "getStats"));
        st.bindText(1, creator);

        int rc = st.step();
        if (rc == SQLITE_DONE)
            return std::nullopt;
        if (rc != SQLITE_ROW)
            throw std::runtime_error(lastError(db_, "getStats"));

        CreatorStats stats;
        stats.total_subscribers = st.amount(0);
        stats.total_content = st.amount(1);
        stats.total_tips_received = st.amount(2);
        stats.subscription_fee = st.amount(3);
        stats.engagement_score = st.amount(4);
        return stats;
    }

    std::optional<Content> SqliteLedgerStore::getContent(ContentId id) const {
        std::lock_guard lock(mutex_);
        requireOpen();

        Statement st(db_, "SELECT content_id, creator, content_hash, timestamp, is_premium, tip_enabled, total_tips, "
                          "total_engagements FROM contents WHERE content_id = ?");
        if (!st.ok())
            throw std::runtime_error(lastError(db_, "getContent"));
        st.bindInt64(1, toColumn(id));

        int rc = st.step();
        if (rc == SQLITE_DONE)
            return std::nullopt;
        if (rc != SQLITE_ROW)
            throw std::runtime_error(lastError(db_, "getContent"));

        Content content;
        content.id = fromColumn(st.int64(0));
        content.creator = st.text(1);
        content.content_hash = st.text(2);
        content.timestamp = fromColumn(st.int64(3));
        content.is_premium = st.int64(4) != 0;
        content.tip_enabled = st.int64(5) != 0;
        content.total_tips = st.amount(6);
        content.total_engagements = st.amount(7);
        return content;
    }

    std::optional<Subscription> SqliteLedgerStore::getSubscription(const Address &subscriber,
                                                                   const Address &creator) const {
        std::lock_guard lock(mutex_);
        requireOpen();

        Statement st(db_, "SELECT active, expiry FROM subscriptions WHERE subscriber = ? AND creator = ?");
        if (!st.ok())
            throw std::runtime_error(lastError(db_, "getSubscription"));
        st.bindText(1, subscriber);
        st.bindText(2, creator);

        int rc = st.step();
        if (rc == SQLITE_DONE)
            return std::nullopt;
        if (rc != SQLITE_ROW)
            throw std::runtime_error(lastError(db_, "getSubscription"));

        Subscription sub;
        sub.active = st.int64(0) != 0;
        sub.expiry = fromColumn(st.int64(1));
        return sub;
    }

    bool SqliteLedgerStore::hasEngaged(ContentId id, const Address &user) const {
        std::lock_guard lock(mutex_);
        requireOpen();

        Statement st(db_, "SELECT 1 FROM engagements WHERE content_id = ? AND user_address = ?");
        if (!st.ok())
            throw std::runtime_error(lastError(db_, "hasEngaged"));
        st.bindInt64(1, toColumn(id));
        st.bindText(2, user);

        int rc = st.step();
        if (rc != SQLITE_ROW && rc != SQLITE_DONE)
            throw std::runtime_error(lastError(db_, "hasEngaged"));
        return rc == SQLITE_ROW;
    }

    Amount SqliteLedgerStore::getUserScore(const Address &user) const {
        std::lock_guard lock(mutex_);
        requireOpen();

        Statement st(db_, "SELECT score FROM user_scores WHERE address = ?");
        if (!st.ok())
            throw std::runtime_error(lastError(db_, "getUserScore"));
        st.bindText(1, user);

        int rc = st.step();
        if (rc == SQLITE_DONE)
            return Amount(0);
        if (rc != SQLITE_ROW)
            throw std::runtime_error(lastError(db_, "getUserScore"));
        return st.amount(0);
    }

    ContentId SqliteLedgerStore::nextContentId() const {
        std::lock_guard lock(mutex_);
        requireOpen();

        Statement st(db_, "SELECT value FROM counters WHERE name = ?");
        if (!st.ok())
            throw std::runtime_error(lastError(db_, "nextContentId"));
        st.bindText(1, NEXT_CONTENT_ID);

        int rc = st.step();
        if (rc == SQLITE_DONE)
            return 0;
        if (rc != SQLITE_ROW)
            throw std::runtime_error(lastError(db_, "nextContentId"));
        return fromColumn(st.int64(0));
    }

    // ===========================================
    // Atomic apply
    // ===========================================

    dp::Result<void, dp::Error> SqliteLedgerStore::apply(const WriteBatch &batch) {
        if (batch.empty()) {
            return dp::Result<void, dp::Error>::ok();
        }

        std::lock_guard lock(mutex_);
        if (!db_ || !is_open_) {
            return dp::Result<void, dp::Error>::err(storage_failed("Ledger store is not open"));
        }

        auto fail = [this](const std::string &what) {
            auto msg = lastError(db_, what);
            return dp::Result<void, dp::Error>::err(storage_failed(dp::String(msg.c_str())));
        };

        TxGuard tx(db_);
        if (!tx.active()) {
            return fail("Failed to begin transaction");
        }

        if (batch.config) {
            const auto &config = *batch.config;
            Statement st(db_, "INSERT OR REPLACE INTO platform_config (id, payment_token, treasury, platform_fee_bps, "
                              "subscription_period, verbose) VALUES (0, ?, ?, ?, ?, ?)");
            st.bindText(1, config.payment_token);
            st.bindText(2, config.treasury);
            st.bindInt64(3, config.platform_fee_bps);
            st.bindInt64(4, toColumn(config.subscription_period));
            st.bindInt64(5, config.verbose ? 1 : 0);
            if (!st.run())
                return fail("Failed to write platform_config");
        }

        for (const auto &profile : batch.profiles) {
            Statement st(db_, "INSERT INTO creators (address, profile_data, registered_at) VALUES (?, ?, ?)");
            st.bindText(1, profile.creator);
            st.bindText(2, profile.profile_data);
            st.bindInt64(3, toColumn(profile.registered_at));
            if (!st.run())
                return fail("Failed to write creator " + profile.creator);
        }

        for (const auto &[creator, stats] : batch.stats) {
            Statement st(db_, "INSERT OR REPLACE INTO creator_stats (address, total_subscribers, total_content, "
                              "total_tips_received, subscription_fee, engagement_score) VALUES (?, ?, ?, ?, ?, ?)");
            st.bindText(1, creator);
            st.bindAmount(2, stats.total_subscribers);
            st.bindAmount(3, stats.total_content);
            st.bindAmount(4, stats.total_tips_received);
            st.bindAmount(5, stats.subscription_fee);
            st.bindAmount(6, stats.engagement_score);
            if (!st.run())
                return fail("Failed to write stats for " + creator);
        }

        for (const auto &content : batch.contents) {
            Statement st(db_, "INSERT OR REPLACE INTO contents (content_id, creator, content_hash, timestamp, "
                              "is_premium, tip_enabled, total_tips, total_engagements) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
            st.bindInt64(1, toColumn(content.id));
            st.bindText(2, content.creator);
            st.bindText(3, content.content_hash);
            st.bindInt64(4, toColumn(content.timestamp));
            st.bindInt64(5, content.is_premium ? 1 : 0);
            st.bindInt64(6, content.tip_enabled ? 1 : 0);
            st.bindAmount(7, content.total_tips);
            st.bindAmount(8, content.total_engagements);
            if (!st.run())
                return fail("Failed to write content " + std::to_string(content.id));
        }

        for (const auto &[key, sub] : batch.subscriptions) {
            Statement st(db_, "INSERT OR REPLACE INTO subscriptions (subscriber, creator, active, expiry) "
                              "VALUES (?, ?, ?, ?)");
            st.bindText(1, key.subscriber);
            st.bindText(2, key.creator);
            st.bindInt64(3, sub.active ? 1 : 0);
            st.bindInt64(4, toColumn(sub.expiry));
            if (!st.run())
                return fail("Failed to write subscription");
        }

        for (const auto &key : batch.engagements) {
            Statement st(db_, "INSERT INTO engagements (content_id, user_address) VALUES (?, ?)");
            st.bindInt64(1, toColumn(key.content_id));
            st.bindText(2, key.user);
            if (!st.run())
                return fail("Failed to write engagement");
        }

        for (const auto &[user, score] : batch.user_scores) {
            Statement st(db_, "INSERT OR REPLACE INTO user_scores (address, score) VALUES (?, ?)");
            st.bindText(1, user);
            st.bindAmount(2, score);
            if (!st.run())
                return fail("Failed to write user score");
        }

        if (batch.next_content_id) {
            Statement st(db_, "INSERT OR REPLACE INTO counters (name, value) VALUES (?, ?)");
            st.bindText(1, NEXT_CONTENT_ID);
            st.bindInt64(2, toColumn(*batch.next_content_id));
            if (!st.run())
                return fail("Failed to write content counter");
        }

        if (!tx.commit()) {
            return fail("Failed to commit");
        }
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Event journal
    // ===========================================

    dp::Result<void, dp::Error> SqliteLedgerStore::appendEvent(const ledger::LedgerEvent &event) {
        std::lock_guard lock(mutex_);
        if (!db_ || !is_open_) {
            return dp::Result<void, dp::Error>::err(storage_failed("Ledger store is not open"));
        }

        Statement st(db_, "INSERT INTO events (event_type, creator, actor, content_id, data, is_premium, amount, "
                          "timestamp, expiry) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
        st.bindInt64(1, event.event_type);
        st.bindText(2, event.creator);
        st.bindText(3, event.actor);
        st.bindInt64(4, toColumn(event.content_id));
        st.bindText(5, event.data);
        st.bindInt64(6, event.is_premium ? 1 : 0);
        st.bindAmount(7, event.amount);
        st.bindInt64(8, toColumn(event.timestamp));
        st.bindInt64(9, toColumn(event.expiry));
        if (!st.run()) {
            auto msg = lastError(db_, "Failed to append event");
            return dp::Result<void, dp::Error>::err(storage_failed(dp::String(msg.c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    std::vector<ledger::LedgerEvent> SqliteLedgerStore::readEvents() const {
        std::lock_guard lock(mutex_);
        requireOpen();

        Statement st(db_, "SELECT event_type, creator, actor, content_id, data, is_premium, amount, timestamp, expiry "
                          "FROM events ORDER BY seq");
        if (!st.ok())
            throw std::runtime_error(lastError(db_, "readEvents"));

        std::vector<ledger::LedgerEvent> events;
        int rc;
        while ((rc = st.step()) == SQLITE_ROW) {
            ledger::LedgerEvent ev;
            ev.event_type = static_cast<dp::u8>(st.int64(0));
            ev.creator = st.text(1);
            ev.actor = st.text(2);
            ev.content_id = fromColumn(st.int64(3));
            ev.data = st.text(4);
            ev.is_premium = st.int64(5) != 0;
            ev.amount = st.amount(6);
            ev.timestamp = fromColumn(st.int64(7));
            ev.expiry = fromColumn(st.int64(8));
            events.push_back(std::move(ev));
        }
        if (rc != SQLITE_DONE)
            throw std::runtime_error(lastError(db_, "readEvents"));
        return events;
    }

    int64_t SqliteLedgerStore::eventCount() const { return countRows("events"); }

    // ===========================================
    // Statistics & Diagnostics
    // ===========================================

    int64_t SqliteLedgerStore::countRows(const char *table) const {
        std::lock_guard lock(mutex_);
        requireOpen();

        std::string sql = std::string("SELECT COUNT(*) FROM ") + table;
        Statement st(db_, sql.c_str());
        if (!st.ok() || st.step() != SQLITE_ROW)
            throw std::runtime_error(lastError(db_, sql));
        return st.int64(0);
    }

    int64_t SqliteLedgerStore::creatorCount() const { return countRows("creators"); }

    int64_t SqliteLedgerStore::subscriptionCount() const { return countRows("subscriptions"); }

    int64_t SqliteLedgerStore::engagementCount() const { return countRows("engagements"); }

    bool SqliteLedgerStore::quickCheck() const {
        std::lock_guard lock(mutex_);
        if (!db_ || !is_open_)
            return false;

        Statement st(db_, "PRAGMA quick_check");
        if (!st.ok() || st.step() != SQLITE_ROW)
            return false;
        return st.text(0) == "ok";
    }

    // ===========================================
    // SqliteEventJournal
    // ===========================================

    void SqliteEventJournal::emit(const ledger::LedgerEvent &event) {
        auto result = store_->appendEvent(event);
        if (!result.is_ok()) {
            throw std::runtime_error(result.error().message.c_str());
        }
    }

} // namespace creatorledger::storage
