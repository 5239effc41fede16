#include "drcv/server/session_store.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace drcv::server
{

    StoreError::StoreError(std::string message, drcv::ErrorCode code)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {
        using drcv::protocol::ClientRecord;
        using drcv::protocol::Timestamp;
        using drcv::protocol::UploadSession;
        using drcv::protocol::UploadStatus;

        constexpr auto kSessionColumns =
            "id, filename, client_identity, size, status, started_at, updated_at, completed_at";

        class Statement
        {
        public:
            Statement(sqlite3 *db, const std::string &sql) : db_(db)
            {
                if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK)
                {
                    throw StoreError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db_));
                }
            }

            ~Statement()
            {
                sqlite3_finalize(stmt_);
            }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            Statement &bind_int64(int index, std::int64_t value)
            {
                check_bind(sqlite3_bind_int64(stmt_, index, value));
                return *this;
            }

            Statement &bind_text(int index, const std::string &value)
            {
                check_bind(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                                             SQLITE_TRANSIENT));
                return *this;
            }

            Statement &bind_optional_text(int index, const std::optional<std::string> &value)
            {
                if (value)
                {
                    return bind_text(index, *value);
                }
                check_bind(sqlite3_bind_null(stmt_, index));
                return *this;
            }

            // true while rows are produced, false once the statement is done.
            bool step()
            {
                const int rc = sqlite3_step(stmt_);
                if (rc == SQLITE_ROW)
                {
                    return true;
                }
                if (rc == SQLITE_DONE)
                {
                    return false;
                }
                throw StoreError(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
            }

            void run()
            {
                while (step())
                {
                }
            }

            std::int64_t column_int64(int index) const
            {
                return sqlite3_column_int64(stmt_, index);
            }

            bool column_is_null(int index) const
            {
                return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
            }

            std::string column_text(int index) const
            {
                const auto *text = sqlite3_column_text(stmt_, index);
                if (text == nullptr)
                {
                    return {};
                }
                return std::string(reinterpret_cast<const char *>(text),
                                   static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
            }

        private:
            void check_bind(int rc)
            {
                if (rc != SQLITE_OK)
                {
                    throw StoreError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
                }
            }

            sqlite3 *db_;
            sqlite3_stmt *stmt_{};
        };

        void exec_sql(sqlite3 *db, const char *sql)
        {
            char *err = nullptr;
            if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK)
            {
                std::string message = err ? err : "sqlite error";
                sqlite3_free(err);
                throw StoreError(message);
            }
        }

        bool has_column(sqlite3 *db, const std::string &table, const std::string &column)
        {
            Statement info(db, "PRAGMA table_info(" + table + ");");
            while (info.step())
            {
                if (info.column_text(1) == column)
                {
                    return true;
                }
            }
            return false;
        }

        class Transaction
        {
        public:
            explicit Transaction(sqlite3 *db) : db_(db)
            {
                exec_sql(db_, "BEGIN IMMEDIATE;");
            }

            ~Transaction()
            {
                if (committed_)
                {
                    return;
                }
                char *err = nullptr;
                if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK)
                {
                    spdlog::error("Rollback failed: {}", err ? err : "sqlite error");
                    sqlite3_free(err);
                }
            }

            Transaction(const Transaction &) = delete;
            Transaction &operator=(const Transaction &) = delete;

            void commit()
            {
                exec_sql(db_, "COMMIT;");
                committed_ = true;
            }

        private:
            sqlite3 *db_;
            bool committed_{false};
        };

        UploadSession read_session(const Statement &statement)
        {
            UploadSession session{};
            session.id = statement.column_int64(0);
            session.filename = statement.column_text(1);
            session.client_identity = statement.column_text(2);
            session.size = static_cast<std::uint64_t>(statement.column_int64(3));
            const auto status_label = statement.column_text(4);
            const auto status = drcv::protocol::upload_status_from_string(status_label);
            if (!status)
            {
                throw StoreError("Unknown upload status in store: " + status_label);
            }
            session.status = *status;
            session.started_at = drcv::protocol::from_unix_millis(statement.column_int64(5));
            session.updated_at = drcv::protocol::from_unix_millis(statement.column_int64(6));
            if (!statement.column_is_null(7))
            {
                session.completed_at = drcv::protocol::from_unix_millis(statement.column_int64(7));
            }
            return session;
        }

        ClientRecord read_client(const Statement &statement)
        {
            ClientRecord client{};
            client.identity = statement.column_text(0);
            if (!statement.column_is_null(1))
            {
                client.user_agent = statement.column_text(1);
            }
            client.first_seen = drcv::protocol::from_unix_millis(statement.column_int64(2));
            client.last_seen = drcv::protocol::from_unix_millis(statement.column_int64(3));
            client.status = statement.column_text(4);
            return client;
        }

        std::string session_query(const std::string &tail)
        {
            return std::string("SELECT ") + kSessionColumns + " FROM uploads " + tail;
        }

        std::string status_text(UploadStatus status)
        {
            return std::string(drcv::protocol::to_string(status));
        }

    } // namespace

    SessionStore::SessionStore(const std::filesystem::path &database_path, ClockFunction clock)
        : clock_(std::move(clock))
    {
        const auto location = database_path.string();
        if (location != ":memory:" && database_path.has_parent_path())
        {
            std::filesystem::create_directories(database_path.parent_path());
        }
        if (sqlite3_open_v2(location.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK)
        {
            std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            db_ = nullptr;
            throw StoreError("Failed to open session store " + location + ": " + message);
        }
        sqlite3_busy_timeout(db_, 5000);
        try
        {
            exec("PRAGMA journal_mode=WAL;");
            exec("PRAGMA synchronous=NORMAL;");
            ensure_schema();
        }
        catch (...)
        {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }
    }

    SessionStore::~SessionStore()
    {
        if (db_)
        {
            sqlite3_close(db_);
        }
    }

    drcv::protocol::Timestamp SessionStore::now() const
    {
        return clock_();
    }

    void SessionStore::exec(const char *sql)
    {
        exec_sql(db_, sql);
    }

    void SessionStore::ensure_schema()
    {
        exec(
            "CREATE TABLE IF NOT EXISTS uploads ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  filename TEXT NOT NULL,"
            "  client_identity TEXT NOT NULL,"
            "  size INTEGER NOT NULL DEFAULT 0,"
            "  status TEXT NOT NULL,"
            "  started_at INTEGER NOT NULL,"
            "  updated_at INTEGER NOT NULL,"
            "  completed_at INTEGER,"
            "  change_seq INTEGER NOT NULL DEFAULT 0"
            ");");
        if (!has_column(db_, "uploads", "change_seq"))
        {
            exec("ALTER TABLE uploads ADD COLUMN change_seq INTEGER NOT NULL DEFAULT 0;");
        }
        // One in-progress session per (filename, client).
        exec(
            "CREATE UNIQUE INDEX IF NOT EXISTS idx_uploads_open_key "
            "ON uploads(filename, client_identity) WHERE status != 'complete';");
        exec("CREATE INDEX IF NOT EXISTS idx_uploads_updated_at ON uploads(updated_at);");
        exec("CREATE INDEX IF NOT EXISTS idx_uploads_change_seq ON uploads(change_seq);");
        exec(
            "CREATE TABLE IF NOT EXISTS clients ("
            "  identity TEXT PRIMARY KEY,"
            "  user_agent TEXT,"
            "  first_seen INTEGER NOT NULL,"
            "  last_seen INTEGER NOT NULL,"
            "  status TEXT NOT NULL DEFAULT 'connected'"
            ");");
        exec(
            "CREATE TABLE IF NOT EXISTS kv ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT NOT NULL"
            ");");

        Statement latest(db_, "SELECT COALESCE(MAX(change_seq), 0) FROM uploads;");
        if (latest.step())
        {
            change_seq_ = latest.column_int64(0);
        }
    }

    std::int64_t SessionStore::resolve(const std::string &filename, const std::string &client_identity)
    {
        std::lock_guard lock(mutex_);
        Transaction transaction(db_);

        std::optional<std::int64_t> existing;
        {
            Statement select(db_, "SELECT id FROM uploads "
                                  "WHERE filename = ?1 AND client_identity = ?2 AND status != 'complete' LIMIT 1;");
            select.bind_text(1, filename).bind_text(2, client_identity);
            if (select.step())
            {
                existing = select.column_int64(0);
            }
        }
        if (existing)
        {
            transaction.commit();
            return *existing;
        }

        const auto now = drcv::protocol::to_unix_millis(clock_());
        const auto seq = change_seq_ + 1;
        Statement insert(db_, "INSERT INTO uploads(filename, client_identity, size, status, started_at, updated_at, "
                              "change_seq) VALUES(?1, ?2, 0, ?3, ?4, ?4, ?5);");
        insert.bind_text(1, filename)
            .bind_text(2, client_identity)
            .bind_text(3, status_text(UploadStatus::Init))
            .bind_int64(4, now)
            .bind_int64(5, seq);
        insert.run();
        const auto id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
        transaction.commit();
        change_seq_ = seq;
        return id;
    }

    std::optional<drcv::protocol::UploadSession> SessionStore::find_open(const std::string &filename,
                                                                         const std::string &client_identity) const
    {
        std::lock_guard lock(mutex_);
        Statement select(db_, session_query("WHERE filename = ?1 AND client_identity = ?2 "
                                            "AND status != 'complete' LIMIT 1;"));
        select.bind_text(1, filename).bind_text(2, client_identity);
        if (select.step())
        {
            return read_session(select);
        }
        return std::nullopt;
    }

    std::optional<drcv::protocol::UploadSession> SessionStore::get(std::int64_t id) const
    {
        std::lock_guard lock(mutex_);
        return get_locked(id);
    }

    std::optional<drcv::protocol::UploadSession> SessionStore::get_locked(std::int64_t id) const
    {
        Statement select(db_, session_query("WHERE id = ?1;"));
        select.bind_int64(1, id);
        if (select.step())
        {
            return read_session(select);
        }
        return std::nullopt;
    }

    drcv::protocol::UploadSession SessionStore::record_chunk(std::int64_t id, std::uint64_t bytes)
    {
        std::lock_guard lock(mutex_);
        Transaction transaction(db_);
        const auto seq = change_seq_ + 1;
        Statement update(db_, "UPDATE uploads SET size = size + ?1, status = ?2, updated_at = ?3, change_seq = ?4 "
                              "WHERE id = ?5 AND status != 'complete';");
        update.bind_int64(1, static_cast<std::int64_t>(bytes))
            .bind_text(2, status_text(UploadStatus::Uploading))
            .bind_int64(3, drcv::protocol::to_unix_millis(clock_()))
            .bind_int64(4, seq)
            .bind_int64(5, id);
        update.run();
        if (sqlite3_changes(db_) == 0)
        {
            throw StoreError("Upload session " + std::to_string(id) + " is not open", drcv::ErrorCode::NotFound);
        }
        auto session = get_locked(id);
        transaction.commit();
        change_seq_ = seq;
        return *session;
    }

    drcv::protocol::UploadSession SessionStore::mark_complete(std::int64_t id, std::uint64_t final_bytes)
    {
        std::lock_guard lock(mutex_);
        Transaction transaction(db_);
        const auto seq = change_seq_ + 1;
        Statement update(db_, "UPDATE uploads SET size = size + ?1, status = ?2, updated_at = ?3, completed_at = ?3, "
                              "change_seq = ?4 WHERE id = ?5 AND status != 'complete';");
        update.bind_int64(1, static_cast<std::int64_t>(final_bytes))
            .bind_text(2, status_text(UploadStatus::Complete))
            .bind_int64(3, drcv::protocol::to_unix_millis(clock_()))
            .bind_int64(4, seq)
            .bind_int64(5, id);
        update.run();
        if (sqlite3_changes(db_) == 0)
        {
            throw StoreError("Upload session " + std::to_string(id) + " is not open", drcv::ErrorCode::NotFound);
        }
        auto session = get_locked(id);
        transaction.commit();
        change_seq_ = seq;
        return *session;
    }

    std::size_t SessionStore::touch_uploads(const std::string &client_identity, const std::vector<std::int64_t> &ids)
    {
        const std::set<std::int64_t> unique_ids(ids.begin(), ids.end());
        if (unique_ids.empty())
        {
            return 0;
        }

        std::lock_guard lock(mutex_);
        Transaction transaction(db_);
        const auto now = drcv::protocol::to_unix_millis(clock_());
        const auto seq = change_seq_ + 1;
        std::size_t refreshed = 0;
        for (const auto id : unique_ids)
        {
            Statement update(db_, "UPDATE uploads SET updated_at = ?1, change_seq = ?2 "
                                  "WHERE id = ?3 AND client_identity = ?4 AND status = ?5;");
            update.bind_int64(1, now)
                .bind_int64(2, seq)
                .bind_int64(3, id)
                .bind_text(4, client_identity)
                .bind_text(5, status_text(UploadStatus::Uploading));
            update.run();
            refreshed += static_cast<std::size_t>(sqlite3_changes(db_));
        }
        transaction.commit();
        if (refreshed > 0)
        {
            change_seq_ = seq;
        }
        return refreshed;
    }

    void SessionStore::upsert_client(const std::string &identity, const std::optional<std::string> &user_agent)
    {
        std::lock_guard lock(mutex_);
        Statement upsert(db_, "INSERT INTO clients(identity, user_agent, first_seen, last_seen, status) "
                              "VALUES(?1, ?2, ?3, ?3, 'connected') "
                              "ON CONFLICT(identity) DO UPDATE SET "
                              "  user_agent = COALESCE(excluded.user_agent, clients.user_agent),"
                              "  last_seen = excluded.last_seen,"
                              "  status = 'connected';");
        upsert.bind_text(1, identity)
            .bind_optional_text(2, user_agent)
            .bind_int64(3, drcv::protocol::to_unix_millis(clock_()));
        upsert.run();
    }

    std::optional<drcv::protocol::ClientRecord> SessionStore::find_client(const std::string &identity) const
    {
        std::lock_guard lock(mutex_);
        Statement select(db_, "SELECT identity, user_agent, first_seen, last_seen, status "
                              "FROM clients WHERE identity = ?1;");
        select.bind_text(1, identity);
        if (select.step())
        {
            return read_client(select);
        }
        return std::nullopt;
    }

    std::vector<drcv::protocol::ClientRecord> SessionStore::list_clients() const
    {
        std::lock_guard lock(mutex_);
        Statement select(db_, "SELECT identity, user_agent, first_seen, last_seen, status "
                              "FROM clients ORDER BY last_seen DESC, identity ASC;");
        std::vector<ClientRecord> clients;
        while (select.step())
        {
            clients.push_back(read_client(select));
        }
        return clients;
    }

    std::vector<drcv::protocol::UploadSession> SessionStore::mark_stale_uploads_disconnected(
        drcv::protocol::Timestamp cutoff)
    {
        std::lock_guard lock(mutex_);
        Transaction transaction(db_);
        const auto uploading = status_text(UploadStatus::Uploading);
        const auto cutoff_millis = drcv::protocol::to_unix_millis(cutoff);

        std::vector<UploadSession> stale;
        {
            Statement select(db_, session_query("WHERE status = ?1 AND updated_at < ?2 ORDER BY id;"));
            select.bind_text(1, uploading).bind_int64(2, cutoff_millis);
            while (select.step())
            {
                stale.push_back(read_session(select));
            }
        }
        if (stale.empty())
        {
            transaction.commit();
            return stale;
        }

        // updated_at moves so the change feed reports the transition.
        const auto now = clock_();
        const auto seq = change_seq_ + 1;
        Statement update(db_, "UPDATE uploads SET status = ?1, updated_at = ?2, change_seq = ?3 "
                              "WHERE status = ?4 AND updated_at < ?5;");
        update.bind_text(1, status_text(UploadStatus::Disconnected))
            .bind_int64(2, drcv::protocol::to_unix_millis(now))
            .bind_int64(3, seq)
            .bind_text(4, uploading)
            .bind_int64(5, cutoff_millis);
        update.run();
        transaction.commit();
        change_seq_ = seq;

        for (auto &session : stale)
        {
            session.status = UploadStatus::Disconnected;
            session.updated_at = now;
        }
        return stale;
    }

    std::vector<std::string> SessionStore::remove_stale_clients(drcv::protocol::Timestamp cutoff)
    {
        std::lock_guard lock(mutex_);
        Transaction transaction(db_);
        const auto cutoff_millis = drcv::protocol::to_unix_millis(cutoff);

        std::vector<std::string> removed;
        {
            Statement select(db_, "SELECT identity FROM clients "
                                  "WHERE status = 'connected' AND last_seen < ?1 ORDER BY identity;");
            select.bind_int64(1, cutoff_millis);
            while (select.step())
            {
                removed.push_back(select.column_text(0));
            }
        }
        Statement remove(db_, "DELETE FROM clients WHERE status = 'connected' AND last_seen < ?1;");
        remove.bind_int64(1, cutoff_millis);
        remove.run();
        transaction.commit();
        return removed;
    }

    std::int64_t SessionStore::change_cursor() const
    {
        std::lock_guard lock(mutex_);
        return change_seq_;
    }

    SessionChanges SessionStore::changes_since(std::int64_t cursor) const
    {
        std::lock_guard lock(mutex_);
        SessionChanges changes;
        changes.cursor = change_seq_;
        if (cursor >= change_seq_)
        {
            return changes;
        }
        Statement select(db_, session_query("WHERE change_seq > ?1 ORDER BY updated_at ASC, id ASC;"));
        select.bind_int64(1, cursor);
        while (select.step())
        {
            changes.sessions.push_back(read_session(select));
        }
        return changes;
    }

    std::vector<drcv::protocol::UploadSession> SessionStore::list_sessions(std::size_t page, std::size_t page_size,
                                                                           const std::string &filter) const
    {
        const auto offset = static_cast<std::int64_t>((std::max<std::size_t>(page, 1) - 1) * page_size);
        std::lock_guard lock(mutex_);
        std::vector<UploadSession> sessions;
        if (filter.empty())
        {
            Statement select(db_, session_query("ORDER BY id DESC LIMIT ?1 OFFSET ?2;"));
            select.bind_int64(1, static_cast<std::int64_t>(page_size)).bind_int64(2, offset);
            while (select.step())
            {
                sessions.push_back(read_session(select));
            }
            return sessions;
        }

        // instr() keeps % and _ in the filter literal.
        Statement select(db_, session_query("WHERE instr(filename, ?1) > 0 ORDER BY id DESC LIMIT ?2 OFFSET ?3;"));
        select.bind_text(1, filter)
            .bind_int64(2, static_cast<std::int64_t>(page_size))
            .bind_int64(3, offset);
        while (select.step())
        {
            sessions.push_back(read_session(select));
        }
        return sessions;
    }

    std::optional<std::string> SessionStore::kv_get(const std::string &key) const
    {
        std::lock_guard lock(mutex_);
        Statement select(db_, "SELECT value FROM kv WHERE key = ?1;");
        select.bind_text(1, key);
        if (select.step())
        {
            return select.column_text(0);
        }
        return std::nullopt;
    }

    void SessionStore::kv_set(const std::string &key, const std::string &value)
    {
        std::lock_guard lock(mutex_);
        Statement upsert(db_, "INSERT INTO kv(key, value) VALUES(?1, ?2) "
                              "ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
        upsert.bind_text(1, key).bind_text(2, value);
        upsert.run();
    }

} // namespace drcv::server
