#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "drcv/error_codes.hpp"
#include "drcv/protocol.hpp"

struct sqlite3;

namespace drcv::server
{

    class StoreError : public std::runtime_error
    {
    public:
        explicit StoreError(std::string message, drcv::ErrorCode code = drcv::ErrorCode::StorageFailure);

        drcv::ErrorCode code() const noexcept { return code_; }

    private:
        drcv::ErrorCode code_;
    };

    struct SessionChanges
    {
        std::vector<drcv::protocol::UploadSession> sessions;
        // Position after the last change included in `sessions`.
        std::int64_t cursor{};
    };

    /**
     * Durable table of upload sessions and connected clients, backed by SQLite.
     *
     * Every public operation runs under one mutex and is a single statement or a single
     * transaction, so callers on different io threads never observe a half-applied change.
     * At most one non-complete session exists per (filename, client identity); the schema
     * enforces it with a partial unique index.
     */
    class SessionStore
    {
    public:
        using ClockFunction = std::function<drcv::protocol::Timestamp()>;

        explicit SessionStore(const std::filesystem::path &database_path,
                              ClockFunction clock = &drcv::protocol::now);
        ~SessionStore();

        SessionStore(const SessionStore &) = delete;
        SessionStore &operator=(const SessionStore &) = delete;

        drcv::protocol::Timestamp now() const;

        // Returns the open session for the key, creating an `init` row when there is none.
        std::int64_t resolve(const std::string &filename, const std::string &client_identity);

        std::optional<drcv::protocol::UploadSession> find_open(const std::string &filename,
                                                               const std::string &client_identity) const;
        std::optional<drcv::protocol::UploadSession> get(std::int64_t id) const;

        drcv::protocol::UploadSession record_chunk(std::int64_t id, std::uint64_t bytes);
        // Adds the final chunk's bytes and completes the session in one transaction.
        drcv::protocol::UploadSession mark_complete(std::int64_t id, std::uint64_t final_bytes = 0);

        // Refreshes updated_at of the caller's `uploading` sessions among `ids`; returns how many.
        std::size_t touch_uploads(const std::string &client_identity, const std::vector<std::int64_t> &ids);

        void upsert_client(const std::string &identity, const std::optional<std::string> &user_agent);
        std::optional<drcv::protocol::ClientRecord> find_client(const std::string &identity) const;
        std::vector<drcv::protocol::ClientRecord> list_clients() const;

        std::vector<drcv::protocol::UploadSession> mark_stale_uploads_disconnected(drcv::protocol::Timestamp cutoff);
        std::vector<std::string> remove_stale_clients(drcv::protocol::Timestamp cutoff);

        // Every write to an upload row stamps it with the next change sequence number alongside updated_at.
        std::int64_t change_cursor() const;
        // Sessions written strictly after `cursor`, oldest updated_at first.
        SessionChanges changes_since(std::int64_t cursor) const;

        // Newest first. `page` is 1-based; `filter` matches a filename substring when non-empty.
        std::vector<drcv::protocol::UploadSession> list_sessions(std::size_t page, std::size_t page_size,
                                                                 const std::string &filter) const;

        std::optional<std::string> kv_get(const std::string &key) const;
        void kv_set(const std::string &key, const std::string &value);

    private:
        void exec(const char *sql);
        void ensure_schema();
        std::optional<drcv::protocol::UploadSession> get_locked(std::int64_t id) const;

        sqlite3 *db_{};
        mutable std::mutex mutex_;
        ClockFunction clock_;
        std::int64_t change_seq_{0};
    };

} // namespace drcv::server
