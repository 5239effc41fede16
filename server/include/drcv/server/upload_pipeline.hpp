#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "drcv/error_codes.hpp"
#include "drcv/protocol.hpp"
#include "drcv/server/session_store.hpp"

namespace drcv::server
{

    class UploadError : public std::runtime_error
    {
    public:
        UploadError(drcv::ErrorCode code, std::string message);

        drcv::ErrorCode code() const noexcept { return code_; }

    private:
        drcv::ErrorCode code_;
    };

    struct ChunkRequest
    {
        std::string filename;
        std::string client_identity;
        std::uint64_t chunk_index{};
        std::uint64_t total_chunks{};
        std::string data;
    };

    struct ChunkResult
    {
        std::int64_t session_id{};
        std::uint64_t size{};
        drcv::protocol::UploadStatus status{drcv::protocol::UploadStatus::Init};
        std::filesystem::path final_path{};
    };

    /**
     * Appends chunks to per-session staging files and finalizes them.
     *
     * Chunks of one session are processed one at a time: the append, the size update and the
     * final rename all happen under that session's mutex. Staging files live in a hidden
     * directory under the upload root and are named by session id, so two clients sending the
     * same filename never share one.
     */
    class UploadPipeline
    {
    public:
        UploadPipeline(SessionStore &store, std::filesystem::path upload_dir, std::uint64_t max_file_size);

        ChunkResult ingest(const ChunkRequest &request);

        // Bytes accepted so far by the open session for the key; 0 when there is none.
        std::uint64_t probe(const std::string &filename, const std::string &client_identity) const;

        std::filesystem::path staging_path(std::int64_t session_id) const;
        std::filesystem::path final_path(const std::string &filename) const;

        static void validate_filename(const std::string &filename);

        // Drops per-session state for sessions the reaper disconnected; a later chunk starts afresh.
        void release_idle(const std::vector<drcv::protocol::UploadSession> &sessions);
        std::size_t tracked_sessions() const;

    private:
        struct SessionSlot
        {
            std::mutex mutex;
            bool announced{false};
        };

        std::shared_ptr<SessionSlot> slot_for(std::int64_t session_id);
        void release_slot(std::int64_t session_id);
        void append_to_staging(const std::filesystem::path &path, const std::string &data) const;
        std::uint64_t staged_length(const std::filesystem::path &path) const;
        void truncate_staging(const std::filesystem::path &path, std::uint64_t length) const;

        SessionStore &store_;
        std::filesystem::path upload_dir_;
        std::filesystem::path staging_dir_;
        std::uint64_t max_file_size_;

        mutable std::mutex slots_mutex_;
        std::unordered_map<std::int64_t, std::shared_ptr<SessionSlot>> slots_;
    };

} // namespace drcv::server
