#include "drcv/server/upload_pipeline.hpp"

#include <fstream>
#include <limits>
#include <system_error>

#include <spdlog/spdlog.h>

namespace drcv::server
{

    UploadError::UploadError(drcv::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {
        constexpr auto kStagingDir = ".drcv-staging";
        constexpr auto kStagingSuffix = ".part";
        // A session id that completed between resolve and lock is retried once with a fresh resolve.
        constexpr int kResolveAttempts = 2;
    } // namespace

    UploadPipeline::UploadPipeline(SessionStore &store, std::filesystem::path upload_dir, std::uint64_t max_file_size)
        : store_(store),
          upload_dir_(std::move(upload_dir)),
          staging_dir_(upload_dir_ / kStagingDir),
          max_file_size_(max_file_size)
    {
        std::filesystem::create_directories(staging_dir_);
    }

    void UploadPipeline::validate_filename(const std::string &filename)
    {
        if (filename.empty() || filename == "." || filename == "..")
        {
            throw UploadError(drcv::ErrorCode::InvalidPayload, "Invalid filename");
        }
        if (filename.find_first_of(std::string("/\\\0", 3)) != std::string::npos)
        {
            throw UploadError(drcv::ErrorCode::InvalidPayload, "Filename must not contain path separators");
        }
        if (filename == kStagingDir)
        {
            throw UploadError(drcv::ErrorCode::InvalidPayload, "Filename is reserved");
        }
    }

    std::filesystem::path UploadPipeline::staging_path(std::int64_t session_id) const
    {
        return staging_dir_ / (std::to_string(session_id) + kStagingSuffix);
    }

    std::filesystem::path UploadPipeline::final_path(const std::string &filename) const
    {
        return upload_dir_ / filename;
    }

    std::uint64_t UploadPipeline::probe(const std::string &filename, const std::string &client_identity) const
    {
        const auto session = store_.find_open(filename, client_identity);
        return session ? session->size : 0;
    }

    ChunkResult UploadPipeline::ingest(const ChunkRequest &request)
    {
        validate_filename(request.filename);
        if (request.total_chunks == 0 || request.chunk_index >= request.total_chunks)
        {
            throw UploadError(drcv::ErrorCode::InvalidPayload, "chunkIndex must be below totalChunks");
        }
        const auto chunk_bytes = static_cast<std::uint64_t>(request.data.size());
        if (chunk_bytes != 0 && request.total_chunks > std::numeric_limits<std::uint64_t>::max() / chunk_bytes)
        {
            throw UploadError(drcv::ErrorCode::PayloadTooLarge, "Upload exceeds the maximum file size");
        }
        // Pessimistic: assumes every chunk is as large as this one.
        if (chunk_bytes * request.total_chunks > max_file_size_)
        {
            throw UploadError(drcv::ErrorCode::PayloadTooLarge, "Upload exceeds the maximum file size");
        }

        const bool final_chunk = request.chunk_index + 1 == request.total_chunks;
        std::int64_t session_id = 0;
        try
        {
            for (int attempt = 0; attempt < kResolveAttempts; ++attempt)
            {
                session_id = store_.resolve(request.filename, request.client_identity);
                auto slot = slot_for(session_id);
                std::lock_guard session_lock(slot->mutex);

                auto session = store_.get(session_id);
                if (!session || session->status == drcv::protocol::UploadStatus::Complete)
                {
                    continue;
                }
                const auto previous_size = session->size;

                const auto staging = staging_path(session_id);
                const auto staged_before = staged_length(staging);
                append_to_staging(staging, request.data);

                if (!slot->announced)
                {
                    slot->announced = true;
                    if (previous_size == 0)
                    {
                        spdlog::info("Upload started: {} from {} (session {})", request.filename,
                                     request.client_identity, session_id);
                    }
                    else
                    {
                        spdlog::info("Upload resumed: {} from {} (session {}) at {} bytes", request.filename,
                                     request.client_identity, session_id, previous_size);
                    }
                }

                if (!final_chunk)
                {
                    if (chunk_bytes > 0)
                    {
                        try
                        {
                            session = store_.record_chunk(session_id, chunk_bytes);
                        }
                        catch (const StoreError &)
                        {
                            truncate_staging(staging, staged_before);
                            throw;
                        }
                    }
                    return ChunkResult{
                        .session_id = session_id,
                        .size = session->size,
                        .status = session->status,
                    };
                }

                const auto target = final_path(request.filename);
                std::error_code ec;
                std::filesystem::rename(staging, target, ec);
                if (ec)
                {
                    spdlog::error("Failed to finalize {} from {} (session {}): {}", request.filename,
                                  request.client_identity, session_id, ec.message());
                    truncate_staging(staging, staged_before);
                    throw UploadError(drcv::ErrorCode::StorageFailure, "Failed to finalize upload: " + ec.message());
                }

                drcv::protocol::UploadSession completed;
                try
                {
                    completed = store_.mark_complete(session_id, chunk_bytes);
                }
                catch (const StoreError &)
                {
                    // Put the staging file back as it was before this chunk so a retry starts clean.
                    std::error_code restore_ec;
                    std::filesystem::rename(target, staging, restore_ec);
                    if (restore_ec)
                    {
                        spdlog::error("Failed to restore staging file for session {}: {}", session_id,
                                      restore_ec.message());
                    }
                    else
                    {
                        truncate_staging(staging, staged_before);
                    }
                    throw;
                }
                release_slot(session_id);
                spdlog::info("Upload completed: {} from {} (session {}, {} bytes)", request.filename,
                             request.client_identity, session_id, completed.size);

                ChunkResult result{
                    .session_id = session_id,
                    .size = completed.size,
                    .status = completed.status,
                    .final_path = target,
                };
                return result;
            }
        }
        catch (const StoreError &ex)
        {
            spdlog::error("Store failure for {} from {} (session {}): {}", request.filename, request.client_identity,
                          session_id, ex.what());
            throw UploadError(drcv::ErrorCode::StorageFailure, ex.what());
        }

        spdlog::error("Could not obtain an open session for {} from {}", request.filename, request.client_identity);
        throw UploadError(drcv::ErrorCode::StorageFailure, "Could not obtain an open upload session");
    }

    std::uint64_t UploadPipeline::staged_length(const std::filesystem::path &path) const
    {
        std::error_code ec;
        const auto length = std::filesystem::file_size(path, ec);
        return ec ? 0 : static_cast<std::uint64_t>(length);
    }

    void UploadPipeline::truncate_staging(const std::filesystem::path &path, std::uint64_t length) const
    {
        std::error_code ec;
        std::filesystem::resize_file(path, length, ec);
        if (ec)
        {
            spdlog::error("Failed to roll back staging file {} to {} bytes: {}", path.string(), length, ec.message());
        }
    }

    void UploadPipeline::append_to_staging(const std::filesystem::path &path, const std::string &data) const
    {
        std::ofstream file(path, std::ios::binary | std::ios::app);
        if (!file.is_open())
        {
            spdlog::error("Failed to open staging file {}", path.string());
            throw UploadError(drcv::ErrorCode::StorageFailure, "Failed to open staging file");
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file)
        {
            spdlog::error("Failed to write {} bytes to staging file {}", data.size(), path.string());
            throw UploadError(drcv::ErrorCode::StorageFailure, "Failed to write staging file");
        }
    }

    std::shared_ptr<UploadPipeline::SessionSlot> UploadPipeline::slot_for(std::int64_t session_id)
    {
        std::lock_guard lock(slots_mutex_);
        auto &slot = slots_[session_id];
        if (!slot)
        {
            slot = std::make_shared<SessionSlot>();
        }
        return slot;
    }

    void UploadPipeline::release_slot(std::int64_t session_id)
    {
        std::lock_guard lock(slots_mutex_);
        slots_.erase(session_id);
    }

    void UploadPipeline::release_idle(const std::vector<drcv::protocol::UploadSession> &sessions)
    {
        std::lock_guard lock(slots_mutex_);
        for (const auto &session : sessions)
        {
            const auto it = slots_.find(session.id);
            // A slot still referenced elsewhere has a chunk in flight.
            if (it != slots_.end() && it->second.use_count() == 1)
            {
                slots_.erase(it);
            }
        }
    }

    std::size_t UploadPipeline::tracked_sessions() const
    {
        std::lock_guard lock(slots_mutex_);
        return slots_.size();
    }

} // namespace drcv::server
