/**
 * drcv - Upload session data model and its JSON wire form.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace drcv::protocol
{

    using Clock = std::chrono::system_clock;
    using Timestamp = std::chrono::time_point<Clock, std::chrono::milliseconds>;

    Timestamp now() noexcept;

    std::int64_t to_unix_millis(Timestamp time) noexcept;
    Timestamp from_unix_millis(std::int64_t millis) noexcept;

    // RFC 3339 in UTC with millisecond precision, e.g. 2026-01-02T03:04:05.678Z
    std::string format_timestamp(Timestamp time);

    enum class UploadStatus : std::uint8_t
    {
        Init,
        Uploading,
        Complete,
        Disconnected
    };

    std::string_view to_string(UploadStatus status) noexcept;
    std::optional<UploadStatus> upload_status_from_string(std::string_view value) noexcept;

    struct UploadSession
    {
        std::int64_t id{};
        std::string filename;
        std::string client_identity;
        std::uint64_t size{};
        UploadStatus status{UploadStatus::Init};
        Timestamp started_at{};
        Timestamp updated_at{};
        std::optional<Timestamp> completed_at{};
    };

    void to_json(nlohmann::json &json, const UploadSession &session);

    struct ClientRecord
    {
        std::string identity;
        std::optional<std::string> user_agent{};
        Timestamp first_seen{};
        Timestamp last_seen{};
        std::string status{"connected"};
    };

    void to_json(nlohmann::json &json, const ClientRecord &client);

    struct HeartbeatRequest
    {
        std::vector<std::int64_t> upload_ids;
    };

    void to_json(nlohmann::json &json, const HeartbeatRequest &request);
    void from_json(const nlohmann::json &json, HeartbeatRequest &request);

    enum class FeedEventKind : std::uint8_t
    {
        Updates,
        Heartbeat
    };

    std::string_view to_string(FeedEventKind kind) noexcept;

    struct ChangeFeedEvent
    {
        FeedEventKind kind{FeedEventKind::Heartbeat};
        Timestamp at{};
        std::vector<UploadSession> sessions;
    };

    // Payload of the event: the row array for updates, {"ts": ...} for heartbeats.
    void to_json(nlohmann::json &json, const ChangeFeedEvent &event);

} // namespace drcv::protocol
