#include "drcv/protocol.hpp"

#include <array>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace drcv::protocol
{

    namespace
    {

        struct UploadStatusMapping
        {
            UploadStatus status;
            std::string_view label;
        };

        constexpr std::array<UploadStatusMapping, 4> kStatusMappings{{
            {UploadStatus::Init, "init"},
            {UploadStatus::Uploading, "uploading"},
            {UploadStatus::Complete, "complete"},
            {UploadStatus::Disconnected, "disconnected"},
        }};

        struct FeedEventMapping
        {
            FeedEventKind kind;
            std::string_view label;
        };

        constexpr std::array<FeedEventMapping, 2> kFeedEventMappings{{
            {FeedEventKind::Updates, "updates"},
            {FeedEventKind::Heartbeat, "heartbeat"},
        }};

    } // namespace

    Timestamp now() noexcept
    {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
    }

    std::int64_t to_unix_millis(Timestamp time) noexcept
    {
        return static_cast<std::int64_t>(time.time_since_epoch().count());
    }

    Timestamp from_unix_millis(std::int64_t millis) noexcept
    {
        return Timestamp{std::chrono::milliseconds{millis}};
    }

    std::string format_timestamp(Timestamp time)
    {
        const auto millis = to_unix_millis(time);
        auto seconds = static_cast<std::time_t>(millis / 1000);
        auto fraction = millis % 1000;
        if (fraction < 0)
        {
            fraction += 1000;
            --seconds;
        }
        std::tm utc{};
        if (gmtime_r(&seconds, &utc) == nullptr)
        {
            throw std::runtime_error("Timestamp out of range");
        }
        std::array<char, 32> date{};
        const auto written = std::strftime(date.data(), date.size(), "%Y-%m-%dT%H:%M:%S", &utc);
        std::array<char, 8> millis_part{};
        std::snprintf(millis_part.data(), millis_part.size(), ".%03dZ", static_cast<int>(fraction));
        return std::string(date.data(), written) + millis_part.data();
    }

    std::string_view to_string(UploadStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<UploadStatus> upload_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(FeedEventKind kind) noexcept
    {
        for (const auto &mapping : kFeedEventMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    void to_json(nlohmann::json &json, const UploadSession &session)
    {
        json = {
            {"id", session.id},
            {"filename", session.filename},
            {"client", session.client_identity},
            {"size", session.size},
            {"status", to_string(session.status)},
            {"started_at", format_timestamp(session.started_at)},
            {"updated_at", format_timestamp(session.updated_at)},
            {"completed_at", nullptr},
        };
        if (session.completed_at)
        {
            json["completed_at"] = format_timestamp(*session.completed_at);
        }
    }

    void to_json(nlohmann::json &json, const ClientRecord &client)
    {
        json = {
            {"identity", client.identity},
            {"user_agent", nullptr},
            {"first_seen", format_timestamp(client.first_seen)},
            {"last_seen", format_timestamp(client.last_seen)},
            {"status", client.status},
        };
        if (client.user_agent)
        {
            json["user_agent"] = *client.user_agent;
        }
    }

    void to_json(nlohmann::json &json, const HeartbeatRequest &request)
    {
        json = {
            {"uploadIds", request.upload_ids},
        };
    }

    void from_json(const nlohmann::json &json, HeartbeatRequest &request)
    {
        request.upload_ids.clear();
        if (!json.is_object())
        {
            throw std::runtime_error("Heartbeat body must be a JSON object");
        }
        if (auto it = json.find("uploadIds"); it != json.end() && !it->is_null())
        {
            request.upload_ids = it->get<std::vector<std::int64_t>>();
        }
    }

    void to_json(nlohmann::json &json, const ChangeFeedEvent &event)
    {
        if (event.kind == FeedEventKind::Updates)
        {
            json = nlohmann::json::array();
            for (const auto &session : event.sessions)
            {
                json.push_back(session);
            }
            return;
        }
        json = {
            {"ts", format_timestamp(event.at)},
        };
    }

} // namespace drcv::protocol
