#include "drcv/server/liveness_tracker.hpp"

#include <spdlog/spdlog.h>

namespace drcv::server
{

    LivenessTracker::LivenessTracker(SessionStore &store) : store_(store) {}

    std::size_t LivenessTracker::heartbeat(const std::string &client_identity,
                                           const std::optional<std::string> &user_agent,
                                           const std::vector<std::int64_t> &upload_ids)
    {
        store_.upsert_client(client_identity, user_agent);
        const auto acknowledged = store_.touch_uploads(client_identity, upload_ids);
        if (acknowledged < upload_ids.size())
        {
            spdlog::debug("Heartbeat from {} acknowledged {} of {} uploads", client_identity, acknowledged,
                          upload_ids.size());
        }
        return acknowledged;
    }

    void LivenessTracker::touch_client(const std::string &client_identity, const std::optional<std::string> &user_agent)
    {
        store_.upsert_client(client_identity, user_agent);
    }

} // namespace drcv::server
