#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "drcv/server/session_store.hpp"

namespace drcv::server
{

    class LivenessTracker
    {
    public:
        explicit LivenessTracker(SessionStore &store);

        // Refreshes the client row and the caller's live uploads; returns how many ids were acknowledged.
        std::size_t heartbeat(const std::string &client_identity, const std::optional<std::string> &user_agent,
                              const std::vector<std::int64_t> &upload_ids);

        void touch_client(const std::string &client_identity, const std::optional<std::string> &user_agent);

    private:
        SessionStore &store_;
    };

} // namespace drcv::server
