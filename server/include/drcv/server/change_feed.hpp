#pragma once

#include <cstdint>

#include "drcv/protocol.hpp"
#include "drcv/server/session_store.hpp"

namespace drcv::server
{

    // One per observer. Each tick reports the sessions changed since the previous tick.
    class ChangeFeedPublisher
    {
    public:
        explicit ChangeFeedPublisher(const SessionStore &store);

        // `updates` with the changed rows, or `heartbeat` when nothing changed. Always advances the watermark.
        drcv::protocol::ChangeFeedEvent tick();

        std::int64_t watermark() const noexcept { return watermark_; }

    private:
        const SessionStore &store_;
        std::int64_t watermark_;
    };

} // namespace drcv::server
