#include "drcv/server/change_feed.hpp"

#include <utility>

namespace drcv::server
{

    ChangeFeedPublisher::ChangeFeedPublisher(const SessionStore &store)
        : store_(store), watermark_(store.change_cursor()) {}

    drcv::protocol::ChangeFeedEvent ChangeFeedPublisher::tick()
    {
        auto changes = store_.changes_since(watermark_);
        drcv::protocol::ChangeFeedEvent event{};
        event.at = store_.now();
        event.sessions = std::move(changes.sessions);
        event.kind = event.sessions.empty() ? drcv::protocol::FeedEventKind::Heartbeat
                                            : drcv::protocol::FeedEventKind::Updates;
        watermark_ = changes.cursor;
        return event;
    }

} // namespace drcv::server
