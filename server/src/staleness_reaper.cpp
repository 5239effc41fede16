#include "drcv/server/staleness_reaper.hpp"

#include <boost/asio/post.hpp>

#include <utility>

#include <spdlog/spdlog.h>

namespace drcv::server
{

    StalenessReaper::StalenessReaper(boost::asio::io_context &io_context, SessionStore &store, ReaperSettings settings)
        : strand_(boost::asio::make_strand(io_context)),
          timer_(strand_),
          store_(store),
          settings_(settings)
    {
    }

    void StalenessReaper::on_disconnect(DisconnectListener listener)
    {
        on_disconnect_ = std::move(listener);
    }

    void StalenessReaper::start()
    {
        boost::asio::post(strand_, [this]
                          {
            if (running_)
            {
                return;
            }
            running_ = true;
            spdlog::info("Staleness reaper running every {}s (uploads {}s, clients {}s)", settings_.interval.count(),
                         settings_.upload_stale_timeout.count(), settings_.client_stale_timeout.count());
            schedule_next(); });
    }

    void StalenessReaper::stop()
    {
        boost::asio::post(strand_, [this]
                          {
            running_ = false;
            timer_.cancel(); });
    }

    ReapReport StalenessReaper::sweep()
    {
        const auto now = store_.now();
        ReapReport report;
        report.disconnected = store_.mark_stale_uploads_disconnected(now - settings_.upload_stale_timeout);
        for (const auto &session : report.disconnected)
        {
            spdlog::warn("Upload disconnected: {} from {} (session {}, {} bytes)", session.filename,
                         session.client_identity, session.id, session.size);
        }
        if (!report.disconnected.empty() && on_disconnect_)
        {
            on_disconnect_(report.disconnected);
        }
        report.removed_clients = store_.remove_stale_clients(now - settings_.client_stale_timeout);
        for (const auto &identity : report.removed_clients)
        {
            spdlog::info("Client {} timed out", identity);
        }
        return report;
    }

    void StalenessReaper::schedule_next()
    {
        timer_.expires_after(settings_.interval);
        timer_.async_wait([this](const boost::system::error_code &ec)
                          {
            if (ec || !running_)
            {
                return;
            }
            try
            {
                sweep();
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Staleness sweep failed: {}", ex.what());
            }
            schedule_next(); });
    }

} // namespace drcv::server
