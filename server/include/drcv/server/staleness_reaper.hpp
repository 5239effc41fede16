#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "drcv/protocol.hpp"
#include "drcv/server/session_store.hpp"

namespace drcv::server
{

    struct ReapReport
    {
        std::vector<drcv::protocol::UploadSession> disconnected;
        std::vector<std::string> removed_clients;
    };

    struct ReaperSettings
    {
        std::chrono::seconds interval{std::chrono::seconds{10}};
        std::chrono::seconds upload_stale_timeout{std::chrono::seconds{60}};
        std::chrono::seconds client_stale_timeout{std::chrono::seconds{120}};
    };

    /**
     * Periodic sweep on the io_context: demotes `uploading` sessions nobody has touched for
     * `upload_stale_timeout` to `disconnected` and deletes clients silent for
     * `client_stale_timeout`. Uploads and clients age independently.
     */
    class StalenessReaper
    {
    public:
        using DisconnectListener = std::function<void(const std::vector<drcv::protocol::UploadSession> &)>;

        StalenessReaper(boost::asio::io_context &io_context, SessionStore &store, ReaperSettings settings);

        // Called after each sweep that disconnected at least one session.
        void on_disconnect(DisconnectListener listener);

        void start();
        void stop();

        ReapReport sweep();

    private:
        void schedule_next();

        boost::asio::strand<boost::asio::io_context::executor_type> strand_;
        boost::asio::steady_timer timer_;
        SessionStore &store_;
        ReaperSettings settings_;
        DisconnectListener on_disconnect_;
        bool running_{false};
    };

} // namespace drcv::server
