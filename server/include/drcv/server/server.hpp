#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "drcv/server/config.hpp"
#include "drcv/server/liveness_tracker.hpp"
#include "drcv/server/session_store.hpp"
#include "drcv/server/staleness_reaper.hpp"
#include "drcv/server/tunnel.hpp"
#include "drcv/server/upload_pipeline.hpp"

namespace drcv::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);
        ~Server();

        // Blocks until stop() or SIGINT/SIGTERM.
        void run();

        void stop();

        std::uint16_t upload_port() const;
        std::uint16_t admin_port() const;

    private:
        using tcp = boost::asio::ip::tcp;

        void open_acceptor(tcp::acceptor &acceptor, const std::string &address, std::uint16_t port);
        void accept_upload();
        void accept_admin();
        void start_tunnel();
        void handle_signal();

        ServerConfig config_;
        boost::asio::io_context io_context_;
        tcp::acceptor upload_acceptor_;
        tcp::acceptor admin_acceptor_;
        boost::asio::signal_set signals_;

        SessionStore store_;
        UploadPipeline pipeline_;
        LivenessTracker liveness_;
        StalenessReaper reaper_;
        TunnelStatus tunnel_status_;
        std::unique_ptr<TunnelRunner> tunnel_runner_;

        std::vector<std::thread> workers_;
    };

} // namespace drcv::server
