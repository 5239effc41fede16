#include "drcv/server/server.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "drcv/server/admin_connection.hpp"
#include "drcv/server/upload_connection.hpp"

namespace drcv::server
{

    namespace
    {

        constexpr std::uint64_t kBodyOverhead = 1ULL << 20;

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          upload_acceptor_(io_context_),
          admin_acceptor_(io_context_),
          signals_(io_context_),
          store_(config_.database_path),
          pipeline_(store_, config_.upload_dir, config_.max_file_size),
          liveness_(store_),
          reaper_(io_context_, store_,
                  ReaperSettings{.interval = config_.reap_interval,
                                 .upload_stale_timeout = config_.upload_stale_timeout,
                                 .client_stale_timeout = config_.client_stale_timeout})
    {
        reaper_.on_disconnect([this](const std::vector<drcv::protocol::UploadSession> &sessions)
                              { pipeline_.release_idle(sessions); });

        open_acceptor(upload_acceptor_, config_.address, config_.port);
        open_acceptor(admin_acceptor_, config_.admin_address, config_.admin_port);

        spdlog::info("Upload listener on {}:{} with upload dir {}", config_.address, upload_port(),
                     config_.upload_dir.string());
        spdlog::info("Admin listener on {}:{}", config_.admin_address, admin_port());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const boost::system::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    Server::~Server()
    {
        if (tunnel_runner_)
        {
            tunnel_runner_->shutdown();
        }
    }

    void Server::open_acceptor(tcp::acceptor &acceptor, const std::string &address, std::uint16_t port)
    {
        const tcp::endpoint endpoint(boost::asio::ip::make_address(address), port);
        acceptor.open(endpoint.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(endpoint);
        acceptor.listen();
    }

    void Server::run()
    {
        start_tunnel();
        reaper_.start();
        accept_upload();
        accept_admin();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();

        if (tunnel_runner_)
        {
            tunnel_runner_->shutdown();
            tunnel_runner_.reset();
        }
    }

    void Server::stop()
    {
        boost::asio::post(io_context_, [this]
                          { handle_signal(); });
    }

    std::uint16_t Server::upload_port() const
    {
        return upload_acceptor_.local_endpoint().port();
    }

    std::uint16_t Server::admin_port() const
    {
        return admin_acceptor_.local_endpoint().port();
    }

    void Server::accept_upload()
    {
        upload_acceptor_.async_accept(
            boost::asio::make_strand(io_context_),
            [this](const boost::system::error_code &ec, tcp::socket socket)
            {
                if (!ec)
                {
                    UploadServices services{pipeline_, liveness_, config_.upload_timeout,
                                            config_.chunk_size + kBodyOverhead};
                    std::make_shared<UploadConnection>(std::move(socket), services)->start();
                    spdlog::debug("Accepted upload connection");
                }
                else if (ec != boost::asio::error::operation_aborted)
                {
                    spdlog::error("Accept error: {}", ec.message());
                }
                if (upload_acceptor_.is_open())
                {
                    accept_upload();
                }
            });
    }

    void Server::accept_admin()
    {
        admin_acceptor_.async_accept(
            boost::asio::make_strand(io_context_),
            [this](const boost::system::error_code &ec, tcp::socket socket)
            {
                if (!ec)
                {
                    AdminServices services{store_, tunnel_status_, config_.page_size, config_.feed_interval};
                    std::make_shared<AdminConnection>(std::move(socket), services)->start();
                    spdlog::debug("Accepted admin connection");
                }
                else if (ec != boost::asio::error::operation_aborted)
                {
                    spdlog::error("Admin accept error: {}", ec.message());
                }
                if (admin_acceptor_.is_open())
                {
                    accept_admin();
                }
            });
    }

    void Server::start_tunnel()
    {
        if (!config_.tunnel_provider)
        {
            return;
        }
        try
        {
            auto provider = make_tunnel_provider(*config_.tunnel_provider);
            auto manager = provider->ensure(store_, TunnelConfig{.hostname_root = config_.cf_domain,
                                                                 .local_port = upload_port()});
            tunnel_runner_ = manager->run();
            tunnel_status_.set_hostname(manager->hostname());
            spdlog::info("Public URL: https://{}", manager->hostname());
        }
        catch (const TunnelError &ex)
        {
            spdlog::error("Tunnel unavailable, serving locally only: {}", ex.what());
        }
        catch (const StoreError &ex)
        {
            spdlog::error("Tunnel token could not be stored, serving locally only: {}", ex.what());
        }
    }

    void Server::handle_signal()
    {
        boost::system::error_code ec;
        upload_acceptor_.close(ec);
        admin_acceptor_.close(ec);
        reaper_.stop();
        io_context_.stop();
        spdlog::info("Shutting down");
    }

} // namespace drcv::server
