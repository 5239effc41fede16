#include "drcv/server/tunnel.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace drcv::server
{

    namespace
    {
        namespace bp = boost::process;

        constexpr auto kExecutable = "cloudflared";
        constexpr auto kTokenKey = "cf_hash";
        constexpr auto kTunnelPrefix = "drcv-";

        struct CommandOutput
        {
            int exit_code{};
            std::string out;
            std::string err;
        };

        std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        bool mentions_login(const std::string &stderr_text)
        {
            const auto lowered = to_lower(stderr_text);
            return lowered.find("not authenticated") != std::string::npos ||
                   lowered.find("login") != std::string::npos;
        }

        boost::filesystem::path find_executable()
        {
            auto path = bp::search_path(kExecutable);
            if (path.empty())
            {
                spdlog::error("cloudflared not found in PATH. Install it and run `cloudflared tunnel login` once.");
                throw TunnelError(TunnelErrorKind::NotInstalled, "cloudflared not found in PATH");
            }
            return path;
        }

        CommandOutput run_command(const boost::filesystem::path &executable, const std::vector<std::string> &args)
        {
            boost::asio::io_context io_context;
            std::future<std::string> out;
            std::future<std::string> err;
            try
            {
                bp::child child(executable, bp::args(args), bp::std_in.close(), bp::std_out > out, bp::std_err > err,
                                io_context);
                io_context.run();
                child.wait();
                return CommandOutput{.exit_code = child.exit_code(), .out = out.get(), .err = err.get()};
            }
            catch (const bp::process_error &ex)
            {
                throw TunnelError(TunnelErrorKind::Network,
                                  "failed to exec cloudflared " + (args.empty() ? std::string{} : args.front()) + ": " +
                                      ex.what());
            }
        }

        void throw_if_unauthenticated(const CommandOutput &output)
        {
            if (mentions_login(output.err))
            {
                spdlog::error("Cloudflare Tunnel not authenticated. Run `cloudflared tunnel login` and restart.");
                throw TunnelError(TunnelErrorKind::Auth, "Not authenticated with Cloudflare");
            }
        }

        void check_installed(const boost::filesystem::path &executable)
        {
            const auto output = run_command(executable, {"--version"});
            if (output.exit_code != 0)
            {
                throw TunnelError(TunnelErrorKind::NotInstalled, "cloudflared --version failed");
            }
        }

        std::optional<std::string> extract_uuid(const std::string &line)
        {
            static const std::regex kUuid(
                "[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}");
            std::smatch match;
            if (std::regex_search(line, match, kUuid))
            {
                return match.str();
            }
            return std::nullopt;
        }

        std::optional<std::string> find_tunnel_uuid(const boost::filesystem::path &executable, const std::string &name)
        {
            const auto output = run_command(executable, {"tunnel", "list"});
            if (output.exit_code != 0)
            {
                throw_if_unauthenticated(output);
                throw TunnelError(TunnelErrorKind::Config, "tunnel list failed: " + output.err);
            }
            std::istringstream lines(output.out);
            std::string line;
            while (std::getline(lines, line))
            {
                if (line.find(name) == std::string::npos)
                {
                    continue;
                }
                if (auto uuid = extract_uuid(line))
                {
                    return uuid;
                }
            }
            return std::nullopt;
        }

        void create_tunnel(const boost::filesystem::path &executable, const std::string &name)
        {
            const auto output = run_command(executable, {"tunnel", "create", name});
            if (output.exit_code != 0)
            {
                throw_if_unauthenticated(output);
                throw TunnelError(TunnelErrorKind::Config, "create tunnel failed: " + output.err);
            }
        }

        void route_dns(const boost::filesystem::path &executable, const std::string &name, const std::string &hostname)
        {
            const auto output = run_command(executable, {"tunnel", "route", "dns", name, hostname});
            if (output.exit_code == 0)
            {
                return;
            }
            throw_if_unauthenticated(output);
            if (to_lower(output.err).find("already exists") == std::string::npos)
            {
                throw TunnelError(TunnelErrorKind::Config, "route dns failed: " + output.err);
            }
        }

        std::filesystem::path write_config(const std::string &uuid, const std::string &hostname, std::uint16_t port)
        {
            const char *home = std::getenv("HOME");
            if (home == nullptr || *home == '\0')
            {
                throw TunnelError(TunnelErrorKind::Config, "cannot resolve home directory");
            }
            const auto config_dir = std::filesystem::path(home) / ".cloudflared";
            const auto config_path = config_dir / ("config-" + hostname + ".yml");
            const auto credentials = config_dir / (uuid + ".json");

            std::error_code ec;
            std::filesystem::create_directories(config_dir, ec);
            if (ec)
            {
                throw TunnelError(TunnelErrorKind::Config, ec.message());
            }
            std::ofstream out(config_path, std::ios::trunc);
            out << "tunnel: " << uuid << "\n"
                << "credentials-file: " << credentials.string() << "\n\n"
                << "ingress:\n"
                << "  - hostname: " << hostname << "\n"
                << "    service: http://localhost:" << port << "\n"
                << "  - service: http_status:404\n";
            out.flush();
            if (!out)
            {
                throw TunnelError(TunnelErrorKind::Config, "failed to write " + config_path.string());
            }
            return config_path;
        }

        class CloudflareTunnelRunner : public TunnelRunner
        {
        public:
            explicit CloudflareTunnelRunner(bp::child child) : child_(std::move(child)) {}

            ~CloudflareTunnelRunner() override
            {
                shutdown();
            }

            void shutdown() override
            {
                if (!child_.valid())
                {
                    return;
                }
                std::error_code ec;
                if (child_.running(ec))
                {
                    child_.terminate(ec);
                    if (ec)
                    {
                        spdlog::warn("Failed to stop cloudflared: {}", ec.message());
                    }
                }
                child_.wait(ec);
                child_.detach();
                spdlog::info("cloudflared stopped");
            }

        private:
            bp::child child_;
        };

        class CloudflareTunnelManager : public TunnelManager
        {
        public:
            CloudflareTunnelManager(boost::filesystem::path executable, std::string hostname,
                                    std::filesystem::path config_path)
                : executable_(std::move(executable)),
                  hostname_(std::move(hostname)),
                  config_path_(std::move(config_path))
            {
            }

            const std::string &hostname() const override
            {
                return hostname_;
            }

            std::unique_ptr<TunnelRunner> run() override
            {
                try
                {
                    bp::child child(executable_,
                                    bp::args({"--loglevel", "error", "--transport-loglevel", "error", "tunnel",
                                              "--config", config_path_.string(), "run"}),
                                    bp::std_in.close(), bp::std_out > bp::null);
                    spdlog::info("cloudflared running for https://{}", hostname_);
                    return std::make_unique<CloudflareTunnelRunner>(std::move(child));
                }
                catch (const bp::process_error &ex)
                {
                    throw TunnelError(TunnelErrorKind::Network, std::string("failed to start cloudflared: ") + ex.what());
                }
            }

        private:
            boost::filesystem::path executable_;
            std::string hostname_;
            std::filesystem::path config_path_;
        };

        class CloudflareTunnelProvider : public TunnelProvider
        {
        public:
            std::unique_ptr<TunnelManager> ensure(SessionStore &store, const TunnelConfig &config) override
            {
                const auto executable = find_executable();
                check_installed(executable);

                const auto token = load_or_create_tunnel_token(store, kTokenKey);
                const auto hostname = token + "." + config.hostname_root;
                const auto tunnel_name = kTunnelPrefix + token;

                auto uuid = find_tunnel_uuid(executable, tunnel_name);
                if (!uuid)
                {
                    create_tunnel(executable, tunnel_name);
                    uuid = find_tunnel_uuid(executable, tunnel_name);
                }
                if (!uuid)
                {
                    throw TunnelError(TunnelErrorKind::Config, "Failed to obtain tunnel UUID");
                }

                route_dns(executable, tunnel_name, hostname);
                auto config_path = write_config(*uuid, hostname, config.local_port);
                return std::make_unique<CloudflareTunnelManager>(executable, hostname, std::move(config_path));
            }
        };

    } // namespace

    std::unique_ptr<TunnelProvider> make_cloudflare_tunnel_provider()
    {
        return std::make_unique<CloudflareTunnelProvider>();
    }

} // namespace drcv::server
