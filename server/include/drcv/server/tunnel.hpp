#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "drcv/server/session_store.hpp"

namespace drcv::server
{

    enum class TunnelErrorKind : std::uint8_t
    {
        NotInstalled,
        Config,
        Network,
        Auth
    };

    std::string_view to_string(TunnelErrorKind kind) noexcept;

    class TunnelError : public std::runtime_error
    {
    public:
        TunnelError(TunnelErrorKind kind, const std::string &message);

        TunnelErrorKind kind() const noexcept { return kind_; }

    private:
        TunnelErrorKind kind_;
    };

    struct TunnelConfig
    {
        std::string hostname_root;
        std::uint16_t local_port{};
    };

    class TunnelRunner
    {
    public:
        virtual ~TunnelRunner() = default;

        virtual void shutdown() = 0;
    };

    class TunnelManager
    {
    public:
        virtual ~TunnelManager() = default;

        virtual const std::string &hostname() const = 0;
        virtual std::unique_ptr<TunnelRunner> run() = 0;
    };

    // Exposes the local upload port under a public hostname through a third-party relay.
    class TunnelProvider
    {
    public:
        virtual ~TunnelProvider() = default;

        virtual std::unique_ptr<TunnelManager> ensure(SessionStore &store, const TunnelConfig &config) = 0;
    };

    std::unique_ptr<TunnelProvider> make_tunnel_provider(std::string_view name);

    // Random subdomain token persisted under `key`, so the public hostname survives restarts.
    std::string load_or_create_tunnel_token(SessionStore &store, const std::string &key);

    std::unique_ptr<TunnelProvider> make_cloudflare_tunnel_provider();

    // Public hostname as seen by the admin listener; empty until a tunnel is up.
    class TunnelStatus
    {
    public:
        void set_hostname(std::optional<std::string> hostname);
        std::optional<std::string> hostname() const;

    private:
        mutable std::mutex mutex_;
        std::optional<std::string> hostname_;
    };

} // namespace drcv::server
