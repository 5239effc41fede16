#include "drcv/server/tunnel.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "drcv/crypto.hpp"

namespace drcv::server
{

    namespace
    {
        struct TunnelErrorKindMapping
        {
            TunnelErrorKind kind;
            std::string_view label;
        };

        constexpr std::array<TunnelErrorKindMapping, 4> kKindMappings{{
            {TunnelErrorKind::NotInstalled, "Tunnel not installed"},
            {TunnelErrorKind::Config, "Configuration error"},
            {TunnelErrorKind::Network, "Network error"},
            {TunnelErrorKind::Auth, "Authentication error"},
        }};

        constexpr std::size_t kTokenLength = 6;
    } // namespace

    std::string_view to_string(TunnelErrorKind kind) noexcept
    {
        for (const auto &mapping : kKindMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "Tunnel error";
    }

    TunnelError::TunnelError(TunnelErrorKind kind, const std::string &message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message), kind_(kind) {}

    std::unique_ptr<TunnelProvider> make_tunnel_provider(std::string_view name)
    {
        std::string lowered(name);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        if (lowered == "cloudflare")
        {
            return make_cloudflare_tunnel_provider();
        }
        throw TunnelError(TunnelErrorKind::Config, "Unknown tunnel provider: " + std::string(name));
    }

    std::string load_or_create_tunnel_token(SessionStore &store, const std::string &key)
    {
        try
        {
            if (auto existing = store.kv_get(key); existing && !existing->empty())
            {
                return *existing;
            }
            auto token = drcv::crypto::random_token(kTokenLength);
            store.kv_set(key, token);
            return token;
        }
        catch (const StoreError &ex)
        {
            throw TunnelError(TunnelErrorKind::Config, std::string("cannot persist tunnel token: ") + ex.what());
        }
    }

    void TunnelStatus::set_hostname(std::optional<std::string> hostname)
    {
        std::lock_guard lock(mutex_);
        hostname_ = std::move(hostname);
    }

    std::optional<std::string> TunnelStatus::hostname() const
    {
        std::lock_guard lock(mutex_);
        return hostname_;
    }

} // namespace drcv::server
