#include "drcv/server/client_identity.hpp"

#include <array>
#include <cctype>
#include <string_view>

namespace drcv::server
{

    namespace
    {

        constexpr std::array<std::string_view, 3> kSingleValueHeaders{{
            "X-Real-IP",
            "CF-Connecting-IP",
            "True-Client-IP",
        }};

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        std::string_view header_value(const boost::beast::http::fields &headers, std::string_view name)
        {
            const auto it = headers.find(boost::beast::string_view(name.data(), name.size()));
            if (it == headers.end())
            {
                return {};
            }
            const auto value = it->value();
            return std::string_view(value.data(), value.size());
        }

    } // namespace

    bool is_trusted_relay(const boost::asio::ip::address &peer) noexcept
    {
        if (peer.is_v6() && peer.to_v6().is_v4_mapped())
        {
            return peer.to_v6().to_v4().is_loopback();
        }
        return peer.is_loopback();
    }

    std::string resolve_client_identity(const boost::asio::ip::address &peer, const boost::beast::http::fields &headers)
    {
        if (is_trusted_relay(peer))
        {
            const auto forwarded = header_value(headers, "X-Forwarded-For");
            const auto first = trim(forwarded.substr(0, forwarded.find(',')));
            if (!first.empty())
            {
                return std::string(first);
            }
            for (const auto name : kSingleValueHeaders)
            {
                const auto value = trim(header_value(headers, name));
                if (!value.empty())
                {
                    return std::string(value);
                }
            }
        }
        if (peer.is_v6() && peer.to_v6().is_v4_mapped())
        {
            return peer.to_v6().to_v4().to_string();
        }
        return peer.to_string();
    }

} // namespace drcv::server
