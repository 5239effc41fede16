#pragma once

#include <boost/asio/ip/address.hpp>
#include <boost/beast/http/fields.hpp>
#include <string>

namespace drcv::server
{

    // Loopback peers are the local tunnel relay; only they may name the client through headers.
    bool is_trusted_relay(const boost::asio::ip::address &peer) noexcept;

    /**
     * Identity used to scope resumption and liveness. For a trusted relay the first non-empty of
     * X-Forwarded-For (first entry), X-Real-IP, CF-Connecting-IP and True-Client-IP wins;
     * otherwise, or when none is present, the peer address.
     */
    std::string resolve_client_identity(const boost::asio::ip::address &peer, const boost::beast::http::fields &headers);

} // namespace drcv::server
