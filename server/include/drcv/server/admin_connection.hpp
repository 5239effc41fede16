#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "drcv/server/change_feed.hpp"
#include "drcv/server/session_store.hpp"
#include "drcv/server/tunnel.hpp"

namespace drcv::server
{

    struct AdminServices
    {
        SessionStore &store;
        TunnelStatus &tunnel;
        std::size_t page_size;
        std::chrono::milliseconds feed_interval;
    };

    /**
     * Connection on the loopback admin listener. Serves the session listing as JSON and, on
     * `/events`, turns into a Server-Sent Events stream fed by its own ChangeFeedPublisher until
     * the observer goes away.
     */
    class AdminConnection : public std::enable_shared_from_this<AdminConnection>
    {
    public:
        using Request = boost::beast::http::request<boost::beast::http::string_body>;
        using Response = boost::beast::http::response<boost::beast::http::string_body>;

        AdminConnection(boost::asio::ip::tcp::socket socket, AdminServices services);

        void start();

    private:
        void read_request();
        void on_read(boost::beast::error_code ec, std::size_t bytes);
        void send(Response response);
        void on_write(bool close, boost::beast::error_code ec, std::size_t bytes);
        void close();

        Response handle(const Request &request);

        void start_event_stream(const Request &request);
        void on_stream_header(boost::beast::error_code ec, std::size_t bytes);
        void schedule_event();
        void on_event_written(boost::beast::error_code ec, std::size_t bytes);

        boost::beast::tcp_stream stream_;
        boost::beast::flat_buffer buffer_;
        Request request_;
        std::shared_ptr<Response> pending_;
        AdminServices services_;

        using StreamHeader = boost::beast::http::response<boost::beast::http::empty_body>;
        std::unique_ptr<StreamHeader> stream_header_;
        std::unique_ptr<boost::beast::http::response_serializer<boost::beast::http::empty_body>> stream_serializer_;
        std::optional<ChangeFeedPublisher> publisher_;
        boost::asio::steady_timer feed_timer_;
        std::string event_payload_;
    };

} // namespace drcv::server
