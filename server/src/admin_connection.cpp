#include "drcv/server/admin_connection.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <nlohmann/json.hpp>

#include <charconv>
#include <utility>

#include <spdlog/spdlog.h>

#include "drcv/event_stream.hpp"
#include "http_common.hpp"

namespace drcv::server
{

    namespace
    {
        namespace beast = boost::beast;
        namespace http = beast::http;
        using namespace drcv::server::http_common;

        constexpr std::chrono::seconds kReadTimeout{30};

        constexpr auto kDashboardPage =
            "<!doctype html><html><head><title>drcv admin</title></head>"
            "<body><h1>drcv admin</h1>"
            "<p>Sessions: <a href=\"/data\">/data</a>, clients: <a href=\"/clients\">/clients</a>, "
            "live feed: <a href=\"/events\">/events</a>.</p></body></html>";

        std::size_t page_from(std::string_view target)
        {
            const auto value = query_parameter(target, "page");
            if (!value)
            {
                return 1;
            }
            long long page = 0;
            const auto *last = value->data() + value->size();
            const auto [ptr, ec] = std::from_chars(value->data(), last, page);
            if (ec != std::errc{} || ptr != last || page < 1)
            {
                return 1;
            }
            return static_cast<std::size_t>(page);
        }
    } // namespace

    AdminConnection::AdminConnection(boost::asio::ip::tcp::socket socket, AdminServices services)
        : stream_(std::move(socket)), services_(services), feed_timer_(stream_.get_executor())
    {
    }

    void AdminConnection::start()
    {
        read_request();
    }

    void AdminConnection::read_request()
    {
        request_ = {};
        stream_.expires_after(kReadTimeout);
        http::async_read(stream_, buffer_, request_,
                         beast::bind_front_handler(&AdminConnection::on_read, shared_from_this()));
    }

    void AdminConnection::on_read(beast::error_code ec, std::size_t /*bytes*/)
    {
        if (ec == http::error::end_of_stream)
        {
            return close();
        }
        if (ec)
        {
            if (ec != beast::error::timeout)
            {
                spdlog::debug("Admin connection read failed: {}", ec.message());
            }
            return close();
        }

        if (request_.method() == http::verb::get && request_path(request_target(request_)) == "/events")
        {
            return start_event_stream(request_);
        }
        send(handle(request_));
    }

    void AdminConnection::send(Response response)
    {
        pending_ = std::make_shared<Response>(std::move(response));
        const bool close = pending_->need_eof();
        http::async_write(stream_, *pending_,
                          beast::bind_front_handler(&AdminConnection::on_write, shared_from_this(), close));
    }

    void AdminConnection::on_write(bool close, beast::error_code ec, std::size_t /*bytes*/)
    {
        pending_.reset();
        if (ec)
        {
            spdlog::debug("Admin connection write failed: {}", ec.message());
            return this->close();
        }
        if (close)
        {
            return this->close();
        }
        read_request();
    }

    void AdminConnection::close()
    {
        boost::system::error_code ec;
        feed_timer_.cancel();
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
    }

    AdminConnection::Response AdminConnection::handle(const Request &request)
    {
        const auto target = request_target(request);
        const auto path = request_path(target);
        if (request.method() != http::verb::get)
        {
            return make_error_response(request, drcv::ErrorCode::Unsupported, "Method not allowed");
        }
        try
        {
            if (path == "/")
            {
                return make_html_response(request, kDashboardPage);
            }
            if (path == "/data")
            {
                const auto filter = query_parameter(target, "q").value_or(std::string{});
                const auto sessions = services_.store.list_sessions(page_from(target), services_.page_size, filter);
                return make_json_response(request, nlohmann::json(sessions));
            }
            if (path == "/clients")
            {
                return make_json_response(request, nlohmann::json(services_.store.list_clients()));
            }
            if (path == "/tunnel")
            {
                nlohmann::json body = nlohmann::json::object();
                const auto hostname = services_.tunnel.hostname();
                body["hostname"] = hostname ? nlohmann::json(*hostname) : nlohmann::json(nullptr);
                return make_json_response(request, body);
            }
            return make_error_response(request, drcv::ErrorCode::NotFound, "Not found");
        }
        catch (const StoreError &ex)
        {
            spdlog::error("Admin query {} failed: {}", std::string(path), ex.what());
            return make_error_response(request, ex.code(), "Storage failure");
        }
    }

    void AdminConnection::start_event_stream(const Request &request)
    {
        stream_.expires_never();
        publisher_.emplace(services_.store);

        stream_header_ = std::make_unique<StreamHeader>(http::status::ok, request.version());
        stream_header_->set(http::field::content_type, "text/event-stream");
        stream_header_->set(http::field::cache_control, "no-cache");
        stream_header_->keep_alive(true);
        stream_serializer_ = std::make_unique<http::response_serializer<http::empty_body>>(*stream_header_);

        spdlog::debug("Change feed observer connected");
        http::async_write_header(stream_, *stream_serializer_,
                                 beast::bind_front_handler(&AdminConnection::on_stream_header, shared_from_this()));
    }

    void AdminConnection::on_stream_header(beast::error_code ec, std::size_t /*bytes*/)
    {
        if (ec)
        {
            spdlog::debug("Change feed header write failed: {}", ec.message());
            return close();
        }
        schedule_event();
    }

    void AdminConnection::schedule_event()
    {
        feed_timer_.expires_after(services_.feed_interval);
        feed_timer_.async_wait([self = shared_from_this()](const boost::system::error_code &ec)
                               {
            if (ec)
            {
                return;
            }
            try
            {
                self->event_payload_ = drcv::protocol::encode_event(self->publisher_->tick());
            }
            catch (const StoreError &ex)
            {
                spdlog::error("Change feed query failed: {}", ex.what());
                return self->close();
            }
            boost::asio::async_write(self->stream_, boost::asio::buffer(self->event_payload_),
                                     beast::bind_front_handler(&AdminConnection::on_event_written, self)); });
    }

    void AdminConnection::on_event_written(beast::error_code ec, std::size_t /*bytes*/)
    {
        if (ec)
        {
            spdlog::debug("Change feed observer disconnected: {}", ec.message());
            return close();
        }
        schedule_event();
    }

} // namespace drcv::server
