#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "drcv/server/liveness_tracker.hpp"
#include "drcv/server/upload_pipeline.hpp"

namespace drcv::server
{

    struct UploadServices
    {
        UploadPipeline &pipeline;
        LivenessTracker &liveness;
        std::chrono::seconds upload_timeout;
        std::uint64_t body_limit;
    };

    // One keep-alive HTTP connection on the public listener.
    class UploadConnection : public std::enable_shared_from_this<UploadConnection>
    {
    public:
        using Request = boost::beast::http::request<boost::beast::http::string_body>;
        using Response = boost::beast::http::response<boost::beast::http::string_body>;

        UploadConnection(boost::asio::ip::tcp::socket socket, UploadServices services);

        void start();

    private:
        void read_request();
        void arm_deadline();
        void on_read(boost::beast::error_code ec, std::size_t bytes);
        void send(Response response, bool close_after);
        void on_write(bool close, boost::beast::error_code ec, std::size_t bytes);
        void close();

        Response handle(const Request &request);
        Response handle_upload(const Request &request, const std::string &identity);
        Response handle_probe(const Request &request, const std::string &identity);
        Response handle_heartbeat(const Request &request, const std::string &identity);

        boost::beast::tcp_stream stream_;
        boost::beast::flat_buffer buffer_;
        boost::asio::steady_timer deadline_;
        bool timed_out_{false};
        std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
        std::shared_ptr<Response> pending_;
        boost::asio::ip::address peer_;
        UploadServices services_;
    };

} // namespace drcv::server
