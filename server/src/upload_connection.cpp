#include "drcv/server/upload_connection.hpp"

#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <nlohmann/json.hpp>

#include <charconv>
#include <initializer_list>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "drcv/multipart.hpp"
#include "drcv/protocol.hpp"
#include "drcv/server/client_identity.hpp"
#include "http_common.hpp"

namespace drcv::server
{

    namespace
    {
        namespace beast = boost::beast;
        namespace http = beast::http;
        using namespace drcv::server::http_common;

        constexpr auto kIndexPage =
            "<!doctype html><html><head><title>drcv</title></head>"
            "<body><h1>drcv</h1><p>POST chunks to /upload as multipart/form-data.</p></body></html>";

        std::optional<std::uint64_t> parse_count(std::string_view text)
        {
            std::uint64_t value = 0;
            const auto *first = text.data();
            const auto *last = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc{} || ptr != last || text.empty())
            {
                return std::nullopt;
            }
            return value;
        }

        std::uint64_t required_count(const std::vector<drcv::multipart::Part> &parts,
                                     std::initializer_list<std::string_view> names)
        {
            for (const auto name : names)
            {
                if (const auto *part = drcv::multipart::find_part(parts, name))
                {
                    if (auto value = parse_count(part->data))
                    {
                        return *value;
                    }
                    throw UploadError(drcv::ErrorCode::InvalidPayload, "Invalid " + std::string(name));
                }
            }
            throw UploadError(drcv::ErrorCode::InvalidPayload, "Missing " + std::string(*names.begin()));
        }

        Request error_stub()
        {
            Request request;
            request.version(11);
            request.keep_alive(false);
            return request;
        }
    } // namespace

    UploadConnection::UploadConnection(boost::asio::ip::tcp::socket socket, UploadServices services)
        : stream_(std::move(socket)), deadline_(stream_.get_executor()), services_(services)
    {
        boost::system::error_code ec;
        const auto endpoint = stream_.socket().remote_endpoint(ec);
        if (!ec)
        {
            peer_ = endpoint.address();
        }
    }

    void UploadConnection::start()
    {
        read_request();
    }

    void UploadConnection::read_request()
    {
        parser_.emplace();
        parser_->body_limit(services_.body_limit);
        arm_deadline();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&UploadConnection::on_read, shared_from_this()));
    }

    void UploadConnection::arm_deadline()
    {
        timed_out_ = false;
        deadline_.expires_after(services_.upload_timeout);
        deadline_.async_wait([self = shared_from_this()](const boost::system::error_code &ec)
                             {
            if (ec)
            {
                return;
            }
            self->timed_out_ = true;
            boost::system::error_code ignored;
            self->stream_.socket().cancel(ignored); });
    }

    void UploadConnection::on_read(beast::error_code ec, std::size_t /*bytes*/)
    {
        deadline_.cancel();

        if (timed_out_)
        {
            if (parser_->got_some())
            {
                spdlog::warn("Request from {} timed out", peer_.to_string());
                return send(make_error_response(error_stub(), drcv::ErrorCode::Timeout, "Request timed out"), true);
            }
            return close();
        }
        if (ec == http::error::end_of_stream)
        {
            return close();
        }
        if (ec == http::error::body_limit)
        {
            return send(make_error_response(error_stub(), drcv::ErrorCode::PayloadTooLarge, "Request body too large"),
                        true);
        }
        if (ec)
        {
            spdlog::debug("Upload connection read failed: {}", ec.message());
            return close();
        }

        const auto request = parser_->release();
        auto response = handle(request);
        if (request.method() == http::verb::head)
        {
            // Content-Length stays as prepared; HEAD carries no body.
            response.body().clear();
        }
        send(std::move(response), !request.keep_alive());
    }

    void UploadConnection::send(Response response, bool close_after)
    {
        pending_ = std::make_shared<Response>(std::move(response));
        if (close_after)
        {
            pending_->keep_alive(false);
        }
        const bool close = pending_->need_eof();
        http::async_write(stream_, *pending_,
                          beast::bind_front_handler(&UploadConnection::on_write, shared_from_this(), close));
    }

    void UploadConnection::on_write(bool close, beast::error_code ec, std::size_t /*bytes*/)
    {
        pending_.reset();
        if (ec)
        {
            spdlog::debug("Upload connection write failed: {}", ec.message());
            return this->close();
        }
        if (close)
        {
            return this->close();
        }
        read_request();
    }

    void UploadConnection::close()
    {
        boost::system::error_code ec;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
    }

    UploadConnection::Response UploadConnection::handle(const Request &request)
    {
        const auto path = request_path(request_target(request));
        try
        {
            const auto identity = resolve_client_identity(peer_, request);
            if (path == "/")
            {
                if (request.method() != http::verb::get)
                {
                    return make_error_response(request, drcv::ErrorCode::Unsupported, "Method not allowed");
                }
                return make_html_response(request, kIndexPage);
            }
            if (path == "/upload")
            {
                if (request.method() == http::verb::post)
                {
                    return handle_upload(request, identity);
                }
                if (request.method() == http::verb::head)
                {
                    return handle_probe(request, identity);
                }
                return make_error_response(request, drcv::ErrorCode::Unsupported, "Method not allowed");
            }
            if (path == "/heartbeat")
            {
                if (request.method() != http::verb::post)
                {
                    return make_error_response(request, drcv::ErrorCode::Unsupported, "Method not allowed");
                }
                return handle_heartbeat(request, identity);
            }
            return make_error_response(request, drcv::ErrorCode::NotFound, "Not found");
        }
        catch (const UploadError &ex)
        {
            return make_error_response(request, ex.code(), ex.what());
        }
        catch (const drcv::multipart::MultipartError &ex)
        {
            return make_error_response(request, drcv::ErrorCode::InvalidPayload, ex.what());
        }
        catch (const nlohmann::json::exception &ex)
        {
            return make_error_response(request, drcv::ErrorCode::InvalidPayload, ex.what());
        }
        catch (const StoreError &ex)
        {
            spdlog::error("Store failure on {}: {}", std::string(path), ex.what());
            return make_error_response(request, ex.code(), "Storage failure");
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Unhandled error on {}: {}", std::string(path), ex.what());
            return make_error_response(request, drcv::ErrorCode::InternalError, "Internal error");
        }
    }

    UploadConnection::Response UploadConnection::handle_upload(const Request &request, const std::string &identity)
    {
        const auto content_type = header(request, http::field::content_type);
        const auto boundary = content_type ? drcv::multipart::boundary_from_content_type(*content_type) : std::nullopt;
        if (!boundary)
        {
            throw UploadError(drcv::ErrorCode::InvalidPayload, "Expected multipart/form-data");
        }

        auto parts = drcv::multipart::decode(request.body(), *boundary);

        const auto *chunk = drcv::multipart::find_part(parts, "chunk");
        if (chunk == nullptr)
        {
            throw UploadError(drcv::ErrorCode::InvalidPayload, "Missing chunk");
        }

        ChunkRequest chunk_request;
        if (const auto *filename = drcv::multipart::find_part(parts, "filename"))
        {
            chunk_request.filename = filename->data;
        }
        else if (chunk->filename)
        {
            chunk_request.filename = *chunk->filename;
        }
        else
        {
            throw UploadError(drcv::ErrorCode::InvalidPayload, "Missing filename");
        }
        chunk_request.client_identity = identity;
        chunk_request.chunk_index = required_count(parts, {"chunkIndex", "chunk_index"});
        chunk_request.total_chunks = required_count(parts, {"totalChunks", "total_chunks"});

        for (auto &part : parts)
        {
            if (part.name == "chunk")
            {
                chunk_request.data = std::move(part.data);
                break;
            }
        }

        const auto result = services_.pipeline.ingest(chunk_request);
        // Only accepted chunks count as client activity; rejected requests leave the store untouched.
        services_.liveness.touch_client(identity, header(request, http::field::user_agent));
        return make_text_response(request, http::status::ok, std::to_string(result.session_id));
    }

    UploadConnection::Response UploadConnection::handle_probe(const Request &request, const std::string &identity)
    {
        const auto filename = query_parameter(request_target(request), "filename");
        if (!filename || filename->empty())
        {
            throw UploadError(drcv::ErrorCode::InvalidPayload, "Missing filename");
        }

        services_.liveness.touch_client(identity, header(request, http::field::user_agent));

        const auto uploaded = services_.pipeline.probe(*filename, identity);
        auto response = make_text_response(request, http::status::ok, {});
        response.set("x-uploaded-bytes", std::to_string(uploaded));
        return response;
    }

    UploadConnection::Response UploadConnection::handle_heartbeat(const Request &request, const std::string &identity)
    {
        drcv::protocol::HeartbeatRequest heartbeat;
        if (!request.body().empty())
        {
            const auto body = nlohmann::json::parse(request.body());
            if (!body.is_object())
            {
                throw UploadError(drcv::ErrorCode::InvalidPayload, "Heartbeat body must be a JSON object");
            }
            heartbeat = body.get<drcv::protocol::HeartbeatRequest>();
        }
        const auto acknowledged =
            services_.liveness.heartbeat(identity, header(request, http::field::user_agent), heartbeat.upload_ids);
        return make_text_response(request, http::status::ok, "heartbeat_ok:" + std::to_string(acknowledged));
    }

} // namespace drcv::server
