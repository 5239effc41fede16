#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "drcv/crypto.hpp"
#include "drcv/error_codes.hpp"
#include "drcv/event_stream.hpp"
#include "drcv/multipart.hpp"
#include "drcv/protocol.hpp"
#include "drcv/server/config.hpp"

using namespace drcv;
using namespace drcv::protocol;

void run_server_component_tests();
void run_http_endpoint_tests();

namespace
{

    void test_timestamp_format()
    {
        const auto stamp = from_unix_millis(1'700'000'000'123);
        assert(to_unix_millis(stamp) == 1'700'000'000'123);
        assert(format_timestamp(stamp) == "2023-11-14T22:13:20.123Z");
        assert(format_timestamp(from_unix_millis(0)) == "1970-01-01T00:00:00.000Z");
    }

    void test_upload_status_names()
    {
        for (const auto status : {UploadStatus::Init, UploadStatus::Uploading, UploadStatus::Complete,
                                  UploadStatus::Disconnected})
        {
            assert(upload_status_from_string(to_string(status)) == status);
        }
        assert(to_string(UploadStatus::Disconnected) == "disconnected");
        assert(!upload_status_from_string("paused"));
    }

    void test_session_serialization()
    {
        UploadSession session{
            .id = 7,
            .filename = "report.csv",
            .client_identity = "203.0.113.9",
            .size = 2000,
            .status = UploadStatus::Uploading,
            .started_at = from_unix_millis(1'700'000'000'000),
            .updated_at = from_unix_millis(1'700'000'001'500),
        };

        auto json = nlohmann::json(session);
        assert(json["id"] == 7);
        assert(json["filename"] == "report.csv");
        assert(json["client"] == "203.0.113.9");
        assert(json["size"] == 2000);
        assert(json["status"] == "uploading");
        assert(json["updated_at"] == "2023-11-14T22:13:21.500Z");
        assert(json["completed_at"].is_null());

        session.status = UploadStatus::Complete;
        session.completed_at = session.updated_at;
        json = nlohmann::json(session);
        assert(json["completed_at"] == json["updated_at"]);
    }

    void test_client_serialization()
    {
        ClientRecord client{
            .identity = "198.51.100.4",
            .first_seen = from_unix_millis(1'000),
            .last_seen = from_unix_millis(2'000),
        };
        auto json = nlohmann::json(client);
        assert(json["identity"] == "198.51.100.4");
        assert(json["user_agent"].is_null());
        assert(json["status"] == "connected");

        client.user_agent = "curl/8.0";
        json = nlohmann::json(client);
        assert(json["user_agent"] == "curl/8.0");
    }

    void test_heartbeat_payload()
    {
        const auto request = nlohmann::json::parse(R"({"uploadIds":[3,5,3]})").get<HeartbeatRequest>();
        assert((request.upload_ids == std::vector<std::int64_t>{3, 5, 3}));

        const auto empty = nlohmann::json::parse("{}").get<HeartbeatRequest>();
        assert(empty.upload_ids.empty());

        const auto encoded = nlohmann::json(HeartbeatRequest{.upload_ids = {1, 2}});
        assert(encoded["uploadIds"].size() == 2);

        bool caught = false;
        try
        {
            (void)nlohmann::json::parse(R"({"uploadIds":["x"]})").get<HeartbeatRequest>();
        }
        catch (const nlohmann::json::exception &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_event_stream()
    {
        ChangeFeedEvent heartbeat{.kind = FeedEventKind::Heartbeat, .at = from_unix_millis(0)};
        const auto frame = encode_event(heartbeat);
        assert(frame == "event: heartbeat\ndata: {\"ts\":\"1970-01-01T00:00:00.000Z\"}\n\n");

        ChangeFeedEvent updates{.kind = FeedEventKind::Updates, .at = from_unix_millis(0)};
        updates.sessions.push_back(UploadSession{.id = 1, .filename = "a\nb.txt", .client_identity = "c"});
        const auto stream = encode_event(updates) + frame;

        auto first = try_decode_event(stream);
        assert(first);
        assert(first->name == "updates");
        assert(first->data.is_array());
        assert(first->data[0]["filename"] == "a\nb.txt");

        auto second = try_decode_event(std::string_view(stream).substr(first->bytes_consumed));
        assert(second);
        assert(second->name == "heartbeat");
        assert(second->bytes_consumed == frame.size());

        assert(!try_decode_event("event: updates\ndata: [1"));
    }

    void test_multipart_roundtrip()
    {
        const std::string binary("\x00\xff\r\n--not-a-boundary\r\n\x7f", 23);
        const std::vector<multipart::Part> parts{
            {.name = "filename", .data = "report.csv"},
            {.name = "chunkIndex", .data = "0"},
            {.name = "chunk", .filename = std::string("blob"), .content_type = "application/octet-stream",
             .data = binary},
        };
        const auto body = multipart::encode(parts, "XyZ123");

        const auto boundary = multipart::boundary_from_content_type("multipart/form-data; boundary=\"XyZ123\"");
        assert(boundary == std::string("XyZ123"));

        const auto decoded = multipart::decode(body, *boundary);
        assert(decoded.size() == 3);
        const auto *chunk = multipart::find_part(decoded, "chunk");
        assert(chunk != nullptr);
        assert(chunk->data == binary);
        assert(chunk->filename == std::string("blob"));
        assert(chunk->content_type == "application/octet-stream");
        assert(multipart::find_part(decoded, "filename")->data == "report.csv");
        assert(multipart::find_part(decoded, "totalChunks") == nullptr);
    }

    void test_multipart_rejects_garbage()
    {
        assert(!multipart::boundary_from_content_type("application/json"));
        assert(!multipart::boundary_from_content_type("multipart/form-data"));

        bool caught = false;
        try
        {
            (void)multipart::decode("--abc\r\nContent-Disposition: form-data; name=\"x\"\r\n\r\nvalue", "abc");
        }
        catch (const multipart::MultipartError &)
        {
            caught = true;
        }
        assert(caught);

        caught = false;
        try
        {
            (void)multipart::decode("no delimiter here", "abc");
        }
        catch (const multipart::MultipartError &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_error_codes()
    {
        assert(http_status(ErrorCode::InvalidPayload) == 400);
        assert(http_status(ErrorCode::PayloadTooLarge) == 413);
        assert(http_status(ErrorCode::Timeout) == 408);
        assert(http_status(ErrorCode::StorageFailure) == 500);
        assert(to_string(ErrorCode::PayloadTooLarge) == "payload_too_large");
        assert(http_status(ErrorCode::Unsupported) == 405);
        assert(to_string(ErrorCode::InvalidPayload) == "invalid_payload");
    }

    void test_random_token()
    {
        const auto token = crypto::random_token(6);
        assert(token.size() == 6);
        for (const char c : token)
        {
            assert((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'));
        }
        assert(crypto::random_token(32) != crypto::random_token(32));
    }

    void test_byte_sizes()
    {
        using server::parse_byte_size;
        assert(parse_byte_size("1024") == 1024);
        assert(parse_byte_size("4MiB") == 4ULL * 1024 * 1024);
        assert(parse_byte_size("100GiB") == 100ULL << 30);
        assert(parse_byte_size("500MB") == 500'000'000ULL);
        assert(parse_byte_size("1.5 kb") == 1500);

        for (const auto *bad : {"", "-1", "12parsecs", "MiB"})
        {
            bool caught = false;
            try
            {
                (void)parse_byte_size(bad);
            }
            catch (const std::runtime_error &)
            {
                caught = true;
            }
            assert(caught);
        }
    }

    void test_parse_arguments()
    {
        {
            char program[] = "drcv_server";
            char *argv[] = {program};
            const auto config = server::parse_arguments(1, argv);
            assert(config.port == 8080);
            assert(config.admin_port == 8081);
            assert(config.admin_address == "127.0.0.1");
            assert(config.max_file_size == 100ULL << 30);
            assert(config.chunk_size == 4ULL << 20);
            assert(config.upload_timeout == std::chrono::seconds(300));
            assert(config.upload_stale_timeout == std::chrono::seconds(60));
            assert(config.client_stale_timeout == std::chrono::seconds(120));
            assert(config.page_size == 100);
            assert(config.cf_domain == "drcv.app");
            assert(!config.tunnel_provider);
        }
        {
            std::vector<std::string> args{"drcv_server", "--port", "9000", "--chunk-size", "1MiB", "--tunnel",
                                          "cloudflare", "--feed-interval", "250", "--verbose"};
            std::vector<char *> argv;
            for (auto &arg : args)
            {
                argv.push_back(arg.data());
            }
            const auto config = server::parse_arguments(static_cast<int>(argv.size()), argv.data());
            assert(config.port == 9000);
            assert(config.chunk_size == 1ULL << 20);
            assert(config.tunnel_provider == std::string("cloudflare"));
            assert(config.feed_interval == std::chrono::milliseconds(250));
            assert(config.verbose);
        }
        for (std::vector<std::string> args : {std::vector<std::string>{"drcv_server", "--port"},
                                              std::vector<std::string>{"drcv_server", "--port", "0"},
                                              std::vector<std::string>{"drcv_server", "--bogus"},
                                              std::vector<std::string>{"drcv_server", "--page-size", "0"}})
        {
            std::vector<char *> argv;
            for (auto &arg : args)
            {
                argv.push_back(arg.data());
            }
            bool caught = false;
            try
            {
                (void)server::parse_arguments(static_cast<int>(argv.size()), argv.data());
            }
            catch (const std::runtime_error &)
            {
                caught = true;
            }
            assert(caught);
        }
    }

} // namespace

int main()
{
    try
    {
        test_timestamp_format();
        test_upload_status_names();
        test_session_serialization();
        test_client_serialization();
        test_heartbeat_payload();
        test_event_stream();
        test_multipart_roundtrip();
        test_multipart_rejects_garbage();
        test_error_codes();
        test_random_token();
        test_byte_sizes();
        test_parse_arguments();
        run_server_component_tests();
        run_http_endpoint_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
