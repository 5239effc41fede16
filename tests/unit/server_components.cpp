#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/beast/http/fields.hpp>
#include <sqlite3.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "drcv/protocol.hpp"
#include "drcv/server/change_feed.hpp"
#include "drcv/server/client_identity.hpp"
#include "drcv/server/liveness_tracker.hpp"
#include "drcv/server/session_store.hpp"
#include "drcv/server/staleness_reaper.hpp"
#include "drcv/server/tunnel.hpp"
#include "drcv/server/upload_pipeline.hpp"

using namespace drcv;
using namespace drcv::server;
using drcv::protocol::Timestamp;
using drcv::protocol::UploadStatus;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    // Store clock the test moves by hand. With `failing` set, every store write that needs the time fails.
    struct ManualClock
    {
        std::shared_ptr<Timestamp> current = std::make_shared<Timestamp>(protocol::from_unix_millis(1'700'000'000'000));
        std::shared_ptr<bool> failing = std::make_shared<bool>(false);

        SessionStore::ClockFunction function() const
        {
            return [current = current, failing = failing]
            {
                if (*failing)
                {
                    throw StoreError("database is locked");
                }
                return *current;
            };
        }

        void advance(std::chrono::milliseconds delta) { *current += delta; }
    };

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    template <typename Fn>
    bool throws_upload_error(Fn &&fn, ErrorCode expected)
    {
        try
        {
            fn();
        }
        catch (const UploadError &ex)
        {
            return ex.code() == expected;
        }
        return false;
    }

    void test_resolve_is_idempotent()
    {
        ManualClock clock;
        SessionStore store(":memory:", clock.function());

        const auto first = store.resolve("movie.mkv", "10.0.0.1");
        assert(store.resolve("movie.mkv", "10.0.0.1") == first);
        assert(store.resolve("movie.mkv", "10.0.0.2") != first);
        assert(store.resolve("other.mkv", "10.0.0.1") != first);

        const auto open = store.find_open("movie.mkv", "10.0.0.1");
        assert(open);
        assert(open->id == first);
        assert(open->status == UploadStatus::Init);
        assert(open->size == 0);
        assert(open->started_at == *clock.current);

        store.mark_complete(first);
        assert(!store.find_open("movie.mkv", "10.0.0.1"));
        assert(store.resolve("movie.mkv", "10.0.0.1") != first);

        bool caught = false;
        try
        {
            store.mark_complete(first);
        }
        catch (const StoreError &ex)
        {
            caught = ex.code() == ErrorCode::NotFound;
        }
        assert(caught);
    }

    void test_example_scenario()
    {
        const auto root = std::filesystem::temp_directory_path() / "drcv_pipeline_scenario";
        cleanup_path(root);

        ManualClock clock;
        SessionStore store(":memory:", clock.function());
        UploadPipeline pipeline(store, root, 100ULL << 30);
        boost::asio::io_context io_context;
        StalenessReaper reaper(io_context, store, ReaperSettings{});

        const std::string identity = "10.0.0.5";
        const std::string block(1000, 'r');

        auto result = pipeline.ingest(ChunkRequest{"report.csv", identity, 0, 3, block});
        const auto id = result.session_id;
        assert(result.size == 1000);
        assert(result.status == UploadStatus::Uploading);
        assert(std::filesystem::file_size(pipeline.staging_path(id)) == 1000);

        clock.advance(std::chrono::seconds(61));
        const auto report = reaper.sweep();
        assert(report.disconnected.size() == 1);
        assert(report.disconnected.front().id == id);
        assert(store.get(id)->status == UploadStatus::Disconnected);
        assert(pipeline.probe("report.csv", identity) == 1000);

        clock.advance(std::chrono::seconds(5));
        result = pipeline.ingest(ChunkRequest{"report.csv", identity, 1, 3, block});
        assert(result.session_id == id);
        assert(result.size == 2000);
        assert(result.status == UploadStatus::Uploading);

        result = pipeline.ingest(ChunkRequest{"report.csv", identity, 2, 3, block});
        assert(result.session_id == id);
        assert(result.size == 3000);
        assert(result.status == UploadStatus::Complete);
        assert(result.final_path == root / "report.csv");
        assert(std::filesystem::file_size(root / "report.csv") == 3000);
        assert(!std::filesystem::exists(pipeline.staging_path(id)));

        const auto stored = store.get(id);
        assert(stored->status == UploadStatus::Complete);
        assert(stored->completed_at);
        assert(*stored->completed_at == *clock.current);
        assert(pipeline.probe("report.csv", identity) == 0);

        // A completed key is free again.
        result = pipeline.ingest(ChunkRequest{"report.csv", identity, 0, 3, block});
        assert(result.session_id != id);

        cleanup_path(root);
    }

    void test_chunks_append_in_order()
    {
        const auto root = std::filesystem::temp_directory_path() / "drcv_pipeline_append";
        cleanup_path(root);

        ManualClock clock;
        SessionStore store(":memory:", clock.function());
        UploadPipeline pipeline(store, root, 1 << 20);

        (void)pipeline.ingest(ChunkRequest{"notes.txt", "a", 0, 3, "hello "});
        // An empty chunk keeps the session but moves neither size nor status.
        auto result = pipeline.ingest(ChunkRequest{"notes.txt", "a", 1, 3, ""});
        assert(result.size == 6);
        result = pipeline.ingest(ChunkRequest{"notes.txt", "a", 2, 3, "world"});
        assert(result.status == UploadStatus::Complete);
        assert(read_file(root / "notes.txt") == "hello world");

        cleanup_path(root);
    }

    void test_same_filename_isolated_by_client()
    {
        const auto root = std::filesystem::temp_directory_path() / "drcv_pipeline_isolated";
        cleanup_path(root);

        ManualClock clock;
        SessionStore store(":memory:", clock.function());
        UploadPipeline pipeline(store, root, 1 << 20);

        const auto a = pipeline.ingest(ChunkRequest{"photo.jpg", "10.0.0.1", 0, 2, "AAAA"});
        const auto b = pipeline.ingest(ChunkRequest{"photo.jpg", "10.0.0.2", 0, 2, "BB"});
        assert(a.session_id != b.session_id);
        assert(pipeline.staging_path(a.session_id) != pipeline.staging_path(b.session_id));
        assert(pipeline.probe("photo.jpg", "10.0.0.1") == 4);
        assert(pipeline.probe("photo.jpg", "10.0.0.2") == 2);
        assert(pipeline.probe("photo.jpg", "10.0.0.3") == 0);

        cleanup_path(root);
    }

    void test_pipeline_validation()
    {
        const auto root = std::filesystem::temp_directory_path() / "drcv_pipeline_validation";
        cleanup_path(root);

        ManualClock clock;
        SessionStore store(":memory:", clock.function());
        UploadPipeline pipeline(store, root, 10);

        for (const auto *name : {"", ".", "..", "../escape.txt", "dir/file.txt", "dir\\file.txt", ".drcv-staging"})
        {
            assert(throws_upload_error([&]
                                       { (void)pipeline.ingest(ChunkRequest{name, "a", 0, 1, "x"}); },
                                       ErrorCode::InvalidPayload));
        }
        assert(throws_upload_error([&]
                                   { (void)pipeline.ingest(ChunkRequest{"ok.txt", "a", 2, 2, "x"}); },
                                   ErrorCode::InvalidPayload));
        assert(throws_upload_error([&]
                                   { (void)pipeline.ingest(ChunkRequest{"ok.txt", "a", 0, 0, "x"}); },
                                   ErrorCode::InvalidPayload));
        // 6 bytes x 2 chunks is over the 10 byte limit.
        assert(throws_upload_error([&]
                                   { (void)pipeline.ingest(ChunkRequest{"big.bin", "a", 0, 2, "123456"}); },
                                   ErrorCode::PayloadTooLarge));
        assert(throws_upload_error([&]
                                   { (void)pipeline.ingest(ChunkRequest{"big.bin", "a", 0, ~0ULL, "123456"}); },
                                   ErrorCode::PayloadTooLarge));

        // Rejected before any store mutation.
        assert(!store.find_open("big.bin", "a"));
        assert(!store.find_open("ok.txt", "a"));

        cleanup_path(root);
    }

    void test_heartbeat_rules()
    {
        const auto root = std::filesystem::temp_directory_path() / "drcv_heartbeat";
        cleanup_path(root);

        ManualClock clock;
        SessionStore store(":memory:", clock.function());
        UploadPipeline pipeline(store, root, 1 << 20);
        LivenessTracker liveness(store);
        boost::asio::io_context io_context;
        StalenessReaper reaper(io_context, store, ReaperSettings{});

        const auto mine = pipeline.ingest(ChunkRequest{"a.bin", "alice", 0, 4, "data"}).session_id;
        const auto idle = store.resolve("b.bin", "alice");
        const auto theirs = pipeline.ingest(ChunkRequest{"c.bin", "bob", 0, 4, "data"}).session_id;

        clock.advance(std::chrono::seconds(30));
        assert(liveness.heartbeat("alice", std::string("uploader/1.0"), {mine, mine, idle, theirs, 9999}) == 1);
        assert(store.get(mine)->updated_at == *clock.current);
        assert(store.get(idle)->status == UploadStatus::Init);
        assert(store.get(theirs)->updated_at != *clock.current);

        const auto client = store.find_client("alice");
        assert(client);
        assert(client->user_agent == std::string("uploader/1.0"));
        assert(client->last_seen == *clock.current);

        clock.advance(std::chrono::seconds(1));
        assert(liveness.heartbeat("alice", std::nullopt, {}) == 0);
        assert(store.find_client("alice")->user_agent == std::string("uploader/1.0"));

        // bob never heartbeats; alice keeps hers alive.
        clock.advance(std::chrono::seconds(35));
        const auto report = reaper.sweep();
        assert(report.disconnected.size() == 1);
        assert(report.disconnected.front().id == theirs);
        assert(store.get(mine)->status == UploadStatus::Uploading);

        assert(liveness.heartbeat("bob", std::nullopt, {theirs}) == 0);
        assert(store.get(theirs)->status == UploadStatus::Disconnected);

        cleanup_path(root);
    }

    void test_reaper_thresholds()
    {
        const auto root = std::filesystem::temp_directory_path() / "drcv_reaper";
        cleanup_path(root);

        ManualClock clock;
        SessionStore store(":memory:", clock.function());
        UploadPipeline pipeline(store, root, 1 << 20);
        LivenessTracker liveness(store);
        boost::asio::io_context io_context;
        StalenessReaper reaper(io_context, store, ReaperSettings{});

        const auto id = pipeline.ingest(ChunkRequest{"a.bin", "carol", 0, 2, "xy"}).session_id;
        liveness.touch_client("carol", std::nullopt);

        clock.advance(std::chrono::seconds(60));
        auto report = reaper.sweep();
        assert(report.disconnected.empty());

        clock.advance(std::chrono::milliseconds(1));
        report = reaper.sweep();
        assert(report.disconnected.size() == 1);
        assert(report.removed_clients.empty());
        assert(store.get(id)->updated_at == *clock.current);

        clock.advance(std::chrono::seconds(60));
        report = reaper.sweep();
        assert(report.disconnected.empty());
        assert(report.removed_clients.size() == 1);
        assert(report.removed_clients.front() == "carol");
        assert(!store.find_client("carol"));
        assert(store.get(id)->status == UploadStatus::Disconnected);

        cleanup_path(root);
    }

    void test_reaper_runs_on_timer()
    {
        const auto root = std::filesystem::temp_directory_path() / "drcv_reaper_timer";
        cleanup_path(root);

        ManualClock clock;
        SessionStore store(":memory:", clock.function());
        UploadPipeline pipeline(store, root, 1 << 20);
        const auto id = pipeline.ingest(ChunkRequest{"a.bin", "dave", 0, 2, "xy"}).session_id;
        clock.advance(std::chrono::minutes(5));

        boost::asio::io_context io_context;
        StalenessReaper reaper(io_context, store,
                               ReaperSettings{.interval = std::chrono::seconds(1),
                                              .upload_stale_timeout = std::chrono::seconds(60),
                                              .client_stale_timeout = std::chrono::seconds(120)});
        reaper.start();
        io_context.run_for(std::chrono::milliseconds(1500));
        assert(store.get(id)->status == UploadStatus::Disconnected);
        reaper.stop();
        io_context.restart();
        io_context.run_for(std::chrono::milliseconds(100));

        cleanup_path(root);
    }

    void test_change_feed()
    {
        const auto root = std::filesystem::temp_directory_path() / "drcv_change_feed";
        cleanup_path(root);

        ManualClock clock;
        SessionStore store(":memory:", clock.function());
        UploadPipeline pipeline(store, root, 1 << 20);
        const auto before = pipeline.ingest(ChunkRequest{"old.bin", "erin", 0, 2, "xy"}).session_id;
        clock.advance(std::chrono::seconds(1));

        ChangeFeedPublisher publisher(store);
        assert(publisher.watermark() == store.change_cursor());

        clock.advance(std::chrono::seconds(1));
        auto event = publisher.tick();
        assert(event.kind == protocol::FeedEventKind::Heartbeat);
        assert(event.sessions.empty());
        assert(event.at == *clock.current);

        clock.advance(std::chrono::seconds(1));
        const auto id = pipeline.ingest(ChunkRequest{"new.bin", "erin", 0, 2, "xy"}).session_id;
        clock.advance(std::chrono::seconds(1));
        event = publisher.tick();
        assert(event.kind == protocol::FeedEventKind::Updates);
        assert(event.sessions.size() == 1);
        assert(event.sessions.front().id == id);
        assert(event.sessions.front().id != before);

        event = publisher.tick();
        assert(event.kind == protocol::FeedEventKind::Heartbeat);

        cleanup_path(root);
    }

    void test_change_feed_same_millisecond()
    {
        const auto root = std::filesystem::temp_directory_path() / "drcv_change_feed_ms";
        cleanup_path(root);

        ManualClock clock;
        SessionStore store(":memory:", clock.function());
        UploadPipeline pipeline(store, root, 1 << 20);
        ChangeFeedPublisher publisher(store);

        // Write and tick share one millisecond: reported once, then never again.
        const auto id = pipeline.ingest(ChunkRequest{"burst.bin", "gina", 0, 4, "ab"}).session_id;
        auto event = publisher.tick();
        assert(event.kind == protocol::FeedEventKind::Updates);
        assert(event.sessions.size() == 1);
        clock.advance(std::chrono::seconds(1));
        event = publisher.tick();
        assert(event.kind == protocol::FeedEventKind::Heartbeat);

        // A write in the same millisecond right after a tick is not lost.
        event = publisher.tick();
        assert(event.kind == protocol::FeedEventKind::Heartbeat);
        (void)pipeline.ingest(ChunkRequest{"burst.bin", "gina", 1, 4, "cd"});
        event = publisher.tick();
        assert(event.kind == protocol::FeedEventKind::Updates);
        assert(event.sessions.size() == 1);
        assert(event.sessions.front().id == id);
        assert(event.sessions.front().size == 4);

        // Several writes between ticks coalesce into one row.
        (void)pipeline.ingest(ChunkRequest{"burst.bin", "gina", 2, 4, "ef"});
        (void)store.touch_uploads("gina", {id});
        event = publisher.tick();
        assert(event.sessions.size() == 1);
        assert(publisher.tick().kind == protocol::FeedEventKind::Heartbeat);

        cleanup_path(root);
    }

    void test_failed_finalize_keeps_upload_resumable()
    {
        const auto root = std::filesystem::temp_directory_path() / "drcv_pipeline_finalize";
        cleanup_path(root);

        ManualClock clock;
        SessionStore store(":memory:", clock.function());
        UploadPipeline pipeline(store, root, 1 << 20);

        const auto id = pipeline.ingest(ChunkRequest{"report.csv", "hana", 0, 3, "aaa"}).session_id;
        (void)pipeline.ingest(ChunkRequest{"report.csv", "hana", 1, 3, "bbb"});

        *clock.failing = true;
        assert(throws_upload_error([&]
                                   { (void)pipeline.ingest(ChunkRequest{"report.csv", "hana", 2, 3, "ccc"}); },
                                   ErrorCode::StorageFailure));
        *clock.failing = false;

        assert(!std::filesystem::exists(root / "report.csv"));
        assert(read_file(pipeline.staging_path(id)) == "aaabbb");
        const auto pending = store.get(id);
        assert(pending->status == UploadStatus::Uploading);
        assert(pending->size == 6);
        assert(pipeline.probe("report.csv", "hana") == 6);

        const auto result = pipeline.ingest(ChunkRequest{"report.csv", "hana", 2, 3, "ccc"});
        assert(result.session_id == id);
        assert(result.status == UploadStatus::Complete);
        assert(result.size == 9);
        assert(read_file(root / "report.csv") == "aaabbbccc");

        cleanup_path(root);
    }

    void test_failed_chunk_rolls_back_staging()
    {
        const auto root = std::filesystem::temp_directory_path() / "drcv_pipeline_rollback";
        cleanup_path(root);

        ManualClock clock;
        SessionStore store(":memory:", clock.function());
        UploadPipeline pipeline(store, root, 1 << 20);

        const auto id = pipeline.ingest(ChunkRequest{"log.txt", "ivan", 0, 3, "one"}).session_id;
        *clock.failing = true;
        assert(throws_upload_error([&]
                                   { (void)pipeline.ingest(ChunkRequest{"log.txt", "ivan", 1, 3, "two"}); },
                                   ErrorCode::StorageFailure));
        *clock.failing = false;
        assert(read_file(pipeline.staging_path(id)) == "one");
        assert(store.get(id)->size == 3);

        cleanup_path(root);
    }

    void test_concurrent_chunks_for_one_session()
    {
        const auto root = std::filesystem::temp_directory_path() / "drcv_pipeline_concurrent";
        cleanup_path(root);

        SessionStore store(":memory:");
        UploadPipeline pipeline(store, root, 1ULL << 30);

        constexpr int kThreads = 8;
        constexpr int kChunksPerThread = 25;
        constexpr std::size_t kChunkBytes = 100;

        std::vector<std::thread> senders;
        for (int t = 0; t < kThreads; ++t)
        {
            senders.emplace_back([&pipeline, t]
                                 {
                const std::string block(kChunkBytes, static_cast<char>('a' + t));
                for (int i = 0; i < kChunksPerThread; ++i)
                {
                    const auto index = static_cast<std::uint64_t>(i);
                    (void)pipeline.ingest(ChunkRequest{"shared.bin", "jo", index, 10'000, block});
                } });
        }
        for (auto &sender : senders)
        {
            sender.join();
        }

        const auto session = store.find_open("shared.bin", "jo");
        assert(session);
        assert(session->size == kThreads * kChunksPerThread * kChunkBytes);
        assert(store.list_sessions(1, 10, "").size() == 1);

        const auto staged = read_file(pipeline.staging_path(session->id));
        assert(staged.size() == session->size);
        // Every chunk landed whole: no interleaving inside a block.
        for (std::size_t offset = 0; offset < staged.size(); offset += kChunkBytes)
        {
            assert(staged.find_first_not_of(staged[offset], offset) >= offset + kChunkBytes);
        }

        cleanup_path(root);
    }

    void test_concurrent_resolve_creates_one_row()
    {
        SessionStore store(":memory:");

        constexpr int kThreads = 8;
        std::vector<std::int64_t> ids(kThreads * 50);
        std::vector<std::thread> resolvers;
        for (int t = 0; t < kThreads; ++t)
        {
            resolvers.emplace_back([&store, &ids, t]
                                   {
                for (int i = 0; i < 50; ++i)
                {
                    ids[static_cast<std::size_t>(t * 50 + i)] = store.resolve("race.bin", "kim");
                } });
        }
        for (auto &resolver : resolvers)
        {
            resolver.join();
        }

        for (const auto id : ids)
        {
            assert(id == ids.front());
        }
        assert(store.list_sessions(1, 10, "race").size() == 1);
    }

    void test_reaped_sessions_release_state()
    {
        const auto root = std::filesystem::temp_directory_path() / "drcv_pipeline_release";
        cleanup_path(root);

        ManualClock clock;
        SessionStore store(":memory:", clock.function());
        UploadPipeline pipeline(store, root, 1 << 20);
        boost::asio::io_context io_context;
        StalenessReaper reaper(io_context, store, ReaperSettings{});
        reaper.on_disconnect([&pipeline](const std::vector<protocol::UploadSession> &sessions)
                             { pipeline.release_idle(sessions); });

        const auto id = pipeline.ingest(ChunkRequest{"idle.bin", "lee", 0, 3, "xyz"}).session_id;
        (void)pipeline.ingest(ChunkRequest{"done.bin", "lee", 0, 1, "x"});
        assert(pipeline.tracked_sessions() == 1);

        clock.advance(std::chrono::seconds(61));
        assert(reaper.sweep().disconnected.size() == 1);
        assert(pipeline.tracked_sessions() == 0);

        const auto resumed = pipeline.ingest(ChunkRequest{"idle.bin", "lee", 1, 3, "xyz"});
        assert(resumed.session_id == id);
        assert(resumed.size == 6);
        assert(pipeline.tracked_sessions() == 1);

        cleanup_path(root);
    }

    void test_list_sessions()
    {
        ManualClock clock;
        SessionStore store(":memory:", clock.function());
        const auto a = store.resolve("report-a.csv", "x");
        const auto b = store.resolve("photo.jpg", "x");
        const auto c = store.resolve("report-c.csv", "x");

        const auto page1 = store.list_sessions(1, 2, "");
        assert(page1.size() == 2);
        assert(page1[0].id == c);
        assert(page1[1].id == b);
        const auto page2 = store.list_sessions(2, 2, "");
        assert(page2.size() == 1);
        assert(page2[0].id == a);
        assert(store.list_sessions(3, 2, "").empty());

        const auto reports = store.list_sessions(1, 10, "report");
        assert(reports.size() == 2);
        assert(reports[0].id == c);
        assert(reports[1].id == a);
    }

    void test_client_listing()
    {
        ManualClock clock;
        SessionStore store(":memory:", clock.function());
        store.upsert_client("first", std::string("ua-1"));
        clock.advance(std::chrono::seconds(1));
        store.upsert_client("second", std::nullopt);

        const auto clients = store.list_clients();
        assert(clients.size() == 2);
        assert(clients[0].identity == "second");
        assert(!clients[0].user_agent);
        assert(clients[1].identity == "first");
        assert(clients[1].status == "connected");
        assert(clients[1].first_seen == clients[1].last_seen);
    }

    void test_store_survives_reopen()
    {
        const auto root = std::filesystem::temp_directory_path() / "drcv_store_reopen";
        cleanup_path(root);
        const auto database = root / "nested" / "drcv.db";

        std::int64_t id = 0;
        {
            SessionStore store(database);
            id = store.resolve("keep.bin", "frank");
            store.record_chunk(id, 42);
            store.kv_set("cf_hash", "abc123");
        }
        {
            SessionStore store(database);
            const auto session = store.find_open("keep.bin", "frank");
            assert(session);
            assert(session->id == id);
            assert(session->size == 42);
            assert(store.kv_get("cf_hash") == std::string("abc123"));
            assert(!store.kv_get("missing"));
        }

        cleanup_path(root);
    }

    void test_client_identity()
    {
        const auto loopback = boost::asio::ip::make_address("127.0.0.1");
        const auto remote = boost::asio::ip::make_address("198.51.100.20");

        boost::beast::http::fields forwarded;
        forwarded.set("X-Forwarded-For", " 203.0.113.5 , 10.0.0.1");
        forwarded.set("X-Real-IP", "192.0.2.1");
        assert(resolve_client_identity(loopback, forwarded) == "203.0.113.5");
        assert(resolve_client_identity(remote, forwarded) == "198.51.100.20");

        boost::beast::http::fields real_ip;
        real_ip.set("CF-Connecting-IP", "192.0.2.9");
        assert(resolve_client_identity(loopback, real_ip) == "192.0.2.9");
        real_ip.set("X-Real-IP", "192.0.2.8");
        assert(resolve_client_identity(loopback, real_ip) == "192.0.2.8");

        const boost::beast::http::fields none;
        assert(resolve_client_identity(loopback, none) == "127.0.0.1");

        assert(is_trusted_relay(boost::asio::ip::make_address("::1")));
        assert(is_trusted_relay(boost::asio::ip::make_address("::ffff:127.0.0.1")));
        assert(!is_trusted_relay(remote));
        assert(resolve_client_identity(boost::asio::ip::make_address("::ffff:198.51.100.20"), forwarded) ==
               "198.51.100.20");
    }

    void test_tunnel_helpers()
    {
        ManualClock clock;
        SessionStore store(":memory:", clock.function());

        const auto token = load_or_create_tunnel_token(store, "cf_hash");
        assert(token.size() == 6);
        assert(load_or_create_tunnel_token(store, "cf_hash") == token);
        assert(store.kv_get("cf_hash") == token);

        assert(make_tunnel_provider("Cloudflare") != nullptr);
        bool caught = false;
        try
        {
            (void)make_tunnel_provider("carrier-pigeon");
        }
        catch (const TunnelError &ex)
        {
            caught = ex.kind() == TunnelErrorKind::Config;
        }
        assert(caught);

        TunnelStatus status;
        assert(!status.hostname());
        status.set_hostname(std::string("abc123.drcv.app"));
        assert(status.hostname() == std::string("abc123.drcv.app"));
    }

    void test_tunnel_token_store_failure()
    {
        const auto root = std::filesystem::temp_directory_path() / "drcv_tunnel_token";
        cleanup_path(root);
        const auto database = root / "drcv.db";

        SessionStore store(database);
        {
            sqlite3 *raw = nullptr;
            assert(sqlite3_open(database.string().c_str(), &raw) == SQLITE_OK);
            assert(sqlite3_exec(raw, "DROP TABLE kv;", nullptr, nullptr, nullptr) == SQLITE_OK);
            sqlite3_close(raw);
        }

        bool caught = false;
        try
        {
            (void)load_or_create_tunnel_token(store, "cf_hash");
        }
        catch (const TunnelError &ex)
        {
            caught = ex.kind() == TunnelErrorKind::Config;
        }
        assert(caught);

        cleanup_path(root);
    }

} // namespace

void run_server_component_tests()
{
    test_resolve_is_idempotent();
    test_example_scenario();
    test_chunks_append_in_order();
    test_same_filename_isolated_by_client();
    test_pipeline_validation();
    test_heartbeat_rules();
    test_reaper_thresholds();
    test_reaper_runs_on_timer();
    test_change_feed();
    test_change_feed_same_millisecond();
    test_failed_finalize_keeps_upload_resumable();
    test_failed_chunk_rolls_back_staging();
    test_concurrent_chunks_for_one_session();
    test_concurrent_resolve_creates_one_row();
    test_reaped_sessions_release_state();
    test_list_sessions();
    test_client_listing();
    test_store_survives_reopen();
    test_client_identity();
    test_tunnel_helpers();
    test_tunnel_token_store_failure();
}
