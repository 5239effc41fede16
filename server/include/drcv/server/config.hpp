#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace drcv::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8080};
        std::string admin_address{"127.0.0.1"};
        std::uint16_t admin_port{8081};
        std::filesystem::path upload_dir{"./uploads"};
        std::filesystem::path database_path{"./drcv.db"};
        std::uint64_t max_file_size{100ULL << 30};
        std::uint64_t chunk_size{4ULL << 20};
        std::size_t worker_threads{0};
        std::chrono::seconds upload_timeout{std::chrono::seconds{300}};
        std::chrono::seconds reap_interval{std::chrono::seconds{10}};
        std::chrono::seconds upload_stale_timeout{std::chrono::seconds{60}};
        std::chrono::seconds client_stale_timeout{std::chrono::seconds{120}};
        std::chrono::milliseconds feed_interval{std::chrono::seconds{1}};
        std::size_t page_size{100};
        std::optional<std::string> tunnel_provider;
        std::string cf_domain{"drcv.app"};
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
        bool show_help{false};
    };

    // Accepts plain byte counts and decimal/binary units: 512KB, 4MiB, 100GiB, 1.5GB.
    std::uint64_t parse_byte_size(std::string_view text);

    ServerConfig parse_arguments(int argc, char *argv[]);

    std::string usage(std::string_view program_name);

} // namespace drcv::server
