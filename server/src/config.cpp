#include "drcv/server/config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace drcv::server
{

    namespace
    {

        struct UnitMapping
        {
            std::string_view suffix;
            double multiplier;
        };

        constexpr std::array<UnitMapping, 13> kUnits{{
            {"", 1.0},
            {"b", 1.0},
            {"kb", 1e3},
            {"mb", 1e6},
            {"gb", 1e9},
            {"tb", 1e12},
            {"kib", 1024.0},
            {"mib", 1024.0 * 1024.0},
            {"gib", 1024.0 * 1024.0 * 1024.0},
            {"tib", 1024.0 * 1024.0 * 1024.0 * 1024.0},
            {"k", 1024.0},
            {"m", 1024.0 * 1024.0},
            {"g", 1024.0 * 1024.0 * 1024.0},
        }};

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            ++index;
            return std::string(argv[index]);
        }

        std::uint64_t parse_unsigned(const std::string &value, const std::string &flag)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoull(value, &consumed);
                if (consumed != value.size() || value.front() == '-')
                {
                    throw std::invalid_argument(value);
                }
                return parsed;
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error("Invalid value for " + flag + ": " + value);
            }
        }

        std::uint16_t parse_port(const std::string &value, const std::string &flag)
        {
            const auto port = parse_unsigned(value, flag);
            if (port == 0 || port > std::numeric_limits<std::uint16_t>::max())
            {
                throw std::runtime_error("Port out of range for " + flag + ": " + value);
            }
            return static_cast<std::uint16_t>(port);
        }

        std::chrono::seconds parse_seconds(const std::string &value, const std::string &flag)
        {
            const auto seconds = parse_unsigned(value, flag);
            if (seconds == 0)
            {
                throw std::runtime_error(flag + " must be positive");
            }
            return std::chrono::seconds(static_cast<std::int64_t>(seconds));
        }

    } // namespace

    std::uint64_t parse_byte_size(std::string_view text)
    {
        std::string lowered;
        for (const char ch : text)
        {
            if (!std::isspace(static_cast<unsigned char>(ch)))
            {
                lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
            }
        }
        const auto unit_start = std::find_if(lowered.begin(), lowered.end(), [](char c)
                                             { return std::isalpha(static_cast<unsigned char>(c)) != 0; });
        const std::string number(lowered.begin(), unit_start);
        const std::string unit(unit_start, lowered.end());
        if (number.empty() || number.front() == '-')
        {
            throw std::runtime_error("Invalid size: " + std::string(text));
        }

        double value = 0.0;
        try
        {
            std::size_t consumed = 0;
            value = std::stod(number, &consumed);
            if (consumed != number.size())
            {
                throw std::invalid_argument(number);
            }
        }
        catch (const std::logic_error &)
        {
            throw std::runtime_error("Invalid size: " + std::string(text));
        }

        for (const auto &mapping : kUnits)
        {
            if (mapping.suffix == unit)
            {
                const auto bytes = std::floor(value * mapping.multiplier);
                if (!std::isfinite(bytes) || bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max()))
                {
                    throw std::runtime_error("Size too large: " + std::string(text));
                }
                return static_cast<std::uint64_t>(bytes);
            }
        }
        throw std::runtime_error("Unknown size unit: " + std::string(text));
    }

    std::string usage(std::string_view program_name)
    {
        std::string text = "Usage: ";
        text.append(program_name);
        text.append(
            " [--port <PORT>] [--admin-port <PORT>] [--address <ADDRESS>] [--admin-address <ADDRESS>]\n"
            "       [--upload-dir <DIR>] [--database <FILE>] [--max-file-size <SIZE>] [--chunk-size <SIZE>]\n"
            "       [--threads <N>] [--upload-timeout <seconds>] [--reap-interval <seconds>]\n"
            "       [--upload-stale-timeout <seconds>] [--client-stale-timeout <seconds>]\n"
            "       [--feed-interval <milliseconds>] [--page-size <N>]\n"
            "       [--tunnel <provider>] [--cf-domain <DOMAIN>] [--log <FILE>] [--verbose]\n");
        return text;
    }

    ServerConfig parse_arguments(int argc, char *argv[])
    {
        ServerConfig config;
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--port")
            {
                config.port = parse_port(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--admin-port")
            {
                config.admin_port = parse_port(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--address")
            {
                config.address = require_value(i, argc, argv, arg);
            }
            else if (arg == "--admin-address")
            {
                config.admin_address = require_value(i, argc, argv, arg);
            }
            else if (arg == "--upload-dir")
            {
                config.upload_dir = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--database")
            {
                config.database_path = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--max-file-size")
            {
                config.max_file_size = parse_byte_size(require_value(i, argc, argv, arg));
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = parse_byte_size(require_value(i, argc, argv, arg));
                if (config.chunk_size == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(parse_unsigned(require_value(i, argc, argv, arg), arg));
            }
            else if (arg == "--upload-timeout")
            {
                config.upload_timeout = parse_seconds(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--reap-interval")
            {
                config.reap_interval = parse_seconds(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--upload-stale-timeout")
            {
                config.upload_stale_timeout = parse_seconds(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--client-stale-timeout")
            {
                config.client_stale_timeout = parse_seconds(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--feed-interval")
            {
                const auto millis = parse_unsigned(require_value(i, argc, argv, arg), arg);
                if (millis == 0)
                {
                    throw std::runtime_error("--feed-interval must be positive");
                }
                config.feed_interval = std::chrono::milliseconds(static_cast<std::int64_t>(millis));
            }
            else if (arg == "--page-size")
            {
                config.page_size = static_cast<std::size_t>(parse_unsigned(require_value(i, argc, argv, arg), arg));
                if (config.page_size == 0)
                {
                    throw std::runtime_error("--page-size must be positive");
                }
            }
            else if (arg == "--tunnel")
            {
                config.tunnel_provider = require_value(i, argc, argv, arg);
            }
            else if (arg == "--cf-domain")
            {
                config.cf_domain = require_value(i, argc, argv, arg);
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }
        return config;
    }

} // namespace drcv::server
