#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>

#include "drcv/server/config.hpp"
#include "drcv/server/server.hpp"
#include "drcv/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void configure_logging(const drcv::server::ServerConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace

int main(int argc, char *argv[])
{
    using drcv::server::Server;
    using drcv::server::ServerConfig;

    ServerConfig config;
    try
    {
        config = drcv::server::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << drcv::server::usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.show_help)
    {
        std::cout << "drcv server " << drcv::version() << "\n"
                  << drcv::server::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try
    {
        configure_logging(config);
        spdlog::info("Starting drcv {} on {}:{}", drcv::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
