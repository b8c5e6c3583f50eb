#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "sharelink/server/server.hpp"
#include "sharelink/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "ShareLink server " << sharelink::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>] [--retention-hours <H>] "
                     "[--sweep-interval <seconds>] [--idle-timeout <seconds>] [--log <FILE>]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

} // namespace

int main(int argc, char *argv[])
{
    using sharelink::server::Server;
    using sharelink::server::ServerConfig;

    ServerConfig config;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }

            const bool takes_value = arg == "--port" || arg == "--root" || arg == "--address" ||
                                     arg == "--threads" || arg == "--retention-hours" ||
                                     arg == "--sweep-interval" || arg == "--idle-timeout" || arg == "--log";
            if (!takes_value)
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }

            if (arg == "--port")
            {
                const int port = std::stoi(*value);
                if (port <= 0 || port > 65535)
                {
                    throw std::out_of_range("port must be in 1-65535");
                }
                config.port = static_cast<std::uint16_t>(port);
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--retention-hours")
            {
                config.retention = std::chrono::hours(std::stoll(*value));
            }
            else if (arg == "--sweep-interval")
            {
                config.sweep_interval = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--idle-timeout")
            {
                config.idle_timeout = std::chrono::seconds(std::stoll(*value));
            }
            else
            {
                config.log_file = std::filesystem::path(*value);
            }
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid argument value: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.port == 0 || config.root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (config.retention.count() <= 0 || config.sweep_interval.count() <= 0 || config.idle_timeout.count() <= 0)
    {
        std::cerr << "Durations must be positive" << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting ShareLink server {} on {}:{}", sharelink::version(), config.address, config.port);

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
