#include "filedepot/server/config.hpp"

#include <stdexcept>
#include <string>

namespace filedepot::server
{

    namespace
    {

        std::uint64_t parse_number(const std::string &flag, const std::string &value)
        {
            std::size_t consumed = 0;
            std::uint64_t number = 0;
            try
            {
                number = std::stoull(value, &consumed);
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error("Invalid value for " + flag + ": " + value);
            }
            if (consumed != value.size())
            {
                throw std::runtime_error("Invalid value for " + flag + ": " + value);
            }
            return number;
        }

        std::uint64_t parse_bounded(const std::string &flag, const std::string &value, std::uint64_t low,
                                    std::uint64_t high)
        {
            const auto number = parse_number(flag, value);
            if (number < low || number > high)
            {
                throw std::runtime_error(flag + " must be between " + std::to_string(low) + " and " +
                                         std::to_string(high) + ", got " + value);
            }
            return number;
        }

    } // namespace

    ServerConfig parse_arguments(int argc, const char *const argv[])
    {
        ServerConfig config;
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
                continue;
            }

            const bool takes_value = arg == "--port" || arg == "--root" || arg == "--address" ||
                                     arg == "--threads" || arg == "--idle-timeout" || arg == "--chunk-size" ||
                                     arg == "--log";
            if (!takes_value)
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            if (i + 1 >= argc)
            {
                throw std::runtime_error("Missing value for " + arg);
            }
            const std::string value = argv[++i];

            if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(parse_bounded(arg, value, 0, 65535));
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(value);
            }
            else if (arg == "--address")
            {
                config.address = value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(parse_bounded(arg, value, 0, kMaxWorkerThreads));
            }
            else if (arg == "--idle-timeout")
            {
                const auto ceiling = static_cast<std::uint64_t>(kMaxIdleTimeout.count());
                config.idle_timeout = std::chrono::seconds(parse_bounded(arg, value, 1, ceiling));
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = static_cast<std::size_t>(parse_bounded(arg, value, 1, kMaxChunkSize));
            }
            else
            {
                config.log_file = std::filesystem::path(value);
            }
        }

        if (config.root.empty())
        {
            throw std::runtime_error("--root must not be empty");
        }
        return config;
    }

} // namespace filedepot::server
