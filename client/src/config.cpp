#include "filedepot/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace filedepot::client
{

    namespace
    {
        constexpr auto kUsage =
            "Usage: filedepot-client <host>:<port> [--download-dir <dir>] [--log <file>] [--connect-timeout <s>]"
            " [--timeout <s>] [--connect-attempts <n>] [--transfer-attempts <n>] [--chunk-size <bytes>]"
            " [command args...]";

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
                throw std::runtime_error(flag + " expects a number, got '" + value + "'");
            }
            if (consumed != value.size())
            {
                throw std::runtime_error(flag + " expects a number, got '" + value + "'");
            }
            return number;
        }

        std::uint64_t parse_positive(const std::string &flag, const std::string &value, std::uint64_t ceiling)
        {
            const auto number = parse_number(flag, value);
            if (number == 0)
            {
                throw std::runtime_error(flag + " must be greater than zero");
            }
            if (number > ceiling)
            {
                throw std::runtime_error(flag + " must not exceed " + std::to_string(ceiling));
            }
            return number;
        }

    } // namespace

    ClientConfig parse_arguments(int argc, const char *const argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error(kUsage);
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0 || colon_pos + 1 == endpoint.size())
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        const auto port = parse_positive("port", endpoint.substr(colon_pos + 1), 65535);
        config.port = static_cast<std::uint16_t>(port);

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg.rfind("--", 0) != 0)
            {
                config.command.push_back(arg);
                while (index < argc)
                {
                    config.command.emplace_back(argv[index++]);
                }
                break;
            }
            if (index >= argc)
            {
                throw std::runtime_error(arg + " requires a value");
            }
            const std::string value = argv[index++];
            if (arg == "--download-dir")
            {
                config.download_dir = std::filesystem::path(value);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(value);
            }
            else if (arg == "--connect-timeout")
            {
                config.connect_timeout = std::chrono::seconds(parse_positive(arg, value, kMaxTimeoutSeconds));
            }
            else if (arg == "--timeout")
            {
                config.io_timeout = std::chrono::seconds(parse_positive(arg, value, kMaxTimeoutSeconds));
            }
            else if (arg == "--connect-attempts")
            {
                config.connect_attempts = static_cast<std::size_t>(parse_positive(arg, value, kMaxAttempts));
            }
            else if (arg == "--transfer-attempts")
            {
                config.transfer_attempts = static_cast<std::size_t>(parse_positive(arg, value, kMaxAttempts));
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = static_cast<std::size_t>(parse_positive(arg, value, kMaxChunkSize));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

} // namespace filedepot::client
