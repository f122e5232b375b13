#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace filedepot::server
{

    // Upper bounds accepted on the command line.
    inline constexpr std::chrono::seconds kMaxIdleTimeout{std::chrono::hours{24 * 30}};
    inline constexpr std::size_t kMaxWorkerThreads = 1024;
    inline constexpr std::size_t kMaxChunkSize = 16 * 1024 * 1024;

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        // 0 binds an ephemeral port; Server::port() reports the one chosen.
        std::uint16_t port{5000};
        std::filesystem::path root{"server_storage"};
        std::size_t worker_threads{0};
        std::chrono::seconds idle_timeout{std::chrono::seconds{300}};
        std::size_t chunk_size{64 * 1024};
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
    };

    // Throws std::runtime_error on unknown flags and out-of-range values.
    ServerConfig parse_arguments(int argc, const char *const argv[]);

} // namespace filedepot::server
