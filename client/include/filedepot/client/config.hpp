#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace filedepot::client
{

    // Upper bounds accepted on the command line.
    inline constexpr std::uint64_t kMaxTimeoutSeconds = 30ULL * 24 * 60 * 60;
    inline constexpr std::uint64_t kMaxAttempts = 100;
    inline constexpr std::uint64_t kMaxChunkSize = 16 * 1024 * 1024;

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        std::filesystem::path download_dir{"client_downloads"};
        std::optional<std::filesystem::path> log_path;
        std::chrono::milliseconds connect_timeout{std::chrono::seconds{30}};
        std::chrono::milliseconds io_timeout{std::chrono::seconds{300}};
        std::size_t connect_attempts{3};
        // Delay before the second connect attempt; doubled after every failure.
        std::chrono::milliseconds connect_backoff{500};
        std::size_t transfer_attempts{3};
        std::size_t chunk_size{64 * 1024};
        // One-shot command; the interactive shell runs when empty.
        std::vector<std::string> command;
    };

    // Throws std::runtime_error with a usage hint on malformed input.
    ClientConfig parse_arguments(int argc, const char *const argv[]);

} // namespace filedepot::client
