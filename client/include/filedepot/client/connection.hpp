/**
 * FileDepot - Blocking client connection with per-operation timeouts.
 *
 * Every call starts one asynchronous operation and drives a private
 * io_context for at most the configured timeout. An operation that does not
 * finish in time is cancelled by closing the socket and reported as Timeout.
 * Any failure leaves the connection closed.
 */
#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "filedepot/error_codes.hpp"

namespace filedepot::client
{

    class ClientError : public std::runtime_error
    {
    public:
        ClientError(filedepot::ErrorCode code, const std::string &message)
            : std::runtime_error(message), code_(code) {}

        filedepot::ErrorCode code() const noexcept { return code_; }

    private:
        filedepot::ErrorCode code_;
    };

    class Connection
    {
    public:
        explicit Connection(std::chrono::milliseconds io_timeout = std::chrono::seconds{300});

        Connection(const Connection &) = delete;
        Connection &operator=(const Connection &) = delete;

        void open(const std::string &host, std::uint16_t port, std::chrono::milliseconds timeout);
        void close() noexcept;
        bool is_open() const noexcept { return socket_.is_open(); }

        void write_frame(const nlohmann::json &message);
        // Throws protocol::ProtocolError when the frame is not a JSON object.
        nlohmann::json read_frame();

        void write_bytes(std::span<const char> data);
        // At least one byte unless the buffer is empty.
        std::size_t read_some(std::span<char> buffer);

    private:
        void read_exact(std::span<std::uint8_t> buffer);
        bool run_for(std::chrono::milliseconds timeout);
        void check(const std::error_code &ec, bool finished, const char *what);

        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::chrono::milliseconds io_timeout_;
    };

} // namespace filedepot::client
