#include "filedepot/client/connection.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <vector>

#include "filedepot/framing.hpp"
#include "filedepot/protocol.hpp"

namespace filedepot::client
{

    Connection::Connection(std::chrono::milliseconds io_timeout)
        : socket_(io_context_), io_timeout_(io_timeout) {}

    void Connection::open(const std::string &host, std::uint16_t port, std::chrono::milliseconds timeout)
    {
        close();

        std::error_code ec;
        asio::ip::tcp::resolver resolver(io_context_);
        const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec)
        {
            throw ClientError(filedepot::ErrorCode::ConnectionError, "Cannot resolve " + host + ": " + ec.message());
        }

        ec = asio::error::would_block;
        asio::async_connect(socket_, endpoints,
                            [&ec](const std::error_code &result, const asio::ip::tcp::endpoint & /*endpoint*/)
                            { ec = result; });
        const bool finished = run_for(timeout);
        check(ec, finished, "connect");
    }

    void Connection::close() noexcept
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Connection::write_frame(const nlohmann::json &message)
    {
        const auto frame = protocol::encode_frame(message);
        write_bytes(std::span<const char>(reinterpret_cast<const char *>(frame.data()), frame.size()));
    }

    nlohmann::json Connection::read_frame()
    {
        std::array<std::uint8_t, protocol::kFrameHeaderSize> header{};
        read_exact(header);
        std::size_t size = 0;
        try
        {
            size = protocol::frame_payload_size(header);
        }
        catch (const protocol::ProtocolError &)
        {
            close();
            throw;
        }
        std::vector<std::uint8_t> payload(size);
        read_exact(payload);
        return protocol::parse_frame_payload(payload);
    }

    void Connection::write_bytes(std::span<const char> data)
    {
        std::error_code ec = asio::error::would_block;
        asio::async_write(socket_, asio::buffer(data.data(), data.size()),
                          [&ec](const std::error_code &result, std::size_t /*bytes*/)
                          { ec = result; });
        const bool finished = run_for(io_timeout_);
        check(ec, finished, "write");
    }

    std::size_t Connection::read_some(std::span<char> buffer)
    {
        if (buffer.empty())
        {
            return 0;
        }
        std::error_code ec = asio::error::would_block;
        std::size_t received = 0;
        socket_.async_read_some(asio::buffer(buffer.data(), buffer.size()),
                                [&ec, &received](const std::error_code &result, std::size_t bytes)
                                {
                                    ec = result;
                                    received = bytes;
                                });
        const bool finished = run_for(io_timeout_);
        check(ec, finished, "read");
        return received;
    }

    void Connection::read_exact(std::span<std::uint8_t> buffer)
    {
        std::error_code ec = asio::error::would_block;
        asio::async_read(socket_, asio::buffer(buffer.data(), buffer.size()),
                         [&ec](const std::error_code &result, std::size_t /*bytes*/)
                         { ec = result; });
        const bool finished = run_for(io_timeout_);
        check(ec, finished, "read");
    }

    bool Connection::run_for(std::chrono::milliseconds timeout)
    {
        io_context_.restart();
        io_context_.run_for(timeout);
        if (io_context_.stopped())
        {
            return true;
        }
        // Closing the socket aborts the pending operation; run its handler.
        close();
        io_context_.run();
        return false;
    }

    void Connection::check(const std::error_code &ec, bool finished, const char *what)
    {
        if (!finished)
        {
            throw ClientError(filedepot::ErrorCode::Timeout, std::string(what) + " timed out");
        }
        if (!ec)
        {
            return;
        }
        close();
        if (ec == asio::error::eof || ec == asio::error::connection_reset)
        {
            throw ClientError(filedepot::ErrorCode::ConnectionError,
                              std::string(what) + " failed: connection closed by peer");
        }
        throw ClientError(filedepot::ErrorCode::ConnectionError, std::string(what) + " failed: " + ec.message());
    }

} // namespace filedepot::client
