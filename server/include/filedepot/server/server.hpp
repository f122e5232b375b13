#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "filedepot/logger.hpp"
#include "filedepot/server/config.hpp"
#include "filedepot/server/storage.hpp"

namespace filedepot::server
{

    /**
     * Accepts connections forever and hands each one to its own Session on a
     * dedicated strand. The acceptor is bound in the constructor so port() is
     * valid before run().
     */
    class Server
    {
    public:
        Server(ServerConfig config, filedepot::Logger logger);

        // Blocks until stop() or SIGINT/SIGTERM, running the event loop on
        // worker_threads threads (hardware concurrency when 0).
        void run();

        // Safe to call from any thread.
        void stop();

        std::uint16_t port() const;

        Storage &storage() noexcept { return storage_; }

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void shutdown();

        ServerConfig config_;
        filedepot::Logger logger_;
        Storage storage_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        std::vector<std::thread> workers_;
    };

} // namespace filedepot::server
