#include "filedepot/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>
#include <asio/strand.hpp>

#include <csignal>
#include <thread>

#include "filedepot/server/session.hpp"

namespace filedepot::server
{

    namespace
    {
        constexpr auto kComponent = "server";

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config, filedepot::Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          storage_(config_.root, logger_),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        logger_.info(kComponent, "Listening on ", config_.address, ":", port(), " with root ",
                     config_.root.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int signal)
                            {
            if (!ec)
            {
                logger_.info(kComponent, "Signal ", signal, " received, shutting down");
                shutdown();
            } });
    }

    void Server::run()
    {
        accept_next();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count - 1);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        logger_.info(kComponent, "Event loop running with ", worker_count, " thread(s)");
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();
        logger_.info(kComponent, "Server stopped");
        logger_.flush();
    }

    void Server::stop()
    {
        asio::post(io_context_, [this]
                   { shutdown(); });
    }

    std::uint16_t Server::port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(asio::make_strand(io_context_),
                               [this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            SessionServices services{
                .storage = storage_,
                .logger = logger_,
                .idle_timeout = config_.idle_timeout,
                .chunk_size = config_.chunk_size,
            };
            auto session = std::make_shared<Session>(std::move(socket), std::move(services));
            session->start();
        }
        else if (ec == asio::error::operation_aborted)
        {
            return;
        }
        else
        {
            logger_.error(kComponent, "Accept error: ", ec.message());
        }
        if (acceptor_.is_open())
        {
            accept_next();
        }
    }

    void Server::shutdown()
    {
        std::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
        io_context_.stop();
    }

} // namespace filedepot::server
