#include "filedepot/client/session.hpp"

#include <algorithm>
#include <thread>

namespace filedepot::client
{

    namespace
    {
        constexpr auto kComponent = "client";
    } // namespace

    ClientSession::ClientSession(ClientConfig config, filedepot::Logger logger, ProgressListener &progress)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          progress_(progress),
          connection_(config_.io_timeout) {}

    void ClientSession::connect()
    {
        const auto attempts = std::max<std::size_t>(config_.connect_attempts, 1);
        auto delay = config_.connect_backoff;
        for (std::size_t attempt = 1;; ++attempt)
        {
            try
            {
                connection_.open(config_.host, config_.port, config_.connect_timeout);
                logger_.info(kComponent, "Connected to ", config_.host, ":", config_.port);
                return;
            }
            catch (const ClientError &ex)
            {
                logger_.warn(kComponent, "Connect attempt ", attempt, "/", attempts, " failed: ", ex.what());
                if (attempt >= attempts)
                {
                    throw ClientError(filedepot::ErrorCode::ConnectionError,
                                      "Unable to connect to " + config_.host + ":" + std::to_string(config_.port) +
                                          " after " + std::to_string(attempts) + " attempt(s): " + ex.what());
                }
            }
            std::this_thread::sleep_for(delay);
            delay *= 2;
        }
    }

    void ClientSession::disconnect() noexcept
    {
        connection_.close();
    }

    void ClientSession::ensure_connected()
    {
        if (!connection_.is_open())
        {
            connect();
        }
    }

    nlohmann::json ClientSession::send_request(const protocol::Request &request)
    {
        const auto message = protocol::encode_request(request);
        ensure_connected();
        try
        {
            connection_.write_frame(message);
            return connection_.read_frame();
        }
        catch (const ClientError &ex)
        {
            if (!filedepot::is_transient(ex.code()))
            {
                throw;
            }
            logger_.warn(kComponent, protocol::to_string(protocol::command_of(request)), " failed (", ex.what(),
                         "), reconnecting once");
        }
        disconnect();
        connect();
        connection_.write_frame(message);
        return connection_.read_frame();
    }

    ListOutcome ClientSession::list()
    {
        ListOutcome outcome;
        try
        {
            const auto reply = protocol::decode_reply<protocol::FileList>(send_request(protocol::ListRequest{}));
            if (const auto *error = std::get_if<protocol::ErrorResponse>(&reply))
            {
                outcome.code = error->error;
                outcome.message = error->message;
                return outcome;
            }
            outcome.files = std::get<protocol::FileList>(reply).files;
            logger_.info(kComponent, "Listed ", outcome.files.size(), " remote file(s)");
        }
        catch (const ClientError &ex)
        {
            disconnect();
            outcome.code = ex.code();
            outcome.message = ex.what();
        }
        catch (const protocol::ProtocolError &ex)
        {
            disconnect();
            outcome.code = filedepot::ErrorCode::ProtocolError;
            outcome.message = ex.what();
        }
        return outcome;
    }

    std::filesystem::path ClientSession::partial_path(const std::string &local_name) const
    {
        return config_.download_dir / (local_name + ".part");
    }

} // namespace filedepot::client
