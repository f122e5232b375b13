#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "filedepot/client/config.hpp"
#include "filedepot/client/connection.hpp"
#include "filedepot/client/progress.hpp"
#include "filedepot/error_codes.hpp"
#include "filedepot/logger.hpp"
#include "filedepot/protocol.hpp"

namespace filedepot::client
{

    struct TransferOutcome
    {
        filedepot::ErrorCode code{filedepot::ErrorCode::Ok};
        std::string message;
        // Remote name for uploads, local path for downloads.
        std::string filename;
        std::string hash;
        std::uint64_t bytes_transferred{};

        bool ok() const noexcept { return code == filedepot::ErrorCode::Ok; }
    };

    struct ListOutcome
    {
        filedepot::ErrorCode code{filedepot::ErrorCode::Ok};
        std::string message;
        std::vector<protocol::FileRecord> files;

        bool ok() const noexcept { return code == filedepot::ErrorCode::Ok; }
    };

    /**
     * Client side of one server connection. Requests are strictly sequential.
     * Transient failures (ConnectionError, Timeout) are retried here; anything
     * else is reported to the caller unchanged.
     *
     * A download in progress lives in <download_dir>/<name>.part; its length is
     * the offset the next attempt resumes from.
     */
    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, filedepot::Logger logger, ProgressListener &progress);

        // Throws ClientError(ConnectionError) once every attempt has failed.
        void connect();
        void disconnect() noexcept;
        bool connected() const noexcept { return connection_.is_open(); }

        // Sends a request and returns the raw reply frame, reconnecting and
        // resending once on a transient failure.
        nlohmann::json send_request(const protocol::Request &request);

        TransferOutcome upload(const std::filesystem::path &local_path,
                               protocol::DuplicateAction action = protocol::DuplicateAction::Overwrite);

        TransferOutcome download(const std::string &filename, const std::optional<std::string> &version = std::nullopt);

        ListOutcome list();

        std::filesystem::path partial_path(const std::string &local_name) const;

        const ClientConfig &config() const noexcept { return config_; }

    private:
        TransferOutcome download_once(const std::string &filename, const std::optional<std::string> &version,
                                      const std::string &local_name);
        void ensure_connected();

        ClientConfig config_;
        filedepot::Logger logger_;
        ProgressListener &progress_;
        Connection connection_;
    };

} // namespace filedepot::client
