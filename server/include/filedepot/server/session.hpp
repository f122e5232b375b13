#pragma once

#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>
#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "filedepot/crypto.hpp"
#include "filedepot/error_codes.hpp"
#include "filedepot/logger.hpp"
#include "filedepot/protocol.hpp"
#include "filedepot/server/storage.hpp"

namespace filedepot::server
{

    struct SessionServices
    {
        Storage &storage;
        filedepot::Logger logger;
        std::chrono::seconds idle_timeout;
        std::size_t chunk_size;
    };

    /**
     * One accepted connection. Commands are served strictly one at a time:
     * a frame is read, the command runs to completion (including any raw
     * payload that follows), and only then is the next frame read.
     *
     * All handlers run on the socket's strand.
     */
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        enum class State
        {
            AwaitCommand,
            UploadNegotiate,
            UploadReceiving,
            UploadVerify,
            DownloadNegotiate,
            DownloadSending,
            ListHandling,
            Closed
        };

        Session(asio::ip::tcp::socket socket, SessionServices services);

        void start();

        void stop();

        State state() const noexcept { return state_; }

    private:
        using FrameHandler = std::function<void(nlohmann::json)>;

        void read_command();
        void read_frame(FrameHandler handler);
        void dispatch(const nlohmann::json &message);
        void send_message(const nlohmann::json &message, std::function<void()> next);
        void send_error(filedepot::ErrorCode code, std::string message, std::function<void()> next);
        // Error reply followed by a return to AwaitCommand.
        void reject(filedepot::ErrorCode code, std::string message);
        void on_socket_error(const std::error_code &ec);

        void touch();
        void watch_deadline();

        void handle_upload(const protocol::UploadRequest &request);
        void receive_upload_chunk();
        void finish_upload();

        void handle_download(const protocol::DownloadRequest &request);
        void await_download_ack();
        void send_download_chunk();

        void handle_list();

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        asio::steady_timer deadline_;
        SessionServices services_;
        std::string peer_;
        State state_{State::AwaitCommand};

        std::array<std::uint8_t, 4> header_buffer_{};
        std::vector<std::uint8_t> payload_buffer_;
        std::vector<char> chunk_buffer_;

        struct UploadTransfer
        {
            std::string filename;
            std::uint64_t expected{};
            std::uint64_t received{};
            std::string declared_hash;
            crypto::Sha256 digest{};
            std::unique_ptr<StagedUpload> staged;
            // First disk failure; the stream is still drained to stay in sync.
            std::optional<std::string> write_failure{};
        };
        std::optional<UploadTransfer> upload_;

        struct DownloadTransfer
        {
            std::string filename;
            std::unique_ptr<RangeReader> reader;
            std::uint64_t offset{};
            std::uint64_t sent{};
        };
        std::optional<DownloadTransfer> download_;
    };

} // namespace filedepot::server
