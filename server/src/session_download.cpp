#include "filedepot/server/session.hpp"

#include <asio/write.hpp>

namespace filedepot::server
{

    namespace
    {
        constexpr auto kComponent = "session";

        bool is_transfer_ack(const nlohmann::json &message)
        {
            try
            {
                static_cast<void>(message.get<protocol::TransferAck>());
                return true;
            }
            catch (const protocol::ProtocolError &)
            {
                return false;
            }
        }
    } // namespace

    void Session::handle_download(const protocol::DownloadRequest &request)
    {
        state_ = State::DownloadNegotiate;
        auto &storage = services_.storage;
        protocol::DownloadReady ready;
        try
        {
            const auto path = request.version ? storage.resolve_version(request.filename, *request.version)
                                              : storage.resolve(request.filename);
            auto reader = storage.read_range(path);
            ready.filesize = reader->size();
            ready.hash = reader->hash();

            std::uint64_t offset = 0;
            if (request.resume_offset && *request.resume_offset <= ready.filesize)
            {
                offset = *request.resume_offset;
                ready.resuming_from = offset;
            }
            reader->seek(offset);

            download_ = DownloadTransfer{
                .filename = request.version ? *request.version : request.filename,
                .reader = std::move(reader),
                .offset = offset,
            };
        }
        catch (const StorageError &ex)
        {
            reject(ex.code(), ex.what());
            return;
        }
        catch (const std::exception &ex)
        {
            reject(filedepot::ErrorCode::InternalError, ex.what());
            return;
        }

        services_.logger.info(kComponent, peer_, " downloading ", download_->filename, " (", ready.filesize,
                              " bytes from offset ", download_->offset, ")");

        auto self = shared_from_this();
        send_message(nlohmann::json(ready), [this, self]
                     { await_download_ack(); });
    }

    void Session::await_download_ack()
    {
        auto self = shared_from_this();
        read_frame([this, self](nlohmann::json message)
                   {
            if (!is_transfer_ack(message))
            {
                download_.reset();
                reject(filedepot::ErrorCode::ProtocolError, "Expected transfer acknowledgement");
                return;
            }
            state_ = State::DownloadSending;
            send_download_chunk(); });
    }

    void Session::send_download_chunk()
    {
        std::size_t bytes = 0;
        try
        {
            bytes = download_->reader->read(chunk_buffer_);
        }
        catch (const StorageError &ex)
        {
            // Mid-stream there is no way to report it in band.
            services_.logger.error(kComponent, "Read failed for ", download_->filename, ": ", ex.what());
            stop();
            return;
        }

        if (bytes == 0)
        {
            services_.logger.info(kComponent, peer_, " received ", download_->filename, " (", download_->sent,
                                  " bytes sent)");
            download_.reset();
            read_command();
            return;
        }

        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(chunk_buffer_.data(), bytes),
                          [this, self](const std::error_code &ec, std::size_t written)
                          {
                              if (ec)
                              {
                                  on_socket_error(ec);
                                  return;
                              }
                              touch();
                              download_->sent += written;
                              send_download_chunk();
                          });
    }

} // namespace filedepot::server
