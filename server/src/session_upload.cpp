#include "filedepot/server/session.hpp"

#include <asio/read.hpp>

#include <algorithm>
#include <span>

namespace filedepot::server
{

    namespace
    {
        constexpr auto kComponent = "session";
    } // namespace

    void Session::handle_upload(const protocol::UploadRequest &request)
    {
        state_ = State::UploadNegotiate;
        auto &storage = services_.storage;
        protocol::UploadReady ready{.filename = request.filename, .is_duplicate = false, .action = request.action};
        try
        {
            ready.is_duplicate = storage.exists(request.filename);
            if (ready.is_duplicate)
            {
                switch (request.action)
                {
                case protocol::DuplicateAction::Overwrite:
                    break;
                case protocol::DuplicateAction::Rename:
                    ready.filename = storage.next_free_name(request.filename);
                    break;
                case protocol::DuplicateAction::Version:
                    storage.archive_move(request.filename);
                    break;
                }
            }

            upload_ = UploadTransfer{
                .filename = ready.filename,
                .expected = request.filesize,
                .received = 0,
                .declared_hash = request.hash,
                .staged = storage.stage(ready.filename),
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

        services_.logger.info(kComponent, peer_, " uploading ", request.filename, " (", request.filesize,
                              " bytes, ", protocol::to_string(request.action), ") as ", ready.filename);

        auto self = shared_from_this();
        send_message(nlohmann::json(ready), [this, self]
                     {
            state_ = State::UploadReceiving;
            receive_upload_chunk(); });
    }

    void Session::receive_upload_chunk()
    {
        const auto remaining = upload_->expected - upload_->received;
        if (remaining == 0)
        {
            finish_upload();
            return;
        }

        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_buffer_.size(), remaining));
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(chunk_buffer_.data(), want),
                         [this, self](const std::error_code &ec, std::size_t bytes)
                         {
                             if (ec)
                             {
                                 on_socket_error(ec);
                                 return;
                             }
                             touch();

                             auto &upload = *upload_;
                             const std::span<const char> data(chunk_buffer_.data(), bytes);
                             upload.received += bytes;
                             upload.digest.update(data);
                             if (!upload.write_failure)
                             {
                                 try
                                 {
                                     upload.staged->append(data);
                                 }
                                 catch (const StorageError &ex)
                                 {
                                     services_.logger.error(kComponent, "Write failed for ", upload.filename, ": ",
                                                            ex.what());
                                     upload.write_failure = ex.what();
                                     upload.staged->discard();
                                 }
                             }
                             receive_upload_chunk();
                         });
    }

    void Session::finish_upload()
    {
        state_ = State::UploadVerify;
        auto upload = std::move(*upload_);
        upload_.reset();

        const auto actual = upload.digest.finalize();
        if (upload.write_failure)
        {
            reject(filedepot::ErrorCode::IoError, *upload.write_failure);
            return;
        }
        if (!crypto::digests_equal(actual, upload.declared_hash))
        {
            upload.staged->discard();
            services_.logger.warn(kComponent, "Hash mismatch for ", upload.filename, " from ", peer_,
                                  ": declared ", upload.declared_hash, ", received ", actual);
            reject(filedepot::ErrorCode::HashMismatch,
                   "Hash mismatch: expected " + upload.declared_hash + ", received " + actual);
            return;
        }

        try
        {
            upload.staged->commit();
        }
        catch (const StorageError &ex)
        {
            reject(ex.code(), ex.what());
            return;
        }

        services_.logger.info(kComponent, peer_, " stored ", upload.filename, " (", upload.received, " bytes, sha256 ",
                              actual, ")");
        protocol::TransferResult result{.message = "File uploaded successfully as " + upload.filename, .hash = actual};
        auto self = shared_from_this();
        send_message(nlohmann::json(result), [this, self]
                     { read_command(); });
    }

} // namespace filedepot::server
