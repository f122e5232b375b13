#include "filedepot/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <string>
#include <utility>

#include "filedepot/framing.hpp"

namespace filedepot::server
{

    namespace
    {
        constexpr auto kComponent = "session";
        constexpr std::size_t kMinChunkSize = 1024;
    } // namespace

    Session::Session(asio::ip::tcp::socket socket, SessionServices services)
        : socket_(std::move(socket)),
          deadline_(socket_.get_executor()),
          services_(std::move(services)),
          chunk_buffer_(std::max(services_.chunk_size, kMinChunkSize))
    {
        peer_ = remote_endpoint();
    }

    void Session::start()
    {
        services_.logger.info(kComponent, "Client connected from ", peer_);
        if (services_.idle_timeout.count() > 0)
        {
            touch();
            watch_deadline();
        }
        read_command();
    }

    void Session::stop()
    {
        if (state_ == State::Closed)
        {
            return;
        }
        if (upload_)
        {
            services_.logger.warn(kComponent, peer_, " dropped mid-upload of ", upload_->filename, " after ",
                                  upload_->received, "/", upload_->expected, " bytes; discarding");
        }
        state_ = State::Closed;
        upload_.reset();
        download_.reset();

        std::error_code ec;
        deadline_.cancel();
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        services_.logger.info(kComponent, "Closed connection from ", peer_);
    }

    void Session::touch()
    {
        if (services_.idle_timeout.count() > 0)
        {
            deadline_.expires_after(services_.idle_timeout);
        }
    }

    void Session::watch_deadline()
    {
        auto self = shared_from_this();
        deadline_.async_wait([this, self](const std::error_code & /*ec*/)
                             {
            if (state_ == State::Closed)
            {
                return;
            }
            if (deadline_.expiry() <= asio::steady_timer::clock_type::now())
            {
                services_.logger.warn(kComponent, peer_, " idle for ", services_.idle_timeout.count(),
                                      "s, closing");
                stop();
                return;
            }
            watch_deadline(); });
    }

    void Session::read_command()
    {
        state_ = State::AwaitCommand;
        auto self = shared_from_this();
        read_frame([this, self](nlohmann::json message)
                   { dispatch(message); });
    }

    void Session::read_frame(FrameHandler handler)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self, handler = std::move(handler)](const std::error_code &ec, std::size_t /*bytes*/) mutable
                         {
                             if (ec)
                             {
                                 on_socket_error(ec);
                                 return;
                             }
                             touch();

                             std::size_t size = 0;
                             try
                             {
                                 size = protocol::frame_payload_size(header_buffer_);
                             }
                             catch (const protocol::ProtocolError &ex)
                             {
                                 // The stream cannot be resynchronized past an unreadable frame.
                                 services_.logger.warn(kComponent, peer_, ": ", ex.what());
                                 send_error(filedepot::ErrorCode::ProtocolError, ex.what(), [this, self]
                                            { stop(); });
                                 return;
                             }

                             payload_buffer_.resize(size);
                             asio::async_read(socket_, asio::buffer(payload_buffer_),
                                              [this, self, handler = std::move(handler)](const std::error_code &ec,
                                                                                         std::size_t /*bytes*/)
                                              {
                                                  if (ec)
                                                  {
                                                      on_socket_error(ec);
                                                      return;
                                                  }
                                                  touch();

                                                  nlohmann::json message;
                                                  try
                                                  {
                                                      message = protocol::parse_frame_payload(payload_buffer_);
                                                  }
                                                  catch (const protocol::ProtocolError &ex)
                                                  {
                                                      reject(filedepot::ErrorCode::ProtocolError, ex.what());
                                                      return;
                                                  }
                                                  handler(std::move(message));
                                              });
                         });
    }

    void Session::dispatch(const nlohmann::json &message)
    {
        protocol::Request request;
        try
        {
            request = protocol::decode_request(message);
        }
        catch (const protocol::UnknownCommandError &ex)
        {
            services_.logger.warn(kComponent, peer_, " sent unknown command ", ex.command());
            reject(filedepot::ErrorCode::UnknownCommand, ex.what());
            return;
        }
        catch (const protocol::ProtocolError &ex)
        {
            reject(filedepot::ErrorCode::ProtocolError, ex.what());
            return;
        }
        catch (const nlohmann::json::exception &ex)
        {
            reject(filedepot::ErrorCode::ProtocolError, ex.what());
            return;
        }

        services_.logger.debug(kComponent, peer_, " -> ", protocol::to_string(protocol::command_of(request)));

        if (const auto *upload = std::get_if<protocol::UploadRequest>(&request))
        {
            handle_upload(*upload);
        }
        else if (const auto *download = std::get_if<protocol::DownloadRequest>(&request))
        {
            handle_download(*download);
        }
        else
        {
            handle_list();
        }
    }

    void Session::send_message(const nlohmann::json &message, std::function<void()> next)
    {
        std::shared_ptr<std::vector<std::uint8_t>> frame;
        try
        {
            frame = std::make_shared<std::vector<std::uint8_t>>(protocol::encode_frame(message));
        }
        catch (const protocol::ProtocolError &ex)
        {
            services_.logger.error(kComponent, "Cannot encode reply for ", peer_, ": ", ex.what());
            send_error(filedepot::ErrorCode::InternalError, ex.what(), std::move(next));
            return;
        }
        catch (const nlohmann::json::exception &ex)
        {
            services_.logger.error(kComponent, "Cannot encode reply for ", peer_, ": ", ex.what());
            send_error(filedepot::ErrorCode::InternalError, "Reply could not be encoded", std::move(next));
            return;
        }

        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame, next = std::move(next)](const std::error_code &ec, std::size_t /*bytes*/)
                          {
                              if (ec)
                              {
                                  on_socket_error(ec);
                                  return;
                              }
                              touch();
                              if (next)
                              {
                                  next();
                              }
                          });
    }

    void Session::send_error(filedepot::ErrorCode code, std::string message, std::function<void()> next)
    {
        protocol::ErrorResponse response{.error = code, .message = std::move(message)};
        send_message(nlohmann::json(response), std::move(next));
    }

    void Session::reject(filedepot::ErrorCode code, std::string message)
    {
        services_.logger.debug(kComponent, peer_, " <- ", filedepot::to_string(code), ": ", message);
        auto self = shared_from_this();
        send_error(code, std::move(message), [this, self]
                   { read_command(); });
    }

    void Session::on_socket_error(const std::error_code &ec)
    {
        if (state_ == State::Closed || ec == asio::error::operation_aborted)
        {
            stop();
            return;
        }
        if (ec == asio::error::eof)
        {
            services_.logger.debug(kComponent, peer_, " disconnected");
        }
        else
        {
            services_.logger.warn(kComponent, peer_, " socket error: ", ec.message());
        }
        stop();
    }

    void Session::handle_list()
    {
        state_ = State::ListHandling;
        protocol::FileList list;
        try
        {
            list.files = services_.storage.list();
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

        services_.logger.info(kComponent, peer_, " listed ", list.files.size(), " file(s)");
        auto self = shared_from_this();
        send_message(nlohmann::json(list), [this, self]
                     { read_command(); });
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace filedepot::server
