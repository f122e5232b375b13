#include "filedepot/client/session.hpp"

#include <algorithm>
#include <fstream>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "filedepot/crypto.hpp"

namespace filedepot::client
{

    namespace
    {
        constexpr auto kComponent = "client";

        bool is_plain_name(const std::string &name)
        {
            if (name.empty() || name == "." || name == "..")
            {
                return false;
            }
            return name.find_first_of("/\\") == std::string::npos && name.find('\0') == std::string::npos;
        }

        TransferOutcome failure(TransferOutcome outcome, filedepot::ErrorCode code, std::string message)
        {
            outcome.code = code;
            outcome.message = std::move(message);
            return outcome;
        }

    } // namespace

    TransferOutcome ClientSession::upload(const std::filesystem::path &local_path, protocol::DuplicateAction action)
    {
        TransferOutcome outcome;
        outcome.filename = local_path.filename().string();

        std::error_code ec;
        if (!std::filesystem::is_regular_file(local_path, ec))
        {
            return failure(std::move(outcome), filedepot::ErrorCode::InvalidRequest,
                           "Local file not found: " + local_path.string());
        }

        protocol::UploadRequest request;
        try
        {
            request.filename = outcome.filename;
            request.filesize = std::filesystem::file_size(local_path);
            request.hash = crypto::hash_file(local_path);
            request.action = action;
        }
        catch (const std::exception &ex)
        {
            return failure(std::move(outcome), filedepot::ErrorCode::IoError, ex.what());
        }

        std::ifstream input(local_path, std::ios::binary);
        if (!input.is_open())
        {
            return failure(std::move(outcome), filedepot::ErrorCode::IoError, "Cannot open " + local_path.string());
        }

        try
        {
            const auto reply = protocol::decode_reply<protocol::UploadReady>(send_request(request));
            if (const auto *error = std::get_if<protocol::ErrorResponse>(&reply))
            {
                return failure(std::move(outcome), error->error, error->message);
            }
            const auto &ready = std::get<protocol::UploadReady>(reply);
            outcome.filename = ready.filename;
            logger_.info(kComponent, "Uploading ", local_path.string(), " as ", ready.filename, " (",
                         request.filesize, " bytes, ", protocol::to_string(ready.action),
                         ready.is_duplicate ? ", duplicate" : "", ")");

            std::vector<char> buffer(std::max<std::size_t>(config_.chunk_size, 1));
            progress_.on_progress(TransferDirection::Upload, ready.filename, 0, request.filesize);
            while (outcome.bytes_transferred < request.filesize)
            {
                const auto want = std::min<std::uint64_t>(buffer.size(), request.filesize - outcome.bytes_transferred);
                input.read(buffer.data(), static_cast<std::streamsize>(want));
                const auto got = static_cast<std::size_t>(input.gcount());
                if (got == 0)
                {
                    // The server still expects the declared byte count; drop the stream.
                    disconnect();
                    return failure(std::move(outcome), filedepot::ErrorCode::IoError,
                                   "Local file changed while uploading: " + local_path.string());
                }
                connection_.write_bytes(std::span<const char>(buffer.data(), got));
                outcome.bytes_transferred += got;
                progress_.on_progress(TransferDirection::Upload, ready.filename, outcome.bytes_transferred,
                                      request.filesize);
            }

            const auto result = protocol::decode_reply<protocol::TransferResult>(connection_.read_frame());
            if (const auto *error = std::get_if<protocol::ErrorResponse>(&result))
            {
                logger_.warn(kComponent, "Upload of ", ready.filename, " rejected: ", error->message);
                return failure(std::move(outcome), error->error, error->message);
            }
            const auto &success = std::get<protocol::TransferResult>(result);
            outcome.hash = success.hash;
            outcome.message = success.message;
            logger_.info(kComponent, "Uploaded ", ready.filename, " sha256 ", success.hash);
        }
        catch (const ClientError &ex)
        {
            disconnect();
            logger_.error(kComponent, "Upload of ", local_path.string(), " failed: ", ex.what());
            return failure(std::move(outcome), ex.code(), ex.what());
        }
        catch (const protocol::ProtocolError &ex)
        {
            disconnect();
            return failure(std::move(outcome), filedepot::ErrorCode::ProtocolError, ex.what());
        }
        return outcome;
    }

    TransferOutcome ClientSession::download(const std::string &filename, const std::optional<std::string> &version)
    {
        const auto local_name = version ? *version : filename;
        if (!is_plain_name(filename) || !is_plain_name(local_name))
        {
            TransferOutcome outcome;
            outcome.filename = local_name;
            return failure(std::move(outcome), filedepot::ErrorCode::InvalidRequest,
                           "Not a plain file name: " + local_name);
        }

        std::error_code ec;
        std::filesystem::create_directories(config_.download_dir, ec);
        if (ec)
        {
            TransferOutcome outcome;
            outcome.filename = local_name;
            return failure(std::move(outcome), filedepot::ErrorCode::IoError,
                           "Cannot create " + config_.download_dir.string() + ": " + ec.message());
        }

        const auto attempts = std::max<std::size_t>(config_.transfer_attempts, 1);
        std::uint64_t moved = 0;
        for (std::size_t attempt = 1;; ++attempt)
        {
            auto outcome = download_once(filename, version, local_name);
            moved += outcome.bytes_transferred;
            if (outcome.ok() || !filedepot::is_transient(outcome.code) || attempt >= attempts)
            {
                outcome.bytes_transferred = moved;
                return outcome;
            }
            logger_.warn(kComponent, "Download of ", local_name, " interrupted (", outcome.message, "), attempt ",
                         attempt + 1, "/", attempts, " resumes from the partial file");
        }
    }

    TransferOutcome ClientSession::download_once(const std::string &filename, const std::optional<std::string> &version,
                                                 const std::string &local_name)
    {
        TransferOutcome outcome;
        const auto part = partial_path(local_name);
        const auto target = config_.download_dir / local_name;
        outcome.filename = target.string();

        std::error_code ec;
        std::uint64_t offset = 0;
        if (std::filesystem::is_regular_file(part, ec))
        {
            offset = std::filesystem::file_size(part, ec);
            if (ec)
            {
                return failure(std::move(outcome), filedepot::ErrorCode::IoError, "Cannot stat " + part.string());
            }
        }

        protocol::DownloadRequest request{.filename = filename, .version = version};
        if (offset > 0)
        {
            request.resume_offset = offset;
        }

        try
        {
            const auto reply = protocol::decode_reply<protocol::DownloadReady>(send_request(request));
            if (const auto *error = std::get_if<protocol::ErrorResponse>(&reply))
            {
                return failure(std::move(outcome), error->error, error->message);
            }
            const auto &ready = std::get<protocol::DownloadReady>(reply);
            const auto start = ready.resuming_from.value_or(0);
            if (start != 0 && start != offset)
            {
                throw protocol::ProtocolError("Server resumes from an offset that was not requested");
            }
            if (start == 0 && offset > 0)
            {
                logger_.info(kComponent, "Partial ", part.string(), " does not match the remote file, restarting");
            }

            std::ofstream output(part, std::ios::binary | (start > 0 ? std::ios::app : std::ios::trunc));
            if (!output.is_open())
            {
                disconnect();
                return failure(std::move(outcome), filedepot::ErrorCode::IoError, "Cannot open " + part.string());
            }

            connection_.write_frame(nlohmann::json(protocol::TransferAck{}));
            logger_.info(kComponent, "Downloading ", local_name, " (", ready.filesize, " bytes from offset ", start,
                         ")");

            std::vector<char> buffer(std::max<std::size_t>(config_.chunk_size, 1));
            std::uint64_t received = start;
            progress_.on_progress(TransferDirection::Download, local_name, received, ready.filesize);
            while (received < ready.filesize)
            {
                const auto want = std::min<std::uint64_t>(buffer.size(), ready.filesize - received);
                const auto got = connection_.read_some(std::span<char>(buffer.data(), static_cast<std::size_t>(want)));
                output.write(buffer.data(), static_cast<std::streamsize>(got));
                output.flush();
                if (!output)
                {
                    disconnect();
                    return failure(std::move(outcome), filedepot::ErrorCode::IoError, "Write failed on " + part.string());
                }
                received += got;
                outcome.bytes_transferred += got;
                progress_.on_progress(TransferDirection::Download, local_name, received, ready.filesize);
            }
            output.close();

            std::string actual;
            try
            {
                actual = crypto::hash_file(part);
            }
            catch (const std::runtime_error &ex)
            {
                logger_.error(kComponent, "Cannot verify ", local_name, ": ", ex.what());
                return failure(std::move(outcome), filedepot::ErrorCode::IoError, ex.what());
            }
            if (!crypto::digests_equal(actual, ready.hash))
            {
                std::filesystem::remove(part, ec);
                logger_.warn(kComponent, "Hash mismatch for ", local_name, ": expected ", ready.hash, ", got ", actual);
                return failure(std::move(outcome), filedepot::ErrorCode::HashMismatch,
                               "Hash mismatch: expected " + ready.hash + ", received " + actual);
            }

            std::filesystem::rename(part, target, ec);
            if (ec)
            {
                return failure(std::move(outcome), filedepot::ErrorCode::IoError,
                               "Cannot move " + part.string() + " into place: " + ec.message());
            }
            outcome.hash = actual;
            outcome.message = "Downloaded " + local_name;
            logger_.info(kComponent, "Downloaded ", local_name, " sha256 ", actual);
        }
        catch (const ClientError &ex)
        {
            disconnect();
            logger_.error(kComponent, "Download of ", local_name, " failed: ", ex.what());
            return failure(std::move(outcome), ex.code(), ex.what());
        }
        catch (const protocol::ProtocolError &ex)
        {
            disconnect();
            return failure(std::move(outcome), filedepot::ErrorCode::ProtocolError, ex.what());
        }
        return outcome;
    }

} // namespace filedepot::client
