/**
 * FileDepot - Control message schema and serialization helpers.
 *
 * Every control message is one JSON object carried in one frame (see
 * framing.hpp). Requests carry a "command" label, replies a "status" label.
 * Each shape is checked field by field on decode; anything that does not match
 * raises ProtocolError instead of being trusted.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "filedepot/error_codes.hpp"

namespace filedepot::protocol
{

    class ProtocolError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // A well-formed request whose command label nobody implements.
    class UnknownCommandError : public ProtocolError
    {
    public:
        explicit UnknownCommandError(std::string command);

        const std::string &command() const noexcept { return command_; }

    private:
        std::string command_;
    };

    enum class Command : std::uint8_t
    {
        Upload,
        Download,
        List
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class DuplicateAction : std::uint8_t
    {
        Overwrite,
        Rename,
        Version
    };

    std::string_view to_string(DuplicateAction action) noexcept;
    std::optional<DuplicateAction> duplicate_action_from_string(std::string_view value) noexcept;

    struct UploadRequest
    {
        std::string filename;
        std::uint64_t filesize{};
        std::string hash;
        DuplicateAction action{DuplicateAction::Overwrite};
    };

    void to_json(nlohmann::json &json, const UploadRequest &request);
    void from_json(const nlohmann::json &json, UploadRequest &request);

    struct DownloadRequest
    {
        std::string filename;
        std::optional<std::string> version{};
        std::optional<std::uint64_t> resume_offset{};
    };

    void to_json(nlohmann::json &json, const DownloadRequest &request);
    void from_json(const nlohmann::json &json, DownloadRequest &request);

    struct ListRequest
    {
    };

    void to_json(nlohmann::json &json, const ListRequest &request);
    void from_json(const nlohmann::json &json, ListRequest &request);

    using Request = std::variant<UploadRequest, DownloadRequest, ListRequest>;

    Command command_of(const Request &request) noexcept;

    nlohmann::json encode_request(const Request &request);

    // Throws UnknownCommandError for an unknown label, ProtocolError for any
    // other mismatch.
    Request decode_request(const nlohmann::json &json);

    struct UploadReady
    {
        std::string filename;
        bool is_duplicate{};
        DuplicateAction action{DuplicateAction::Overwrite};
    };

    void to_json(nlohmann::json &json, const UploadReady &reply);
    void from_json(const nlohmann::json &json, UploadReady &reply);

    struct DownloadReady
    {
        std::uint64_t filesize{};
        std::string hash;
        std::optional<std::uint64_t> resuming_from{};
    };

    void to_json(nlohmann::json &json, const DownloadReady &reply);
    void from_json(const nlohmann::json &json, DownloadReady &reply);

    // Sent by the client between DownloadReady and the raw byte stream.
    struct TransferAck
    {
    };

    void to_json(nlohmann::json &json, const TransferAck &ack);
    void from_json(const nlohmann::json &json, TransferAck &ack);

    struct TransferResult
    {
        std::string message;
        std::string hash;
    };

    void to_json(nlohmann::json &json, const TransferResult &result);
    void from_json(const nlohmann::json &json, TransferResult &result);

    struct VersionRecord
    {
        std::string filename;
        std::uint64_t size{};
        std::uint64_t created{};
        std::string hash;
    };

    void to_json(nlohmann::json &json, const VersionRecord &record);
    void from_json(const nlohmann::json &json, VersionRecord &record);

    struct FileRecord
    {
        std::string filename;
        std::uint64_t size{};
        std::uint64_t modified{};
        std::string hash;
        std::vector<VersionRecord> versions;
    };

    void to_json(nlohmann::json &json, const FileRecord &record);
    void from_json(const nlohmann::json &json, FileRecord &record);

    struct FileList
    {
        std::vector<FileRecord> files;
    };

    void to_json(nlohmann::json &json, const FileList &list);
    void from_json(const nlohmann::json &json, FileList &list);

    struct ErrorResponse
    {
        ErrorCode error{ErrorCode::InternalError};
        std::string message;
    };

    void to_json(nlohmann::json &json, const ErrorResponse &response);
    void from_json(const nlohmann::json &json, ErrorResponse &response);

    template <typename Message>
    using Reply = std::variant<Message, ErrorResponse>;

    bool is_error_reply(const nlohmann::json &json);

    template <typename Message>
    Reply<Message> decode_reply(const nlohmann::json &json)
    {
        if (is_error_reply(json))
        {
            return json.get<ErrorResponse>();
        }
        return json.get<Message>();
    }

} // namespace filedepot::protocol
