#include "filedepot/protocol.hpp"

#include <array>

namespace filedepot::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 3> kCommandMappings{{
            {Command::Upload, "UPLOAD"},
            {Command::Download, "DOWNLOAD"},
            {Command::List, "LIST"},
        }};

        struct DuplicateActionMapping
        {
            DuplicateAction action;
            std::string_view label;
        };

        constexpr std::array<DuplicateActionMapping, 3> kDuplicateActionMappings{{
            {DuplicateAction::Overwrite, "overwrite"},
            {DuplicateAction::Rename, "rename"},
            {DuplicateAction::Version, "versioning"},
        }};

        constexpr auto kStatusReady = "ready";
        constexpr auto kStatusSuccess = "success";
        constexpr auto kStatusError = "error";

        const nlohmann::json &require_field(const nlohmann::json &json, const std::string &key)
        {
            if (!json.is_object())
            {
                throw ProtocolError("Expected a JSON object");
            }
            const auto it = json.find(key);
            if (it == json.end())
            {
                throw ProtocolError("Missing field '" + key + "'");
            }
            return *it;
        }

        std::string require_string(const nlohmann::json &json, const std::string &key)
        {
            const auto &value = require_field(json, key);
            if (!value.is_string())
            {
                throw ProtocolError("Field '" + key + "' must be a string");
            }
            return value.get<std::string>();
        }

        std::uint64_t require_uint(const nlohmann::json &json, const std::string &key)
        {
            const auto &value = require_field(json, key);
            if (value.is_number_unsigned())
            {
                return value.get<std::uint64_t>();
            }
            if (value.is_number_integer() && value.get<std::int64_t>() >= 0)
            {
                return static_cast<std::uint64_t>(value.get<std::int64_t>());
            }
            throw ProtocolError("Field '" + key + "' must be a non-negative integer");
        }

        bool require_bool(const nlohmann::json &json, const std::string &key)
        {
            const auto &value = require_field(json, key);
            if (!value.is_boolean())
            {
                throw ProtocolError("Field '" + key + "' must be a boolean");
            }
            return value.get<bool>();
        }

        std::optional<std::uint64_t> optional_uint(const nlohmann::json &json, const std::string &key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return require_uint(json, key);
            }
            return std::nullopt;
        }

        std::optional<std::string> optional_string(const nlohmann::json &json, const std::string &key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return require_string(json, key);
            }
            return std::nullopt;
        }

        void require_status(const nlohmann::json &json, std::string_view expected)
        {
            const auto status = require_string(json, "status");
            if (status != expected)
            {
                throw ProtocolError("Unexpected status '" + status + "', wanted '" + std::string(expected) + "'");
            }
        }

        DuplicateAction require_action(const nlohmann::json &json, const std::string &key)
        {
            const auto label = require_string(json, key);
            auto action = duplicate_action_from_string(label);
            if (!action)
            {
                throw ProtocolError("Unknown handling mode: " + label);
            }
            return *action;
        }

        template <typename Item>
        std::vector<Item> require_array(const nlohmann::json &json, const std::string &key)
        {
            const auto &value = require_field(json, key);
            if (!value.is_array())
            {
                throw ProtocolError("Field '" + key + "' must be an array");
            }
            std::vector<Item> items;
            items.reserve(value.size());
            for (const auto &element : value)
            {
                items.push_back(element.get<Item>());
            }
            return items;
        }

    } // namespace

    UnknownCommandError::UnknownCommandError(std::string command)
        : ProtocolError("Unknown command: " + command), command_(std::move(command)) {}

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(DuplicateAction action) noexcept
    {
        for (const auto &mapping : kDuplicateActionMappings)
        {
            if (mapping.action == action)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<DuplicateAction> duplicate_action_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kDuplicateActionMappings)
        {
            if (mapping.label == value)
            {
                return mapping.action;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const UploadRequest &request)
    {
        json = {
            {"command", std::string(to_string(Command::Upload))},
            {"filename", request.filename},
            {"filesize", request.filesize},
            {"hash", request.hash},
            {"handling_mode", std::string(to_string(request.action))},
        };
    }

    void from_json(const nlohmann::json &json, UploadRequest &request)
    {
        request.filename = require_string(json, "filename");
        request.filesize = require_uint(json, "filesize");
        request.hash = require_string(json, "hash");
        if (request.hash.empty())
        {
            throw ProtocolError("Field 'hash' must not be empty");
        }
        request.action = json.contains("handling_mode") ? require_action(json, "handling_mode")
                                                        : DuplicateAction::Overwrite;
    }

    void to_json(nlohmann::json &json, const DownloadRequest &request)
    {
        json = {
            {"command", std::string(to_string(Command::Download))},
            {"filename", request.filename},
        };
        if (request.version)
        {
            json["version"] = *request.version;
        }
        if (request.resume_offset)
        {
            json["resume_offset"] = *request.resume_offset;
        }
    }

    void from_json(const nlohmann::json &json, DownloadRequest &request)
    {
        request.filename = require_string(json, "filename");
        request.version = optional_string(json, "version");
        request.resume_offset = optional_uint(json, "resume_offset");
    }

    void to_json(nlohmann::json &json, const ListRequest & /*request*/)
    {
        json = {{"command", std::string(to_string(Command::List))}};
    }

    void from_json(const nlohmann::json &json, ListRequest & /*request*/)
    {
        if (!json.is_object())
        {
            throw ProtocolError("Expected a JSON object");
        }
    }

    Command command_of(const Request &request) noexcept
    {
        if (std::holds_alternative<UploadRequest>(request))
        {
            return Command::Upload;
        }
        if (std::holds_alternative<DownloadRequest>(request))
        {
            return Command::Download;
        }
        return Command::List;
    }

    nlohmann::json encode_request(const Request &request)
    {
        return std::visit([](const auto &message)
                          { return nlohmann::json(message); },
                          request);
    }

    Request decode_request(const nlohmann::json &json)
    {
        const auto label = require_string(json, "command");
        const auto command = command_from_string(label);
        if (!command)
        {
            throw UnknownCommandError(label);
        }
        switch (*command)
        {
        case Command::Upload:
            return json.get<UploadRequest>();
        case Command::Download:
            return json.get<DownloadRequest>();
        case Command::List:
            return json.get<ListRequest>();
        }
        throw UnknownCommandError(label);
    }

    void to_json(nlohmann::json &json, const UploadReady &reply)
    {
        json = {
            {"status", kStatusReady},
            {"filename", reply.filename},
            {"is_duplicate", reply.is_duplicate},
            {"handling_mode", std::string(to_string(reply.action))},
        };
    }

    void from_json(const nlohmann::json &json, UploadReady &reply)
    {
        require_status(json, kStatusReady);
        reply.filename = require_string(json, "filename");
        reply.is_duplicate = require_bool(json, "is_duplicate");
        reply.action = require_action(json, "handling_mode");
    }

    void to_json(nlohmann::json &json, const DownloadReady &reply)
    {
        json = {
            {"status", kStatusReady},
            {"filesize", reply.filesize},
            {"hash", reply.hash},
        };
        if (reply.resuming_from)
        {
            json["resuming_from"] = *reply.resuming_from;
        }
    }

    void from_json(const nlohmann::json &json, DownloadReady &reply)
    {
        require_status(json, kStatusReady);
        reply.filesize = require_uint(json, "filesize");
        reply.hash = require_string(json, "hash");
        reply.resuming_from = optional_uint(json, "resuming_from");
        if (reply.resuming_from && *reply.resuming_from > reply.filesize)
        {
            throw ProtocolError("Resume offset lies beyond the end of the file");
        }
    }

    void to_json(nlohmann::json &json, const TransferAck & /*ack*/)
    {
        json = {{"status", kStatusReady}};
    }

    void from_json(const nlohmann::json &json, TransferAck & /*ack*/)
    {
        require_status(json, kStatusReady);
    }

    void to_json(nlohmann::json &json, const TransferResult &result)
    {
        json = {
            {"status", kStatusSuccess},
            {"message", result.message},
            {"hash", result.hash},
        };
    }

    void from_json(const nlohmann::json &json, TransferResult &result)
    {
        require_status(json, kStatusSuccess);
        result.message = json.contains("message") ? require_string(json, "message") : std::string{};
        result.hash = require_string(json, "hash");
    }

    void to_json(nlohmann::json &json, const VersionRecord &record)
    {
        json = {
            {"filename", record.filename},
            {"size", record.size},
            {"created", record.created},
            {"hash", record.hash},
        };
    }

    void from_json(const nlohmann::json &json, VersionRecord &record)
    {
        record.filename = require_string(json, "filename");
        record.size = require_uint(json, "size");
        record.created = require_uint(json, "created");
        record.hash = require_string(json, "hash");
    }

    void to_json(nlohmann::json &json, const FileRecord &record)
    {
        json = {
            {"filename", record.filename},
            {"size", record.size},
            {"modified", record.modified},
            {"hash", record.hash},
            {"versions", record.versions},
        };
    }

    void from_json(const nlohmann::json &json, FileRecord &record)
    {
        record.filename = require_string(json, "filename");
        record.size = require_uint(json, "size");
        record.modified = require_uint(json, "modified");
        record.hash = require_string(json, "hash");
        record.versions = require_array<VersionRecord>(json, "versions");
    }

    void to_json(nlohmann::json &json, const FileList &list)
    {
        json = {
            {"status", kStatusSuccess},
            {"files", list.files},
        };
    }

    void from_json(const nlohmann::json &json, FileList &list)
    {
        require_status(json, kStatusSuccess);
        list.files = require_array<FileRecord>(json, "files");
    }

    void to_json(nlohmann::json &json, const ErrorResponse &response)
    {
        json = {
            {"status", kStatusError},
            {"error", std::string(to_string(response.error))},
            {"message", response.message},
        };
    }

    void from_json(const nlohmann::json &json, ErrorResponse &response)
    {
        require_status(json, kStatusError);
        const auto label = require_string(json, "error");
        response.error = error_code_from_string(label).value_or(ErrorCode::InternalError);
        response.message = json.contains("message") ? require_string(json, "message") : std::string{};
    }

    bool is_error_reply(const nlohmann::json &json)
    {
        if (!json.is_object())
        {
            throw ProtocolError("Expected a JSON object");
        }
        const auto it = json.find("status");
        return it != json.end() && it->is_string() && it->get<std::string>() == kStatusError;
    }

} // namespace filedepot::protocol
