#include "filedepot/error_codes.hpp"

#include <array>

namespace filedepot
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 10> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::ProtocolError, "protocol_error"},
            {ErrorCode::InvalidRequest, "invalid_request"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::HashMismatch, "hash_mismatch"},
            {ErrorCode::UnknownCommand, "unknown_command"},
            {ErrorCode::ConnectionError, "connection_error"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == value)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

} // namespace filedepot
