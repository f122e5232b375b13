/**
 * FileDepot - Error kinds shared by the codec, the server and the client.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace filedepot
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        ProtocolError = 1,
        InvalidRequest = 2,
        NotFound = 3,
        HashMismatch = 4,
        UnknownCommand = 5,
        ConnectionError = 6,
        Timeout = 7,
        IoError = 8,
        InternalError = 9
    };

    std::string_view to_string(ErrorCode code) noexcept;

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    // Errors worth a reconnect: the peer may come back.
    constexpr bool is_transient(ErrorCode code) noexcept
    {
        return code == ErrorCode::ConnectionError || code == ErrorCode::Timeout;
    }

} // namespace filedepot
