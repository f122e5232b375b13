/**
 * FileDepot - Length-prefixed JSON framing helpers.
 *
 * A frame is a 4-byte big-endian length followed by that many bytes of JSON.
 * Raw payload bytes announced by a message follow the frame unwrapped, so the
 * decoder consumes exactly one frame and leaves everything after it untouched.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace filedepot::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);
    inline constexpr std::size_t kMaxFrameSize = 16 * 1024 * 1024;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    // Throws ProtocolError when the announced size exceeds kMaxFrameSize.
    std::size_t frame_payload_size(const std::array<std::uint8_t, kFrameHeaderSize> &header);

    // Throws ProtocolError when the bytes are not a single JSON object.
    nlohmann::json parse_frame_payload(std::span<const std::uint8_t> payload);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace filedepot::protocol
