#include "filedepot/framing.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

#include "filedepot/protocol.hpp"

namespace filedepot::protocol
{

    namespace
    {
        std::uint32_t read_u32_be(std::span<const std::uint8_t> buffer)
        {
            return (static_cast<std::uint32_t>(buffer[0]) << 24) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        void write_u32_be(std::uint32_t value, std::span<std::uint8_t> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }

        std::size_t checked_size(std::uint32_t announced)
        {
            if (announced > kMaxFrameSize)
            {
                throw ProtocolError("Frame of " + std::to_string(announced) + " bytes exceeds the " +
                                    std::to_string(kMaxFrameSize) + " byte limit");
            }
            return static_cast<std::size_t>(announced);
        }
    } // namespace

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        // Invalid UTF-8 in a string (a non-UTF-8 file name on disk) becomes U+FFFD.
        const auto text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (text.size() > kMaxFrameSize)
        {
            throw ProtocolError("Message of " + std::to_string(text.size()) + " bytes is too large to frame");
        }
        std::vector<std::uint8_t> frame(kFrameHeaderSize + text.size());
        write_u32_be(static_cast<std::uint32_t>(text.size()),
                     std::span<std::uint8_t>(frame).first<kFrameHeaderSize>());
        std::copy(text.begin(), text.end(), frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize));
        return frame;
    }

    std::size_t frame_payload_size(const std::array<std::uint8_t, kFrameHeaderSize> &header)
    {
        return checked_size(read_u32_be(header));
    }

    nlohmann::json parse_frame_payload(std::span<const std::uint8_t> payload)
    {
        auto message = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
        if (message.is_discarded())
        {
            throw ProtocolError("Frame payload is not valid JSON");
        }
        if (!message.is_object())
        {
            throw ProtocolError("Frame payload is not a JSON object");
        }
        return message;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const auto payload_size = checked_size(read_u32_be(buffer.first<kFrameHeaderSize>()));
        if (buffer.size() < kFrameHeaderSize + payload_size)
        {
            return std::nullopt;
        }
        DecodedFrame result{
            .message = parse_frame_payload(buffer.subspan(kFrameHeaderSize, payload_size)),
            .bytes_consumed = kFrameHeaderSize + payload_size,
        };
        return result;
    }

} // namespace filedepot::protocol
