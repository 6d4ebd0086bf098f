/**
 * DropSlot - Length-prefixed JSON framing helpers.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace dropslot::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Upper bound for a single frame; a chunk travels base64 encoded inside one frame.
    inline constexpr std::uint32_t kMaxFrameSize = 64u * 1024u * 1024u;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::uint32_t decode_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header);

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace dropslot::protocol
