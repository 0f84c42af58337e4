#pragma once

#include <podman/exceptions.hpp>

#include <boost/json.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace podman {

// Stream a multiplexed frame belongs to
enum class stream_id : std::uint8_t {
    standard_input = 0,
    standard_output = 1,
    standard_error = 2
};

struct frame {
    stream_id stream;
    std::string payload;
};

namespace {
    constexpr std::size_t frame_header_size = 8;
}

namespace detail {

inline auto hex_bytes(std::string_view bytes) -> std::string {
    std::string hex;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) {
            hex += ' ';
        }
        hex += std::format("{:02x}", static_cast<unsigned char>(bytes[i]));
    }
    return hex;
}

} // namespace detail

/**
 * @brief Split an attached-stream payload into frames
 *
 * Each frame starts with an 8-byte header: stream id (0, 1 or 2), three
 * zero bytes, and the payload length as a 32-bit big-endian integer.
 *
 * @param payload Complete payload read from the service
 * @return Frames in payload order
 * @throws stream_parse_error naming the offset and header bytes of the bad frame
 */
inline auto demux_frames(std::string_view payload) -> std::vector<frame> {
    std::vector<frame> frames;
    std::size_t offset = 0;

    while (offset < payload.size()) {
        auto remaining = payload.size() - offset;
        if (remaining < frame_header_size) {
            throw stream_parse_error(std::format(
                "Truncated frame header at offset {}: {}",
                offset, detail::hex_bytes(payload.substr(offset))));
        }

        auto header = payload.substr(offset, frame_header_size);
        auto id = static_cast<unsigned char>(header[0]);
        if (id > static_cast<unsigned char>(stream_id::standard_error) ||
            header[1] != '\0' || header[2] != '\0' || header[3] != '\0') {
            throw stream_parse_error(std::format(
                "Invalid frame header at offset {}: {}", offset, detail::hex_bytes(header)));
        }

        std::uint32_t length = 0;
        for (std::size_t i = 4; i < frame_header_size; ++i) {
            length = (length << 8) | static_cast<unsigned char>(header[i]);
        }

        if (remaining - frame_header_size < length) {
            throw stream_parse_error(std::format(
                "Truncated frame payload at offset {}: header {} announces {} bytes, {} available",
                offset, detail::hex_bytes(header), length, remaining - frame_header_size));
        }

        frames.push_back({
            static_cast<stream_id>(id),
            std::string(payload.substr(offset + frame_header_size, length))
        });
        offset += frame_header_size + length;
    }

    return frames;
}

/**
 * @brief Visit newline-separated JSON objects in order
 *
 * Blank lines are skipped; any other chunk must be a JSON object. Chunks
 * before a malformed one have already been handed to visit when it throws.
 *
 * @throws stream_parse_error with the 1-based line number and the chunk
 */
template<typename Visitor>
requires std::invocable<Visitor&, boost::json::object&>
auto for_each_json_chunk(std::string_view payload, Visitor&& visit) -> void {
    std::size_t line_number = 0;
    std::size_t start = 0;

    while (start <= payload.size()) {
        auto end = payload.find('\n', start);
        if (end == std::string_view::npos) {
            end = payload.size();
        }
        ++line_number;

        auto chunk = payload.substr(start, end - start);
        if (!chunk.empty() && chunk.back() == '\r') {
            chunk.remove_suffix(1);
        }

        if (chunk.find_first_not_of(" \t") != std::string_view::npos) {
            boost::json::error_code ec;
            auto value = boost::json::parse(boost::json::string_view(chunk.data(), chunk.size()), ec);
            if (ec || !value.is_object()) {
                throw stream_parse_error(std::format(
                    "Malformed JSON chunk at line {}: {}", line_number, chunk));
            }
            visit(value.as_object());
        }

        start = end + 1;
    }
}

inline auto decode_json_stream(std::string_view payload) -> std::vector<boost::json::object> {
    std::vector<boost::json::object> objects;
    for_each_json_chunk(payload, [&](boost::json::object& obj) {
        objects.push_back(std::move(obj));
    });
    return objects;
}

} // namespace podman
