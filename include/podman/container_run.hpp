#pragma once

#include <podman/container.hpp>
#include <podman/exceptions.hpp>
#include <podman/stream.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace podman {

// Lines written to stderr in a multiplexed log payload.
// A line split across frames is joined back together.
inline auto stderr_lines_from_logs(std::string_view payload) -> std::vector<std::string> {
    std::string text;
    for (auto& f : demux_frames(payload)) {
        if (f.stream == stream_id::standard_error) {
            text += f.payload;
        }
    }

    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

// Returns for a zero exit status, throws container_error otherwise.
inline auto check_exit_status(
    const container& ctr,
    int exit_status,
    command_line command,
    std::string image,
    std::optional<std::vector<std::string>> stderr_lines = std::nullopt
) -> void {
    if (exit_status == 0) {
        return;
    }
    throw container_error(ctr, exit_status, std::move(command), std::move(image), std::move(stderr_lines));
}

} // namespace podman
