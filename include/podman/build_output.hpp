#pragma once

#include <podman/exceptions.hpp>
#include <podman/stream.hpp>

#include <boost/json.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace podman {

struct build_result {
    std::string image_id;
    std::vector<std::string> log;
};

namespace detail {

// Short ids are 12 hex digits, full ids 64.
inline auto is_image_id(std::string_view text) -> bool {
    return text.size() >= 12 && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) || (c >= 'a' && c <= 'f');
    });
}

inline auto to_std_string(const boost::json::string& s) -> std::string {
    return std::string(s.data(), s.size());
}

inline auto strip_digest_prefix(std::string_view id) -> std::string {
    constexpr std::string_view digest_prefix = "sha256:";
    if (id.starts_with(digest_prefix)) {
        id.remove_prefix(digest_prefix.size());
    }
    return std::string(id);
}

} // namespace detail

/**
 * @brief Consume the progress stream of an image build
 *
 * Every "stream" field is kept as one log entry (without its trailing
 * newline). The image id is the last entry consisting only of a hex id, or
 * the last "aux.ID". The log is complete up to the failure point whenever
 * build_error is thrown.
 *
 * @param payload Newline-separated JSON progress objects
 * @throws build_error on an "error" field, a malformed chunk, or when no image id was reported
 */
inline auto collect_build_output(std::string_view payload) -> build_result {
    build_result result;

    try {
        for_each_json_chunk(payload, [&](boost::json::object& obj) {
            if (const auto* stream = obj.if_contains("stream"); stream != nullptr && stream->is_string()) {
                auto entry = detail::to_std_string(stream->as_string());
                if (!entry.empty() && entry.back() == '\n') {
                    entry.pop_back();
                }
                if (detail::is_image_id(entry)) {
                    result.image_id = entry;
                }
                result.log.push_back(std::move(entry));
            }

            if (const auto* aux = obj.if_contains("aux"); aux != nullptr && aux->is_object()) {
                if (const auto* id = aux->as_object().if_contains("ID"); id != nullptr && id->is_string()) {
                    result.image_id = detail::strip_digest_prefix(detail::to_std_string(id->as_string()));
                }
            }

            if (const auto* error = obj.if_contains("error"); error != nullptr) {
                std::string reason = error->is_string()
                    ? detail::to_std_string(error->as_string())
                    : std::string(boost::json::serialize(*error));
                throw build_error(reason, result.log);
            }
        });
    } catch (const stream_parse_error& e) {
        throw build_error(e.reason(), result.log);
    }

    if (result.image_id.empty()) {
        throw build_error("Build failed: no image id reported", result.log);
    }

    return result;
}

} // namespace podman
