#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <concepts>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace podman {

enum class log_level : std::uint8_t {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

namespace {
    constexpr std::array<std::pair<log_level, std::string_view>, 6> log_level_names = {{
        {log_level::trace, "TRACE"},
        {log_level::debug, "DEBUG"},
        {log_level::info, "INFO"},
        {log_level::warning, "WARNING"},
        {log_level::error, "ERROR"},
        {log_level::critical, "CRITICAL"},
    }};
}

inline auto to_string(log_level level) -> std::string_view {
    for (const auto& [value, name] : log_level_names) {
        if (value == level) {
            return name;
        }
    }
    return "UNKNOWN";
}

inline auto operator<<(std::ostream& os, log_level level) -> std::ostream& {
    return os << to_string(level);
}

// Case-insensitive; "warn" is accepted for warning.
inline auto parse_log_level(std::string_view text) -> std::optional<log_level> {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c){ return std::toupper(c); });
    if (upper == "WARN") {
        return log_level::warning;
    }
    for (const auto& [value, name] : log_level_names) {
        if (name == upper) {
            return value;
        }
    }
    return std::nullopt;
}

// Key/value pairs attached to a structured log line
using log_fields = std::vector<std::pair<std::string_view, std::string_view>>;

// Sink used by error_reporter and the examples
template<typename L>
concept diagnostic_logger = requires(
    L logger,
    log_level level,
    std::string_view message,
    log_fields key_value_pairs
) {
    { logger.log(level, message) } -> std::same_as<void>;
    { logger.log(level, message, key_value_pairs) } -> std::same_as<void>;

    { logger.trace(message) } -> std::same_as<void>;
    { logger.debug(message) } -> std::same_as<void>;
    { logger.info(message) } -> std::same_as<void>;
    { logger.warning(message) } -> std::same_as<void>;
    { logger.error(message) } -> std::same_as<void>;
    { logger.critical(message) } -> std::same_as<void>;
};

} // namespace podman
