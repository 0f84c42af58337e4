#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <unistd.h>

extern char** environ;

namespace podman {

// Environment snapshot in its original order.
using environment = std::vector<std::pair<std::string, std::string>>;

// Variables that may appear in connection diagnostics. Both naming
// families are kept together so they cannot drift apart.
inline constexpr std::array<std::string_view, 6> connection_environment_names = {
    "DOCKER_HOST",       "CONTAINER_HOST",
    "DOCKER_TLS_VERIFY", "CONTAINER_TLS_VERIFY",
    "DOCKER_CERT_PATH",  "CONTAINER_CERT_PATH",
};

inline auto is_connection_variable(std::string_view name) -> bool {
    return std::find(connection_environment_names.begin(),
                     connection_environment_names.end(),
                     name) != connection_environment_names.end();
}

// Entries of env whose names are in the connection allow-list, in order.
inline auto filter_connection_environment(const environment& env) -> environment {
    environment relevant;
    for (const auto& [name, value] : env) {
        if (is_connection_variable(name)) {
            relevant.emplace_back(name, value);
        }
    }
    return relevant;
}

// First value of name in env, if any.
inline auto lookup(const environment& env, std::string_view name) -> std::optional<std::string> {
    for (const auto& [key, value] : env) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

// Copy of the process environment.
inline auto environment_snapshot() -> environment {
    environment env;
    for (char** entry = ::environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view line{*entry};
        auto separator = line.find('=');
        if (separator == std::string_view::npos) {
            env.emplace_back(std::string(line), std::string());
            continue;
        }
        env.emplace_back(std::string(line.substr(0, separator)),
                         std::string(line.substr(separator + 1)));
    }
    return env;
}

} // namespace podman
