#pragma once

#include <podman/environment.hpp>
#include <podman/exceptions.hpp>

#include <folly/ExceptionWrapper.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace podman {

namespace {
    constexpr std::string_view default_system_socket = "unix:///run/podman/podman.sock";
    constexpr std::string_view user_socket_suffix = "/podman/podman.sock";
    constexpr std::array<std::string_view, 6> supported_schemes = {
        "unix://", "http+unix://", "tcp://", "http://", "https://", "ssh://"
    };
}

// Settings used to reach the service.
struct connection_config {
    std::string host{default_system_socket};
    bool tls_verify{false};
    std::string cert_path{};

    static auto from_environment(const podman::environment& env) -> connection_config;
};

// First non-empty value among the two naming families, CONTAINER_* first.
inline auto lookup_either(
    const environment& env,
    std::string_view container_name,
    std::string_view docker_name
) -> std::optional<std::string> {
    for (auto name : {container_name, docker_name}) {
        auto value = lookup(env, name);
        if (value && !value->empty()) {
            return value;
        }
    }
    return std::nullopt;
}

inline auto parse_tls_verify(const std::string& value) -> bool {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c){ return std::tolower(c); });

    if (lowered == "1" || lowered == "true" || lowered == "yes") {
        return true;
    }
    if (lowered.empty() || lowered == "0" || lowered == "false" || lowered == "no") {
        return false;
    }
    throw invalid_argument("TLS verify setting must be one of 1, 0, true, false, yes, no: " + value);
}

inline auto validate_connection_config(const connection_config& config) -> void {
    if (config.host.empty()) {
        throw invalid_argument("host cannot be empty");
    }

    auto scheme = std::find_if(supported_schemes.begin(), supported_schemes.end(),
                               [&](std::string_view s){ return config.host.starts_with(s); });
    if (scheme == supported_schemes.end()) {
        throw invalid_argument("host scheme must be one of unix, http+unix, tcp, http, https, ssh: " + config.host);
    }

    if (config.host.size() == scheme->size()) {
        throw invalid_argument("host has no address after scheme: " + config.host);
    }
}

inline auto connection_config::from_environment(const podman::environment& env) -> connection_config {
    connection_config config;

    if (auto host = lookup_either(env, "CONTAINER_HOST", "DOCKER_HOST")) {
        config.host = *host;
    } else if (auto runtime_dir = lookup(env, "XDG_RUNTIME_DIR"); runtime_dir && !runtime_dir->empty()) {
        config.host = "unix://" + *runtime_dir + std::string(user_socket_suffix);
    }

    try {
        if (auto verify = lookup_either(env, "CONTAINER_TLS_VERIFY", "DOCKER_TLS_VERIFY")) {
            config.tls_verify = parse_tls_verify(*verify);
        }
        if (auto cert_path = lookup_either(env, "CONTAINER_CERT_PATH", "DOCKER_CERT_PATH")) {
            config.cert_path = *cert_path;
        }
        validate_connection_config(config);
    } catch (const invalid_argument& e) {
        throw connection_error(
            "Failed to configure connection from environment",
            env,
            config.host,
            folly::exception_wrapper(e));
    }

    return config;
}

} // namespace podman
