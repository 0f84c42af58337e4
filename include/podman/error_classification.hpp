#pragma once

#include <podman/exceptions.hpp>

#include <exception>
#include <optional>
#include <ostream>
#include <string>

namespace podman {

/**
 * @brief Fault classification for different handling strategies
 */
enum class fault_type {
    client_fault,          // 4xx: caller must correct the request
    server_fault,          // 5xx: service-side failure
    not_found,             // Resource or image absent
    stream_decode_fault,   // Streamed payload could not be decoded
    connection_fault,      // No HTTP exchange took place
    operation_fault,       // Build or container run completed unsuccessfully
    invalid_argument,      // Library call rejected its parameters
    unknown                // Not raised by this library, or no status
};

inline auto operator<<(std::ostream& os, fault_type type) -> std::ostream& {
    switch (type) {
        case fault_type::client_fault: return os << "client_fault";
        case fault_type::server_fault: return os << "server_fault";
        case fault_type::not_found: return os << "not_found";
        case fault_type::stream_decode_fault: return os << "stream_decode_fault";
        case fault_type::connection_fault: return os << "connection_fault";
        case fault_type::operation_fault: return os << "operation_fault";
        case fault_type::invalid_argument: return os << "invalid_argument";
        case fault_type::unknown: return os << "unknown";
        default: return os << "unknown(" << static_cast<int>(type) << ")";
    }
}

/**
 * @brief Error classification result
 */
struct error_classification {
    fault_type fault;
    bool should_retry;
    std::string description;
    std::optional<int> status_code;  // Set for api_error and its subtypes
};

/**
 * @brief Classify an exception by its type
 *
 * Only the dynamic type and, for api_error, the live status code are
 * consulted; the message text is never inspected. should_retry tells
 * whether repeating the same call unchanged can succeed; backoff is the
 * caller's business.
 *
 * @param e Exception to classify
 * @return Error classification result
 */
inline auto classify_error(const std::exception& e) -> error_classification {
    if (const auto* api = dynamic_cast<const api_error*>(&e)) {
        auto code = api->status_code();

        if (api->kind() == error_kind::not_found || api->kind() == error_kind::image_not_found) {
            return {
                .fault = fault_type::not_found,
                .should_retry = false,
                .description = "Resource not found",
                .status_code = code
            };
        }

        if (api->is_client_error()) {
            return {
                .fault = fault_type::client_fault,
                .should_retry = false,
                .description = "Request rejected by service",
                .status_code = code
            };
        }

        if (api->is_server_error()) {
            return {
                .fault = fault_type::server_fault,
                .should_retry = true,
                .description = "Service failed to handle request",
                .status_code = code
            };
        }

        return {
            .fault = fault_type::unknown,
            .should_retry = true,
            .description = "HTTP exchange failed without an error status",
            .status_code = code
        };
    }

    if (dynamic_cast<const stream_parse_error*>(&e) != nullptr) {
        return {
            .fault = fault_type::stream_decode_fault,
            .should_retry = false,
            .description = "Malformed stream payload",
            .status_code = std::nullopt
        };
    }

    if (const auto* native = dynamic_cast<const podman_error*>(&e)) {
        switch (native->kind()) {
            case error_kind::connection:
                return {
                    .fault = fault_type::connection_fault,
                    .should_retry = true,
                    .description = "Connection to service failed",
                    .status_code = std::nullopt
                };
            case error_kind::build:
            case error_kind::container:
                return {
                    .fault = fault_type::operation_fault,
                    .should_retry = false,
                    .description = "Operation completed unsuccessfully",
                    .status_code = std::nullopt
                };
            case error_kind::invalid_argument:
                return {
                    .fault = fault_type::invalid_argument,
                    .should_retry = false,
                    .description = "Invalid argument",
                    .status_code = std::nullopt
                };
            default:
                break;
        }
    }

    return {
        .fault = fault_type::unknown,
        .should_retry = false,
        .description = "Unknown error: " + std::string(e.what()),
        .status_code = std::nullopt
    };
}

} // namespace podman
