#pragma once

#include <podman/exceptions.hpp>
#include <podman/http_response.hpp>

#include <boost/json.hpp>

#include <concepts>
#include <memory>
#include <string>
#include <utility>

namespace podman {

namespace {
    constexpr int status_not_found = 404;
}

// Cause and message of an error body, as reported by the service
struct error_body {
    std::string cause;
    std::string message;
};

// Error bodies look like {"cause": "...", "message": "...", "response": 404}.
// Anything else is reported verbatim as both cause and message.
inline auto parse_error_body(const std::string& text) -> error_body {
    boost::json::error_code ec;
    auto value = boost::json::parse(text, ec);
    if (!ec && value.is_object()) {
        const auto& obj = value.as_object();
        const auto* cause = obj.if_contains("cause");
        const auto* message = obj.if_contains("message");
        if (cause != nullptr && cause->is_string() && message != nullptr && message->is_string()) {
            const auto& c = cause->as_string();
            const auto& m = message->as_string();
            return {std::string(c.data(), c.size()), std::string(m.data(), m.size())};
        }
    }
    return {text, text};
}

/**
 * @brief Throw the api_error matching a non-2xx response
 *
 * The same shared response is attached to the thrown error, so its status
 * stays readable through the error.
 *
 * @tparam NotFound Error type thrown for 404, e.g. image_not_found for image lookups
 * @param response Response of a completed exchange
 */
template<typename NotFound = not_found>
requires std::derived_from<NotFound, api_error>
auto raise_for_status(const std::shared_ptr<const http_response>& response) -> void {
    if (!response) {
        throw invalid_argument("raise_for_status requires a response");
    }

    if (response->ok()) {
        return;
    }

    auto body = parse_error_body(response->text());

    if (response->status_code() == status_not_found) {
        throw NotFound(body.cause, response, body.message);
    }
    throw api_error(body.cause, response, body.message);
}

} // namespace podman
