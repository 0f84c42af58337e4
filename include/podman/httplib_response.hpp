#pragma once

#include <podman/exceptions.hpp>
#include <podman/http_response.hpp>

#include <httplib.h>

#include <format>
#include <memory>
#include <string>
#include <utility>

namespace podman {

// http_response over a cpp-httplib response.
// The underlying httplib::Response is shared, not copied, so a transport
// that keeps updating it is observed by every error holding this adapter.
class httplib_response : public http_response {
public:
    explicit httplib_response(std::shared_ptr<const httplib::Response> response)
        : _response(std::move(response)) {}

    auto status_code() const -> int override {
        return _response->status;
    }

    auto reason() const -> std::string override {
        if (!_response->reason.empty()) {
            return _response->reason;
        }
        return httplib::status_message(_response->status);
    }

    auto text() const -> std::string override {
        return _response->body;
    }

    auto native() const -> const httplib::Response& {
        return *_response;
    }

private:
    std::shared_ptr<const httplib::Response> _response;
};

/**
 * @brief Take the response out of a cpp-httplib result
 *
 * A result without a response means the exchange failed at the transport
 * level; that is reported as an api_error without a response, so it carries
 * no status code and renders as its message.
 *
 * @param result Result of a cpp-httplib client call
 * @param host Service address used for the request, named in the message
 */
inline auto check_result(httplib::Result&& result, const std::string& host) -> std::shared_ptr<const http_response> {
    if (!result) {
        throw api_error(std::format("HTTP request to {} failed: {}", host, httplib::to_string(result.error())));
    }

    auto response = std::make_shared<const httplib::Response>(std::move(result.value()));
    return std::make_shared<const httplib_response>(std::move(response));
}

} // namespace podman
