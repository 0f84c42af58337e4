#pragma once

#include <string>
#include <utility>

namespace podman {

// Read-only view of a completed HTTP exchange.
// Errors hold the response through a shared pointer and re-read it on every
// query, so the status reported by an error follows the response object.
class http_response {
public:
    virtual ~http_response() = default;

    virtual auto status_code() const -> int = 0;
    virtual auto reason() const -> std::string = 0;
    virtual auto text() const -> std::string = 0;

    auto ok() const -> bool {
        auto code = status_code();
        return code >= 200 && code < 300;
    }
};

// Plain value response, used by transports that already decoded the
// status line and by tests.
class static_response : public http_response {
public:
    static_response(int status_code, std::string reason, std::string text = {})
        : _status_code(status_code)
        , _reason(std::move(reason))
        , _text(std::move(text)) {}

    auto status_code() const -> int override {
        return _status_code;
    }

    auto reason() const -> std::string override {
        return _reason;
    }

    auto text() const -> std::string override {
        return _text;
    }

    auto set_status_code(int status_code) -> void {
        _status_code = status_code;
    }

    auto set_reason(std::string reason) -> void {
        _reason = std::move(reason);
    }

private:
    int _status_code;
    std::string _reason;
    std::string _text;
};

} // namespace podman
