#pragma once

#include <podman/container.hpp>
#include <podman/environment.hpp>
#include <podman/http_response.hpp>

#include <folly/ExceptionWrapper.h>
#include <folly/Synchronized.h>

#include <format>
#include <list>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace podman {

/**
 * @brief Kind tag carried by every library error
 */
enum class error_kind {
    api,
    not_found,
    image_not_found,
    build,
    container,
    connection,
    invalid_argument,
    stream_parse
};

inline auto operator<<(std::ostream& os, error_kind kind) -> std::ostream& {
    switch (kind) {
        case error_kind::api: return os << "api";
        case error_kind::not_found: return os << "not_found";
        case error_kind::image_not_found: return os << "image_not_found";
        case error_kind::build: return os << "build";
        case error_kind::container: return os << "container";
        case error_kind::connection: return os << "connection";
        case error_kind::invalid_argument: return os << "invalid_argument";
        case error_kind::stream_parse: return os << "stream_parse";
        default: return os << "unknown(" << static_cast<int>(kind) << ")";
    }
}

namespace detail {

inline auto join(const std::vector<std::string>& parts, std::string_view separator) -> std::string {
    std::string joined;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += parts[i];
    }
    return joined;
}

} // namespace detail

/**
 * @brief Error reported by the service for an HTTP exchange
 *
 * The status code is read from the attached response on every call, so
 * classification and rendering follow the response object rather than a
 * copy taken at construction.
 */
class api_error : public std::runtime_error {
public:
    /**
     * @param message Message from the service, usually the response body
     * @param response Response of the failed exchange, null for transport failures
     * @param explanation Additional context appended to the rendered message
     */
    explicit api_error(
        const std::string& message,
        std::shared_ptr<const http_response> response = nullptr,
        std::optional<std::string> explanation = std::nullopt
    )
        : std::runtime_error(message)
        , _message(message)
        , _response(std::move(response))
        , _explanation(std::move(explanation))
        , _rendered(std::make_shared<folly::Synchronized<std::list<std::string>>>()) {}

    virtual auto kind() const -> error_kind {
        return error_kind::api;
    }

    auto message() const -> const std::string& {
        return _message;
    }

    auto response() const -> const std::shared_ptr<const http_response>& {
        return _response;
    }

    auto explanation() const -> const std::optional<std::string>& {
        return _explanation;
    }

    auto status_code() const -> std::optional<int> {
        if (_response) {
            return _response->status_code();
        }
        return std::nullopt;
    }

    auto is_client_error() const -> bool {
        auto code = status_code().value_or(0);
        return code >= 400 && code < 500;
    }

    auto is_server_error() const -> bool {
        auto code = status_code().value_or(0);
        return code >= 500 && code < 600;
    }

    auto is_error() const -> bool {
        return is_client_error() || is_server_error();
    }

    // The response reason replaces the constructor message once a response
    // is attached; the explanation is appended, never substituted.
    auto render() const -> std::string {
        auto msg = _message;

        if (_response) {
            msg = _response->reason();
        }

        if (is_client_error()) {
            msg = std::format("{} Client Error: {}", *status_code(), msg);
        } else if (is_server_error()) {
            msg = std::format("{} Server Error: {}", *status_code(), msg);
        }

        if (_explanation && !_explanation->empty()) {
            msg = std::format("{} ({})", msg, *_explanation);
        }

        return msg;
    }

    // Re-rendered on every call. A text is stored only when it differs from
    // the last one and stored texts are never released before the error, so
    // every pointer handed out stays valid. Copies share the store.
    auto what() const noexcept -> const char* override {
        try {
            auto text = render();
            auto rendered = _rendered->wlock();
            if (rendered->empty() || rendered->back() != text) {
                rendered->push_back(std::move(text));
            }
            return rendered->back().c_str();
        } catch (const std::exception&) {
            return std::runtime_error::what();
        }
    }

private:
    std::string _message;
    std::shared_ptr<const http_response> _response;
    std::optional<std::string> _explanation;
    std::shared_ptr<folly::Synchronized<std::list<std::string>>> _rendered;
};

// Resource not found on the service
class not_found : public api_error {
public:
    using api_error::api_error;

    auto kind() const -> error_kind override {
        return error_kind::not_found;
    }
};

// Image not found on the service
class image_not_found : public api_error {
public:
    using api_error::api_error;

    auto kind() const -> error_kind override {
        return error_kind::image_not_found;
    }
};

// Root kept for code written against the Docker-named hierarchy
class docker_exception : public std::runtime_error {
public:
    virtual auto kind() const -> error_kind = 0;

    virtual auto render() const -> std::string {
        return std::runtime_error::what();
    }

protected:
    explicit docker_exception(const std::string& message)
        : std::runtime_error(message) {}
};

// Root of the errors raised by this library itself
class podman_error : public docker_exception {
protected:
    explicit podman_error(const std::string& message)
        : docker_exception(message) {}
};

// Parameter to a library call was not valid
class invalid_argument : public podman_error {
public:
    explicit invalid_argument(const std::string& message)
        : podman_error(message) {}

    auto kind() const -> error_kind override {
        return error_kind::invalid_argument;
    }
};

// Image build finished without producing an image
class build_error : public podman_error {
public:
    build_error(const std::string& reason, std::vector<std::string> build_log)
        : podman_error(reason)
        , _reason(reason)
        , _build_log(std::move(build_log)) {}

    auto kind() const -> error_kind override {
        return error_kind::build;
    }

    auto reason() const -> const std::string& {
        return _reason;
    }

    auto build_log() const -> const std::vector<std::string>& {
        return _build_log;
    }

private:
    std::string _reason;
    std::vector<std::string> _build_log;
};

// Command as passed when the container was created
using command_line = std::variant<std::string, std::vector<std::string>>;

inline auto to_string(const command_line& command) -> std::string {
    if (const auto* single = std::get_if<std::string>(&command)) {
        return *single;
    }
    return detail::join(std::get<std::vector<std::string>>(command), " ");
}

/**
 * @brief Container exited with a non-zero status
 *
 * The message is composed once at construction; later changes to the
 * referenced container do not alter it.
 */
class container_error : public podman_error {
public:
    /**
     * @param container Container that reported the error, must outlive this error
     * @param exit_status Non-zero exit status, zero throws invalid_argument
     * @param command Command passed to the container when created
     * @param image Image used to create the container
     * @param stderr_lines Error output reported by the container
     */
    container_error(
        const podman::container& container,
        int exit_status,
        command_line command,
        std::string image,
        std::optional<std::vector<std::string>> stderr_lines = std::nullopt
    )
        : podman_error(compose_message(require_nonzero(exit_status), command, image, stderr_lines))
        , _container(&container)
        , _exit_status(exit_status)
        , _command(std::move(command))
        , _image(std::move(image))
        , _stderr_lines(std::move(stderr_lines)) {}

    auto kind() const -> error_kind override {
        return error_kind::container;
    }

    auto container() const -> const podman::container& {
        return *_container;
    }

    auto exit_status() const -> int {
        return _exit_status;
    }

    auto command() const -> const command_line& {
        return _command;
    }

    auto image() const -> const std::string& {
        return _image;
    }

    auto stderr_lines() const -> const std::optional<std::vector<std::string>>& {
        return _stderr_lines;
    }

private:
    const podman::container* _container;
    int _exit_status;
    command_line _command;
    std::string _image;
    std::optional<std::vector<std::string>> _stderr_lines;

    static auto require_nonzero(int exit_status) -> int {
        if (exit_status == 0) {
            throw invalid_argument("container_error requires a non-zero exit status");
        }
        return exit_status;
    }

    static auto compose_message(
        int exit_status,
        const command_line& command,
        const std::string& image,
        const std::optional<std::vector<std::string>>& stderr_lines
    ) -> std::string {
        std::string err;
        if (stderr_lines) {
            err = ": " + detail::join(*stderr_lines, "\n");
        }
        return std::format("Command '{}' in image '{}' returned non-zero exit status {}{}",
                           to_string(command), image, exit_status, err);
    }
};

/**
 * @brief Connection to the service could not be established
 *
 * Rendered as "|"-separated segments in a fixed order: message, host,
 * connection-related environment, cause. Only variables named in
 * connection_environment_names are ever rendered.
 */
class connection_error : public podman_error {
public:
    explicit connection_error(
        const std::string& message,
        std::optional<podman::environment> environment = std::nullopt,
        std::optional<std::string> host = std::nullopt,
        folly::exception_wrapper original_error = {}
    )
        : podman_error(compose(message, environment, host, original_error))
        , _message(message)
        , _environment(std::move(environment))
        , _host(std::move(host))
        , _original_error(std::move(original_error)) {}

    auto kind() const -> error_kind override {
        return error_kind::connection;
    }

    auto message() const -> const std::string& {
        return _message;
    }

    auto environment() const -> const std::optional<podman::environment>& {
        return _environment;
    }

    auto host() const -> const std::optional<std::string>& {
        return _host;
    }

    auto original_error() const -> const folly::exception_wrapper& {
        return _original_error;
    }

private:
    std::string _message;
    std::optional<podman::environment> _environment;
    std::optional<std::string> _host;
    folly::exception_wrapper _original_error;

    static auto describe(const folly::exception_wrapper& error) -> std::string {
        if (const auto* e = error.get_exception()) {
            return e->what();
        }
        return error.class_name().toStdString();
    }

    static auto compose(
        const std::string& message,
        const std::optional<podman::environment>& environment,
        const std::optional<std::string>& host,
        const folly::exception_wrapper& original_error
    ) -> std::string {
        std::vector<std::string> segments{message};

        if (host && !host->empty()) {
            segments.push_back(std::format("Host: {}", *host));
        }

        if (environment) {
            auto relevant = filter_connection_environment(*environment);
            if (!relevant.empty()) {
                std::string block = "Environment:";
                for (const auto& [key, value] : relevant) {
                    block += std::format("\n  {}={}", key, value);
                }
                segments.push_back(std::move(block));
            }
        }

        if (original_error) {
            segments.push_back(std::format("Caused by: {}", describe(original_error)));
        }

        return detail::join(segments, " | ");
    }
};

// Streamed payload could not be decoded; carries no HTTP context.
class stream_parse_error : public std::runtime_error {
public:
    explicit stream_parse_error(const std::string& reason)
        : std::runtime_error(reason)
        , _reason(reason) {}

    auto kind() const -> error_kind {
        return error_kind::stream_parse;
    }

    auto reason() const -> const std::string& {
        return _reason;
    }

    auto render() const -> std::string {
        return _reason;
    }

private:
    std::string _reason;
};

} // namespace podman
