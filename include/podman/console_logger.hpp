#pragma once

#include <podman/environment.hpp>
#include <podman/logger.hpp>

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace podman {

/**
 * @brief Structured logger writing one line per entry
 *
 * Lines look like "2024-05-01 12:00:00.123 WARNING: message [key=value]".
 * Entries at error and above go to the error stream, the rest to the output
 * stream. The minimum level may be changed while other threads log; output
 * lines never interleave.
 */
class console_logger {
public:
    explicit console_logger(log_level min_level = log_level::info)
        : console_logger(min_level, std::cout, std::cerr) {}

    console_logger(log_level min_level, std::ostream& out, std::ostream& err)
        : _min_level(min_level)
        , _out(&out)
        , _err(&err) {}

    // Level from PODMAN_LOG_LEVEL, info when unset or not a level name.
    static auto from_environment(const environment& env) -> console_logger {
        auto level = log_level::info;
        if (auto text = lookup(env, "PODMAN_LOG_LEVEL")) {
            level = parse_log_level(*text).value_or(log_level::info);
        }
        return console_logger(level);
    }

    console_logger(console_logger&& other) noexcept
        : _min_level(other._min_level.load())
        , _out(other._out)
        , _err(other._err) {}

    console_logger& operator=(console_logger&&) = delete;
    console_logger(const console_logger&) = delete;
    console_logger& operator=(const console_logger&) = delete;

    auto log(log_level level, std::string_view message) -> void {
        write(level, message, nullptr);
    }

    auto log(log_level level, std::string_view message, const log_fields& key_value_pairs) -> void {
        write(level, message, &key_value_pairs);
    }

    auto trace(std::string_view message) -> void { write(log_level::trace, message, nullptr); }
    auto debug(std::string_view message) -> void { write(log_level::debug, message, nullptr); }
    auto info(std::string_view message) -> void { write(log_level::info, message, nullptr); }
    auto warning(std::string_view message) -> void { write(log_level::warning, message, nullptr); }
    auto error(std::string_view message) -> void { write(log_level::error, message, nullptr); }
    auto critical(std::string_view message) -> void { write(log_level::critical, message, nullptr); }

    auto set_min_level(log_level level) -> void {
        _min_level.store(level);
    }

    [[nodiscard]] auto get_min_level() const -> log_level {
        return _min_level.load();
    }

    [[nodiscard]] auto enabled(log_level level) const -> bool {
        return level >= _min_level.load();
    }

private:
    std::atomic<log_level> _min_level;
    std::ostream* _out;
    std::ostream* _err;
    std::mutex _mutex;

    auto write(log_level level, std::string_view message, const log_fields* fields) -> void {
        if (!enabled(level)) {
            return;
        }

        // Formatted before locking so the stream is held only for the write.
        std::ostringstream line;
        line << timestamp() << ' ' << level << ": " << message;
        if (fields != nullptr) {
            for (const auto& [key, value] : *fields) {
                line << " [" << key << '=' << value << ']';
            }
        }
        line << '\n';

        auto& stream = level >= log_level::error ? *_err : *_out;
        std::lock_guard<std::mutex> lock(_mutex);
        stream << line.str();
        stream.flush();
    }

    static auto timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto seconds = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&seconds, &local);

        std::ostringstream oss;
        oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << millis.count();
        return oss.str();
    }
};

static_assert(diagnostic_logger<console_logger>,
    "console_logger must satisfy diagnostic_logger concept");

} // namespace podman
