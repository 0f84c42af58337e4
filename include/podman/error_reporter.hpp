#pragma once

#include <podman/error_classification.hpp>
#include <podman/logger.hpp>

#include <exception>
#include <sstream>
#include <string>

namespace podman {

// Logs caught errors for callers that decided to surface them.
// Retryable faults are logged as warnings, everything else as errors.
template<diagnostic_logger Logger>
class error_reporter {
public:
    explicit error_reporter(Logger& logger)
        : _logger(logger) {}

    auto report(const std::exception& e) -> error_classification {
        auto classification = classify_error(e);

        std::ostringstream fault;
        fault << classification.fault;
        auto fault_name = fault.str();
        std::string retry = classification.should_retry ? "true" : "false";
        std::string message = e.what();

        auto level = classification.should_retry ? log_level::warning : log_level::error;

        if (classification.status_code) {
            auto status = std::to_string(*classification.status_code);
            _logger.log(level, message, {
                {"fault", fault_name},
                {"retry", retry},
                {"status_code", status}
            });
        } else {
            _logger.log(level, message, {
                {"fault", fault_name},
                {"retry", retry}
            });
        }

        return classification;
    }

private:
    Logger& _logger;
};

} // namespace podman
