/**
 * Example: Error Handling with the Podman client error layer
 *
 * This example demonstrates:
 * 1. Turning HTTP error responses into api_error / not_found
 * 2. Reporting a misconfigured connection with its environment context
 * 3. Build and container failures carrying their output
 *
 * Every caught error is classified and reported through console_logger, the
 * way a caller would decide whether to retry or to surface the failure.
 */

#include <podman/build_output.hpp>
#include <podman/connection_config.hpp>
#include <podman/console_logger.hpp>
#include <podman/container.hpp>
#include <podman/container_run.hpp>
#include <podman/environment.hpp>
#include <podman/error_reporter.hpp>
#include <podman/exceptions.hpp>
#include <podman/http_response.hpp>
#include <podman/response_errors.hpp>

#include <folly/init/Init.h>

#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {
    constexpr const char* test_image = "quay.io/podman/hello";
    constexpr const char* test_container_id = "3f2a9d41c07be85a6d1e";
    constexpr const char* test_container_name = "quirky_lamport";
    constexpr const char* missing_container_body =
        R"({"cause":"no such container","message":"no container with name or ID \"web\" found: no such container","response":404})";
    constexpr const char* locked_database_body =
        R"({"cause":"database is locked","message":"cannot start container: database is locked","response":500})";
    constexpr const char* failing_build_output =
        "{\"stream\":\"STEP 1/2: FROM quay.io/podman/hello\\n\"}\n"
        "{\"stream\":\"STEP 2/2: RUN /bin/false\\n\"}\n"
        "{\"error\":\"building at STEP \\\"RUN /bin/false\\\": exit status 1\"}\n";
}

// Scenario 1: HTTP error responses
auto test_response_errors(podman::error_reporter<podman::console_logger>& reporter) -> bool {
    std::cout << "\nTest 1: HTTP Error Responses\n";

    bool saw_not_found = false;
    bool saw_server_error = false;

    try {
        podman::raise_for_status(
            std::make_shared<const podman::static_response>(404, "Not Found", missing_container_body));
    } catch (const podman::not_found& e) {
        auto classification = reporter.report(e);
        saw_not_found = !classification.should_retry;
        std::cout << std::format("  Cause: {}\n", e.message());
    }

    try {
        podman::raise_for_status(
            std::make_shared<const podman::static_response>(500, "Internal Server Error", locked_database_body));
    } catch (const podman::api_error& e) {
        auto classification = reporter.report(e);
        saw_server_error = e.is_server_error() && classification.should_retry;
    }

    if (saw_not_found && saw_server_error) {
        std::cout << "  ✓ Client errors are final, server errors are retryable\n";
        return true;
    }
    std::cerr << "  ✗ Failed: unexpected classification of HTTP errors\n";
    return false;
}

// Scenario 2: connection settings taken from the environment
auto test_connection_configuration(podman::error_reporter<podman::console_logger>& reporter) -> bool {
    std::cout << "\nTest 2: Connection Configuration\n";

    try {
        auto config = podman::connection_config::from_environment(podman::environment_snapshot());
        std::cout << std::format("  Host from process environment: {}\n", config.host);
    } catch (const podman::connection_error& e) {
        reporter.report(e);
    }

    podman::environment broken = {
        {"CONTAINER_HOST", "ftp://podman.example"},
        {"CONTAINER_TLS_VERIFY", "1"},
        {"HOME", "/home/example"}
    };

    try {
        podman::connection_config::from_environment(broken);
    } catch (const podman::connection_error& e) {
        reporter.report(e);
        std::cout << "  ✓ Misconfigured host reported with its environment\n";
        return true;
    }

    std::cerr << "  ✗ Failed: unsupported scheme was accepted\n";
    return false;
}

// Scenario 3: operations that ran but did not succeed
auto test_operation_failures(podman::error_reporter<podman::console_logger>& reporter) -> bool {
    std::cout << "\nTest 3: Build and Container Failures\n";

    bool build_failed = false;
    try {
        podman::collect_build_output(failing_build_output);
    } catch (const podman::build_error& e) {
        reporter.report(e);
        std::cout << std::format("  Build log kept {} line(s)\n", e.build_log().size());
        build_failed = e.build_log().size() == 2;
    }

    podman::container ctr(test_container_id, test_container_name, test_image, "exited");
    bool container_failed = false;
    try {
        podman::check_exit_status(ctr, 127, std::vector<std::string>{"/bin/missing", "--help"}, test_image,
                                  std::vector<std::string>{"exec: /bin/missing: not found"});
    } catch (const podman::container_error& e) {
        reporter.report(e);
        std::cout << std::format("  Container {} exited with {}\n", e.container().short_id(), e.exit_status());
        container_failed = true;
    }

    if (build_failed && container_failed) {
        std::cout << "  ✓ Operation failures carry their output\n";
        return true;
    }
    std::cerr << "  ✗ Failed: operation failures were not raised\n";
    return false;
}

auto main(int argc, char* argv[]) -> int {
    folly::Init init(&argc, &argv);

    std::cout << "========================================\n";
    std::cout << "  Error Handling Example\n";
    std::cout << "========================================\n";

    auto logger = podman::console_logger::from_environment(podman::environment_snapshot());
    podman::error_reporter reporter(logger);

    int failed_scenarios = 0;

    if (!test_response_errors(reporter)) failed_scenarios++;
    if (!test_connection_configuration(reporter)) failed_scenarios++;
    if (!test_operation_failures(reporter)) failed_scenarios++;

    std::cout << "\n========================================\n";
    if (failed_scenarios > 0) {
        std::cout << std::format("  {} scenario(s) failed\n", failed_scenarios);
        std::cout << "========================================\n";
        return 1;
    }

    std::cout << "  All scenarios passed!\n";
    std::cout << "========================================\n";
    return 0;
}
