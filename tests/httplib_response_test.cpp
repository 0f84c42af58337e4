#define BOOST_TEST_MODULE httplib_response_test
#include <boost/test/unit_test.hpp>

#include <podman/exceptions.hpp>
#include <podman/httplib_response.hpp>
#include <podman/response_errors.hpp>

#include <httplib.h>

#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace {
    constexpr const char* test_bind_address = "127.0.0.1";
    constexpr const char* container_missing_body =
        R"({"cause":"no such container","message":"no container with name or ID \"web\" found: no such container","response":404})";
}

BOOST_AUTO_TEST_SUITE(httplib_response_test)

BOOST_AUTO_TEST_CASE(test_adapter_reads_status_reason_body, * boost::unit_test::timeout(15)) {
    auto native = std::make_shared<httplib::Response>();
    native->status = 409;
    native->reason = "Conflict";
    native->body = "container already exists";

    podman::httplib_response response(native);

    BOOST_CHECK_EQUAL(response.status_code(), 409);
    BOOST_CHECK_EQUAL(response.reason(), "Conflict");
    BOOST_CHECK_EQUAL(response.text(), "container already exists");
    BOOST_CHECK(!response.ok());
}

BOOST_AUTO_TEST_CASE(test_adapter_falls_back_to_standard_reason, * boost::unit_test::timeout(15)) {
    auto native = std::make_shared<httplib::Response>();
    native->status = 404;

    podman::httplib_response response(native);

    BOOST_CHECK_EQUAL(response.reason(), "Not Found");
}

BOOST_AUTO_TEST_CASE(test_error_follows_shared_native_response, * boost::unit_test::timeout(15)) {
    auto native = std::make_shared<httplib::Response>();
    native->status = 404;
    native->reason = "Not Found";

    podman::api_error error("ignored", std::make_shared<const podman::httplib_response>(native));
    BOOST_CHECK(error.is_client_error());

    native->status = 500;
    native->reason = "Internal Server Error";

    BOOST_CHECK(error.is_server_error());
    BOOST_CHECK_EQUAL(error.render(), "500 Server Error: Internal Server Error");
}

BOOST_AUTO_TEST_CASE(test_transport_failure_raises_api_error_without_status, * boost::unit_test::timeout(15)) {
    httplib::Result failed(nullptr, httplib::Error::Connection);

    try {
        podman::check_result(std::move(failed), "tcp://127.0.0.1:1");
        BOOST_FAIL("Expected api_error");
    } catch (const podman::api_error& e) {
        BOOST_CHECK(!e.status_code().has_value());
        BOOST_CHECK(!e.is_error());
        BOOST_CHECK(e.render().starts_with("HTTP request to tcp://127.0.0.1:1 failed: "));
    }
}

BOOST_AUTO_TEST_CASE(test_not_found_from_live_server, * boost::unit_test::timeout(30)) {
    httplib::Server server;
    server.Get("/v5.0.0/libpod/containers/web/json", [](const httplib::Request&, httplib::Response& res) {
        res.status = 404;
        res.set_content(container_missing_body, "application/json");
    });

    auto port = server.bind_to_any_port(test_bind_address);
    BOOST_REQUIRE(port > 0);
    std::thread server_thread([&server] { server.listen_after_bind(); });
    server.wait_until_ready();

    httplib::Client client(test_bind_address, port);
    auto host = std::string("tcp://") + test_bind_address + ":" + std::to_string(port);

    std::optional<podman::not_found> caught;
    try {
        auto response = podman::check_result(client.Get("/v5.0.0/libpod/containers/web/json"), host);
        podman::raise_for_status(response);
    } catch (const podman::not_found& e) {
        caught = e;
    } catch (const std::exception& e) {
        BOOST_ERROR("Unexpected exception: " << e.what());
    }

    server.stop();
    server_thread.join();

    BOOST_REQUIRE(caught.has_value());
    BOOST_CHECK_EQUAL(caught->status_code().value(), 404);
    BOOST_CHECK_EQUAL(caught->message(), "no such container");
    BOOST_CHECK_EQUAL(caught->render(),
        "404 Client Error: Not Found (no container with name or ID \"web\" found: no such container)");
}

BOOST_AUTO_TEST_SUITE_END()
