#define BOOST_TEST_MODULE error_classification_test
#include <boost/test/unit_test.hpp>

#include <podman/container.hpp>
#include <podman/error_classification.hpp>
#include <podman/exceptions.hpp>
#include <podman/http_response.hpp>

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {
    auto response(int status, const std::string& reason) -> std::shared_ptr<podman::static_response> {
        return std::make_shared<podman::static_response>(status, reason);
    }
}

BOOST_AUTO_TEST_SUITE(error_classification_test)

BOOST_AUTO_TEST_CASE(test_not_found_types, * boost::unit_test::timeout(15)) {
    auto generic = podman::classify_error(podman::not_found("missing", response(404, "Not Found")));
    auto image = podman::classify_error(podman::image_not_found("missing", response(404, "Not Found")));

    BOOST_CHECK(generic.fault == podman::fault_type::not_found);
    BOOST_CHECK(image.fault == podman::fault_type::not_found);
    BOOST_CHECK(!generic.should_retry);
    BOOST_CHECK_EQUAL(generic.status_code.value(), 404);
}

BOOST_AUTO_TEST_CASE(test_client_and_server_faults, * boost::unit_test::timeout(15)) {
    auto client = podman::classify_error(podman::api_error("bad", response(409, "Conflict")));
    auto server = podman::classify_error(podman::api_error("bad", response(500, "Internal Server Error")));

    BOOST_CHECK(client.fault == podman::fault_type::client_fault);
    BOOST_CHECK(!client.should_retry);
    BOOST_CHECK_EQUAL(client.status_code.value(), 409);

    BOOST_CHECK(server.fault == podman::fault_type::server_fault);
    BOOST_CHECK(server.should_retry);
    BOOST_CHECK_EQUAL(server.status_code.value(), 500);
}

// A 404 raised as a plain api_error is still a client fault, not a not_found.
BOOST_AUTO_TEST_CASE(test_classification_is_type_based, * boost::unit_test::timeout(15)) {
    auto result = podman::classify_error(podman::api_error("not found", response(404, "Not Found")));

    BOOST_CHECK(result.fault == podman::fault_type::client_fault);
}

BOOST_AUTO_TEST_CASE(test_transport_failure_without_status, * boost::unit_test::timeout(15)) {
    auto result = podman::classify_error(podman::api_error("Connection reset"));

    BOOST_CHECK(result.fault == podman::fault_type::unknown);
    BOOST_CHECK(result.should_retry);
    BOOST_CHECK(!result.status_code.has_value());
}

BOOST_AUTO_TEST_CASE(test_library_native_errors, * boost::unit_test::timeout(15)) {
    podman::container ctr("abc", "name", "alpine");

    auto connection = podman::classify_error(podman::connection_error("cannot connect"));
    auto build = podman::classify_error(podman::build_error("failed", {}));
    auto run = podman::classify_error(podman::container_error(ctr, 1, std::string("false"), "alpine"));
    auto argument = podman::classify_error(podman::invalid_argument("bad"));
    auto stream = podman::classify_error(podman::stream_parse_error("bad frame"));

    BOOST_CHECK(connection.fault == podman::fault_type::connection_fault);
    BOOST_CHECK(connection.should_retry);
    BOOST_CHECK(build.fault == podman::fault_type::operation_fault);
    BOOST_CHECK(!build.should_retry);
    BOOST_CHECK(run.fault == podman::fault_type::operation_fault);
    BOOST_CHECK(argument.fault == podman::fault_type::invalid_argument);
    BOOST_CHECK(stream.fault == podman::fault_type::stream_decode_fault);
    BOOST_CHECK(!stream.should_retry);
}

BOOST_AUTO_TEST_CASE(test_foreign_exception, * boost::unit_test::timeout(15)) {
    auto result = podman::classify_error(std::logic_error("bug"));

    BOOST_CHECK(result.fault == podman::fault_type::unknown);
    BOOST_CHECK(!result.should_retry);
    BOOST_CHECK_EQUAL(result.description, "Unknown error: bug");
}

BOOST_AUTO_TEST_CASE(test_stream_output, * boost::unit_test::timeout(15)) {
    std::ostringstream out;
    out << podman::fault_type::server_fault << " " << podman::error_kind::image_not_found;

    BOOST_CHECK_EQUAL(out.str(), "server_fault image_not_found");
}

BOOST_AUTO_TEST_SUITE_END()
