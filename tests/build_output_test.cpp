#define BOOST_TEST_MODULE build_output_test
#include <boost/test/unit_test.hpp>

#include <podman/build_output.hpp>
#include <podman/exceptions.hpp>

#include <string>
#include <vector>

namespace {
    constexpr const char* test_image_id = "7a3f9c1e5b2d";

    constexpr const char* successful_build =
        "{\"stream\":\"STEP 1/2: FROM alpine\\n\"}\n"
        "{\"stream\":\"STEP 2/2: RUN echo built\\n\"}\n"
        "{\"stream\":\"built\\n\"}\n"
        "{\"stream\":\"COMMIT example\\n\"}\n"
        "{\"stream\":\"7a3f9c1e5b2d\\n\"}\n";

    constexpr const char* failing_build =
        "{\"stream\":\"STEP 1/2: FROM alpine\\n\"}\n"
        "{\"stream\":\"STEP 2/2: RUN false\\n\"}\n"
        "{\"error\":\"building at STEP \\\"RUN false\\\": exit status 1\"}\n"
        "{\"stream\":\"never read\\n\"}\n";
}

BOOST_AUTO_TEST_SUITE(build_output_test)

BOOST_AUTO_TEST_CASE(test_successful_build, * boost::unit_test::timeout(15)) {
    auto result = podman::collect_build_output(successful_build);

    BOOST_CHECK_EQUAL(result.image_id, test_image_id);
    std::vector<std::string> expected_log = {
        "STEP 1/2: FROM alpine",
        "STEP 2/2: RUN echo built",
        "built",
        "COMMIT example",
        "7a3f9c1e5b2d"
    };
    BOOST_CHECK(result.log == expected_log);
}

BOOST_AUTO_TEST_CASE(test_aux_id_is_used, * boost::unit_test::timeout(15)) {
    auto result = podman::collect_build_output(
        "{\"stream\":\"Step 1/1 : FROM busybox\\n\"}\n"
        "{\"aux\":{\"ID\":\"sha256:4b6f1e2a9c3d8e7f6a5b4c3d2e1f0a9b8c7d6e5f4a3b2c1d0e9f8a7b6c5d4e3f\"}}\n");

    BOOST_CHECK_EQUAL(result.image_id, "4b6f1e2a9c3d8e7f6a5b4c3d2e1f0a9b8c7d6e5f4a3b2c1d0e9f8a7b6c5d4e3f");
}

BOOST_AUTO_TEST_CASE(test_error_field_raises_build_error_with_log, * boost::unit_test::timeout(15)) {
    try {
        podman::collect_build_output(failing_build);
        BOOST_FAIL("Expected build_error");
    } catch (const podman::build_error& e) {
        BOOST_CHECK_EQUAL(e.reason(), "building at STEP \"RUN false\": exit status 1");
        BOOST_CHECK_EQUAL(e.render(), e.reason());
        std::vector<std::string> expected_log = {"STEP 1/2: FROM alpine", "STEP 2/2: RUN false"};
        BOOST_CHECK(e.build_log() == expected_log);
    }
}

BOOST_AUTO_TEST_CASE(test_missing_image_id, * boost::unit_test::timeout(15)) {
    try {
        podman::collect_build_output("{\"stream\":\"STEP 1/1: FROM scratch\\n\"}\n");
        BOOST_FAIL("Expected build_error");
    } catch (const podman::build_error& e) {
        BOOST_CHECK_EQUAL(e.reason(), "Build failed: no image id reported");
        BOOST_REQUIRE_EQUAL(e.build_log().size(), 1u);
    }
}

BOOST_AUTO_TEST_CASE(test_short_numeric_lines_are_not_ids, * boost::unit_test::timeout(15)) {
    BOOST_CHECK_THROW(
        podman::collect_build_output("{\"stream\":\"10\\n\"}\n{\"stream\":\"cafe\\n\"}\n"),
        podman::build_error);
}

BOOST_AUTO_TEST_CASE(test_malformed_chunk_keeps_captured_log, * boost::unit_test::timeout(15)) {
    try {
        podman::collect_build_output(
            "{\"stream\":\"STEP 1/2: FROM alpine\\n\"}\n"
            "not json\n");
        BOOST_FAIL("Expected build_error");
    } catch (const podman::build_error& e) {
        BOOST_CHECK_EQUAL(e.reason(), "Malformed JSON chunk at line 2: not json");
        BOOST_REQUIRE_EQUAL(e.build_log().size(), 1u);
        BOOST_CHECK_EQUAL(e.build_log().front(), "STEP 1/2: FROM alpine");
    }
}

BOOST_AUTO_TEST_SUITE_END()
