#include <catch2/catch_test_macros.hpp>

#include "prism/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        prism::Error err(prism::ErrorCode::NotFound, "resource not found");
        CHECK(err.code() == prism::ErrorCode::NotFound);
        CHECK(err.message() == "resource not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "resource not found");
    }

    SECTION("error with detail") {
        prism::Error err(prism::ErrorCode::LaunchFailure,
                         "chrome did not start", "exit status 127");
        CHECK(err.code() == prism::ErrorCode::LaunchFailure);
        CHECK(err.message() == "chrome did not start");
        CHECK(err.detail() == "exit status 127");
        CHECK(err.what() == "chrome did not start: exit status 127");
    }
}

TEST_CASE("make_error helpers", "[error]") {
    SECTION("two-argument form") {
        auto err = prism::make_error(prism::ErrorCode::PoolExhausted, "no browser available");
        CHECK(err.code() == prism::ErrorCode::PoolExhausted);
        CHECK(err.message() == "no browser available");
        CHECK(err.detail() == "");
    }

    SECTION("three-argument form") {
        auto err = prism::make_error(prism::ErrorCode::PageLoadTimeout,
                                     "page did not load", "after 30000ms");
        CHECK(err.code() == prism::ErrorCode::PageLoadTimeout);
        CHECK(err.what() == "page did not load: after 30000ms");
    }
}

TEST_CASE("Result type success case", "[error]") {
    prism::Result<int> result = 42;

    REQUIRE(result.has_value());
    CHECK(*result == 42);
}

TEST_CASE("Result type error case", "[error]") {
    prism::Result<int> result = std::unexpected(
        prism::make_error(prism::ErrorCode::InvalidArgument, "bad value"));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == prism::ErrorCode::InvalidArgument);
    CHECK(result.error().message() == "bad value");
}

TEST_CASE("Fail converts to any Result type", "[error]") {
    prism::Result<std::string> text =
        prism::make_fail(prism::make_error(prism::ErrorCode::CaptureFailure, "blank"));
    REQUIRE_FALSE(text.has_value());
    CHECK(text.error().code() == prism::ErrorCode::CaptureFailure);

    prism::Result<void> ok = prism::ok_result();
    CHECK(ok.has_value());
}

TEST_CASE("error_code_to_string uses wire names", "[error]") {
    using prism::ErrorCode;
    CHECK(prism::error_code_to_string(ErrorCode::ComplianceRejected) == "COMPLIANCE_REJECTED");
    CHECK(prism::error_code_to_string(ErrorCode::PoolExhausted) == "POOL_EXHAUSTED");
    CHECK(prism::error_code_to_string(ErrorCode::PoolShutdown) == "POOL_SHUTDOWN");
    CHECK(prism::error_code_to_string(ErrorCode::LaunchFailure) == "LAUNCH_FAILURE");
    CHECK(prism::error_code_to_string(ErrorCode::PageLoadTimeout) == "PAGE_LOAD_TIMEOUT");
    CHECK(prism::error_code_to_string(ErrorCode::CaptureFailure) == "CAPTURE_FAILURE");
    CHECK(prism::error_code_to_string(ErrorCode::InternalError) == "INTERNAL_ERROR");
}
