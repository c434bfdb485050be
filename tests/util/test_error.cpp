#include "util/error.hpp"

#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace snapgate;

namespace {

auto half_if_even(int value) -> Result<int> {
    if (value % 2 != 0) {
        return make_error<int>(ErrorCode::protocol_validation, "odd value");
    }
    return value / 2;
}

auto quarter(int value) -> Result<int> {
    int half = SNAPGATE_TRY(half_if_even(value));
    return SNAPGATE_TRY(half_if_even(half));
}

} // namespace

TEST_CASE("ErrorCode enum values are correct", "[error]") {
    REQUIRE(static_cast<int>(ErrorCode::ok) == 0);
    REQUIRE(ErrorCode::file_not_found != ErrorCode::ok);
    REQUIRE(ErrorCode::transfer_timeout != ErrorCode::transport_error);
}

TEST_CASE("error_code_name returns correct strings", "[error]") {
    REQUIRE(std::string(error_code_name(ErrorCode::ok)) == "ok");
    REQUIRE(std::string(error_code_name(ErrorCode::file_not_found)) == "file_not_found");
    REQUIRE(std::string(error_code_name(ErrorCode::protocol_validation)) ==
            "protocol_validation");
    REQUIRE(std::string(error_code_name(ErrorCode::capacity_exceeded)) == "capacity_exceeded");
    REQUIRE(std::string(error_code_name(ErrorCode::storage_error)) == "storage_error");
    REQUIRE(std::string(error_code_name(ErrorCode::unknown_error)) == "unknown_error");
}

TEST_CASE("Error struct construction", "[error]") {
    SECTION("Basic construction") {
        Error error{ErrorCode::file_not_found, "Test message"};
        REQUIRE(error.code == ErrorCode::file_not_found);
        REQUIRE(error.message == "Test message");
        REQUIRE(error.location.file_name() != nullptr);
    }

    SECTION("Construction with custom source location") {
        auto loc = std::source_location::current();
        Error error{ErrorCode::parse_error, "Parse failed", loc};
        REQUIRE(error.code == ErrorCode::parse_error);
        REQUIRE(error.location.line() == loc.line());
    }
}

TEST_CASE("Result<T> success and error cases", "[error]") {
    SECTION("Success with value") {
        auto result = Result<int>{42};
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Error result") {
        auto result = make_error<int>(ErrorCode::storage_error, "disk full");
        REQUIRE(!result.has_value());
        REQUIRE(result.error().code == ErrorCode::storage_error);
        REQUIRE(result.error().message == "disk full");
    }

    SECTION("Source location is captured") {
        auto line_before = static_cast<uint32_t>(__LINE__);
        auto error_result = make_error<int>(ErrorCode::unknown_error, "Test");
        auto line_after = static_cast<uint32_t>(__LINE__);

        REQUIRE(error_result.error().location.line() > line_before);
        REQUIRE(error_result.error().location.line() < line_after);
    }
}

TEST_CASE("ResultPtr helpers", "[error]") {
    auto ok = make_result_ptr(std::make_unique<int>(7));
    REQUIRE(ok.has_value());
    REQUIRE(**ok == 7);

    auto failed = make_result_ptr_error<int>(ErrorCode::bind_failed, "port in use");
    REQUIRE(!failed.has_value());
    REQUIRE(failed.error().code == ErrorCode::bind_failed);
}

TEST_CASE("SNAPGATE_TRY propagates the first error", "[error]") {
    SECTION("All steps succeed") {
        auto result = quarter(8);
        REQUIRE(result.has_value());
        REQUIRE(*result == 2);
    }

    SECTION("Inner failure is returned unchanged") {
        auto result = quarter(6);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().code == ErrorCode::protocol_validation);
        REQUIRE(result.error().message == "odd value");
    }
}

TEST_CASE("Result<T> chaining operations", "[error]") {
    SECTION("Transform success case") {
        auto result = Result<int>{10};
        auto transformed = result.transform([](int value) { return value * 2; });
        REQUIRE(transformed.value() == 20);
    }

    SECTION("and_then error propagation") {
        auto result = make_error<int>(ErrorCode::parse_error, "Bad input");
        auto chained = result.and_then([](int value) -> Result<std::string> {
            return Result<std::string>{std::to_string(value)};
        });

        REQUIRE(!chained.has_value());
        REQUIRE(chained.error().code == ErrorCode::parse_error);
    }
}
