#include <catch2/catch_test_macros.hpp>
#include <ragline/core/types.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace ragline;

namespace {

Result<int> parse_positive(const std::string& text) {
    int value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return Error{ErrorCode::InvalidArgument, "not a number: " + text};
        }
        value = value * 10 + (c - '0');
    }
    if (value == 0) {
        return ErrorCode::InvalidArgument;
    }
    return value;
}

} // namespace

TEST_CASE("Result - value and error access", "[core][result]") {
    SECTION("holds a value") {
        auto r = parse_positive("42");
        REQUIRE(r);
        CHECK(r.value() == 42);
        CHECK_THROWS_AS(r.error(), std::runtime_error);
    }

    SECTION("holds an error with message") {
        auto r = parse_positive("4x");
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
        CHECK(r.error().message == "not a number: 4x");
        CHECK_THROWS_AS(r.value(), std::runtime_error);
        CHECK(r.value_or(7) == 7);
    }

    SECTION("bare error code gets its default message") {
        auto r = parse_positive("0");
        REQUIRE_FALSE(r);
        CHECK(r.error() == ErrorCode::InvalidArgument);
        CHECK(r.error().message == errorToString(ErrorCode::InvalidArgument));
    }

    SECTION("rvalue value() moves the payload out") {
        Result<std::vector<int>> r(std::vector<int>{1, 2, 3});
        auto moved = std::move(r).value();
        CHECK(moved.size() == 3);
    }
}

TEST_CASE("Result<void> - success and failure", "[core][result]") {
    Result<void> ok;
    CHECK(ok);
    CHECK_NOTHROW(ok.value());

    Result<void> failed = Error{ErrorCode::NotFound, "missing"};
    CHECK_FALSE(failed);
    CHECK(failed.error().code == ErrorCode::NotFound);
    CHECK_THROWS_AS(failed.value(), std::runtime_error);
}
