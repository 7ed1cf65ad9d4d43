#include <catch2/catch_test_macros.hpp>

#include <comicinfo/core/result.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <utility>

using namespace comicinfo;

// ===========================================================================
// Basic Ok / Err
// ===========================================================================

TEST_CASE("Result: Ok result holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err result holds error", "[result]") {
    auto r = Result<int, std::string>::Err("failure");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
}

TEST_CASE("Result: ValueOr returns default on Err", "[result]") {
    CHECK(Result<int, std::string>::Ok(42).ValueOr(0) == 42);
    CHECK(Result<int, std::string>::Err("fail").ValueOr(99) == 99);
}

// ===========================================================================
// Monadic helpers
// ===========================================================================

TEST_CASE("Result: AndThen chain stops at first Err", "[result]") {
    bool second_called = false;
    auto r = Result<int, std::string>::Ok(5)
        .AndThen([](int) -> Result<int, std::string> {
            return Result<int, std::string>::Err("stop here");
        })
        .AndThen([&second_called](int v) -> Result<int, std::string> {
            second_called = true;
            return Result<int, std::string>::Ok(v * 100);
        });
    REQUIRE(r.IsErr());
    CHECK(r.Error() == "stop here");
    CHECK_FALSE(second_called);
}

TEST_CASE("Result: Map changes type", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    auto r2 = std::move(r).Map([](int v) -> std::string { return std::to_string(v); });
    REQUIRE(r2.IsOk());
    CHECK(r2.Value() == "42");
}

TEST_CASE("Result: MapError rewrites only the error", "[result]") {
    auto ok = Result<int, std::string>::Ok(1)
        .MapError([](std::string e) { return "wrapped: " + e; });
    REQUIRE(ok.IsOk());
    CHECK(ok.Value() == 1);

    auto err = Result<int, std::string>::Err("boom")
        .MapError([](std::string e) { return "wrapped: " + e; });
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "wrapped: boom");
}

TEST_CASE("Result: move-only type in Ok", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(42));
    auto ptr = std::move(r).Value();
    REQUIRE(ptr != nullptr);
    CHECK(*ptr == 42);
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, std::string>::Ok();
    CHECK(ok.IsOk());
    auto err = Result<void, std::string>::Err("nope");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "nope");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: Parse and File messages are prefixed", "[error]") {
    CHECK(Error::Parse("Invalid XML syntax").ToString() == "Parse error: Invalid XML syntax");
    CHECK(Error::File("File does not exist: '/x.xml'").ToString() ==
          "File error: File does not exist: '/x.xml'");
    CHECK(Error::Schema("Page element missing required Image attribute").ToString() ==
          "Schema error: Page element missing required Image attribute");
}

TEST_CASE("Error: InvalidEnum lists the valid values", "[error]") {
    auto e = Error::InvalidEnum("Manga", "Maybe", {"Unknown", "No", "Yes"});
    CHECK(e.Is(ErrorKind::InvalidEnum));
    CHECK(e.ToString() ==
          "Invalid value 'Maybe' for field 'Manga'. Valid values are: Unknown, No, Yes");
}

TEST_CASE("Error: InvalidEnum with a single valid value has no separator", "[error]") {
    auto e = Error::InvalidEnum("Format", "Odd", {"Only"});
    CHECK(e.ToString() == "Invalid value 'Odd' for field 'Format'. Valid values are: Only");
}

TEST_CASE("Error: Range shows bounds", "[error]") {
    auto e = Error::Range("Year", "999", "1000", "9999");
    CHECK(e.ToString() == "Value '999' for field 'Year' is out of range (1000..9999)");
}

TEST_CASE("Error: TypeCoercion names the expected type", "[error]") {
    auto e = Error::TypeCoercion("Day", "not a number", "Int");
    CHECK(e.ToString() == "Cannot convert value 'not a number' for field 'Day' to Int");
}

TEST_CASE("Error: KindName is stable", "[error]") {
    CHECK(Error::Parse("").KindName() == "parse");
    CHECK(Error::File("").KindName() == "file");
    CHECK(Error::InvalidEnum("", "", {}).KindName() == "invalid_enum");
    CHECK(Error::Range("", "", "", "").KindName() == "range");
    CHECK(Error::TypeCoercion("", "", "").KindName() == "type_coercion");
    CHECK(Error::Schema("").KindName() == "schema");
}

TEST_CASE("Error: ToJson carries kind-specific members", "[error]") {
    auto j = nlohmann::json::parse(Error::Range("Month", "13", "1", "12").ToJson());
    REQUIRE(j.contains("error"));
    const auto& body = j["error"];
    CHECK(body["kind"] == "range");
    CHECK(body["field"] == "Month");
    CHECK(body["value"] == "13");
    CHECK(body["min"] == "1");
    CHECK(body["max"] == "12");
    CHECK_FALSE(body.contains("expected_type"));

    auto parse = nlohmann::json::parse(Error::Parse("bad").ToJson());
    CHECK(parse["error"]["kind"] == "parse");
    CHECK_FALSE(parse["error"].contains("field"));
}

TEST_CASE("Error: equality compares every member", "[error]") {
    CHECK(Error::Parse("a") == Error::Parse("a"));
    CHECK(Error::Parse("a") != Error::Parse("b"));
    CHECK(Error::Parse("a") != Error::File("a"));
}

TEST_CASE("Error: stream operator writes ToString", "[error]") {
    std::ostringstream oss;
    oss << Error::Parse("oops");
    CHECK(oss.str() == "Parse error: oops");
}
