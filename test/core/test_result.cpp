#include <catch2/catch_test_macros.hpp>

#include <tabedit/core/result.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace tabedit;

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
    REQUIRE_FALSE(r.IsOk());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
}

// ===========================================================================
// Copy and move
// ===========================================================================

TEST_CASE("Result: copies keep the value or the error", "[result]") {
    auto original = Result<std::vector<std::string>, Error>::Ok({"Sales", "Product"});
    auto copy = original;
    REQUIRE(copy.IsOk());
    CHECK(copy.Value() == original.Value());

    auto failed = Result<std::vector<std::string>, Error>::Err(
        Error{"Find", "Sales/Nope", "Object does not exist", ErrorCategory::NotFound});
    auto failed_copy = failed;
    CHECK(failed_copy.Error() == failed.Error());
}

TEST_CASE("Result: rvalue accessors move the payload out", "[result]") {
    auto ok = Result<std::string, Error>::Ok("[Total Sales] - [Total Cost]");
    CHECK(std::move(ok).Value() == "[Total Sales] - [Total Cost]");

    auto err = Result<std::string, Error>::Err(
        Error{"Tokenize", "", "Unterminated string literal", ErrorCategory::ParseError});
    auto moved = std::move(err).Error();
    CHECK(moved.category == ErrorCategory::ParseError);
}

TEST_CASE("Result: move-only value", "[result]") {
    auto r = Result<std::unique_ptr<int>, Error>::Ok(std::make_unique<int>(7));
    auto moved = std::move(r);
    REQUIRE(moved.IsOk());
    auto ptr = std::move(moved).Value();
    REQUIRE(ptr != nullptr);
    CHECK(*ptr == 7);
}

// ===========================================================================
// Result<void, E>
// ===========================================================================

TEST_CASE("Result<void>: Ok has no error", "[result]") {
    auto r = Result<void, std::string>::Ok();
    CHECK(r.IsOk());
    CHECK(static_cast<bool>(r));
}

TEST_CASE("Result<void>: Err carries error", "[result]") {
    auto r = Result<void, std::string>::Err("broken");
    REQUIRE(r.IsErr());
    CHECK(r.Error() == "broken");
    CHECK(std::move(r).Error() == "broken");
}

// ===========================================================================
// Error struct
// ===========================================================================

TEST_CASE("Error: ToString with target", "[error]") {
    Error e{"Rename", "Sales/Amount", "Name 'Cost' is already used", ErrorCategory::NameConflict};
    CHECK(e.ToString() == "Rename [Sales/Amount]: Name 'Cost' is already used");
}

TEST_CASE("Error: ToString without target", "[error]") {
    Error e{"LoadModel", "", "Document is empty", ErrorCategory::ParseError};
    CHECK(e.ToString() == "LoadModel: Document is empty");
}

TEST_CASE("Error: default category is Internal", "[error]") {
    Error e;
    CHECK(e.category == ErrorCategory::Internal);
    CHECK(e.ExitCode() == 99);
}

TEST_CASE("Error: ExitCode mapping", "[error]") {
    auto code = [](ErrorCategory c) { return Error{"Op", "", "m", c}.ExitCode(); };
    CHECK(code(ErrorCategory::NameConflict) == 2);
    CHECK(code(ErrorCategory::InvalidValue) == 3);
    CHECK(code(ErrorCategory::InvalidMove) == 4);
    CHECK(code(ErrorCategory::NotFound) == 5);
    CHECK(code(ErrorCategory::ParseError) == 6);
    CHECK(code(ErrorCategory::ConfigError) == 7);
    CHECK(code(ErrorCategory::Internal) == 99);
}

TEST_CASE("Error: CategoryName", "[error]") {
    CHECK(Error{"Op", "", "m", ErrorCategory::NameConflict}.CategoryName() == "name_conflict");
    CHECK(Error{"Op", "", "m", ErrorCategory::InvalidMove}.CategoryName() == "invalid_move");
    CHECK(Error{"Op", "", "m", ErrorCategory::ConfigError}.CategoryName() == "config");
}

TEST_CASE("Error: ToJson contains required fields", "[error]") {
    Error e{"Move", "Sales/Total", "Destination is not a table", ErrorCategory::InvalidMove};
    auto json = e.ToJson();
    CHECK(json.find(R"("category":"invalid_move")") != std::string::npos);
    CHECK(json.find(R"("operation":"Move")") != std::string::npos);
    CHECK(json.find(R"("target":"Sales/Total")") != std::string::npos);
    CHECK(json.find(R"("exit_code":4)") != std::string::npos);
}

TEST_CASE("Error: ToJson omits empty target", "[error]") {
    Error e{"ConfigLoader", "", "Missing model", ErrorCategory::ConfigError};
    CHECK(e.ToJson().find("target") == std::string::npos);
}

TEST_CASE("Error: ToJson escapes special characters", "[error]") {
    Error e{"SetExpression", "Sales/M", "Bad \"quote\" and back\\slash\n", ErrorCategory::ParseError};
    auto json = e.ToJson();
    CHECK(json.find(R"(\"quote\")") != std::string::npos);
    CHECK(json.find(R"(back\\slash)") != std::string::npos);
    CHECK(json.find(R"(\n)") != std::string::npos);
}

TEST_CASE("Error: equality includes category", "[error]") {
    Error a{"Rename", "T", "m", ErrorCategory::NameConflict};
    Error b{"Rename", "T", "m", ErrorCategory::InvalidValue};
    CHECK(a != b);
    b.category = ErrorCategory::NameConflict;
    CHECK(a == b);
}

TEST_CASE("Result with Error type", "[result][error]") {
    auto r = Result<int, Error>::Err(Error{"Find", "X", "Object does not exist", ErrorCategory::NotFound});
    REQUIRE(r.IsErr());
    CHECK(r.Error().ExitCode() == 5);
}
