#include <catch2/catch.hpp>
#include <lastgood/result.hpp>
#include <string>

using namespace lastgood;

static Result<int> try_double(Result<int> input) {
    LASTGOOD_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(LastgoodError{LastgoodError::NotFound, "missing item"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LastgoodError::NotFound);
    REQUIRE(r.error().message == "missing item");
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(LastgoodError{LastgoodError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("LASTGOOD_TRY propagates errors and passes values", "[result]") {
    REQUIRE(try_double(Result<int>::ok(21)).value() == 42);

    auto r = try_double(LastgoodError{LastgoodError::Parse, "bad input"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "bad input");
}

TEST_CASE("with_context wraps Err and leaves Ok alone", "[result]") {
    auto ok = Result<int>::ok(1).with_context("outer");
    REQUIRE(ok.is_ok());

    auto err = Result<int>::err(LastgoodError{LastgoodError::Network, "connection refused"})
        .with_context("error making request");
    REQUIRE(err.is_err());
    REQUIRE(err.error().message == "error making request");
    REQUIRE(err.error().causes.size() == 1);
    REQUIRE(err.error().causes[0] == "connection refused");
}

TEST_CASE("ok_status is Ok", "[result]") {
    REQUIRE(ok_status().is_ok());
}

// ===== Error formatting =====

TEST_CASE("format includes code and message", "[error]") {
    LastgoodError e{LastgoodError::Config, "unknown profile"};
    REQUIRE(e.format() == "error[Config]: unknown profile");
}

TEST_CASE("format includes hint", "[error]") {
    LastgoodError e{LastgoodError::InvalidArg, "bad flag", "see --help"};
    REQUIRE(e.format() == "error[InvalidArg]: bad flag\n  hint: see --help");
}

TEST_CASE("context builds an outermost-first cause chain", "[error]") {
    LastgoodError e{LastgoodError::Parse, "expected '='"};
    e.context("error reading manifest from https://example.invalid/a.toml");
    e.context("search aborted");

    REQUIRE(e.code == LastgoodError::Parse);
    REQUIRE(e.message == "search aborted");
    REQUIRE(e.causes.size() == 2);
    REQUIRE(e.format() ==
        "error[Parse]: search aborted\n"
        "\tcaused by: error reading manifest from https://example.invalid/a.toml\n"
        "\tcaused by: expected '='");
}

TEST_CASE("caused_by appends innermost cause", "[error]") {
    LastgoodError e{LastgoodError::Network, "error making request"};
    e.caused_by("Could not resolve host");
    REQUIRE(e.causes.back() == "Could not resolve host");
}
