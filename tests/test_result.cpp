#include <catch2/catch.hpp>
#include <stencil/result.hpp>
#include <memory>
#include <string>

using namespace stencil;

static Result<int> try_double(Result<int> input) {
    STENCIL_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Result<std::string> try_chain(bool fail_first) {
    auto first = fail_first
        ? Result<int>::err(StencilError{StencilError::SourceUnavailable, "first failed"})
        : Result<int>::ok(10);
    STENCIL_TRY(first);
    Status second = ok_status();
    STENCIL_TRY(second);
    return Result<std::string>::ok(std::to_string(first.value()));
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(StencilError{StencilError::TemplateNotFound, "missing item"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(r.is_ok());
    REQUIRE(r.error().code == StencilError::TemplateNotFound);
    REQUIRE(r.error().message == "missing item");
}

TEST_CASE("Implicit conversion from StencilError", "[result]") {
    Result<std::string> r = StencilError{StencilError::IO, "disk full"};
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StencilError::IO);
}

TEST_CASE("Bool conversion", "[result]") {
    auto ok = Result<int>::ok(1);
    auto err = Result<int>::err(StencilError{StencilError::IO, "fail"});
    REQUIRE(static_cast<bool>(ok) == true);
    REQUIRE(static_cast<bool>(err) == false);
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(StencilError{StencilError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("map() transforms Ok value", "[result]") {
    auto r = Result<int>::ok(5);
    auto mapped = r.map([](int x) { return x * 2; });
    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.value() == 10);
}

TEST_CASE("map() passes through Err", "[result]") {
    auto r = Result<int>::err(StencilError{StencilError::Parse, "bad input"});
    bool called = false;
    auto mapped = r.map([&](int x) { called = true; return x * 2; });
    REQUIRE(mapped.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(mapped.error().code == StencilError::Parse);
    REQUIRE(mapped.error().message == "bad input");
}

TEST_CASE("and_then() chains Ok results", "[result]") {
    auto r = Result<int>::ok(5);
    auto chained = r.and_then([](int x) {
        return Result<int>::ok(x + 10);
    });
    REQUIRE(chained.is_ok());
    REQUIRE(chained.value() == 15);
}

TEST_CASE("and_then() short-circuits on Err", "[result]") {
    auto r = Result<int>::err(StencilError{StencilError::Integrity, "bad digest"});
    bool called = false;
    auto chained = r.and_then([&](int x) {
        called = true;
        return Result<int>::ok(x + 10);
    });
    REQUIRE(chained.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(chained.error().code == StencilError::Integrity);
}

TEST_CASE("STENCIL_TRY propagates errors", "[result]") {
    auto input = Result<int>::err(StencilError{StencilError::Parse, "syntax error"});
    auto output = try_double(input);
    REQUIRE(output.is_err());
    REQUIRE(output.error().code == StencilError::Parse);
    REQUIRE(output.error().message == "syntax error");
}

TEST_CASE("STENCIL_TRY passes through Ok", "[result]") {
    auto output = try_double(Result<int>::ok(7));
    REQUIRE(output.is_ok());
    REQUIRE(output.value() == 14);
}

TEST_CASE("STENCIL_TRY across result types", "[result]") {
    auto ok = try_chain(false);
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value() == "10");

    auto err = try_chain(true);
    REQUIRE(err.is_err());
    REQUIRE(err.error().message == "first failed");
}

TEST_CASE("Status (void result)", "[result]") {
    REQUIRE(ok_status().is_ok());

    auto s = Status::err(StencilError{StencilError::Configuration, "bad config"});
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == StencilError::Configuration);
}

TEST_CASE("Result with move-only type (unique_ptr)", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(r.is_ok());
    REQUIRE(*r.value() == 99);

    auto owned = std::move(r).value();
    REQUIRE(*owned == 99);
}

TEST_CASE("StencilError format() with hint", "[error]") {
    StencilError e{StencilError::TemplateNotFound, "template not found: vue:starter",
                   "check the registry list"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[TemplateNotFound]") != std::string::npos);
    REQUIRE(formatted.find("vue:starter") != std::string::npos);
    REQUIRE(formatted.find("hint: check the registry list") != std::string::npos);
}

TEST_CASE("StencilError format() without hint", "[error]") {
    StencilError e{StencilError::Parse, "unexpected token"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[Parse]: unexpected token");
}

TEST_CASE("StencilError code_name() for all codes", "[error]") {
    REQUIRE(std::string(StencilError::code_name(StencilError::IO)) == "IO");
    REQUIRE(std::string(StencilError::code_name(StencilError::Parse)) == "Parse");
    REQUIRE(std::string(StencilError::code_name(StencilError::Configuration)) == "Configuration");
    REQUIRE(std::string(StencilError::code_name(StencilError::SourceUnavailable)) == "SourceUnavailable");
    REQUIRE(std::string(StencilError::code_name(StencilError::Integrity)) == "IntegrityError");
    REQUIRE(std::string(StencilError::code_name(StencilError::TemplateNotFound)) == "TemplateNotFound");
    REQUIRE(std::string(StencilError::code_name(StencilError::TemplateProcessing)) == "TemplateProcessing");
    REQUIRE(std::string(StencilError::code_name(StencilError::InvalidArg)) == "InvalidArg");
}

TEST_CASE("Only unavailable sources and missing templates are recoverable", "[error]") {
    REQUIRE(StencilError{StencilError::SourceUnavailable, ""}.is_recoverable());
    REQUIRE(StencilError{StencilError::TemplateNotFound, ""}.is_recoverable());
    REQUIRE_FALSE(StencilError{StencilError::Integrity, ""}.is_recoverable());
    REQUIRE_FALSE(StencilError{StencilError::TemplateProcessing, ""}.is_recoverable());
    REQUIRE_FALSE(StencilError{StencilError::Configuration, ""}.is_recoverable());
    REQUIRE_FALSE(StencilError{StencilError::IO, ""}.is_recoverable());
}
