#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <pj/parsers.h>

using namespace pj;
using Catch::Approx;

TEST_CASE("null literal consumes exactly four characters", "[literals][null]") {
    auto r = parsers::null_value("null, 1");
    REQUIRE(r.ok());
    REQUIRE(r.value().is_null());
    REQUIRE(r.rest() == ", 1");
}

TEST_CASE("null literal rejects other text without consuming", "[literals][null]") {
    std::string_view input = "nul";
    auto r = parsers::null_value(input);
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error().remaining == input.size());
    REQUIRE_FALSE(r.error().committed);
}

TEST_CASE("boolean literals", "[literals][boolean]") {
    auto t = parsers::boolean("true]");
    REQUIRE(t.ok());
    REQUIRE(t.value() == Value(true));
    REQUIRE(t.rest() == "]");

    auto f = parsers::boolean("false");
    REQUIRE(f.ok());
    REQUIRE(f.value() == Value(false));
    REQUIRE(f.rest().empty());

    REQUIRE_FALSE(parsers::boolean("True").ok());
    REQUIRE_FALSE(parsers::boolean("").ok());
}

TEST_CASE("integers parse as single precision numbers", "[literals][number]") {
    auto r = parsers::number("123,");
    REQUIRE(r.ok());
    REQUIRE(r.value().as_number() == 123.0f);
    REQUIRE(r.rest() == ",");
}

TEST_CASE("number literal forms", "[literals][number]") {
    REQUIRE(parsers::number("-42").value().as_number() == -42.0f);
    REQUIRE(parsers::number("+7").value().as_number() == 7.0f);
    REQUIRE(parsers::number("0.5").value().as_number() == 0.5f);
    REQUIRE(parsers::number(".25").value().as_number() == 0.25f);
    REQUIRE(parsers::number("3.").value().as_number() == 3.0f);
    REQUIRE(parsers::number("1e3").value().as_number() == 1000.0f);
    REQUIRE(parsers::number("2.5E-1").value().as_number() == Approx(0.25f));
    REQUIRE(parsers::number("-1.5e+2").value().as_number() == -150.0f);
}

TEST_CASE("number consumes only the literal", "[literals][number]") {
    auto r = parsers::number("12.5abc");
    REQUIRE(r.ok());
    REQUIRE(r.value().as_number() == 12.5f);
    REQUIRE(r.rest() == "abc");

    auto dotted = parsers::number("1.2.3");
    REQUIRE(dotted.ok());
    REQUIRE(dotted.rest() == ".3");
}

TEST_CASE("number rejects text that is not a literal", "[literals][number]") {
    for (std::string_view input : {"abc", "-", "+", ".", "-.e1", ""}) {
        auto r = parsers::number(input);
        INFO(input);
        REQUIRE_FALSE(r.ok());
        REQUIRE(r.error().remaining == input.size());
        REQUIRE_FALSE(r.error().committed);
    }
}

TEST_CASE("exponent marker without digits is a committed failure", "[literals][number]") {
    auto r = parsers::number("1e");
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error().committed);
    REQUIRE(r.error().kind == ErrorKind::TruncatedInput);

    auto sign = parsers::number("1e+x");
    REQUIRE_FALSE(sign.ok());
    REQUIRE(sign.error().committed);
    REQUIRE(sign.error().kind == ErrorKind::SyntaxMismatch);
}

TEST_CASE("numbers beyond single precision are rejected", "[literals][number]") {
    auto r = parsers::number("1e39");
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error().committed);
}

TEST_CASE("numbers too small for single precision round to zero", "[literals][number]") {
    auto r = parsers::number("1e-50]");
    REQUIRE(r.ok());
    REQUIRE(r.value() == Value(0.0f));
    REQUIRE(r.rest() == "]");

    auto negative = parsers::number("-0.00001e-45");
    REQUIRE(negative.ok());
    REQUIRE(negative.value().as_number() == 0.0f);

    auto huge_exponent = parsers::number("123456789e-100000000000");
    REQUIRE(huge_exponent.ok());
    REQUIRE(huge_exponent.value().as_number() == 0.0f);

    REQUIRE_FALSE(parsers::number("0.0001e43").ok());
}
