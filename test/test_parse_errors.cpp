#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <pj/json.h>

using namespace pj;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("unrecognised leading character", "[errors]") {
    auto r = parse("  @");
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error().kind == ErrorKind::SyntaxMismatch);
    REQUIRE(r.error().expected == "value");
    REQUIRE(r.error().remaining == 1);
}

TEST_CASE("empty and blank input is truncated", "[errors]") {
    for (const char* text : {"", "   \n\t"}) {
        auto r = parse(text);
        INFO(text);
        REQUIRE_FALSE(r.ok());
        REQUIRE(r.error().kind == ErrorKind::TruncatedInput);
    }
}

TEST_CASE("a failure after the first token is not masked by later alternatives", "[errors]") {
    auto r = parse("[1,");
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error().kind == ErrorKind::TruncatedInput);
    REQUIRE(r.error().expected == "value");
    REQUIRE(r.error().context == std::vector<std::string>{"array"});
}

TEST_CASE("object missing its closing brace", "[errors]") {
    auto r = parse(R"({"a": 1)");
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error().kind == ErrorKind::TruncatedInput);

    auto wrong_close = parse(R"({"a": 1])");
    REQUIRE_FALSE(wrong_close.ok());
    REQUIRE(wrong_close.error().kind == ErrorKind::SyntaxMismatch);
    REQUIRE(wrong_close.error().expected == "'}'");
}

TEST_CASE("malformed escape deep inside a document", "[errors]") {
    auto r = parse(R"({"list": ["ok", "bad \uZZZZ"]})");
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error().kind == ErrorKind::MalformedEscape);
    REQUIRE(r.error().context == std::vector<std::string>{"array", "object item", "object"});
}

TEST_CASE("locate reports 1-based line and column", "[errors]") {
    std::string text = "{\n  \"a\": 1,\n  \"b\" 2\n}";
    auto r = parse(text);
    REQUIRE_FALSE(r.ok());
    Location loc = locate(text, r.error());
    REQUIRE(loc.line == 3);
    REQUIRE(loc.column == 7);
    REQUIRE(text[loc.offset] == '2');
}

TEST_CASE("format_error shows the line, a caret and the context", "[errors]") {
    std::string text = "{\n  \"a\": 1,\n  \"b\" 2\n}";
    auto r = parse(text);
    REQUIRE_FALSE(r.ok());
    std::string msg = format_error(text, r.error());
    REQUIRE_THAT(msg, ContainsSubstring("syntax mismatch: expected ':'"));
    REQUIRE_THAT(msg, ContainsSubstring("(line 3, column 7)"));
    REQUIRE_THAT(msg, ContainsSubstring("\n  \"b\" 2\n      ^"));
    REQUIRE_THAT(msg, ContainsSubstring("(while parsing object item, in object)"));
}

TEST_CASE("format_error at end of input", "[errors]") {
    std::string text = "[1, 2";
    auto r = parse(text);
    REQUIRE_FALSE(r.ok());
    std::string msg = format_error(text, r.error());
    REQUIRE_THAT(msg, ContainsSubstring("truncated input: expected ']'"));
    REQUIRE_THAT(msg, ContainsSubstring("(line 1, column 6)"));
    REQUIRE_THAT(msg, ContainsSubstring("[1, 2\n     ^"));
}

TEST_CASE("parse_json throws with the rendered message", "[errors]") {
    try {
        parse_json(R"({"obj": [1, 2, 3)");
        FAIL("expected parse to throw");
    } catch (const ParseException& e) {
        std::string msg = e.what();
        REQUIRE_THAT(msg, ContainsSubstring("expected ']'"));
        REQUIRE(e.error().kind == ErrorKind::TruncatedInput);
        REQUIRE(e.location().line == 1);
        REQUIRE(e.location().column == 17);
    }
}

TEST_CASE("parse_json rejects extra data after the value", "[errors]") {
    REQUIRE_THROWS_AS(parse_json("true false"), ParseException);
    REQUIRE_THROWS_WITH(parse_json("1 2"), ContainsSubstring("extra data after value"));
}

TEST_CASE("JSON5 syntax is not accepted", "[errors]") {
    REQUIRE_FALSE(parse_document("{a: 1}").ok());
    REQUIRE_FALSE(parse_document("[1, 2,]").ok());
    REQUIRE_FALSE(parse_document("// comment\n1").ok());
    REQUIRE_FALSE(parse_document("'single'").ok());
}

TEST_CASE("error kinds have readable names", "[errors]") {
    REQUIRE(std::string(error_kind_name(ErrorKind::MalformedEscape)) == "malformed escape");
    ParseError e = make_error("x", "'y'");
    REQUIRE(e.message() == "syntax mismatch: expected 'y'");
}
