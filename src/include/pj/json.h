#pragma once

#include <pj/result.h>
#include <pj/value.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace pj {

// Parse one value from the front of `text`, skipping whitespace around it.
// Whatever follows the value is left in the result's rest(); use
// parse_document() to reject it.
Result<Value> parse(std::string_view text);

// Like parse(), but anything other than whitespace after the value is an
// error ("extra data after value").
Result<Value> parse_document(std::string_view text);

// 1-based line and column of a failure inside the text it came from.
struct Location {
    std::size_t offset = 0;
    std::size_t line = 1;
    std::size_t column = 1;
};

Location locate(std::string_view text, const ParseError& error);

// Error message with location, the offending source line, a caret under the
// failing column and the constructs that were being parsed.
std::string format_error(std::string_view text, const ParseError& error);

class ParseException : public std::runtime_error {
  public:
    ParseException(const std::string& what, ParseError error, Location location)
        : std::runtime_error(what), error_(std::move(error)), location_(location) {}

    const ParseError& error() const noexcept { return error_; }
    const Location& location() const noexcept { return location_; }

  private:
    ParseError error_;
    Location location_;
};

// parse_document() that throws ParseException on failure.
Value parse_json(const std::string& text);

namespace json_literals {
    inline Value operator"" _json(const char* s, std::size_t len) {
        return parse_json(std::string(s, len));
    }
}

}  // namespace pj
