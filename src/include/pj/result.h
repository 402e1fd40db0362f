#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace pj {

enum class ErrorKind {
    SyntaxMismatch,   // the input does not match the expected token
    MalformedEscape,  // bad \u escape in a string literal
    TruncatedInput    // input ended where a token was required
};

const char* error_kind_name(ErrorKind kind) noexcept;

// A parse failure. Sub-parsers only ever see a suffix of the document, so
// the position is recorded as the length of the input left at the failure
// point; locate() in <pj/json.h> turns it back into an offset.
struct ParseError {
    ErrorKind kind = ErrorKind::SyntaxMismatch;
    std::size_t remaining = 0;
    std::string expected;
    std::vector<std::string> context;  // innermost label first
    // Alternation must not try a sibling after a committed failure, even when
    // no input was consumed.
    bool committed = false;

    std::string message() const;
};

// Failure at the front of `input`. A syntax mismatch at the end of input is
// reported as truncated input.
ParseError make_error(std::string_view input, std::string expected,
                      ErrorKind kind = ErrorKind::SyntaxMismatch);

// True when `error` happened at the start of `input` without a cut, i.e. the
// parser that produced it consumed nothing and a sibling may be tried.
inline bool recoverable(const ParseError& error, std::string_view input) noexcept {
    return not error.committed and error.remaining == input.size();
}

template <typename T>
struct Parsed {
    std::string_view rest;
    T value;
};

// Outcome of running a parser: the unconsumed input plus the produced value,
// or a ParseError.
template <typename T>
class Result {
  public:
    using value_type = T;

    Result(Parsed<T> parsed) : state_(std::move(parsed)) {}
    Result(ParseError error) : state_(std::move(error)) {}

    bool ok() const noexcept { return std::holds_alternative<Parsed<T>>(state_); }
    explicit operator bool() const noexcept { return ok(); }

    std::string_view rest() const { return std::get<Parsed<T>>(state_).rest; }

    Parsed<T>& parsed() { return std::get<Parsed<T>>(state_); }
    const Parsed<T>& parsed() const { return std::get<Parsed<T>>(state_); }

    T& value() & { return parsed().value; }
    const T& value() const& { return parsed().value; }
    T&& value() && { return std::move(parsed().value); }

    ParseError& error() & { return std::get<ParseError>(state_); }
    const ParseError& error() const& { return std::get<ParseError>(state_); }
    ParseError&& error() && { return std::move(std::get<ParseError>(state_)); }

  private:
    std::variant<Parsed<T>, ParseError> state_;
};

template <typename T>
Result<T> success(std::string_view rest, T value) {
    return Parsed<T>{rest, std::move(value)};
}

}  // namespace pj
