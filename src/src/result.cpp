#include <pj/result.h>

namespace pj {

const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::SyntaxMismatch: return "syntax mismatch";
        case ErrorKind::MalformedEscape: return "malformed escape";
        case ErrorKind::TruncatedInput: return "truncated input";
    }
    return "parse error";
}

std::string ParseError::message() const {
    std::string msg = error_kind_name(kind);
    msg += ": expected ";
    msg += expected;
    return msg;
}

ParseError make_error(std::string_view input, std::string expected, ErrorKind kind) {
    ParseError error;
    error.kind = (kind == ErrorKind::SyntaxMismatch and input.empty()) ? ErrorKind::TruncatedInput
                                                                       : kind;
    error.remaining = input.size();
    error.expected = std::move(expected);
    return error;
}

}  // namespace pj
