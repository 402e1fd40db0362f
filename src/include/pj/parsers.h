// The sub-parsers of the value grammar, exposed so each can be used and
// tested on its own. Every parser takes the input left to parse and returns
// the rest of it together with what was produced.
#pragma once

#include <pj/result.h>
#include <pj/value.h>

#include <string>
#include <string_view>

namespace pj {
namespace parsers {

    // Literals
    Result<Value> null_value(std::string_view input);
    Result<Value> boolean(std::string_view input);
    Result<Value> number(std::string_view input);

    // A quoted string with escapes decoded (also used for object keys).
    Result<std::string> string_literal(std::string_view input);
    Result<Value> string(std::string_view input);

    // Never fails; yields the whitespace it skipped.
    Result<std::string_view> whitespace(std::string_view input);

    // array, object and value are mutually recursive.
    Result<Value> array(std::string_view input);
    Result<Value> object(std::string_view input);

    // One of the six alternatives, no surrounding whitespace.
    Result<Value> value_inner(std::string_view input);
    // value_inner with leading and trailing whitespace stripped.
    Result<Value> value(std::string_view input);

}  // namespace parsers
}  // namespace pj
