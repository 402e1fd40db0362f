#include <pj/parsers.h>
#include <pj/combinators.h>

#include <charconv>
#include <cstdint>
#include <system_error>
#include <utility>
#include <vector>

namespace pj {
namespace parsers {

namespace {
    bool is_digit(char c) { return c >= '0' and c <= '9'; }

    int hex_val(char c) {
        if ('0' <= c and c <= '9') return c - '0';
        if ('a' <= c and c <= 'f') return 10 + (c - 'a');
        if ('A' <= c and c <= 'F') return 10 + (c - 'A');
        return -1;
    }

    // encode a Unicode scalar value as UTF-8 into out
    void encode_utf8(std::uint32_t cp, std::string& out) {
        if (cp <= 0x7F) {
            out.push_back(static_cast<char>(cp));
        } else if (cp <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    char unescape(char c) {
        switch (c) {
            case 'n': return '\n';
            case 'r': return '\r';
            case 't': return '\t';
            default: return c;  // '"', '\\' and unknown escapes stand for themselves
        }
    }

    // The four hex digits of a \u escape; `input` starts right after the 'u'.
    Result<std::uint32_t> hex4(std::string_view input) {
        std::uint32_t cp = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            int hv = k < input.size() ? hex_val(input[k]) : -1;
            if (hv < 0)
                return make_error(input.substr(k), "4 hex digits in \\u escape",
                                  ErrorKind::MalformedEscape);
            cp = (cp << 4) | static_cast<std::uint32_t>(hv);
        }
        return success(input.substr(4), cp);
    }

    // An escape sequence; `input` starts at the backslash. Yields the UTF-8
    // bytes it decodes to.
    Result<std::string> escape_sequence(std::string_view input) {
        std::string_view rest = input.substr(1);
        if (rest.empty()) return make_error(rest, "escaped character");
        std::string out;
        if (rest.front() != 'u') {
            out.push_back(unescape(rest.front()));
            return success(rest.substr(1), std::move(out));
        }
        auto hex = hex4(rest.substr(1));
        if (not hex) return std::move(hex).error();
        std::uint32_t cp = hex.value();
        if (cp >= 0xD800 and cp <= 0xDFFF)
            return make_error(input, "unicode scalar value (unpaired surrogate)",
                              ErrorKind::MalformedEscape);
        encode_utf8(cp, out);
        return success(hex.rest(), std::move(out));
    }

    // Length of the run of decimal digits at `pos`.
    std::size_t digits_at(std::string_view input, std::size_t pos) {
        std::size_t n = pos;
        while (n < input.size() and is_digit(input[n])) ++n;
        return n - pos;
    }

    // True when a scanned float literal (no leading '+') is smaller than 1 in
    // magnitude, i.e. an out-of-range result from it is an underflow.
    bool magnitude_below_one(std::string_view literal) {
        if (not literal.empty() and literal.front() == '-') literal.remove_prefix(1);
        std::size_t e = literal.find_first_of("eE");
        std::string_view mantissa = literal.substr(0, e);
        long exponent = 0;
        if (e != std::string_view::npos) {
            std::size_t k = e + 1;
            bool negative = k < literal.size() and literal[k] == '-';
            if (k < literal.size() and (literal[k] == '+' or literal[k] == '-')) ++k;
            for (; k < literal.size(); ++k) {
                // clamp, only the sign of the final magnitude matters
                if (exponent < 100000) exponent = exponent * 10 + (literal[k] - '0');
            }
            if (negative) exponent = -exponent;
        }
        std::size_t dot = mantissa.find('.');
        long int_len = static_cast<long>(dot == std::string_view::npos ? mantissa.size() : dot);
        long position = 0;  // index of the digit among all mantissa digits
        for (char c : mantissa) {
            if (c == '.') continue;
            // leading digit is worth 10^(int_len - position - 1 + exponent)
            if (c != '0') return int_len - position - 1 + exponent < 0;
            ++position;
        }
        return true;
    }
}  // namespace

Result<Value> null_value(std::string_view input) {
    static const auto parser = map(tag("null"), [](std::string_view) { return Value(); });
    return parser(input);
}

Result<Value> boolean(std::string_view input) {
    static const auto parser = alt(map(tag("true"), [](std::string_view) { return Value(true); }),
                                   map(tag("false"), [](std::string_view) { return Value(false); }));
    return parser(input);
}

Result<Value> number(std::string_view input) {
    std::size_t i = 0;
    if (i < input.size() and (input[i] == '+' or input[i] == '-')) ++i;
    std::size_t int_digits = digits_at(input, i);
    i += int_digits;
    if (i < input.size() and input[i] == '.') {
        std::size_t frac_digits = digits_at(input, i + 1);
        // "1." is a literal, a lone "." is not
        if (int_digits == 0 and frac_digits == 0) return make_error(input, "number");
        i += 1 + frac_digits;
    } else if (int_digits == 0) {
        return make_error(input, "number");
    }
    if (i < input.size() and (input[i] == 'e' or input[i] == 'E')) {
        ++i;
        if (i < input.size() and (input[i] == '+' or input[i] == '-')) ++i;
        std::size_t exp_digits = digits_at(input, i);
        if (exp_digits == 0) {
            auto error = make_error(input.substr(i), "exponent digits");
            error.committed = true;
            return error;
        }
        i += exp_digits;
    }

    std::string_view literal = input.substr(0, i);
    // from_chars does not take a leading '+'
    if (literal.front() == '+') literal.remove_prefix(1);
    float x = 0.0f;
    auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), x);
    if (ec == std::errc::result_out_of_range and magnitude_below_one(literal)) {
        // too small for a float: rounds to zero, keeping the sign
        x = literal.front() == '-' ? -0.0f : 0.0f;
    } else if (ec != std::errc() or ptr != literal.data() + literal.size()) {
        auto error = make_error(input, "number within single precision range");
        error.committed = true;
        return error;
    }
    return success(input.substr(i), Value(x));
}

Result<std::string> string_literal(std::string_view input) {
    if (input.empty() or input.front() != '"') return make_error(input, "'\"'");
    std::string out;
    std::string_view rest = input.substr(1);
    while (true) {
        if (rest.empty()) return make_error(rest, "closing '\"'");
        char c = rest.front();
        if (c == '"') return success(rest.substr(1), std::move(out));
        if (c != '\\') {
            out.push_back(c);
            rest.remove_prefix(1);
            continue;
        }
        auto escaped = escape_sequence(rest);
        if (not escaped) return std::move(escaped).error();
        out += escaped.value();
        rest = escaped.rest();
    }
}

Result<Value> string(std::string_view input) {
    static const auto parser =
        map(string_literal, [](std::string s) { return Value(std::move(s)); });
    return parser(input);
}

Result<std::string_view> whitespace(std::string_view input) {
    std::string_view rest = skip_whitespace(input);
    return success(rest, input.substr(0, input.size() - rest.size()));
}

Result<Value> array(std::string_view input) {
    // ws after '[' lets an empty array hold whitespace: value strips the
    // whitespace around each element, and there is no element in "[ ]"
    static const auto parser = context(
        "array", map(delimited(ws(character('[')), separated_list(character(','), value),
                               character(']')),
                     [](std::vector<Value> items) { return Value(std::move(items)); }));
    return parser(input);
}

Result<Value> object(std::string_view input) {
    using entry_t = std::pair<std::string, Value>;
    static const auto parser = context(
        "object",
        map(delimited(ws(character('{')),
                      separated_list(ws(character(',')),
                                     context("object item",
                                             separated_pair(ws(string_literal),
                                                            ws(character(':')), value))),
                      character('}')),
            [](std::vector<entry_t> entries) {
                Value::object_t out;
                // a repeated key keeps the last value
                for (auto& entry : entries)
                    out.insert_or_assign(std::move(entry.first), std::move(entry.second));
                return Value(std::move(out));
            }));
    return parser(input);
}

Result<Value> value_inner(std::string_view input) {
    static const auto alternatives = alt(null_value, boolean, number, string, array, object);
    auto r = alternatives(input);
    if (not r and recoverable(r.error(), input)) return make_error(input, "value");
    return r;
}

Result<Value> value(std::string_view input) {
    static const auto parser = delimited(whitespace, value_inner, whitespace);
    return parser(input);
}

}  // namespace parsers
}  // namespace pj
