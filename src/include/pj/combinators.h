// Generic parser building blocks. A parser is any callable taking a
// std::string_view and returning a pj::Result.
#pragma once

#include <pj/result.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace pj {

template <typename P>
using parser_output_t = typename std::invoke_result_t<const P&, std::string_view>::value_type;

inline bool is_json_space(char c) noexcept {
    return c == ' ' or c == '\n' or c == '\r' or c == '\t';
}

inline std::string_view skip_whitespace(std::string_view input) noexcept {
    std::size_t n = 0;
    while (n < input.size() and is_json_space(input[n])) ++n;
    return input.substr(n);
}

// Matches `literal` exactly.
inline auto tag(std::string_view literal) {
    return [literal](std::string_view input) -> Result<std::string_view> {
        if (input.substr(0, literal.size()) == literal)
            return success(input.substr(literal.size()), input.substr(0, literal.size()));
        return make_error(input, "'" + std::string(literal) + "'");
    };
}

inline auto character(char c) {
    return [c](std::string_view input) -> Result<char> {
        if (not input.empty() and input.front() == c) return success(input.substr(1), c);
        return make_error(input, std::string("'") + c + "'");
    };
}

// Runs `p`, then swallows the whitespace that follows it.
template <typename P>
auto ws(P p) {
    return [p](std::string_view input) -> Result<parser_output_t<P>> {
        auto r = p(input);
        if (r) r.parsed().rest = skip_whitespace(r.parsed().rest);
        return r;
    };
}

// Labels failures of `p` with the construct being parsed.
template <typename P>
auto context(const char* label, P p) {
    return [label, p](std::string_view input) -> Result<parser_output_t<P>> {
        auto r = p(input);
        if (not r) r.error().context.emplace_back(label);
        return r;
    };
}

template <typename P, typename F>
auto map(P p, F f) {
    using out_t = std::decay_t<std::invoke_result_t<const F&, parser_output_t<P>&&>>;
    return [p, f](std::string_view input) -> Result<out_t> {
        auto r = p(input);
        if (not r) return std::move(r).error();
        auto rest = r.rest();
        return success(rest, f(std::move(r).value()));
    };
}

// open, then p, then close; keeps only the output of p.
template <typename Open, typename P, typename Close>
auto delimited(Open open, P p, Close close) {
    return [open, p, close](std::string_view input) -> Result<parser_output_t<P>> {
        auto o = open(input);
        if (not o) return std::move(o).error();
        auto r = p(o.rest());
        if (not r) return r;
        auto c = close(r.rest());
        if (not c) return std::move(c).error();
        r.parsed().rest = c.rest();
        return r;
    };
}

template <typename First, typename Sep, typename Second>
auto separated_pair(First first, Sep sep, Second second) {
    using pair_t = std::pair<parser_output_t<First>, parser_output_t<Second>>;
    return [first, sep, second](std::string_view input) -> Result<pair_t> {
        auto a = first(input);
        if (not a) return std::move(a).error();
        auto s = sep(a.rest());
        if (not s) return std::move(s).error();
        auto b = second(s.rest());
        if (not b) return std::move(b).error();
        auto rest = b.rest();
        return success(rest, pair_t(std::move(a).value(), std::move(b).value()));
    };
}

// Zero or more `p` separated by `sep`. A missing first element gives an empty
// list; once a separator matched, the element after it is required.
template <typename Sep, typename P>
auto separated_list(Sep sep, P p) {
    using item_t = parser_output_t<P>;
    return [sep, p](std::string_view input) -> Result<std::vector<item_t>> {
        std::vector<item_t> items;
        auto first = p(input);
        if (not first) {
            if (recoverable(first.error(), input)) return success(input, std::move(items));
            return std::move(first).error();
        }
        std::string_view rest = first.rest();
        items.push_back(std::move(first).value());
        while (true) {
            auto s = sep(rest);
            if (not s) {
                if (recoverable(s.error(), rest)) return success(rest, std::move(items));
                return std::move(s).error();
            }
            auto next = p(s.rest());
            if (not next) return std::move(next).error();
            rest = next.rest();
            items.push_back(std::move(next).value());
        }
    };
}

template <typename P>
auto alt(P p) {
    return p;
}

// Ordered choice. The next alternative is tried only when the previous one
// failed without consuming input; the last failure is reported.
template <typename P, typename... Rest>
auto alt(P p, Rest... rest) {
    auto tail = alt(rest...);
    return [p, tail](std::string_view input) -> Result<parser_output_t<P>> {
        auto r = p(input);
        if (r or not recoverable(r.error(), input)) return r;
        return tail(input);
    };
}

}  // namespace pj
