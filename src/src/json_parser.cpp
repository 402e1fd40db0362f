#include <pj/json.h>
#include <pj/parsers.h>

#include <sstream>
#include <utility>

namespace pj {

Result<Value> parse(std::string_view text) {
    return parsers::value(text);
}

Result<Value> parse_document(std::string_view text) {
    auto r = parse(text);
    if (r and not r.rest().empty())
        return make_error(r.rest(), "end of input (extra data after value)");
    return r;
}

Location locate(std::string_view text, const ParseError& error) {
    Location loc;
    loc.offset = error.remaining < text.size() ? text.size() - error.remaining : 0;
    for (std::size_t pos = 0; pos < loc.offset; ++pos) {
        if (text[pos] == '\n') {
            ++loc.line;
            loc.column = 1;
        } else {
            ++loc.column;
        }
    }
    return loc;
}

std::string format_error(std::string_view text, const ParseError& error) {
    Location loc = locate(text, error);

    std::size_t line_start = loc.offset - (loc.column - 1);
    std::size_t line_end = text.find('\n', line_start);
    if (line_end == std::string_view::npos) line_end = text.size();
    std::string_view line_text = text.substr(line_start, line_end - line_start);
    if (not line_text.empty() and line_text.back() == '\r') line_text.remove_suffix(1);

    // columns count bytes
    std::size_t caret_pos = loc.column - 1;
    if (caret_pos > line_text.size()) caret_pos = line_text.size();

    std::ostringstream ss;
    ss << error.message() << " (line " << loc.line << ", column " << loc.column << ")\n";
    ss << line_text << "\n" << std::string(caret_pos, ' ') << '^';
    if (not error.context.empty()) {
        ss << "\n(while parsing ";
        for (std::size_t k = 0; k < error.context.size(); ++k) {
            if (k > 0) ss << ", in ";
            ss << error.context[k];
        }
        ss << ")";
    }
    return ss.str();
}

Value parse_json(const std::string& text) {
    auto r = parse_document(text);
    if (not r) {
        const ParseError& error = r.error();
        throw ParseException(format_error(text, error), error, locate(text, error));
    }
    return std::move(r).value();
}

}  // namespace pj
