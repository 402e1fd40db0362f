#include <pj/value.h>

#include <charconv>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace pj {

namespace {
    std::string format_number(float x) {
        char buf[64];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), x);
        if (ec != std::errc()) return "0.0";
        std::string s(buf, end);
        // keep a decimal point so numbers never read as integers
        if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
        return s;
    }

    void write_quoted(std::ostream& os, const std::string& s) {
        os << '"';
        for (char c : s) {
            switch (c) {
                case '"': os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\n': os << "\\n"; break;
                case '\r': os << "\\r"; break;
                case '\t': os << "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20 or c == 0x7F) {
                        char hex[16];
                        std::snprintf(hex, sizeof(hex), "\\u{%x}", static_cast<unsigned>(c));
                        os << hex;
                    } else {
                        os << c;
                    }
            }
        }
        os << '"';
    }

    struct Printer {
        std::ostream& os;
        int indent;  // < 0: single line

        void newline(int depth) const {
            os << '\n' << std::string(static_cast<std::size_t>(indent * depth), ' ');
        }

        void print(const Value& value, int depth) const {
            switch (value.type()) {
                case Value::Type::Null:
                    os << "Null";
                    break;
                case Value::Type::Boolean:
                    os << "Boolean(" << (value.as_bool() ? "true" : "false") << ")";
                    break;
                case Value::Type::Number:
                    os << "Number(" << format_number(value.as_number()) << ")";
                    break;
                case Value::Type::String:
                    os << "String(";
                    write_quoted(os, value.as_string());
                    os << ")";
                    break;
                case Value::Type::Array: {
                    const auto& items = value.as_array();
                    os << "Array([";
                    bool first = true;
                    for (const auto& item : items) {
                        separate(first, depth);
                        print(item, depth + 1);
                    }
                    close(items.empty(), depth);
                    os << "])";
                    break;
                }
                case Value::Type::Object: {
                    const auto& entries = value.as_object();
                    os << "Object({";
                    bool first = true;
                    for (const auto& [key, item] : entries) {
                        separate(first, depth);
                        write_quoted(os, key);
                        os << ": ";
                        print(item, depth + 1);
                    }
                    close(entries.empty(), depth);
                    os << "})";
                    break;
                }
            }
        }

        void separate(bool& first, int depth) const {
            if (indent >= 0) {
                if (not first) os << ',';
                newline(depth + 1);
            } else if (not first) {
                os << ", ";
            }
            first = false;
        }

        void close(bool empty, int depth) const {
            if (indent < 0 or empty) return;
            os << ',';
            newline(depth);
        }
    };
}  // namespace

const char* type_name(Value::Type type) noexcept {
    switch (type) {
        case Value::Type::Null: return "null";
        case Value::Type::Boolean: return "boolean";
        case Value::Type::Number: return "number";
        case Value::Type::String: return "string";
        case Value::Type::Array: return "array";
        case Value::Type::Object: return "object";
    }
    return "unknown";
}

const Value& Value::at(std::size_t index) const {
    if (not is_array())
        throw std::out_of_range(std::string("cannot index into ") + type_name(type()));
    const auto& items = as_array();
    if (index >= items.size())
        throw std::out_of_range("array index " + std::to_string(index) + " out of range (size " +
                                std::to_string(items.size()) + ")");
    return items[index];
}

const Value& Value::at(const std::string& key) const {
    if (not is_object())
        throw std::out_of_range(std::string("cannot look up key '") + key + "' in " +
                                type_name(type()));
    const auto& entries = as_object();
    auto it = entries.find(key);
    if (it == entries.end()) throw std::out_of_range("key not found: " + key);
    return it->second;
}

bool Value::has(const std::string& key) const {
    return is_object() and as_object().count(key) == 1;
}

std::size_t Value::size() const noexcept {
    if (is_array()) return as_array().size();
    if (is_object()) return as_object().size();
    return 0;
}

std::string Value::to_string() const {
    return dump(-1);
}

std::string Value::dump(int indent) const {
    std::ostringstream ss;
    Printer{ss, indent}.print(*this, 0);
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    Printer{os, -1}.print(value, 0);
    return os;
}

}  // namespace pj
