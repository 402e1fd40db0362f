// pj::Value - the tree produced by the parser
#pragma once

#include <cstddef>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pj {

struct Value {
    using array_t = std::vector<Value>;
    using object_t = std::map<std::string, Value>;

    // Same order as the alternatives of `v`.
    enum class Type { Null, Boolean, Number, String, Array, Object };

    std::variant<std::monostate, bool, float, std::string, array_t, object_t> v;

    Value() = default;
    Value(bool b) : v(b) {}
    Value(float x) : v(x) {}
    Value(double x) : v(static_cast<float>(x)) {}
    Value(int x) : v(static_cast<float>(x)) {}
    Value(const char* s) : v(std::string(s)) {}
    Value(const std::string& s) : v(s) {}
    Value(std::string&& s) : v(std::move(s)) {}
    Value(const array_t& a) : v(a) {}
    Value(array_t&& a) : v(std::move(a)) {}
    Value(const object_t& o) : v(o) {}
    Value(object_t&& o) : v(std::move(o)) {}

    Type type() const noexcept { return static_cast<Type>(v.index()); }

    bool is_null() const noexcept { return std::holds_alternative<std::monostate>(v); }
    bool is_bool() const noexcept { return std::holds_alternative<bool>(v); }
    bool is_number() const noexcept { return std::holds_alternative<float>(v); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(v); }
    bool is_array() const noexcept { return std::holds_alternative<array_t>(v); }
    bool is_object() const noexcept { return std::holds_alternative<object_t>(v); }

    // Throw std::bad_variant_access on a kind mismatch.
    bool as_bool() const { return std::get<bool>(v); }
    float as_number() const { return std::get<float>(v); }
    const std::string& as_string() const { return std::get<std::string>(v); }
    const array_t& as_array() const { return std::get<array_t>(v); }
    const object_t& as_object() const { return std::get<object_t>(v); }

    // Throw std::out_of_range when the element or key is missing, or when the
    // value is not an array/object.
    const Value& at(std::size_t index) const;
    const Value& at(const std::string& key) const;

    bool has(const std::string& key) const;
    // Element count for arrays, entry count for objects, 0 otherwise.
    std::size_t size() const noexcept;

    // Debug tree rendering, e.g. Object({"a": Number(1.0)}). With indent >= 0
    // every child goes on its own line. Not JSON.
    std::string to_string() const;
    std::string dump(int indent) const;

    bool operator==(const Value& o) const { return v == o.v; }
    bool operator!=(const Value& o) const { return not(*this == o); }
};

const char* type_name(Value::Type type) noexcept;

std::ostream& operator<<(std::ostream& os, const Value& value);

}  // namespace pj
