#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "tabula/jsonhlp.hpp"

namespace tabula {

// Sentinel accepted by the insert/update builders for "current timestamp" columns.
inline constexpr const char* NOW_SENTINEL = "now";

struct Value;
using ValueList = std::vector<Value>;

// A bound statement parameter or a column value in caller-supplied row data.
struct Value {
    using variant_t = std::variant<std::nullptr_t, bool, int64_t, double, std::string, ValueList>;
    variant_t data;

    Value() : data(nullptr) {}
    Value(std::nullptr_t) : data(nullptr) {}
    Value(bool v) : data(v) {}
    Value(int v) : data(static_cast<int64_t>(v)) {}
    Value(long v) : data(static_cast<int64_t>(v)) {}
    Value(long long v) : data(static_cast<int64_t>(v)) {}
    Value(unsigned v) : data(static_cast<int64_t>(v)) {}
    Value(unsigned long v) : data(static_cast<int64_t>(v)) {}
    Value(unsigned long long v) : data(static_cast<int64_t>(v)) {}
    Value(double v) : data(v) {}
    Value(const char* v) : data(std::string(v)) {}
    Value(std::string v) : data(std::move(v)) {}
    Value(ValueList v) : data(std::move(v)) {}

    bool is_null() const { return std::holds_alternative<std::nullptr_t>(data); }
    bool is_bool() const { return std::holds_alternative<bool>(data); }
    bool is_int() const { return std::holds_alternative<int64_t>(data); }
    bool is_double() const { return std::holds_alternative<double>(data); }
    bool is_string() const { return std::holds_alternative<std::string>(data); }
    bool is_list() const { return std::holds_alternative<ValueList>(data); }

    bool as_bool() const { return std::get<bool>(data); }
    int64_t as_int() const { return std::get<int64_t>(data); }
    double as_double() const { return std::get<double>(data); }
    const std::string& as_string() const { return std::get<std::string>(data); }
    const ValueList& as_list() const { return std::get<ValueList>(data); }

    bool operator==(const Value& other) const { return data == other.data; }
    bool operator!=(const Value& other) const { return !(*this == other); }
};

using Params = std::vector<Value>;

// Ordered (name, value) association list. Order is the order columns appear in SQL.
using Fields = std::vector<std::pair<std::string, Value>>;

const Value* find_field(const Fields& fields, const std::string& name);

// JSON <-> Value. Objects become their JSON text.
Value to_value(const jval& v);
jval to_jval(const Value& v, jdaloc& allocator);
Fields to_fields(const jval& obj);

// Canonical text used as a lookup key; 7 and 7.0 compare equal.
std::string value_key(const Value& v);
std::string value_key(const jval& v);

// Human readable rendering (logs, error messages, text-format binds).
std::string to_string(const Value& v);

} // namespace tabula
