#include "tabula/value.hpp"
#include <cmath>
#include <format>
#include <sstream>

namespace tabula {

const Value* find_field(const Fields& fields, const std::string& name) {
    for (const auto& [k, v] : fields) {
        if (k == name) return &v;
    }
    return nullptr;
}

Value to_value(const jval& v) {
    if (v.IsNull()) return Value();
    if (v.IsBool()) return Value(v.GetBool());
    if (v.IsInt64()) return Value(static_cast<long long>(v.GetInt64()));
    if (v.IsNumber()) return Value(v.GetDouble());
    if (v.IsString()) return Value(std::string(v.GetString(), v.GetStringLength()));
    if (v.IsArray()) {
        ValueList out;
        out.reserve(v.Size());
        for (const auto& e : v.GetArray()) out.push_back(to_value(e));
        return Value(std::move(out));
    }
    return Value(jhlp::stringify(v));
}

jval to_jval(const Value& v, jdaloc& allocator) {
    return std::visit([&](const auto& x) -> jval {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return jval(json::kNullType);
        } else if constexpr (std::is_same_v<T, bool>) {
            return jval(x);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return jval(x);
        } else if constexpr (std::is_same_v<T, double>) {
            return jval(x);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return jval(x.c_str(), static_cast<json::SizeType>(x.size()), allocator);
        } else {
            jval arr(json::kArrayType);
            for (const auto& e : x) arr.PushBack(to_jval(e, allocator), allocator);
            return arr;
        }
    }, v.data);
}

Fields to_fields(const jval& obj) {
    Fields out;
    if (!obj.IsObject()) TABULA_THROW("expected a JSON object for row data");
    for (jit it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
        out.emplace_back(it->name.GetString(), to_value(it->value));
    }
    return out;
}

namespace {
    std::string number_key(double d) {
        if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9.2e18) {
            return "n:" + std::to_string(static_cast<int64_t>(d));
        }
        std::ostringstream os;
        os.precision(17);
        os << "n:" << d;
        return os.str();
    }
}

std::string value_key(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return x ? "b:1" : "b:0";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return "n:" + std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
            return number_key(x);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "s:" + x;
        } else {
            std::string out = "l:[";
            for (const auto& e : x) out += value_key(e) + ",";
            return out + "]";
        }
    }, v.data);
}

std::string value_key(const jval& v) {
    return value_key(to_value(v));
}

std::string to_string(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
            // shortest text that parses back to the same double
            return std::format("{}", x);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else {
            std::string out = "[";
            for (size_t i = 0; i < x.size(); ++i) {
                if (i) out += ", ";
                out += to_string(x[i]);
            }
            return out + "]";
        }
    }, v.data);
}

} // namespace tabula
