#include "tabula/casing.hpp"
#include <cctype>

namespace tabula {

namespace {
    bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
    bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
    bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
}

std::string camel_to_snake(const std::string& name, const CasingOverrides& overrides) {
    if (auto it = overrides.find(name); it != overrides.end()) return it->second;

    std::string out;
    out.reserve(name.size() + 4);
    const size_t n = name.size();
    for (size_t i = 0; i < n; ++i) {
        const char c = name[i];
        if (!is_upper(c)) { out += c; continue; }
        if (i > 0) {
            const char prev = name[i - 1];
            const char next = (i + 1 < n) ? name[i + 1] : '\0';
            // word boundary, or last capital of an acronym (HTMLParser)
            if (is_lower(prev) || is_digit(prev) || (is_upper(prev) && is_lower(next))) {
                if (out.empty() || out.back() != '_') out += '_';
            }
        }
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string snake_to_camel(const std::string& name, const CasingOverrides& overrides) {
    for (const auto& [camel, snake] : overrides) {
        if (snake == name) return camel;
    }

    std::string out;
    out.reserve(name.size());
    size_t i = 0;
    while (i < name.size() && name[i] == '_') out += name[i++];

    bool upper_next = false;
    for (; i < name.size(); ++i) {
        const char c = name[i];
        if (c == '_') { upper_next = true; continue; }
        if (upper_next) {
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            upper_next = false;
        } else {
            out += c;
        }
    }
    if (upper_next) out += '_';
    return out;
}

} // namespace tabula
