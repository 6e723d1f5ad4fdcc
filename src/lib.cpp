#include "tabula/lib.hpp"
#include <algorithm>
#include <cctype>

namespace tabula {

// Formats printf-style and throws with the call site prepended.
void error(const std::string& msg, const char* file, int line, ...) {
    va_list args;
    va_start(args, line);

    // First pass only measures, so it needs its own copy of the list.
    va_list args_copy;
    va_copy(args_copy, args);
    int required_size = std::vsnprintf(nullptr, 0, msg.c_str(), args_copy);
    va_end(args_copy);

    if (required_size < 0) {
        va_end(args);
        throw std::runtime_error("Error: Failed to determine required buffer size.");
    }

    std::vector<char> buffer(required_size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), msg.c_str(), args);
    va_end(args);

    std::stringstream ss;
    ss << file << ":" << line << ": " << buffer.data();
    throw std::runtime_error(ss.str());
}

std::string join(const strings& xs, const char* sep) {
    std::ostringstream os;
    for (size_t i = 0; i < xs.size(); ++i) {
        if (i) os << sep;
        os << xs[i];
    }
    return os.str();
}

std::string quote_ident(const std::string& name) {
    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string escape_literal(const std::string& value) {
    std::string out; out.reserve(value.size() + 4);
    for (char c : value) out += (c == '\'') ? "''" : std::string(1, c);
    return out;
}

std::string quote_literal(const std::string& value) {
    return "'" + escape_literal(value) + "'";
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace tabula
