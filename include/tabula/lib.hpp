#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <sstream> // To build the final string

namespace tabula {

using strings = std::vector<std::string>;

[[noreturn]] void error(const std::string& msg, const char* file, int line, ...);

std::string join(const strings& xs, const char* sep);

// "na""me" style identifier quoting (no case conversion)
std::string quote_ident(const std::string& name);

// doubles every single quote
std::string escape_literal(const std::string& value);
std::string quote_literal(const std::string& value);

std::string to_lower(std::string s);
std::string to_upper(std::string s);
std::string trim(const std::string& s);

} // namespace tabula

// A helper macro to automatically pass __FILE__ and __LINE__
#define TABULA_THROW(msg, ...) ::tabula::error(msg, __FILE__, __LINE__, ##__VA_ARGS__)
