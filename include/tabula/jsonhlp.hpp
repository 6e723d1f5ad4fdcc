#pragma once

#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/istreamwrapper.h"
#include "rapidjson/error/en.h"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <fstream>
#include <stdexcept>
#include <type_traits>
#include "tabula/lib.hpp"

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;
using jit = rapidjson::Value::ConstMemberIterator;
using jdaloc = rapidjson::Document::AllocatorType;


namespace jhlp {

    // Parses a JSON string into a Document. Prints the parse error and returns false on failure.
    inline bool parse_str(const std::string& json_string, rapidjson::Document& document) {
        document.Parse(json_string.c_str());
        if (document.HasParseError()) {
            std::cerr << "JSON Parse Error: " << rapidjson::GetParseError_En(document.GetParseError())
                      << " at offset " << document.GetErrorOffset() << std::endl;
            return false;
        }
        return true;
    }

    inline bool parse_file(const std::string& file_path, rapidjson::Document& document) {
        std::ifstream ifs(file_path);
        if (!ifs.is_open()) {
            std::cerr << "Failed to open file: " << file_path << std::endl;
            return false;
        }
        rapidjson::IStreamWrapper isw(ifs);
        document.ParseStream(isw);
        if (document.HasParseError()) {
            std::cerr << "JSON Parse Error in file " << file_path << ": "
                      << rapidjson::GetParseError_En(document.GetParseError())
                      << " at offset " << document.GetErrorOffset() << std::endl;
            return false;
        }
        return true;
    }

    inline std::string stringify(const rapidjson::Value& value) {
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        value.Accept(writer);
        return buffer.GetString();
    }

    inline std::string pretty(const rapidjson::Value& value) {
        rapidjson::StringBuffer buffer;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        value.Accept(writer);
        return buffer.GetString();
    }

    // Writes pretty JSON, creating parent directories on demand.
    inline void write_file(const std::string& file_path, const rapidjson::Value& value) {
        std::filesystem::path p(file_path);
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
            if (ec) TABULA_THROW("cannot create directory %s: %s",
                                 p.parent_path().string().c_str(), ec.message().c_str());
        }
        std::ofstream ofs(file_path, std::ios::trunc);
        if (!ofs.is_open()) TABULA_THROW("cannot open %s for writing", file_path.c_str());
        ofs << pretty(value) << "\n";
        if (!ofs) TABULA_THROW("write failed: %s", file_path.c_str());
    }

    // Strings come back bare, everything else as JSON text.
    inline std::string dump(const rapidjson::Value& value, bool pretty_print = false) {
        if (value.IsString()) return value.GetString();
        if (value.IsBool()) return value.GetBool() ? "true" : "false";
        if (value.IsNull()) return "null";
        return pretty_print ? pretty(value) : stringify(value);
    }

    // Reads a member with type checking. Missing keys or a wrong type yield the default.
    template<typename T>
    inline T get(const rapidjson::Value& parent, const std::string& key, const T& default_value = T()) {

        if (!parent.IsObject() || !parent.HasMember(key.c_str())) { return default_value; }
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return val.GetString();
            if (val.IsNumber()) return stringify(val);
        } else if constexpr (std::is_same_v<T, int>) {
            if (val.IsInt()) return val.GetInt();
        } else if constexpr (std::is_same_v<T, int64_t>) {
            if (val.IsInt64()) return val.GetInt64();
        } else if constexpr (std::is_same_v<T, double>){
            if (val.IsNumber()) return val.GetDouble();
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        } else if constexpr (std::is_same_v<T, unsigned>) {
            if (val.IsUint()) return val.GetUint();
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            if (val.IsUint64()) return val.GetUint64();
        }
        return default_value;
    }

    inline std::vector<std::string> get_strings(const rapidjson::Value& parent, const std::string& key) {
        std::vector<std::string> out;
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) return out;
        const jval& arr = parent[key.c_str()];
        if (!arr.IsArray()) return out;
        for (const auto& v : arr.GetArray()) {
            if (v.IsString()) out.emplace_back(v.GetString());
        }
        return out;
    }

    // Template helper to set a value in a RapidJSON Document.
    template<typename T>
    inline void set(rapidjson::Document& document, const std::string& key, const T& value) {
        rapidjson::Document::AllocatorType& allocator = document.GetAllocator();
        if constexpr (std::is_same_v<T, std::string>) {
            document.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                               rapidjson::Value(value.c_str(), allocator).Move(),
                               allocator);
        } else if constexpr (std::is_same_v<T, int64_t>){
            document.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                               rapidjson::Value(value).Move(),
                               allocator);
        } else {
            document.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                               value,
                               allocator);
        }
    }

    // Overload for setting values in a nested object.
    template<typename T>
    inline void set(rapidjson::Value& parent, const std::string& key, const T& value, rapidjson::Document::AllocatorType& allocator) {
        if constexpr (std::is_same_v<T, std::string>) {
            parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                             rapidjson::Value(value.c_str(), allocator).Move(),
                             allocator);
        } else {
            parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                             rapidjson::Value(value).Move(),
                             allocator);
        }
    }

    // Adds or replaces a member, taking ownership of value.
    inline void put(rapidjson::Value& parent, const std::string& key, rapidjson::Value& value,
                    rapidjson::Document::AllocatorType& allocator) {
        auto it = parent.FindMember(key.c_str());
        if (it != parent.MemberEnd()) {
            it->value = value;
            return;
        }
        parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(), value, allocator);
    }

    inline rapidjson::Value string_array(const std::vector<std::string>& xs,
                                         rapidjson::Document::AllocatorType& allocator) {
        rapidjson::Value arr(rapidjson::kArrayType);
        for (const auto& x : xs) arr.PushBack(rapidjson::Value(x.c_str(), allocator).Move(), allocator);
        return arr;
    }

} // namespace jhlp
