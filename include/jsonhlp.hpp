// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/istreamwrapper.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include "lib.hpp"

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;
using jit = rapidjson::Value::ConstMemberIterator;
using jdaloc = rapidjson::Document::AllocatorType;

namespace jhlp {

    // Parse a JSON string into a RapidJSON Document.
    // On failure returns false and, when given, fills err with the reason and offset.
    inline bool parse_str(const std::string& json_string, rapidjson::Document& document, std::string* err = nullptr) {
        document.Parse(json_string.c_str());
        if (document.HasParseError()) {
            if (err) {
                *err = std::string(rapidjson::GetParseError_En(document.GetParseError()))
                    + " at offset " + std::to_string(document.GetErrorOffset());
            }
            return false;
        }
        return true;
    }

    inline bool parse_file(const std::string& file_path, rapidjson::Document& document, std::string* err = nullptr) {
        std::ifstream ifs(file_path);
        if (!ifs.is_open()) {
            if (err) *err = "failed to open file: " + file_path;
            return false;
        }
        rapidjson::IStreamWrapper isw(ifs);
        document.ParseStream(isw);
        if (document.HasParseError()) {
            if (err) {
                *err = file_path + ": " + rapidjson::GetParseError_En(document.GetParseError())
                    + " at offset " + std::to_string(document.GetErrorOffset());
            }
            return false;
        }
        return true;
    }

    inline std::string stringify(const rapidjson::Value& value, bool pretty = false) {
        rapidjson::StringBuffer buffer;
        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            value.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            value.Accept(writer);
        }
        return buffer.GetString();
    }

    // Scalars as bare text (strings unquoted), containers as JSON text.
    inline std::string val2str(const rapidjson::Value& value) {
        if (value.IsString()) {
            return std::string(value.GetString(), value.GetStringLength());
        } else if (value.IsBool()) {
            return value.GetBool() ? "true" : "false";
        } else if (value.IsNull()) {
            return "null";
        }
        return stringify(value);
    }

    inline const jval* find(const rapidjson::Value& parent, const char* key) {
        if (!parent.IsObject()) return nullptr;
        auto it = parent.FindMember(key);
        return it == parent.MemberEnd() ? nullptr : &it->value;
    }

    // Read a member with a fallback when it is absent or of another type.
    template<typename T>
    inline T get(const rapidjson::Value& parent, const std::string& key, const T& default_value = T()) {

        if (!parent.IsObject() || !parent.HasMember(key.c_str())) { return default_value; }
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return val.GetString();
            if (val.IsNumber()) return val2str(val);
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        } else if constexpr (std::is_same_v<T, int>) {
            if (val.IsInt()) return val.GetInt();
        } else if constexpr (std::is_same_v<T, int64_t>) {
            if (val.IsInt64()) return val.GetInt64();
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            if (val.IsUint64()) return val.GetUint64();
        } else if constexpr (std::is_same_v<T, double>) {
            if (val.IsNumber()) return val.GetDouble();
        }
        return default_value;
    }

    // Build a JSON value from a C++ scalar, string or another JSON value.
    template<typename T>
    inline jval make(const T& value, jdaloc& a) {
        jval v;
        if constexpr (std::is_base_of_v<jval, T>) {
            v.CopyFrom(value, a);
        } else if constexpr (std::is_same_v<T, bool>) {
            v.SetBool(value);
        } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T> && sizeof(T) == 8) {
            v.SetUint64(value);
        } else if constexpr (std::is_integral_v<T>) {
            v.SetInt64(static_cast<int64_t>(value));
        } else if constexpr (std::is_floating_point_v<T>) {
            v.SetDouble(static_cast<double>(value));
        } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
            v.SetNull();
        } else {
            const std::string s(value);
            v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), a);
        }
        return v;
    }

    template<typename T>
    inline void set(rapidjson::Value& parent, const std::string& key, const T& value, jdaloc& a) {
        auto it = parent.FindMember(key.c_str());
        if (it != parent.MemberEnd()) {
            it->value = make(value, a);
            return;
        }
        parent.AddMember(jval(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), a).Move(),
            make(value, a).Move(), a);
    }

    template<typename T>
    inline void set(rapidjson::Document& document, const std::string& key, const T& value) {
        set(static_cast<rapidjson::Value&>(document), key, value, document.GetAllocator());
    }

    // Deep copy into a fresh document.
    inline jdoc clone(const rapidjson::Value& value) {
        jdoc d;
        d.CopyFrom(value, d.GetAllocator());
        return d;
    }

} // namespace jhlp
