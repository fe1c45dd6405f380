#pragma once

// RapidJSON field access for the loaders. Private to vmplace_io.

#include <vmplace/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace vmplace::io::detail {

// How a C++ type is recognised and read in a JSON value
template<typename T>
struct JsonField;

template<>
struct JsonField<double> {
    static constexpr const char* expected = "a number";
    static bool matches(const rapidjson::Value& v) { return v.IsNumber(); }
    static double read(const rapidjson::Value& v) { return v.GetDouble(); }
};

template<>
struct JsonField<int> {
    static constexpr const char* expected = "an integer";
    static bool matches(const rapidjson::Value& v) { return v.IsInt(); }
    static int read(const rapidjson::Value& v) { return v.GetInt(); }
};

template<>
struct JsonField<uint64_t> {
    static constexpr const char* expected = "a node index";
    static bool matches(const rapidjson::Value& v) { return v.IsUint64(); }
    static uint64_t read(const rapidjson::Value& v) { return v.GetUint64(); }
};

template<>
struct JsonField<bool> {
    static constexpr const char* expected = "true or false";
    static bool matches(const rapidjson::Value& v) { return v.IsBool(); }
    static bool read(const rapidjson::Value& v) { return v.GetBool(); }
};

template<>
struct JsonField<std::string> {
    static constexpr const char* expected = "a string";
    static bool matches(const rapidjson::Value& v) { return v.IsString(); }
    static std::string read(const rapidjson::Value& v) { return {v.GetString(), v.GetStringLength()}; }
};

inline const rapidjson::Value& member(const rapidjson::Value& obj, const char* name, const std::string& context) {
    if (!obj.IsObject()) {
        throw LoaderError("expected an object", context);
    }
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) {
        throw LoaderError(std::string("'") + name + "' is required", context);
    }
    return it->value;
}

template<typename T>
T require(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& value = member(obj, name, context);
    if (!JsonField<T>::matches(value)) {
        throw LoaderError(std::string("'") + name + "' must be " + JsonField<T>::expected, context);
    }
    return JsonField<T>::read(value);
}

// Absent means @p fallback; present with the wrong type is still an error
template<typename T>
T optional_field(const rapidjson::Value& obj, const char* name, T fallback, const std::string& context) {
    if (!obj.HasMember(name)) {
        return fallback;
    }
    return require<T>(obj, name, context);
}

inline const rapidjson::Value& require_array(const rapidjson::Value& obj, const char* name,
                                             const std::string& context) {
    const auto& value = member(obj, name, context);
    if (!value.IsArray()) {
        throw LoaderError(std::string("'") + name + "' must be an array", context);
    }
    return value;
}

inline const rapidjson::Value& require_object(const rapidjson::Value& obj, const char* name,
                                              const std::string& context) {
    const auto& value = member(obj, name, context);
    if (!value.IsObject()) {
        throw LoaderError(std::string("'") + name + "' must be an object", context);
    }
    return value;
}

// "parent.array[idx]", or "array[idx]" at top level
inline std::string index_context(const std::string& parent, const char* array, rapidjson::SizeType idx) {
    std::string ctx = parent.empty() ? std::string(array) : parent + "." + array;
    return ctx + "[" + std::to_string(idx) + "]";
}

inline void parse_root_object(rapidjson::Document& doc, std::string_view json, const char* what) {
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        throw LoaderError(std::string("invalid JSON: ") + rapidjson::GetParseError_En(doc.GetParseError()),
                          std::string(what) + " at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        throw LoaderError("top-level value must be an object", what);
    }
}

inline std::string slurp(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw LoaderError("cannot open file", path.string());
    }
    std::stringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

} // namespace vmplace::io::detail
