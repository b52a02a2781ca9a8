#include "json_fields.hpp"

#include <rapidjson/error/en.h>

#include <fstream>
#include <sstream>

namespace gigdispatch::io::detail {

const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                   const std::string& context) {
    if (!obj.IsObject() || !obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

double get_double(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

uint64_t get_uint64(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer", context);
    }
    return member.GetUint64();
}

std::string get_string(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return std::string(member.GetString(), member.GetStringLength());
}

const rapidjson::Value& get_array(const rapidjson::Value& obj, const char* name,
                                  const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

const rapidjson::Value& get_object(const rapidjson::Value& obj, const char* name,
                                   const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsObject()) {
        throw LoaderError(std::string("field '") + name + "' must be an object", context);
    }
    return member;
}

double get_double_or(const rapidjson::Value& obj, const char* name, double default_val,
                     const std::string& context) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    return get_double(obj, name, context);
}

uint64_t get_uint64_or(const rapidjson::Value& obj, const char* name, uint64_t default_val,
                       const std::string& context) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    return get_uint64(obj, name, context);
}

bool get_bool_or(const rapidjson::Value& obj, const char* name, bool default_val,
                 const std::string& context) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    const auto& member = obj[name];
    if (!member.IsBool()) {
        throw LoaderError(std::string("field '") + name + "' must be a boolean", context);
    }
    return member.GetBool();
}

std::string get_string_or(const rapidjson::Value& obj, const char* name,
                          const std::string& default_val, const std::string& context) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    return get_string(obj, name, context);
}

void parse_document(rapidjson::Document& doc, std::string_view json) {
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

} // namespace gigdispatch::io::detail
