#pragma once

// Field accessors shared by the JSON loaders. Every accessor reports the
// offending field through LoaderError with the caller's context string.

#include <gigdispatch/io/error.hpp>

#include <rapidjson/document.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace gigdispatch::io::detail {

const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                   const std::string& context);

double get_double(const rapidjson::Value& obj, const char* name, const std::string& context);

uint64_t get_uint64(const rapidjson::Value& obj, const char* name, const std::string& context);

std::string get_string(const rapidjson::Value& obj, const char* name, const std::string& context);

const rapidjson::Value& get_array(const rapidjson::Value& obj, const char* name,
                                  const std::string& context);

const rapidjson::Value& get_object(const rapidjson::Value& obj, const char* name,
                                   const std::string& context);

// Optional getters: absent means default, present with the wrong type is an error.
double get_double_or(const rapidjson::Value& obj, const char* name, double default_val,
                     const std::string& context);

uint64_t get_uint64_or(const rapidjson::Value& obj, const char* name, uint64_t default_val,
                       const std::string& context);

bool get_bool_or(const rapidjson::Value& obj, const char* name, bool default_val,
                 const std::string& context);

std::string get_string_or(const rapidjson::Value& obj, const char* name,
                          const std::string& default_val, const std::string& context);

// Parse @p json into @p doc, throwing LoaderError on syntax errors.
void parse_document(rapidjson::Document& doc, std::string_view json);

// Read a whole file, throwing LoaderError if it cannot be opened.
std::string read_file(const std::filesystem::path& path);

} // namespace gigdispatch::io::detail
