#include "policy/runtime_options.h"

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace widget_script {

namespace {

bool ReadBudget(const nlohmann::json& j, const char* field, int64_t* out,
                std::string* error_out,
                int64_t max_value = std::numeric_limits<int64_t>::max()) {
  if (!j.contains(field)) {
    return true;
  }
  const auto& v = j[field];
  // Unsigned values above INT64_MAX would wrap in get<int64_t>()
  if (!v.is_number_integer() ||
      (v.is_number_unsigned() &&
       v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) ||
      v.get<int64_t>() <= 0) {
    if (error_out) *error_out = fmt::format("'{}' must be a positive integer", field);
    return false;
  }
  if (v.get<int64_t>() > max_value) {
    if (error_out) *error_out = fmt::format("'{}' must not exceed {}", field, max_value);
    return false;
  }
  *out = v.get<int64_t>();
  return true;
}

bool ReadNameSet(const nlohmann::json& j, const char* field, std::set<std::string>* out,
                 std::string* error_out) {
  if (!j.contains(field)) {
    return true;
  }
  const auto& v = j[field];
  if (!v.is_array()) {
    if (error_out) *error_out = fmt::format("'{}' must be an array of names", field);
    return false;
  }
  std::set<std::string> names;
  for (const auto& name : v) {
    if (!name.is_string() || name.get<std::string>().empty()) {
      if (error_out) *error_out = fmt::format("'{}' entries must be non-empty strings", field);
      return false;
    }
    names.insert(name.get<std::string>());
  }
  *out = std::move(names);
  return true;
}

}  // namespace

RuntimeOptions DefaultRuntimeOptions() {
  RuntimeOptions options;
  options.allowed_globals = {"Math", "Date", "String", "Number", "Array", "Object", "JSON"};
  options.forbidden_globals = {"window", "document", "fetch", "XMLHttpRequest", "eval", "Function"};
  return options;
}

int64_t RuntimeOptions::EffectiveMaxExecutionMs() const {
  if (max_execution_ms <= 0) {
    return kDefaultMaxExecutionMs;
  }
  return std::min(max_execution_ms, kMaxExecutionMsCeiling);
}

bool RuntimeOptions::LoadFromFile(const std::string& path, std::string* error_out) {
  std::ifstream file(path);
  if (!file.is_open()) {
    if (error_out) *error_out = "Failed to open options file: " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return LoadFromJson(buffer.str(), error_out);
}

bool RuntimeOptions::LoadFromJson(const std::string& json_str, std::string* error_out) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_str);
  } catch (const std::exception& e) {
    if (error_out) *error_out = std::string("JSON parse error: ") + e.what();
    return false;
  }

  if (!j.is_object()) {
    if (error_out) *error_out = "Options must be a JSON object";
    return false;
  }

  // Parse into a copy so a bad document leaves *this untouched
  RuntimeOptions next = *this;
  if (!ReadBudget(j, "max_execution_ms", &next.max_execution_ms, error_out,
                  kMaxExecutionMsCeiling) ||
      !ReadBudget(j, "max_memory_bytes", &next.max_memory_bytes, error_out) ||
      !ReadBudget(j, "max_stack_bytes", &next.max_stack_bytes, error_out) ||
      !ReadBudget(j, "max_output_bytes", &next.max_output_bytes, error_out) ||
      !ReadNameSet(j, "allowed_globals", &next.allowed_globals, error_out) ||
      !ReadNameSet(j, "forbidden_globals", &next.forbidden_globals, error_out)) {
    return false;
  }

  *this = std::move(next);
  return true;
}

}  // namespace widget_script
