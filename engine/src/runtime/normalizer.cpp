#include "runtime/normalizer.h"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "object/value.h"

namespace widget_script {

namespace {

std::string DescribeJsonType(const nlohmann::json& j) {
  if (j.is_null()) return "null";
  if (j.is_boolean()) return "boolean";
  if (j.is_number()) return "number";
  if (j.is_string()) return "string";
  if (j.is_array()) return "array";
  return "object";
}

ScriptRuntimeResult Invalid(const std::string& message) {
  return ErrorResult(MakeError(ErrorKind::OutputValidationError, message,
                               ExecutionPhase::Executing));
}

// Coerce a primitive to its display string; objects, arrays and null fail
bool CoerceToString(const nlohmann::json& j, std::string* out) {
  if (j.is_null() || j.is_array() || j.is_object()) {
    return false;
  }
  PrimitiveValue value;
  if (!ValueFromJson(j, &value)) {
    return false;
  }
  *out = ToDisplayString(value);
  return true;
}

ScriptRuntimeResult NormalizeText(const nlohmann::json& raw) {
  auto it = raw.find("value");
  if (it == raw.end() || it->is_null()) {
    return Invalid("Text output requires a 'value' field");
  }
  std::string value;
  if (!CoerceToString(*it, &value)) {
    return Invalid(fmt::format("Text output 'value' must be a string, got {}",
                               DescribeJsonType(*it)));
  }
  return OkResult(TextOutput{std::move(value)});
}

ScriptRuntimeResult NormalizeList(const nlohmann::json& raw) {
  auto it = raw.find("items");
  if (it == raw.end() || !it->is_array()) {
    return Invalid("List output requires an 'items' array");
  }

  ListOutput list;
  list.items.reserve(it->size());
  for (size_t i = 0; i < it->size(); ++i) {
    const auto& item = (*it)[i];
    if (!item.is_object()) {
      return Invalid(fmt::format("List item {} must be an object with a 'value', got {}",
                                 i, DescribeJsonType(item)));
    }
    auto value_it = item.find("value");
    if (value_it == item.end() || value_it->is_null()) {
      return Invalid(fmt::format("List item {} is missing 'value'", i));
    }
    std::string value;
    if (!CoerceToString(*value_it, &value)) {
      return Invalid(fmt::format("List item {} 'value' must be a string, got {}",
                                 i, DescribeJsonType(*value_it)));
    }
    list.items.push_back(ListItem{std::move(value)});
  }
  return OkResult(std::move(list));
}

ScriptRuntimeResult NormalizeShape(const nlohmann::json& raw) {
  auto it = raw.find("shape");
  if (it == raw.end() || !it->is_string()) {
    return Invalid("Shape output requires a 'shape' name");
  }
  auto kind = ParseShapeKind(it->get<std::string>());
  if (!kind) {
    return Invalid(fmt::format("Unknown shape '{}' (expected circle, rectangle or ellipse)",
                               it->get<std::string>()));
  }
  return OkResult(ShapeOutput{*kind});
}

}  // namespace

ScriptRuntimeResult NormalizeOutput(const nlohmann::json& raw, int64_t max_output_bytes) {
  if (!raw.is_object()) {
    return Invalid(fmt::format("Script must return an object with a 'type' field, got {}",
                               DescribeJsonType(raw)));
  }

  auto type_it = raw.find("type");
  if (type_it == raw.end() || !type_it->is_string()) {
    return Invalid("Script output is missing a 'type' field");
  }

  const std::string type = type_it->get<std::string>();
  ScriptRuntimeResult result = [&]() {
    if (type == "text") return NormalizeText(raw);
    if (type == "list") return NormalizeList(raw);
    if (type == "shape") return NormalizeShape(raw);
    return Invalid(fmt::format("Unknown output type '{}' (expected text, list or shape)", type));
  }();

  if (result.IsOk() && max_output_bytes > 0) {
    size_t bytes = OutputToJson(result.Output())
                       .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                       .size();
    if (bytes > static_cast<size_t>(max_output_bytes)) {
      return Invalid(fmt::format("Script output is {} bytes, exceeding the {} byte limit",
                                 bytes, max_output_bytes));
    }
  }
  return result;
}

}  // namespace widget_script
