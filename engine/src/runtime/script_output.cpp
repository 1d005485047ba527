#include "runtime/script_output.h"

#include <nlohmann/json.hpp>

namespace widget_script {

std::string_view ShapeKindToString(ShapeKind kind) {
  switch (kind) {
    case ShapeKind::Circle:
      return "circle";
    case ShapeKind::Rectangle:
      return "rectangle";
    case ShapeKind::Ellipse:
      return "ellipse";
  }
  return "unknown";
}

std::optional<ShapeKind> ParseShapeKind(std::string_view s) {
  if (s == "circle") return ShapeKind::Circle;
  if (s == "rectangle" || s == "rect") return ShapeKind::Rectangle;
  if (s == "ellipse") return ShapeKind::Ellipse;
  return std::nullopt;
}

std::string_view OutputTypeName(const ScriptOutput& output) {
  return std::visit(
      [](auto&& arg) -> std::string_view {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, TextOutput>) {
          return "text";
        } else if constexpr (std::is_same_v<T, ListOutput>) {
          return "list";
        } else if constexpr (std::is_same_v<T, ShapeOutput>) {
          return "shape";
        } else {
          static_assert(sizeof(T) == 0, "Unknown type in ScriptOutput variant");
        }
      },
      output);
}

nlohmann::json OutputToJson(const ScriptOutput& output) {
  nlohmann::json j;
  j["type"] = std::string(OutputTypeName(output));

  if (const auto* text = std::get_if<TextOutput>(&output)) {
    j["value"] = text->value;
  } else if (const auto* list = std::get_if<ListOutput>(&output)) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : list->items) {
      items.push_back({{"value", item.value}});
    }
    j["items"] = std::move(items);
  } else if (const auto* shape = std::get_if<ShapeOutput>(&output)) {
    j["shape"] = std::string(ShapeKindToString(shape->shape));
  }
  return j;
}

}  // namespace widget_script
