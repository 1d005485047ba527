#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace widget_script {

/**
 * Shapes a script widget can render.
 */
enum class ShapeKind : uint8_t {
  Circle = 0,
  Rectangle = 1,
  Ellipse = 2,
};

struct TextOutput {
  std::string value;
  bool operator==(const TextOutput&) const = default;
};

struct ListItem {
  std::string value;
  bool operator==(const ListItem&) const = default;
};

struct ListOutput {
  std::vector<ListItem> items;
  bool operator==(const ListOutput&) const = default;
};

struct ShapeOutput {
  ShapeKind shape;
  bool operator==(const ShapeOutput&) const = default;
};

/**
 * ScriptOutput - the validated content of a script widget.
 * Exactly one of text, list or shape.
 */
using ScriptOutput = std::variant<TextOutput, ListOutput, ShapeOutput>;

/**
 * Map ShapeKind to its script name ("circle", "rectangle", "ellipse").
 */
std::string_view ShapeKindToString(ShapeKind kind);

/**
 * Parse ShapeKind from a script name. "rect" is accepted for rectangle.
 */
std::optional<ShapeKind> ParseShapeKind(std::string_view s);

/**
 * The `type` tag of an output: "text", "list" or "shape".
 */
std::string_view OutputTypeName(const ScriptOutput& output);

/**
 * Serialize an output in the shape scripts return it, e.g.
 * {"type": "list", "items": [{"value": "a"}]}.
 */
nlohmann::json OutputToJson(const ScriptOutput& output);

}  // namespace widget_script
