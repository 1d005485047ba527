#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include <nlohmann/json_fwd.hpp>

namespace widget_script {

/**
 * Null value type.
 */
struct NullValue {
  bool operator==(const NullValue&) const = default;
};

/**
 * PrimitiveValue - a single live data value as seen by scripts.
 *
 * Supported types:
 * - null
 * - bool
 * - number (double, matching the script number model)
 * - string
 */
using PrimitiveValue = std::variant<
    NullValue,
    bool,
    double,
    std::string>;

/**
 * Value type enumeration.
 */
enum class ValueType : uint8_t {
  Null = 0,
  Bool = 1,
  Number = 2,
  String = 3,
};

/**
 * Get the type of a PrimitiveValue.
 */
ValueType GetValueType(const PrimitiveValue& v);

/**
 * Check if a PrimitiveValue is null.
 */
bool IsNull(const PrimitiveValue& v);

/**
 * Create a null PrimitiveValue.
 */
inline PrimitiveValue MakeNull() { return NullValue{}; }

/**
 * The neutral value returned for keys that are not in a snapshot.
 */
inline PrimitiveValue MakeEmpty() { return std::string(); }

/**
 * Format a number the way script string conversion does
 * (42 -> "42", 0.5 -> "0.5", NaN -> "NaN").
 */
std::string FormatNumber(double d);

/**
 * Convert a value to its display string (String(value) semantics).
 */
std::string ToDisplayString(const PrimitiveValue& v);

/**
 * Format a value for debugging/logging (strings are quoted).
 */
std::string FormatValue(const PrimitiveValue& v);

/**
 * Convert to/from JSON. Arrays and objects are not primitives;
 * FromJson returns false for them.
 */
nlohmann::json ValueToJson(const PrimitiveValue& v);
bool ValueFromJson(const nlohmann::json& j, PrimitiveValue* out);

}  // namespace widget_script
