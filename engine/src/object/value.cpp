#include "object/value.h"

#include <cmath>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace widget_script {

ValueType GetValueType(const PrimitiveValue& v) {
  return std::visit(
      [](auto&& arg) -> ValueType {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, NullValue>) {
          return ValueType::Null;
        } else if constexpr (std::is_same_v<T, bool>) {
          return ValueType::Bool;
        } else if constexpr (std::is_same_v<T, double>) {
          return ValueType::Number;
        } else if constexpr (std::is_same_v<T, std::string>) {
          return ValueType::String;
        } else {
          static_assert(sizeof(T) == 0, "Unknown type in PrimitiveValue variant");
        }
      },
      v);
}

bool IsNull(const PrimitiveValue& v) {
  return std::holds_alternative<NullValue>(v);
}

std::string FormatNumber(double d) {
  if (std::isnan(d)) {
    return "NaN";
  }
  if (std::isinf(d)) {
    return d > 0 ? "Infinity" : "-Infinity";
  }
  // Integral values print without a fraction, like the script engine does
  if (std::trunc(d) == d && std::fabs(d) < 1e15) {
    return fmt::format("{}", static_cast<int64_t>(d));
  }
  // Up to 1e21 the engine still prints every digit: expand the shortest
  // round-trip form ("1.5e+20") with trailing zeros
  if (std::trunc(d) == d && std::fabs(d) < 1e21) {
    std::string shortest = fmt::format("{}", std::fabs(d));
    size_t e = shortest.find('e');
    if (e == std::string::npos) {
      return d < 0 ? "-" + shortest : shortest;
    }
    std::string mantissa = shortest.substr(0, e);
    int exponent = std::stoi(shortest.substr(e + 1));
    size_t dot = mantissa.find('.');
    size_t int_digits = (dot == std::string::npos ? mantissa.size() : dot) + exponent;
    std::string digits;
    for (char c : mantissa) {
      if (c != '.') digits.push_back(c);
    }
    if (digits.size() < int_digits) {
      digits.append(int_digits - digits.size(), '0');
    }
    return d < 0 ? "-" + digits : digits;
  }
  return fmt::format("{}", d);
}

std::string ToDisplayString(const PrimitiveValue& v) {
  return std::visit(
      [](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, NullValue>) {
          return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
          return FormatNumber(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return arg;
        } else {
          static_assert(sizeof(T) == 0, "Unknown type in PrimitiveValue variant");
        }
      },
      v);
}

std::string FormatValue(const PrimitiveValue& v) {
  if (const auto* s = std::get_if<std::string>(&v)) {
    return fmt::format("\"{}\"", *s);
  }
  return ToDisplayString(v);
}

nlohmann::json ValueToJson(const PrimitiveValue& v) {
  return std::visit(
      [](auto&& arg) -> nlohmann::json {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, NullValue>) {
          return nullptr;
        } else {
          return arg;
        }
      },
      v);
}

bool ValueFromJson(const nlohmann::json& j, PrimitiveValue* out) {
  if (j.is_null()) {
    *out = NullValue{};
  } else if (j.is_boolean()) {
    *out = j.get<bool>();
  } else if (j.is_number()) {
    *out = j.get<double>();
  } else if (j.is_string()) {
    *out = j.get<std::string>();
  } else {
    return false;
  }
  return true;
}

}  // namespace widget_script
