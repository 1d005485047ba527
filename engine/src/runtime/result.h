#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json_fwd.hpp>

#include "runtime/script_output.h"

namespace widget_script {

/**
 * Closed set of script failure classifications.
 */
enum class ErrorKind : uint8_t {
  SyntaxError = 0,
  RuntimeError = 1,
  TimeoutError = 2,
  GlobalAccessError = 3,
  OutputValidationError = 4,
};

/**
 * States of a single run: Idle -> Compiling -> Executing -> Succeeded|Failed.
 * A ScriptError records the phase (Compiling or Executing) it was raised in.
 */
enum class ExecutionPhase : uint8_t {
  Idle = 0,
  Compiling = 1,
  Executing = 2,
  Succeeded = 3,
  Failed = 4,
};

struct ScriptError {
  ErrorKind kind = ErrorKind::RuntimeError;
  std::string message;
  std::optional<int> line;    // 1-based, relative to the script source
  std::optional<int> column;  // 1-based
  ExecutionPhase phase = ExecutionPhase::Executing;
};

/**
 * Per-call bookkeeping attached to every result.
 */
struct RunStats {
  uint64_t sequence = 0;  // Per-runtime call number, increasing
  double elapsed_ms = 0.0;
  ExecutionPhase final_phase = ExecutionPhase::Idle;  // Succeeded or Failed once returned
};

/**
 * ScriptRuntimeResult - either a validated output or one classified error.
 */
class ScriptRuntimeResult {
 public:
  bool IsOk() const { return std::holds_alternative<ScriptOutput>(value_); }

  // Throws std::bad_variant_access when called on the wrong alternative
  const ScriptOutput& Output() const { return std::get<ScriptOutput>(value_); }
  const ScriptError& Error() const { return std::get<ScriptError>(value_); }

  const RunStats& Stats() const { return stats_; }
  RunStats& MutableStats() { return stats_; }

 private:
  friend ScriptRuntimeResult OkResult(ScriptOutput output);
  friend ScriptRuntimeResult ErrorResult(ScriptError error);

  explicit ScriptRuntimeResult(std::variant<ScriptOutput, ScriptError> value)
      : value_(std::move(value)) {}

  std::variant<ScriptOutput, ScriptError> value_;
  RunStats stats_;
};

ScriptRuntimeResult OkResult(ScriptOutput output);
ScriptRuntimeResult ErrorResult(ScriptError error);

/**
 * Build an error with a normalized message and line/column.
 */
ScriptError MakeError(ErrorKind kind, const std::string& message,
                      ExecutionPhase phase,
                      std::optional<int> line = std::nullopt,
                      std::optional<int> column = std::nullopt);

/**
 * Trim whitespace; an empty message becomes "Unknown script error.".
 */
std::string NormalizeErrorMessage(std::string_view message);

/**
 * Drop non-positive line/column values.
 */
std::optional<int> NormalizePosition(std::optional<int> value);

std::string_view ErrorKindToString(ErrorKind kind);
std::optional<ErrorKind> ParseErrorKind(std::string_view s);

std::string_view ExecutionPhaseToString(ExecutionPhase phase);

/**
 * Serialize for the export collaborator and the CLI:
 * {"ok": true, "output": {...}} or
 * {"ok": false, "error": {"kind": "...", "message": "...", "line": n}}
 */
nlohmann::json ResultToJson(const ScriptRuntimeResult& result);

}  // namespace widget_script
