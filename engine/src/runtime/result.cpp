#include "runtime/result.h"

#include <nlohmann/json.hpp>

namespace widget_script {

ScriptRuntimeResult OkResult(ScriptOutput output) {
  ScriptRuntimeResult result(std::move(output));
  result.stats_.final_phase = ExecutionPhase::Succeeded;
  return result;
}

ScriptRuntimeResult ErrorResult(ScriptError error) {
  ScriptRuntimeResult result(std::move(error));
  result.stats_.final_phase = ExecutionPhase::Failed;
  return result;
}

std::string NormalizeErrorMessage(std::string_view message) {
  const char* kSpace = " \t\r\n";
  size_t start = message.find_first_not_of(kSpace);
  if (start == std::string_view::npos) {
    return "Unknown script error.";
  }
  size_t end = message.find_last_not_of(kSpace);
  return std::string(message.substr(start, end - start + 1));
}

std::optional<int> NormalizePosition(std::optional<int> value) {
  if (value && *value > 0) {
    return value;
  }
  return std::nullopt;
}

ScriptError MakeError(ErrorKind kind, const std::string& message,
                      ExecutionPhase phase,
                      std::optional<int> line,
                      std::optional<int> column) {
  ScriptError error;
  error.kind = kind;
  error.message = NormalizeErrorMessage(message);
  error.phase = phase;
  error.line = NormalizePosition(line);
  // A column without a line carries no information
  error.column = error.line ? NormalizePosition(column) : std::nullopt;
  return error;
}

std::string_view ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::SyntaxError:
      return "SyntaxError";
    case ErrorKind::RuntimeError:
      return "RuntimeError";
    case ErrorKind::TimeoutError:
      return "TimeoutError";
    case ErrorKind::GlobalAccessError:
      return "GlobalAccessError";
    case ErrorKind::OutputValidationError:
      return "OutputValidationError";
  }
  return "RuntimeError";
}

std::optional<ErrorKind> ParseErrorKind(std::string_view s) {
  if (s == "SyntaxError") return ErrorKind::SyntaxError;
  if (s == "RuntimeError") return ErrorKind::RuntimeError;
  if (s == "TimeoutError") return ErrorKind::TimeoutError;
  if (s == "GlobalAccessError") return ErrorKind::GlobalAccessError;
  if (s == "OutputValidationError") return ErrorKind::OutputValidationError;
  return std::nullopt;
}

std::string_view ExecutionPhaseToString(ExecutionPhase phase) {
  switch (phase) {
    case ExecutionPhase::Idle:
      return "idle";
    case ExecutionPhase::Compiling:
      return "compiling";
    case ExecutionPhase::Executing:
      return "executing";
    case ExecutionPhase::Succeeded:
      return "succeeded";
    case ExecutionPhase::Failed:
      return "failed";
  }
  return "unknown";
}

nlohmann::json ResultToJson(const ScriptRuntimeResult& result) {
  nlohmann::json j;
  j["ok"] = result.IsOk();
  if (result.IsOk()) {
    j["output"] = OutputToJson(result.Output());
    return j;
  }

  const ScriptError& error = result.Error();
  nlohmann::json err;
  err["kind"] = std::string(ErrorKindToString(error.kind));
  err["message"] = error.message;
  if (error.line) {
    err["line"] = *error.line;
  }
  if (error.column) {
    err["column"] = *error.column;
  }
  j["error"] = std::move(err);
  return j;
}

}  // namespace widget_script
