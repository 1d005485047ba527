#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "policy/global_policy.h"
#include "runtime/result.h"

namespace widget_script {

/**
 * File name scripts are compiled under; stack positions are reported
 * against it.
 */
constexpr const char* kScriptFileName = "script.js";

/**
 * Lines the function wrapper adds before the first source line.
 */
constexpr int kWrapperLineOffset = 1;

/**
 * Longest name, message or backtrace kept from a thrown value. Scripts
 * control these strings, so anything past this is cut off.
 */
constexpr size_t kMaxExceptionTextBytes = 4096;

/**
 * What the interpreter told us about a thrown value.
 */
struct ExceptionInfo {
  std::string name;     // Error name ("TypeError"); empty if a non-Error was thrown
  std::string message;  // Error message, or String(value) for non-Errors
  std::string stack;    // Backtrace text, may be empty
};

struct SourcePosition {
  int line = 0;
  int column = 0;  // 0 if unknown
};

/**
 * Find the first script.js:<line>[:<col>] frame in a backtrace and map it
 * to a position in the user's source.
 */
std::optional<SourcePosition> ParseStackPosition(std::string_view stack);

/**
 * If message is a "x is not defined" reference failure, return x.
 */
std::optional<std::string> UndefinedIdentifier(std::string_view message);

/**
 * Cut text to kMaxExceptionTextBytes on a UTF-8 boundary, marking the cut
 * with "...".
 */
std::string TruncateExceptionText(std::string text);

/**
 * Map a thrown value to an ErrorKind:
 * - the governor fired                    -> TimeoutError
 * - SyntaxError while compiling           -> SyntaxError
 * - ReferenceError "x is not defined"     -> GlobalAccessError
 * - anything else                         -> RuntimeError
 */
ScriptError ClassifyException(const ExceptionInfo& info, ExecutionPhase phase,
                              bool timed_out, int64_t budget_ms);

ScriptError MakeTimeoutError(int64_t budget_ms, ExecutionPhase phase);

ScriptError MakePolicyViolationError(const PolicyViolation& violation);

// A ')', ']' or '}' that would close the function wrapper
ScriptError MakeUnbalancedSourceError(const UnmatchedCloser& closer);

}  // namespace widget_script
