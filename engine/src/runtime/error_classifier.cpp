#include "runtime/error_classifier.h"

#include <charconv>

#include <fmt/format.h>

namespace widget_script {

namespace {

bool IsAsciiIdentStart(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
}

bool IsAsciiIdentPart(char c) {
  return IsAsciiIdentStart(c) || (c >= '0' && c <= '9');
}

// Parse a run of decimal digits at the front of text. Returns the number of
// characters consumed, or 0 if there are no digits or the value overflows.
size_t ParseDecimal(std::string_view text, int* out) {
  size_t digits = 0;
  while (digits < text.size() && text[digits] >= '0' && text[digits] <= '9') {
    ++digits;
  }
  if (digits == 0) {
    return 0;
  }
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + digits, *out);
  if (ec != std::errc() || ptr != text.data() + digits) {
    return 0;
  }
  return digits;
}

}  // namespace

std::optional<SourcePosition> ParseStackPosition(std::string_view stack) {
  constexpr std::string_view kFrame = "script.js:";

  size_t from = 0;
  while (true) {
    size_t at = stack.find(kFrame, from);
    if (at == std::string_view::npos) {
      return std::nullopt;
    }
    std::string_view rest = stack.substr(at + kFrame.size());
    from = at + kFrame.size();

    int line = 0;
    size_t used = ParseDecimal(rest, &line);
    if (used == 0) {
      continue;
    }

    SourcePosition pos;
    pos.line = line - kWrapperLineOffset;
    if (used < rest.size() && rest[used] == ':') {
      int column = 0;
      if (ParseDecimal(rest.substr(used + 1), &column) > 0) {
        pos.column = column;
      }
    }
    if (pos.line <= 0) {
      return std::nullopt;
    }
    return pos;
  }
}

std::optional<std::string> UndefinedIdentifier(std::string_view message) {
  // "'foo' is not defined" (older engines omit the quotes)
  constexpr std::string_view kSuffix = " is not defined";
  if (message.size() <= kSuffix.size() ||
      message.substr(message.size() - kSuffix.size()) != kSuffix) {
    return std::nullopt;
  }
  std::string_view name = message.substr(0, message.size() - kSuffix.size());
  if (!name.empty() && name.front() == '\'') name.remove_prefix(1);
  if (!name.empty() && name.back() == '\'') name.remove_suffix(1);

  if (name.empty() || !IsAsciiIdentStart(name.front())) {
    return std::nullopt;
  }
  for (char c : name) {
    if (!IsAsciiIdentPart(c)) {
      return std::nullopt;
    }
  }
  return std::string(name);
}

std::string TruncateExceptionText(std::string text) {
  if (text.size() <= kMaxExceptionTextBytes) {
    return text;
  }
  size_t cut = kMaxExceptionTextBytes;
  // Do not split a UTF-8 sequence
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  text.resize(cut);
  text += "...";
  return text;
}

ScriptError MakeTimeoutError(int64_t budget_ms, ExecutionPhase phase) {
  return MakeError(ErrorKind::TimeoutError,
                   fmt::format("Script execution timed out after {} ms.", budget_ms),
                   phase);
}

ScriptError MakePolicyViolationError(const PolicyViolation& violation) {
  return MakeError(ErrorKind::GlobalAccessError,
                   fmt::format("Access to '{}' is not allowed in scripts", violation.identifier),
                   ExecutionPhase::Compiling, violation.line, violation.column);
}

ScriptError MakeUnbalancedSourceError(const UnmatchedCloser& closer) {
  return MakeError(ErrorKind::SyntaxError,
                   fmt::format("SyntaxError: unexpected '{}' with no matching opener",
                               closer.token),
                   ExecutionPhase::Compiling, closer.line, closer.column);
}

ScriptError ClassifyException(const ExceptionInfo& info, ExecutionPhase phase,
                              bool timed_out, int64_t budget_ms) {
  if (timed_out) {
    return MakeTimeoutError(budget_ms, phase);
  }

  std::optional<int> line;
  std::optional<int> column;
  if (auto pos = ParseStackPosition(info.stack)) {
    line = pos->line;
    column = pos->column;
  }

  // String(error) form: "TypeError: x is not a function"
  std::string text = info.name.empty()
                         ? info.message
                         : (info.message.empty() ? info.name
                                                 : fmt::format("{}: {}", info.name, info.message));

  if (phase == ExecutionPhase::Compiling && info.name == "SyntaxError") {
    return MakeError(ErrorKind::SyntaxError, text, phase, line, column);
  }

  if (info.name == "ReferenceError") {
    if (auto ident = UndefinedIdentifier(info.message)) {
      return MakeError(ErrorKind::GlobalAccessError,
                       fmt::format("'{}' is not an allowed global ({})", *ident, text),
                       phase, line, column);
    }
  }

  return MakeError(ErrorKind::RuntimeError, text, phase, line, column);
}

}  // namespace widget_script
