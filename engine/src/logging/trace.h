#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace widget_script {

/**
 * Tracing context for a script run.
 * Lets callers tag runs, e.g. with the widget or file the script came from.
 */
struct TraceContext {
  std::string trace_key;    // Caller-chosen label
  std::string script_file;  // Source file path, if any
};

/**
 * Tracer - structured logging for script runs.
 */
class Tracer {
 public:
  /**
   * Log run start.
   * @param trace_ctx Optional caller tags
   */
  static void LogRunStart(const std::string& runtime,
                          uint64_t sequence,
                          size_t source_bytes,
                          int64_t budget_ms,
                          const TraceContext* trace_ctx = nullptr);

  /**
   * Log run end.
   * @param error_kind Empty on success
   */
  static void LogRunEnd(const std::string& runtime,
                        uint64_t sequence,
                        double duration_ms,
                        const std::string& phase,
                        const std::string& error_kind = "",
                        const std::string& error = "",
                        const TraceContext* trace_ctx = nullptr);

  /**
   * Compute span name from op and trace_key.
   * Format: op(trace_key) if trace_key is present, otherwise just op.
   */
  static std::string SpanName(const std::string& op, const std::string& trace_key);

  /**
   * Derive a trace key from a script file path.
   * Extracts the filename stem (e.g., "widgets/clock.js" -> "clock").
   */
  static std::string DeriveTraceKey(const std::string& script_path);

  /**
   * Enable/disable tracing output.
   */
  static void SetEnabled(bool enabled);

  /**
   * Check if tracing is enabled.
   */
  static bool IsEnabled();

 private:
  static bool enabled_;
};

}  // namespace widget_script
