#include "logging/trace.h"

#include <iostream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace widget_script {

bool Tracer::enabled_ = true;

namespace {

void AddTraceContext(nlohmann::json& log, const TraceContext* trace_ctx) {
  if (!trace_ctx) return;
  if (!trace_ctx->trace_key.empty()) {
    log["trace_key"] = trace_ctx->trace_key;
  }
  if (!trace_ctx->script_file.empty()) {
    log["script_file"] = trace_ctx->script_file;
  }
}

}  // namespace

std::string Tracer::SpanName(const std::string& op, const std::string& trace_key) {
  if (trace_key.empty()) {
    return op;
  }
  return fmt::format("{}({})", op, trace_key);
}

std::string Tracer::DeriveTraceKey(const std::string& script_path) {
  if (script_path.empty()) {
    return "";
  }

  // Find the last path separator
  size_t last_sep = script_path.find_last_of("/\\");
  std::string filename = (last_sep == std::string::npos)
                             ? script_path
                             : script_path.substr(last_sep + 1);

  // Remove the extension
  size_t dot_pos = filename.find_last_of('.');
  if (dot_pos != std::string::npos && dot_pos > 0) {
    return filename.substr(0, dot_pos);
  }

  return filename;
}

void Tracer::LogRunStart(const std::string& runtime,
                         uint64_t sequence,
                         size_t source_bytes,
                         int64_t budget_ms,
                         const TraceContext* trace_ctx) {
  if (!enabled_) return;

  nlohmann::json log;
  log["event"] = "run_start";
  log["runtime"] = runtime;
  log["sequence"] = sequence;
  log["span_name"] = SpanName("script.run", trace_ctx ? trace_ctx->trace_key : "");
  log["source_bytes"] = source_bytes;
  log["budget_ms"] = budget_ms;
  AddTraceContext(log, trace_ctx);

  std::cout << log.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void Tracer::LogRunEnd(const std::string& runtime,
                       uint64_t sequence,
                       double duration_ms,
                       const std::string& phase,
                       const std::string& error_kind,
                       const std::string& error,
                       const TraceContext* trace_ctx) {
  if (!enabled_) return;

  nlohmann::json log;
  log["event"] = "run_end";
  log["runtime"] = runtime;
  log["sequence"] = sequence;
  log["span_name"] = SpanName("script.run", trace_ctx ? trace_ctx->trace_key : "");
  log["duration_ms"] = duration_ms;
  log["phase"] = phase;
  log["ok"] = error_kind.empty();
  AddTraceContext(log, trace_ctx);

  if (!error_kind.empty()) {
    log["error_kind"] = error_kind;
    log["error"] = error;
  }

  std::cout << log.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void Tracer::SetEnabled(bool enabled) {
  enabled_ = enabled;
}

bool Tracer::IsEnabled() {
  return enabled_;
}

}  // namespace widget_script
