#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "context/execution_context.h"
#include "logging/trace.h"
#include "policy/runtime_options.h"
#include "runtime/result.h"

namespace widget_script {

/**
 * Base interface for script runtimes.
 *
 * A runtime holds no per-call state: every Run() is independent, and a
 * single instance may be shared between threads. None of the methods
 * throw; every failure comes back as data.
 */
class ScriptRuntime {
 public:
  virtual ~ScriptRuntime() = default;

  /**
   * Compile and execute `source` as the body of function(context) and
   * validate what it returns.
   */
  virtual ScriptRuntimeResult Run(const std::string& source,
                                  const ExecutionContext& context,
                                  const RuntimeOptions& options,
                                  const TraceContext* trace_ctx = nullptr) = 0;

  /**
   * Run with DefaultRuntimeOptions().
   */
  ScriptRuntimeResult Run(const std::string& source, const ExecutionContext& context) {
    return Run(source, context, DefaultRuntimeOptions());
  }

  /**
   * Check policy and syntax without executing anything.
   * Returns std::nullopt if the script compiles.
   */
  virtual std::optional<ScriptError> Compile(const std::string& source,
                                             const RuntimeOptions& options) = 0;

  /**
   * Validate a value produced elsewhere against the output schema.
   */
  virtual ScriptRuntimeResult ValidateOutput(const nlohmann::json& output,
                                             const RuntimeOptions& options) = 0;

  /**
   * Get the runtime name (used in traces).
   */
  virtual std::string Name() const = 0;
};

/**
 * Create the default (QuickJS) runtime.
 */
std::unique_ptr<ScriptRuntime> CreateRuntime();

}  // namespace widget_script
