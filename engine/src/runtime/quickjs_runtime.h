#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include "runtime/script_runtime.h"

namespace widget_script {

/**
 * QuickJsRuntime executes widget scripts in an embedded QuickJS engine.
 *
 * Each Run():
 * 1. Rejects references to forbidden globals (static scan)
 * 2. Creates a private JSRuntime/JSContext with memory and stack limits
 * 3. Strips the global object down to the reachable surface and removes
 *    the Function constructors reachable through function prototypes
 * 4. Compiles the source as `function (context) { "use strict"; ... }`
 * 5. Calls it with a frozen context object under the wall-clock governor
 * 6. Converts and validates the return value
 * 7. Frees everything, whichever way the run ended
 *
 * Sandbox guarantees:
 * - No QuickJS std/os modules exposed
 * - No filesystem/network/process APIs
 * - The only data source is the ExecutionContext snapshot
 */
class QuickJsRuntime : public ScriptRuntime {
 public:
  QuickJsRuntime() = default;
  ~QuickJsRuntime() override = default;

  using ScriptRuntime::Run;

  ScriptRuntimeResult Run(const std::string& source,
                          const ExecutionContext& context,
                          const RuntimeOptions& options,
                          const TraceContext* trace_ctx = nullptr) override;

  std::optional<ScriptError> Compile(const std::string& source,
                                     const RuntimeOptions& options) override;

  ScriptRuntimeResult ValidateOutput(const nlohmann::json& output,
                                     const RuntimeOptions& options) override;

  std::string Name() const override { return "quickjs"; }

 private:
  std::atomic<uint64_t> next_sequence_{1};
};

}  // namespace widget_script
