#pragma once

#include <cstdint>
#include <set>
#include <string>

namespace widget_script {

constexpr int64_t kDefaultMaxExecutionMs = 5000;
constexpr int64_t kDefaultMaxMemoryBytes = 10 * 1024 * 1024;  // 10MB
constexpr int64_t kDefaultMaxStackBytes = 512 * 1024;
constexpr int64_t kDefaultMaxOutputBytes = 200 * 1024;

// Largest time budget a run may ask for (one hour)
constexpr int64_t kMaxExecutionMsCeiling = 60 * 60 * 1000;

/**
 * Execution policy for script runs.
 *
 * Immutable once handed to a runtime; shared by reference across calls.
 */
struct RuntimeOptions {
  int64_t max_execution_ms = kDefaultMaxExecutionMs;
  int64_t max_memory_bytes = kDefaultMaxMemoryBytes;
  int64_t max_stack_bytes = kDefaultMaxStackBytes;
  int64_t max_output_bytes = kDefaultMaxOutputBytes;
  std::set<std::string> allowed_globals;
  std::set<std::string> forbidden_globals;

  /**
   * Overlay fields from a JSON document onto this instance:
   * {
   *   "max_execution_ms": 100,
   *   "max_memory_bytes": 1048576,
   *   "max_stack_bytes": 262144,
   *   "max_output_bytes": 4096,
   *   "allowed_globals": ["Math", ...],
   *   "forbidden_globals": ["fetch", ...]
   * }
   * Budgets must be positive integers; max_execution_ms may not exceed
   * kMaxExecutionMsCeiling.
   * Returns false and sets error_out on failure; *this is unchanged then.
   */
  bool LoadFromJson(const std::string& json_str, std::string* error_out = nullptr);

  // Load from JSON file
  bool LoadFromFile(const std::string& path, std::string* error_out = nullptr);

  /**
   * Time budget actually enforced. A non-positive value never disables the
   * deadline; the default budget applies instead. Larger values are capped
   * at kMaxExecutionMsCeiling.
   */
  int64_t EffectiveMaxExecutionMs() const;
};

/**
 * Default policy: 5s budget and the canonical allow/deny lists.
 */
RuntimeOptions DefaultRuntimeOptions();

}  // namespace widget_script
