#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "policy/runtime_options.h"

namespace widget_script {

/**
 * An identifier token in script source that refers to a binding
 * (not a property name or an object literal key).
 */
struct IdentifierRef {
  std::string name;
  int line = 0;    // 1-based
  int column = 0;  // 1-based
};

/**
 * A reference to a global the script may not reach.
 */
struct PolicyViolation {
  std::string identifier;
  int line = 0;
  int column = 0;
};

/**
 * Name of the parameter scripts receive their ExecutionContext through.
 */
constexpr const char* kContextParamName = "context";

/**
 * A ')', ']' or '}' with no matching opener in the source.
 */
struct UnmatchedCloser {
  char token = 0;
  int line = 0;
  int column = 0;
};

/**
 * What a lexical pass over script source found.
 */
struct SourceScan {
  std::vector<IdentifierRef> refs;
  std::set<std::string, std::less<>> declared;  // var/let/const/function/class, params, labels
  std::optional<UnmatchedCloser> unmatched;     // first closer that would leave the source
};

/**
 * Scan script source for identifier references and declared names.
 *
 * Skips comments, string literals, template literal text (but not the
 * ${...} substitutions), regular expression literals, numbers, property
 * names after '.' or '?.', private names, object literal keys, labels and
 * class member names. Unicode escapes in identifiers (eval) are decoded.
 */
SourceScan ScanSource(std::string_view source);

// ScanSource(source).refs
std::vector<IdentifierRef> ScanIdentifierRefs(std::string_view source);

// Keywords and contextual words that never resolve to a global
bool IsReservedWord(std::string_view name);

/**
 * GlobalSurfacePolicy - which global names a script may reach.
 *
 * Reachable = (allowed_globals + baseline intrinsics) - forbidden_globals.
 * Check() rejects, before anything runs, every reference to a forbidden
 * name and every reference to a name that is neither reachable nor
 * declared by the script. Unreachable names are also absent from the
 * sandbox global object, so a reference the scan misses still fails.
 */
class GlobalSurfacePolicy {
 public:
  explicit GlobalSurfacePolicy(const RuntimeOptions& options);

  bool IsForbidden(std::string_view name) const;

  bool IsReachable(std::string_view name) const;

  /**
   * Return the first reference in scan order that is forbidden, or that is
   * neither reachable, declared, a reserved word nor the context parameter.
   */
  std::optional<PolicyViolation> Check(const SourceScan& scan) const;

  // Check(ScanSource(source))
  std::optional<PolicyViolation> Scan(std::string_view source) const;

  /**
   * Language intrinsics that stay reachable without being listed:
   * undefined, NaN, Infinity, Boolean, the Error constructors,
   * parseInt, parseFloat, isNaN, isFinite.
   */
  static const std::set<std::string, std::less<>>& BaselineIntrinsics();

 private:
  std::set<std::string, std::less<>> allowed_;
  std::set<std::string, std::less<>> forbidden_;
};

}  // namespace widget_script
