#include "runtime/quickjs_runtime.h"

#include <cstring>
#include <exception>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

extern "C" {
#include "quickjs.h"
}

#include "policy/global_policy.h"
#include "runtime/error_classifier.h"
#include "runtime/governor.h"
#include "runtime/normalizer.h"

namespace widget_script {

namespace {

// Nesting limit for converted return values; deeper structures are
// reported as output errors (this is also what stops cycles).
constexpr int kMaxOutputDepth = 16;

// Removes the Function constructors reachable from function prototypes:
// (function(){}).constructor, (function*(){}).constructor, and the async
// variants would otherwise hand out eval even after the globals are gone.
constexpr const char* kNeuterConstructorsSource = R"(
(function () {
  var samples = [function () {}, function* () {}, async function () {}, async function* () {}];
  for (var i = 0; i < samples.length; i++) {
    Object.defineProperty(Object.getPrototypeOf(samples[i]), 'constructor',
                          { value: undefined, writable: false, configurable: false });
  }
})();
)";

// Per-run state reachable from C callbacks via JS_GetContextOpaque
struct SandboxState {
  const ExecutionContext* context;
};

// Owns a JSRuntime/JSContext pair for exactly one call.
class ScopedSandbox {
 public:
  ScopedSandbox(const RuntimeOptions& options, ResourceGovernor* governor,
                SandboxState* state);
  ~ScopedSandbox();

  ScopedSandbox(const ScopedSandbox&) = delete;
  ScopedSandbox& operator=(const ScopedSandbox&) = delete;

  bool Ok() const { return ctx_ != nullptr; }
  JSContext* Context() const { return ctx_; }

 private:
  JSRuntime* rt_ = nullptr;
  JSContext* ctx_ = nullptr;
};

// Frees a JSValue on scope exit unless released.
class JsValueGuard {
 public:
  JsValueGuard(JSContext* ctx, JSValue value) : ctx_(ctx), value_(value) {}
  ~JsValueGuard() { JS_FreeValue(ctx_, value_); }

  JsValueGuard(const JsValueGuard&) = delete;
  JsValueGuard& operator=(const JsValueGuard&) = delete;

  JSValueConst Get() const { return value_; }
  bool IsException() const { return JS_IsException(value_); }

  JSValue Release() {
    JSValue v = value_;
    value_ = JS_UNDEFINED;
    return v;
  }

 private:
  JSContext* ctx_;
  JSValue value_;
};

enum class ConvertStatus : uint8_t {
  Ok = 0,
  TooLarge = 1,
  TooDeep = 2,
  Exception = 3,  // A getter threw or the interpreter was interrupted
};

}  // namespace

// Interrupt handler bridging QuickJS to the wall-clock governor
static int JsInterruptHandler(JSRuntime* /*rt*/, void* opaque) {
  auto* governor = static_cast<ResourceGovernor*>(opaque);
  return governor->Poll() ? 1 : 0;
}

ScopedSandbox::ScopedSandbox(const RuntimeOptions& options, ResourceGovernor* governor,
                             SandboxState* state) {
  rt_ = JS_NewRuntime();
  if (!rt_) return;

  int64_t memory = options.max_memory_bytes > 0 ? options.max_memory_bytes
                                                 : kDefaultMaxMemoryBytes;
  int64_t stack = options.max_stack_bytes > 0 ? options.max_stack_bytes
                                              : kDefaultMaxStackBytes;
  JS_SetMemoryLimit(rt_, static_cast<size_t>(memory));
  JS_SetMaxStackSize(rt_, static_cast<size_t>(stack));
  JS_SetInterruptHandler(rt_, JsInterruptHandler, governor);

  // A fresh context per call; std/os modules are never added.
  ctx_ = JS_NewContext(rt_);
  if (ctx_) {
    JS_SetContextOpaque(ctx_, state);
  }
}

ScopedSandbox::~ScopedSandbox() {
  if (ctx_) JS_FreeContext(ctx_);
  if (rt_) JS_FreeRuntime(rt_);
}

// Drop whatever exception is pending
static void JsClearException(JSContext* ctx) {
  JSValue exc = JS_GetException(ctx);
  JS_FreeValue(ctx, exc);
}

// Get string from JS value; empty if conversion itself throws
static std::string JsGetString(JSContext* ctx, JSValueConst val) {
  size_t len = 0;
  const char* str = JS_ToCStringLen(ctx, &len, val);
  if (!str) {
    JsClearException(ctx);
    return "";
  }
  std::string result(str, len);
  JS_FreeCString(ctx, str);
  return result;
}

static std::string JsGetStringProperty(JSContext* ctx, JSValueConst obj, const char* name) {
  JSValue prop = JS_GetPropertyStr(ctx, obj, name);
  if (JS_IsException(prop)) {
    JsClearException(ctx);
    return "";
  }
  std::string result;
  if (!JS_IsUndefined(prop) && !JS_IsNull(prop)) {
    result = JsGetString(ctx, prop);
  }
  JS_FreeValue(ctx, prop);
  return result;
}

// Take the pending exception and read what the classifier needs from it
static ExceptionInfo ExtractExceptionInfo(JSContext* ctx) {
  ExceptionInfo info;
  JSValue exc = JS_GetException(ctx);
  if (JS_IsError(ctx, exc)) {
    info.name = TruncateExceptionText(JsGetStringProperty(ctx, exc, "name"));
    info.message = TruncateExceptionText(JsGetStringProperty(ctx, exc, "message"));
    info.stack = TruncateExceptionText(JsGetStringProperty(ctx, exc, "stack"));
  } else {
    info.message = TruncateExceptionText(JsGetString(ctx, exc));
  }
  JS_FreeValue(ctx, exc);
  return info;
}

static ScriptRuntimeResult FailFromException(JSContext* ctx, ExecutionPhase phase,
                                             const ResourceGovernor& governor) {
  ExceptionInfo info = ExtractExceptionInfo(ctx);
  return ErrorResult(ClassifyException(info, phase, governor.TimedOut(), governor.BudgetMs()));
}

static JSValue PrimitiveToJs(JSContext* ctx, const PrimitiveValue& value) {
  switch (GetValueType(value)) {
    case ValueType::Null:
      return JS_NULL;
    case ValueType::Bool:
      return JS_NewBool(ctx, std::get<bool>(value));
    case ValueType::Number:
      return JS_NewFloat64(ctx, std::get<double>(value));
    case ValueType::String: {
      const auto& s = std::get<std::string>(value);
      return JS_NewStringLen(ctx, s.data(), s.size());
    }
  }
  return JS_UNDEFINED;
}

// context.get(key)
static JSValue JsContextGet(JSContext* ctx, JSValueConst /*this_val*/,
                            int argc, JSValueConst* argv) {
  auto* state = static_cast<SandboxState*>(JS_GetContextOpaque(ctx));
  if (argc < 1) {
    return JS_NewString(ctx, "");
  }

  size_t len = 0;
  const char* key = JS_ToCStringLen(ctx, &len, argv[0]);
  if (!key) return JS_EXCEPTION;

  // C++ exceptions must not unwind through the interpreter
  try {
    PrimitiveValue value = state->context->Get(std::string_view(key, len));
    JS_FreeCString(ctx, key);
    return PrimitiveToJs(ctx, value);
  } catch (const std::exception& e) {
    JS_FreeCString(ctx, key);
    return JS_ThrowInternalError(ctx, "context.get failed: %s", e.what());
  }
}

// Build the frozen `context` argument
static JSValue NewContextObject(JSContext* ctx, const ExecutionContext& context) {
  JSValue obj = JS_NewObject(ctx);
  if (JS_IsException(obj)) return obj;

  if (JS_DefinePropertyValueStr(ctx, obj, "now", JS_NewInt64(ctx, context.Now()),
                                JS_PROP_ENUMERABLE) < 0 ||
      JS_DefinePropertyValueStr(ctx, obj, "get", JS_NewCFunction(ctx, JsContextGet, "get", 1),
                                JS_PROP_ENUMERABLE) < 0 ||
      JS_PreventExtensions(ctx, obj) < 0) {
    JS_FreeValue(ctx, obj);
    return JS_EXCEPTION;
  }
  return obj;
}

// Neuter function constructors and delete every unreachable global.
// Returns false with a pending exception on failure.
static bool InstallGlobalSurface(JSContext* ctx, const GlobalSurfacePolicy& policy) {
  if (!policy.IsReachable("Function")) {
    JSValue r = JS_Eval(ctx, kNeuterConstructorsSource, std::strlen(kNeuterConstructorsSource),
                        "<sandbox>", JS_EVAL_TYPE_GLOBAL | JS_EVAL_FLAG_STRICT);
    if (JS_IsException(r)) return false;
    JS_FreeValue(ctx, r);
  }

  JSValue global = JS_GetGlobalObject(ctx);
  JSPropertyEnum* props = nullptr;
  uint32_t prop_count = 0;
  if (JS_GetOwnPropertyNames(ctx, &props, &prop_count, global, JS_GPN_STRING_MASK) < 0) {
    JS_FreeValue(ctx, global);
    return false;
  }

  bool ok = true;
  for (uint32_t i = 0; i < prop_count; i++) {
    if (ok) {
      const char* name = JS_AtomToCString(ctx, props[i].atom);
      if (!name) {
        ok = false;
      } else {
        std::string_view view(name);
        // Non-configurable value properties; nothing to gain from them
        bool keep = view == "undefined" || view == "NaN" || view == "Infinity" ||
                    policy.IsReachable(view);
        JS_FreeCString(ctx, name);
        if (!keep && JS_DeleteProperty(ctx, global, props[i].atom, 0) < 0) {
          ok = false;
        }
      }
    }
    JS_FreeAtom(ctx, props[i].atom);
  }
  js_free(ctx, props);
  JS_FreeValue(ctx, global);
  return ok;
}

static void ChargeBytes(int64_t* budget, int64_t bytes) {
  *budget -= bytes;
}

// Convert a JS value to JSON with depth and size bounds.
static ConvertStatus JsToJson(JSContext* ctx, JSValueConst val, int depth,
                              int64_t* budget, nlohmann::json* out) {
  if (depth > kMaxOutputDepth) {
    return ConvertStatus::TooDeep;
  }
  if (*budget < 0) {
    return ConvertStatus::TooLarge;
  }

  if (JS_IsNull(val) || JS_IsUndefined(val)) {
    ChargeBytes(budget, 4);
    *out = nullptr;
    return ConvertStatus::Ok;
  }
  if (JS_IsBool(val)) {
    ChargeBytes(budget, 5);
    *out = JS_ToBool(ctx, val) != 0;
    return ConvertStatus::Ok;
  }
  if (JS_IsNumber(val)) {
    double d = 0.0;
    if (JS_ToFloat64(ctx, &d, val) < 0) return ConvertStatus::Exception;
    ChargeBytes(budget, 8);
    *out = d;
    return ConvertStatus::Ok;
  }
  if (JS_IsString(val)) {
    size_t len = 0;
    const char* str = JS_ToCStringLen(ctx, &len, val);
    if (!str) return ConvertStatus::Exception;
    ChargeBytes(budget, static_cast<int64_t>(len) + 2);
    if (*budget < 0) {
      JS_FreeCString(ctx, str);
      return ConvertStatus::TooLarge;
    }
    *out = std::string(str, len);
    JS_FreeCString(ctx, str);
    return ConvertStatus::Ok;
  }
  if (JS_IsFunction(ctx, val)) {
    // Functions are objects as far as the output schema is concerned
    ChargeBytes(budget, 2);
    *out = nlohmann::json::object();
    return ConvertStatus::Ok;
  }

  int is_array = JS_IsArray(ctx, val);
  if (is_array < 0) return ConvertStatus::Exception;
  if (is_array) {
    JSValue length_val = JS_GetPropertyStr(ctx, val, "length");
    if (JS_IsException(length_val)) return ConvertStatus::Exception;
    int64_t length = 0;
    int rc = JS_ToInt64(ctx, &length, length_val);
    JS_FreeValue(ctx, length_val);
    if (rc < 0) return ConvertStatus::Exception;

    nlohmann::json arr = nlohmann::json::array();
    for (int64_t i = 0; i < length; i++) {
      ChargeBytes(budget, 1);
      if (*budget < 0) return ConvertStatus::TooLarge;
      JSValue elem = JS_GetPropertyInt64(ctx, val, i);
      if (JS_IsException(elem)) return ConvertStatus::Exception;
      nlohmann::json item;
      ConvertStatus status = JsToJson(ctx, elem, depth + 1, budget, &item);
      JS_FreeValue(ctx, elem);
      if (status != ConvertStatus::Ok) return status;
      arr.push_back(std::move(item));
    }
    *out = std::move(arr);
    return ConvertStatus::Ok;
  }

  if (JS_IsObject(val)) {
    nlohmann::json obj = nlohmann::json::object();
    JSPropertyEnum* props = nullptr;
    uint32_t prop_count = 0;
    if (JS_GetOwnPropertyNames(ctx, &props, &prop_count, val,
                               JS_GPN_STRING_MASK | JS_GPN_ENUM_ONLY) < 0) {
      return ConvertStatus::Exception;
    }

    ConvertStatus status = ConvertStatus::Ok;
    for (uint32_t i = 0; i < prop_count; i++) {
      if (status == ConvertStatus::Ok) {
        const char* key = JS_AtomToCString(ctx, props[i].atom);
        if (!key) {
          status = ConvertStatus::Exception;
        } else {
          std::string key_str(key);
          JS_FreeCString(ctx, key);
          ChargeBytes(budget, static_cast<int64_t>(key_str.size()) + 4);
          if (*budget < 0) {
            status = ConvertStatus::TooLarge;
          } else {
            JSValue prop_val = JS_GetProperty(ctx, val, props[i].atom);
            if (JS_IsException(prop_val)) {
              status = ConvertStatus::Exception;
            } else {
              nlohmann::json item;
              status = JsToJson(ctx, prop_val, depth + 1, budget, &item);
              JS_FreeValue(ctx, prop_val);
              if (status == ConvertStatus::Ok) {
                obj[key_str] = std::move(item);
              }
            }
          }
        }
      }
      JS_FreeAtom(ctx, props[i].atom);
    }
    js_free(ctx, props);
    if (status != ConvertStatus::Ok) return status;
    *out = std::move(obj);
    return ConvertStatus::Ok;
  }

  // Symbols, BigInts and anything else without a JSON form
  ChargeBytes(budget, 4);
  *out = nullptr;
  return ConvertStatus::Ok;
}

static std::string WrapSource(const std::string& source) {
  // One line of prefix; kWrapperLineOffset must match. PreScan guarantees
  // the source cannot close the wrapper early.
  return fmt::format("(function ({}) {{\"use strict\";\n{}\n}})", kContextParamName, source);
}

// Lexical checks that run before any interpreter exists
static std::optional<ScriptError> PreScan(const std::string& source,
                                          const GlobalSurfacePolicy& policy) {
  SourceScan scan = ScanSource(source);
  if (scan.unmatched) {
    return MakeUnbalancedSourceError(*scan.unmatched);
  }
  if (auto violation = policy.Check(scan)) {
    return MakePolicyViolationError(*violation);
  }
  return std::nullopt;
}

static ScriptRuntimeResult ExecuteInSandbox(const std::string& source,
                                            const ExecutionContext& context,
                                            const RuntimeOptions& options,
                                            ResourceGovernor& governor) {
  GlobalSurfacePolicy policy(options);
  if (auto error = PreScan(source, policy)) {
    return ErrorResult(std::move(*error));
  }

  SandboxState state{&context};
  ScopedSandbox sandbox(options, &governor, &state);
  if (!sandbox.Ok()) {
    return ErrorResult(MakeError(ErrorKind::RuntimeError, "Failed to create script sandbox",
                                 ExecutionPhase::Compiling));
  }
  JSContext* ctx = sandbox.Context();

  if (!InstallGlobalSurface(ctx, policy)) {
    return FailFromException(ctx, ExecutionPhase::Compiling, governor);
  }

  std::string wrapped = WrapSource(source);
  JsValueGuard compiled(ctx, JS_Eval(ctx, wrapped.c_str(), wrapped.size(), kScriptFileName,
                                     JS_EVAL_TYPE_GLOBAL | JS_EVAL_FLAG_STRICT |
                                         JS_EVAL_FLAG_COMPILE_ONLY));
  if (compiled.IsException()) {
    return FailFromException(ctx, ExecutionPhase::Compiling, governor);
  }

  // JS_EvalFunction takes ownership of the compiled script
  JsValueGuard fn(ctx, JS_EvalFunction(ctx, compiled.Release()));
  if (fn.IsException()) {
    return FailFromException(ctx, ExecutionPhase::Executing, governor);
  }

  JsValueGuard context_obj(ctx, NewContextObject(ctx, context));
  if (context_obj.IsException()) {
    return FailFromException(ctx, ExecutionPhase::Executing, governor);
  }

  JSValue args[1] = {context_obj.Get()};
  JsValueGuard ret(ctx, JS_Call(ctx, fn.Get(), JS_UNDEFINED, 1, args));
  if (ret.IsException()) {
    return FailFromException(ctx, ExecutionPhase::Executing, governor);
  }

  // Conversion can run user getters, so it stays under the governor
  nlohmann::json raw;
  int64_t output_budget = options.max_output_bytes > 0 ? options.max_output_bytes
                                                       : kDefaultMaxOutputBytes;
  ConvertStatus status = JsToJson(ctx, ret.Get(), 0, &output_budget, &raw);
  if (status == ConvertStatus::Exception) {
    return FailFromException(ctx, ExecutionPhase::Executing, governor);
  }

  if (governor.TimedOut()) {
    return ErrorResult(MakeTimeoutError(governor.BudgetMs(), ExecutionPhase::Executing));
  }

  int64_t limit = options.max_output_bytes > 0 ? options.max_output_bytes
                                               : kDefaultMaxOutputBytes;
  if (status == ConvertStatus::TooLarge) {
    return ErrorResult(MakeError(ErrorKind::OutputValidationError,
                                 fmt::format("Script output exceeds the {} byte limit", limit),
                                 ExecutionPhase::Executing));
  }
  if (status == ConvertStatus::TooDeep) {
    return ErrorResult(MakeError(ErrorKind::OutputValidationError,
                                 "Script output is nested more than " +
                                     std::to_string(kMaxOutputDepth) +
                                     " levels deep (or is cyclic)",
                                 ExecutionPhase::Executing));
  }

  return NormalizeOutput(raw, limit);
}

ScriptRuntimeResult QuickJsRuntime::Run(const std::string& source,
                                        const ExecutionContext& context,
                                        const RuntimeOptions& options,
                                        const TraceContext* trace_ctx) {
  uint64_t sequence = next_sequence_.fetch_add(1);
  ResourceGovernor governor(options.EffectiveMaxExecutionMs());
  Tracer::LogRunStart(Name(), sequence, source.size(), governor.BudgetMs(), trace_ctx);

  auto execute = [&]() -> ScriptRuntimeResult {
    try {
      return ExecuteInSandbox(source, context, options, governor);
    } catch (const std::exception& e) {
      return ErrorResult(MakeError(ErrorKind::RuntimeError,
                                   std::string("Internal error: ") + e.what(),
                                   ExecutionPhase::Executing));
    }
  };
  ScriptRuntimeResult result = execute();

  RunStats& stats = result.MutableStats();
  stats.sequence = sequence;
  stats.elapsed_ms = governor.ElapsedMs();

  if (result.IsOk()) {
    Tracer::LogRunEnd(Name(), sequence, stats.elapsed_ms,
                      std::string(ExecutionPhaseToString(stats.final_phase)), "", "", trace_ctx);
  } else {
    Tracer::LogRunEnd(Name(), sequence, stats.elapsed_ms,
                      std::string(ExecutionPhaseToString(result.Error().phase)),
                      std::string(ErrorKindToString(result.Error().kind)),
                      result.Error().message, trace_ctx);
  }
  return result;
}

std::optional<ScriptError> QuickJsRuntime::Compile(const std::string& source,
                                                   const RuntimeOptions& options) {
  try {
    GlobalSurfacePolicy policy(options);
    if (auto error = PreScan(source, policy)) {
      return error;
    }

    ResourceGovernor governor(options.EffectiveMaxExecutionMs());
    ExecutionContext empty;
    SandboxState state{&empty};
    ScopedSandbox sandbox(options, &governor, &state);
    if (!sandbox.Ok()) {
      return MakeError(ErrorKind::RuntimeError, "Failed to create script sandbox",
                       ExecutionPhase::Compiling);
    }
    JSContext* ctx = sandbox.Context();

    std::string wrapped = WrapSource(source);
    JsValueGuard compiled(ctx, JS_Eval(ctx, wrapped.c_str(), wrapped.size(), kScriptFileName,
                                       JS_EVAL_TYPE_GLOBAL | JS_EVAL_FLAG_STRICT |
                                           JS_EVAL_FLAG_COMPILE_ONLY));
    if (compiled.IsException()) {
      ExceptionInfo info = ExtractExceptionInfo(ctx);
      return ClassifyException(info, ExecutionPhase::Compiling, governor.TimedOut(),
                               governor.BudgetMs());
    }
    return std::nullopt;
  } catch (const std::exception& e) {
    return MakeError(ErrorKind::RuntimeError, std::string("Internal error: ") + e.what(),
                     ExecutionPhase::Compiling);
  }
}

ScriptRuntimeResult QuickJsRuntime::ValidateOutput(const nlohmann::json& output,
                                                   const RuntimeOptions& options) {
  int64_t limit = options.max_output_bytes > 0 ? options.max_output_bytes
                                               : kDefaultMaxOutputBytes;
  try {
    return NormalizeOutput(output, limit);
  } catch (const std::exception& e) {
    return ErrorResult(MakeError(ErrorKind::OutputValidationError,
                                 std::string("Internal error: ") + e.what(),
                                 ExecutionPhase::Executing));
  }
}

std::unique_ptr<ScriptRuntime> CreateRuntime() {
  return std::make_unique<QuickJsRuntime>();
}

}  // namespace widget_script
