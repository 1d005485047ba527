#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "context/data_provider.h"
#include "context/execution_context.h"
#include "keys/registry.h"
#include "logging/trace.h"
#include "policy/runtime_options.h"
#include "runtime/result.h"
#include "runtime/script_runtime.h"

using namespace widget_script;

void PrintUsage(const char* prog) {
  fmt::print("Usage: {} <script.js> [--options <options.json>] [--data <data.json>]\n"
             "       [--now <ms>] [--timeout-ms <n>] [--trace-key <key>] [--check] [--quiet]\n",
             prog);
}

bool ReadFile(const std::string& path, std::string* out, std::string* error_out) {
  std::ifstream file(path);
  if (!file.is_open()) {
    if (error_out) *error_out = "Failed to open file: " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  *out = buffer.str();
  return true;
}

bool ParseInt64(const std::string& text, int64_t* out) {
  try {
    size_t pos = 0;
    long long value = std::stoll(text, &pos);
    if (pos != text.size()) return false;
    *out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  std::string script_path;
  std::string options_path;
  std::string data_path;
  std::string trace_key;
  int64_t now_ms = CurrentTimeMs();
  int64_t timeout_ms = 0;
  bool check_only = false;
  bool quiet = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--options" && i + 1 < argc) {
      options_path = argv[++i];
    } else if (arg == "--data" && i + 1 < argc) {
      data_path = argv[++i];
    } else if (arg == "--trace-key" && i + 1 < argc) {
      trace_key = argv[++i];
    } else if (arg == "--now" && i + 1 < argc) {
      if (!ParseInt64(argv[++i], &now_ms)) {
        fmt::print(stderr, "Invalid --now value: {}\n", argv[i]);
        return 1;
      }
    } else if (arg == "--timeout-ms" && i + 1 < argc) {
      if (!ParseInt64(argv[++i], &timeout_ms) || timeout_ms <= 0) {
        fmt::print(stderr, "Invalid --timeout-ms value: {}\n", argv[i]);
        return 1;
      }
    } else if (arg == "--check") {
      check_only = true;
    } else if (arg == "--quiet") {
      quiet = true;
    } else if (arg[0] != '-') {
      script_path = arg;
    } else {
      fmt::print(stderr, "Unknown option: {}\n", arg);
      PrintUsage(argv[0]);
      return 1;
    }
  }

  if (script_path.empty()) {
    fmt::print(stderr, "Error: script path required\n");
    PrintUsage(argv[0]);
    return 1;
  }

  // Set tracing based on quiet flag
  Tracer::SetEnabled(!quiet);

  std::string error;
  std::string source;
  if (!ReadFile(script_path, &source, &error)) {
    fmt::print(stderr, "Error loading script: {}\n", error);
    return 1;
  }

  RuntimeOptions options = DefaultRuntimeOptions();
  if (!options_path.empty() && !options.LoadFromFile(options_path, &error)) {
    fmt::print(stderr, "Error loading options: {}\n", error);
    return 1;
  }
  if (timeout_ms > 0) {
    options.max_execution_ms = timeout_ms;
  }

  auto runtime = CreateRuntime();
  auto dump = [](const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
  };

  if (check_only) {
    auto compile_error = runtime->Compile(source, options);
    nlohmann::json out;
    out["ok"] = !compile_error.has_value();
    if (compile_error) {
      out["error"] = {
          {"kind", std::string(ErrorKindToString(compile_error->kind))},
          {"message", compile_error->message},
      };
      if (compile_error->line) out["error"]["line"] = *compile_error->line;
      if (compile_error->column) out["error"]["column"] = *compile_error->column;
    }
    fmt::print("{}\n", dump(out));
    return compile_error ? 2 : 0;
  }

  // Build the data provider: clock fields first, then file values on top
  DataKeyRegistry registry;
  registry.LoadFromCompiled();
  ContextSnapshotBuilder builder(registry);

  InMemoryDataProvider provider;
  FillTimeFields(provider, now_ms);
  if (!data_path.empty()) {
    std::string data_json;
    if (!ReadFile(data_path, &data_json, &error) || !provider.LoadFromJson(data_json, &error)) {
      fmt::print(stderr, "Error loading data: {}\n", error);
      return 1;
    }
    // LoadFromJson has validated the document
    for (const auto& item : nlohmann::json::parse(data_json).items()) {
      if (!registry.GetByName(item.key())) {
        builder.WithKey(item.key());
      }
    }
  }

  ExecutionContext context = builder.Build(now_ms, provider);

  TraceContext trace_ctx;
  trace_ctx.script_file = script_path;
  trace_ctx.trace_key = trace_key.empty() ? Tracer::DeriveTraceKey(script_path) : trace_key;

  ScriptRuntimeResult result = runtime->Run(source, context, options, &trace_ctx);
  fmt::print("{}\n", dump(ResultToJson(result)));
  return result.IsOk() ? 0 : 2;
}
