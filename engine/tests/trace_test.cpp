#include <catch2/catch_test_macros.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "logging/trace.h"

using namespace widget_script;

namespace {

// Redirects std::cout for the lifetime of the object
class CaptureStdout {
 public:
  CaptureStdout() : old_(std::cout.rdbuf(buffer_.rdbuf())) {}
  ~CaptureStdout() { std::cout.rdbuf(old_); }

  std::vector<nlohmann::json> Lines() const {
    std::vector<nlohmann::json> out;
    std::istringstream in(buffer_.str());
    std::string line;
    while (std::getline(in, line)) {
      if (!line.empty()) out.push_back(nlohmann::json::parse(line));
    }
    return out;
  }

 private:
  std::ostringstream buffer_;
  std::streambuf* old_;
};

}  // namespace

TEST_CASE("Tracer span names", "[trace]") {
  REQUIRE(Tracer::SpanName("script.run", "") == "script.run");
  REQUIRE(Tracer::SpanName("script.run", "clock") == "script.run(clock)");
}

TEST_CASE("Tracer DeriveTraceKey", "[trace]") {
  REQUIRE(Tracer::DeriveTraceKey("widgets/clock.js") == "clock");
  REQUIRE(Tracer::DeriveTraceKey("C:\\widgets\\weather.js") == "weather");
  REQUIRE(Tracer::DeriveTraceKey("greeting") == "greeting");
  REQUIRE(Tracer::DeriveTraceKey(".hidden") == ".hidden");
  REQUIRE(Tracer::DeriveTraceKey("") == "");
}

TEST_CASE("Tracer run events", "[trace]") {
  Tracer::SetEnabled(true);
  TraceContext trace_ctx{"clock", "widgets/clock.js"};

  SECTION("run_start") {
    CaptureStdout capture;
    Tracer::LogRunStart("quickjs", 7, 120, 5000, &trace_ctx);
    auto lines = capture.Lines();
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0]["event"] == "run_start");
    REQUIRE(lines[0]["sequence"] == 7);
    REQUIRE(lines[0]["source_bytes"] == 120);
    REQUIRE(lines[0]["budget_ms"] == 5000);
    REQUIRE(lines[0]["span_name"] == "script.run(clock)");
    REQUIRE(lines[0]["script_file"] == "widgets/clock.js");
  }

  SECTION("run_end success") {
    CaptureStdout capture;
    Tracer::LogRunEnd("quickjs", 7, 1.5, "succeeded");
    auto lines = capture.Lines();
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0]["ok"] == true);
    REQUIRE(lines[0]["phase"] == "succeeded");
    REQUIRE_FALSE(lines[0].contains("error_kind"));
    REQUIRE_FALSE(lines[0].contains("trace_key"));
  }

  SECTION("run_end failure") {
    CaptureStdout capture;
    Tracer::LogRunEnd("quickjs", 8, 100.2, "executing", "TimeoutError",
                      "Script execution timed out after 100 ms.", &trace_ctx);
    auto lines = capture.Lines();
    REQUIRE(lines[0]["ok"] == false);
    REQUIRE(lines[0]["error_kind"] == "TimeoutError");
    REQUIRE(lines[0]["trace_key"] == "clock");
  }

  SECTION("invalid UTF-8 in messages is replaced") {
    CaptureStdout capture;
    Tracer::LogRunEnd("quickjs", 9, 0.0, "executing", "RuntimeError", "bad \xff byte");
    auto lines = capture.Lines();
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0]["error_kind"] == "RuntimeError");
  }

  SECTION("disabled tracer is silent") {
    CaptureStdout capture;
    Tracer::SetEnabled(false);
    Tracer::LogRunStart("quickjs", 1, 0, 5000);
    Tracer::LogRunEnd("quickjs", 1, 0.0, "succeeded");
    Tracer::SetEnabled(true);
    REQUIRE(capture.Lines().empty());
  }
}
