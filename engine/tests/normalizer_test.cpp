#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <nlohmann/json.hpp>

#include "runtime/normalizer.h"

using namespace widget_script;
using Catch::Matchers::ContainsSubstring;
using nlohmann::json;

namespace {

ScriptRuntimeResult Normalize(const char* text) {
  return NormalizeOutput(json::parse(text));
}

void RequireInvalid(const ScriptRuntimeResult& r, const std::string& fragment) {
  REQUIRE_FALSE(r.IsOk());
  REQUIRE(r.Error().kind == ErrorKind::OutputValidationError);
  REQUIRE_THAT(r.Error().message, ContainsSubstring(fragment));
}

}  // namespace

TEST_CASE("Normalize text output", "[normalizer]") {
  SECTION("string value") {
    auto r = Normalize(R"({"type": "text", "value": "Hello, World!"})");
    REQUIRE(r.IsOk());
    REQUIRE(std::get<TextOutput>(r.Output()) == TextOutput{"Hello, World!"});
  }

  SECTION("primitives are coerced") {
    auto r = Normalize(R"({"type": "text", "value": 23})");
    REQUIRE(std::get<TextOutput>(r.Output()).value == "23");

    r = Normalize(R"({"type": "text", "value": 21.5})");
    REQUIRE(std::get<TextOutput>(r.Output()).value == "21.5");

    r = Normalize(R"({"type": "text", "value": true})");
    REQUIRE(std::get<TextOutput>(r.Output()).value == "true");
  }

  SECTION("extra fields are dropped") {
    auto r = Normalize(R"({"type": "text", "value": "a", "color": "red"})");
    REQUIRE(OutputToJson(r.Output()) == json::parse(R"({"type": "text", "value": "a"})"));
  }

  SECTION("missing or null value") {
    RequireInvalid(Normalize(R"({"type": "text"})"), "requires a 'value'");
    RequireInvalid(Normalize(R"({"type": "text", "value": null})"), "requires a 'value'");
  }

  SECTION("structured value") {
    RequireInvalid(Normalize(R"({"type": "text", "value": {"a": 1}})"), "got object");
    RequireInvalid(Normalize(R"({"type": "text", "value": [1]})"), "got array");
  }
}

TEST_CASE("Normalize list output", "[normalizer]") {
  SECTION("items") {
    auto r = Normalize(R"({"type": "list", "items": [{"value": "a"}, {"value": "b"}]})");
    REQUIRE(r.IsOk());
    const auto& list = std::get<ListOutput>(r.Output());
    REQUIRE(list.items.size() == 2);
    REQUIRE(list.items[1].value == "b");
  }

  SECTION("empty list") {
    auto r = Normalize(R"({"type": "list", "items": []})");
    REQUIRE(r.IsOk());
    REQUIRE(std::get<ListOutput>(r.Output()).items.empty());
  }

  SECTION("numeric item values") {
    auto r = Normalize(R"({"type": "list", "items": [{"value": 72}]})");
    REQUIRE(std::get<ListOutput>(r.Output()).items[0].value == "72");
  }

  SECTION("items must be an array") {
    RequireInvalid(Normalize(R"({"type": "list"})"), "'items' array");
    RequireInvalid(Normalize(R"({"type": "list", "items": "a,b"})"), "'items' array");
  }

  SECTION("bad item reports its index") {
    RequireInvalid(Normalize(R"({"type": "list", "items": [{"value": "a"}, "b"]})"),
                   "List item 1");
    RequireInvalid(Normalize(R"({"type": "list", "items": [{"label": "a"}]})"),
                   "List item 0 is missing 'value'");
    RequireInvalid(Normalize(R"({"type": "list", "items": [{"value": [1]}]})"),
                   "List item 0 'value'");
  }
}

TEST_CASE("Normalize shape output", "[normalizer]") {
  SECTION("known shapes") {
    auto r = Normalize(R"({"type": "shape", "shape": "circle"})");
    REQUIRE(std::get<ShapeOutput>(r.Output()).shape == ShapeKind::Circle);

    r = Normalize(R"({"type": "shape", "shape": "rect"})");
    REQUIRE(std::get<ShapeOutput>(r.Output()).shape == ShapeKind::Rectangle);
    REQUIRE(OutputToJson(r.Output())["shape"] == "rectangle");

    r = Normalize(R"({"type": "shape", "shape": "ellipse"})");
    REQUIRE(std::get<ShapeOutput>(r.Output()).shape == ShapeKind::Ellipse);
  }

  SECTION("unknown or missing shape") {
    RequireInvalid(Normalize(R"({"type": "shape", "shape": "star"})"), "Unknown shape 'star'");
    RequireInvalid(Normalize(R"({"type": "shape"})"), "'shape' name");
  }
}

TEST_CASE("Normalize rejects malformed output", "[normalizer]") {
  RequireInvalid(Normalize(R"({"type": "unknown"})"), "Unknown output type 'unknown'");
  RequireInvalid(Normalize(R"({"value": "x"})"), "missing a 'type'");
  RequireInvalid(Normalize(R"({"type": 3})"), "missing a 'type'");
  RequireInvalid(Normalize("42"), "got number");
  RequireInvalid(Normalize("null"), "got null");
  RequireInvalid(Normalize(R"("text")"), "got string");
  RequireInvalid(Normalize("[]"), "got array");
}

TEST_CASE("Normalize enforces the output size limit", "[normalizer]") {
  json raw = {{"type", "text"}, {"value", std::string(100, 'a')}};

  REQUIRE(NormalizeOutput(raw, 1024).IsOk());

  auto r = NormalizeOutput(raw, 64);
  RequireInvalid(r, "exceeding the 64 byte limit");
}
