#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "keys/registry.h"

using namespace widget_script;

TEST_CASE("DataKeyRegistry compiled keys", "[keys]") {
  DataKeyRegistry registry;
  registry.LoadFromCompiled();

  SECTION("catalog covers every category") {
    REQUIRE(registry.AllKeys().size() == 28);
    REQUIRE(registry.GetByName("time.formatted12") != nullptr);
    REQUIRE(registry.GetByName("date.formatted") != nullptr);
    REQUIRE(registry.GetByName("battery.level") != nullptr);
    REQUIRE(registry.GetByName("weather.temp") != nullptr);
    REQUIRE(registry.GetByName("device.greeting") != nullptr);
    REQUIRE(registry.GetByName("music.isPlaying") != nullptr);
  }

  SECTION("key metadata") {
    const auto* temp = registry.GetByName("weather.temp");
    REQUIRE(temp->category == DataCategory::Weather);
    REQUIRE(temp->type == ValueType::Number);

    const auto* charging = registry.GetByName("battery.isCharging");
    REQUIRE(charging->type == ValueType::Bool);
  }

  SECTION("unknown key") {
    REQUIRE(registry.GetByName("weather.humidity") == nullptr);
  }

  SECTION("KeyNames keeps catalog order") {
    auto names = registry.KeyNames();
    REQUIRE(names.size() == registry.AllKeys().size());
    REQUIRE(names.front() == "time.hours");
    REQUIRE(names.back() == "music.isPlaying");
  }
}

TEST_CASE("DataKeyRegistry LoadFromJson", "[keys][json]") {
  DataKeyRegistry registry;

  SECTION("valid document") {
    std::string error;
    bool ok = registry.LoadFromJson(R"({
      "version": 3,
      "keys": [
        {"name": "weather.humidity", "type": "number", "doc": "Relative humidity"},
        {"name": "music.title", "type": "string"}
      ]
    })", &error);
    REQUIRE(ok);
    REQUIRE(error.empty());
    REQUIRE(registry.Version() == 3);
    REQUIRE(registry.AllKeys().size() == 2);
    REQUIRE(registry.GetByName("weather.humidity")->category == DataCategory::Weather);
    REQUIRE(registry.GetByName("music.title")->doc.empty());
  }

  SECTION("unknown category") {
    std::string error;
    REQUIRE_FALSE(registry.LoadFromJson(
        R"({"keys": [{"name": "stocks.price", "type": "number"}]})", &error));
    REQUIRE_THAT(error, Catch::Matchers::ContainsSubstring("stocks.price"));
  }

  SECTION("name without category") {
    std::string error;
    REQUIRE_FALSE(registry.LoadFromJson(R"({"keys": [{"name": "temp", "type": "number"}]})",
                                        &error));
    REQUIRE_THAT(error, Catch::Matchers::ContainsSubstring("category.field"));
  }

  SECTION("unknown type") {
    std::string error;
    REQUIRE_FALSE(registry.LoadFromJson(
        R"({"keys": [{"name": "weather.temp", "type": "f32"}]})", &error));
    REQUIRE_THAT(error, Catch::Matchers::ContainsSubstring("f32"));
  }

  SECTION("failed load keeps previous keys") {
    registry.LoadFromCompiled();
    REQUIRE_FALSE(registry.LoadFromJson("not json"));
    REQUIRE(registry.AllKeys().size() == 28);
  }

  SECTION("file fixture") {
    std::string error;
    REQUIRE(registry.LoadFromFile("engine/tests/testdata/keys.json", &error));
    REQUIRE(registry.GetByName("weather.temp") != nullptr);
  }

  SECTION("missing file") {
    std::string error;
    REQUIRE_FALSE(registry.LoadFromFile("engine/tests/testdata/nope.json", &error));
    REQUIRE_THAT(error, Catch::Matchers::ContainsSubstring("Failed to open"));
  }
}

TEST_CASE("Category and type names", "[keys]") {
  REQUIRE(DataCategoryToString(DataCategory::Battery) == "battery");
  REQUIRE(ParseDataCategory("music") == DataCategory::Music);
  REQUIRE_FALSE(ParseDataCategory("stocks").has_value());

  REQUIRE(ValueTypeToString(ValueType::Bool) == "bool");
  REQUIRE(ParseValueType("number") == ValueType::Number);
  REQUIRE_FALSE(ParseValueType("i64").has_value());
}
