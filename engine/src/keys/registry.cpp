#include "keys/registry.h"

#include <fstream>
#include <nlohmann/json.hpp>

namespace widget_script {

namespace {

struct CompiledKey {
  std::string_view name;
  DataCategory category;
  ValueType type;
  std::string_view doc;
};

constexpr CompiledKey kCompiledKeys[] = {
    {"time.hours", DataCategory::Time, ValueType::String, "Hours, zero-padded 24h"},
    {"time.minutes", DataCategory::Time, ValueType::String, "Minutes, zero-padded"},
    {"time.seconds", DataCategory::Time, ValueType::String, "Seconds, zero-padded"},
    {"time.formatted12", DataCategory::Time, ValueType::String, "h:mm in 12h format"},
    {"time.formatted24", DataCategory::Time, ValueType::String, "HH:mm in 24h format"},
    {"time.ampm", DataCategory::Time, ValueType::String, "AM or PM"},
    {"date.day", DataCategory::Date, ValueType::String, "Day of month"},
    {"date.dayName", DataCategory::Date, ValueType::String, "Weekday name"},
    {"date.dayShort", DataCategory::Date, ValueType::String, "Short weekday name"},
    {"date.month", DataCategory::Date, ValueType::String, "Month number, 1-based"},
    {"date.monthName", DataCategory::Date, ValueType::String, "Month name"},
    {"date.monthShort", DataCategory::Date, ValueType::String, "Short month name"},
    {"date.year", DataCategory::Date, ValueType::String, "Four digit year"},
    {"date.formatted", DataCategory::Date, ValueType::String, "e.g. Jan 1, 2024"},
    {"battery.level", DataCategory::Battery, ValueType::Number, "Charge level, 0-100"},
    {"battery.isCharging", DataCategory::Battery, ValueType::Bool, "Charger connected"},
    {"battery.icon", DataCategory::Battery, ValueType::String, "Icon name for the level"},
    {"weather.temp", DataCategory::Weather, ValueType::Number, "Current temperature"},
    {"weather.condition", DataCategory::Weather, ValueType::String, "Condition text"},
    {"weather.icon", DataCategory::Weather, ValueType::String, "Icon name for the condition"},
    {"weather.high", DataCategory::Weather, ValueType::Number, "Forecast high"},
    {"weather.low", DataCategory::Weather, ValueType::Number, "Forecast low"},
    {"device.name", DataCategory::Device, ValueType::String, "Device name"},
    {"device.greeting", DataCategory::Device, ValueType::String, "Greeting for the time of day"},
    {"music.title", DataCategory::Music, ValueType::String, "Track title"},
    {"music.artist", DataCategory::Music, ValueType::String, "Track artist"},
    {"music.album", DataCategory::Music, ValueType::String, "Track album"},
    {"music.isPlaying", DataCategory::Music, ValueType::Bool, "Playback active"},
};

}  // namespace

std::string_view DataCategoryToString(DataCategory category) {
  switch (category) {
    case DataCategory::Time:
      return "time";
    case DataCategory::Date:
      return "date";
    case DataCategory::Battery:
      return "battery";
    case DataCategory::Weather:
      return "weather";
    case DataCategory::Device:
      return "device";
    case DataCategory::Music:
      return "music";
  }
  return "unknown";
}

std::optional<DataCategory> ParseDataCategory(std::string_view s) {
  if (s == "time") return DataCategory::Time;
  if (s == "date") return DataCategory::Date;
  if (s == "battery") return DataCategory::Battery;
  if (s == "weather") return DataCategory::Weather;
  if (s == "device") return DataCategory::Device;
  if (s == "music") return DataCategory::Music;
  return std::nullopt;
}

std::string_view ValueTypeToString(ValueType type) {
  switch (type) {
    case ValueType::Null:
      return "null";
    case ValueType::Bool:
      return "bool";
    case ValueType::Number:
      return "number";
    case ValueType::String:
      return "string";
  }
  return "unknown";
}

std::optional<ValueType> ParseValueType(std::string_view s) {
  if (s == "null") return ValueType::Null;
  if (s == "bool") return ValueType::Bool;
  if (s == "number") return ValueType::Number;
  if (s == "string") return ValueType::String;
  return std::nullopt;
}

bool DataKeyRegistry::LoadFromFile(const std::string& path, std::string* error_out) {
  std::ifstream file(path);
  if (!file) {
    if (error_out) {
      *error_out = "Failed to open file: " + path;
    }
    return false;
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  return LoadFromJson(content, error_out);
}

bool DataKeyRegistry::LoadFromJson(const std::string& json_str, std::string* error_out) {
  try {
    auto json = nlohmann::json::parse(json_str);

    std::vector<KeyInfo> loaded;
    for (const auto& key_json : json.at("keys")) {
      KeyInfo info;
      info.name = key_json.at("name").get<std::string>();

      // Category is the prefix before the first '.'
      size_t dot = info.name.find('.');
      if (dot == std::string::npos || dot == 0 || dot + 1 == info.name.size()) {
        if (error_out) {
          *error_out = "Key name must be 'category.field': " + info.name;
        }
        return false;
      }
      auto category_opt = ParseDataCategory(std::string_view(info.name).substr(0, dot));
      if (!category_opt) {
        if (error_out) {
          *error_out = "Unknown data category in key: " + info.name;
        }
        return false;
      }
      info.category = *category_opt;

      auto type_str = key_json.at("type").get<std::string>();
      auto type_opt = ParseValueType(type_str);
      if (!type_opt) {
        if (error_out) {
          *error_out = "Unknown value type: " + type_str;
        }
        return false;
      }
      info.type = *type_opt;
      info.doc = key_json.value("doc", "");

      loaded.push_back(std::move(info));
    }

    version_ = json.value("version", 0);
    keys_.clear();
    by_name_.clear();
    for (auto& info : loaded) {
      Add(std::move(info));
    }
    return true;
  } catch (const std::exception& e) {
    if (error_out) {
      *error_out = std::string("JSON parse error: ") + e.what();
    }
    return false;
  }
}

void DataKeyRegistry::LoadFromCompiled() {
  keys_.clear();
  by_name_.clear();

  for (const auto& def : kCompiledKeys) {
    KeyInfo info;
    info.name = std::string(def.name);
    info.category = def.category;
    info.type = def.type;
    info.doc = std::string(def.doc);
    Add(std::move(info));
  }

  version_ = 1;
}

void DataKeyRegistry::Add(KeyInfo info) {
  auto it = by_name_.find(info.name);
  if (it != by_name_.end()) {
    keys_[it->second] = std::move(info);
    return;
  }
  size_t index = keys_.size();
  keys_.push_back(std::move(info));
  by_name_[keys_.back().name] = index;
}

const DataKeyRegistry::KeyInfo* DataKeyRegistry::GetByName(std::string_view name) const {
  auto it = by_name_.find(std::string(name));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return &keys_[it->second];
}

std::vector<std::string> DataKeyRegistry::KeyNames() const {
  std::vector<std::string> names;
  names.reserve(keys_.size());
  for (const auto& info : keys_) {
    names.push_back(info.name);
  }
  return names;
}

}  // namespace widget_script
