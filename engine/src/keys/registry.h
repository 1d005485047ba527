#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "object/value.h"

namespace widget_script {

/**
 * Categories of live data a script can read through context.get().
 */
enum class DataCategory : uint8_t {
  Time = 0,
  Date = 1,
  Battery = 2,
  Weather = 3,
  Device = 4,
  Music = 5,
};

/**
 * Runtime data key registry.
 *
 * Catalog of the "category.field" keys the data-source collaborator
 * provides. The snapshot builder copies every registered key before a run.
 */
class DataKeyRegistry {
 public:
  /**
   * Key metadata.
   */
  struct KeyInfo {
    std::string name;        // e.g. "weather.temp"
    DataCategory category;
    ValueType type;
    std::string doc;
  };

  /**
   * Create an empty registry.
   */
  DataKeyRegistry() = default;

  /**
   * Load registry from JSON file.
   * Returns false and sets error_out on failure.
   */
  bool LoadFromFile(const std::string& path, std::string* error_out = nullptr);

  /**
   * Load registry from JSON string.
   * Returns false and sets error_out on failure.
   */
  bool LoadFromJson(const std::string& json_str, std::string* error_out = nullptr);

  /**
   * Load registry from the compiled-in key table.
   */
  void LoadFromCompiled();

  /**
   * Look up a key by name.
   */
  const KeyInfo* GetByName(std::string_view name) const;

  /**
   * Get all registered keys.
   */
  const std::vector<KeyInfo>& AllKeys() const { return keys_; }

  /**
   * Get all key names, in registration order.
   */
  std::vector<std::string> KeyNames() const;

  /**
   * Get registry version.
   */
  int Version() const { return version_; }

 private:
  int version_ = 0;
  std::vector<KeyInfo> keys_;
  std::unordered_map<std::string, size_t> by_name_;

  void Add(KeyInfo info);
};

/**
 * Map DataCategory enum to its key prefix ("time", "weather", ...).
 */
std::string_view DataCategoryToString(DataCategory category);

/**
 * Parse DataCategory from a key prefix.
 */
std::optional<DataCategory> ParseDataCategory(std::string_view s);

/**
 * Map ValueType to string.
 */
std::string_view ValueTypeToString(ValueType type);

/**
 * Parse ValueType from string ("null", "bool", "number", "string").
 */
std::optional<ValueType> ParseValueType(std::string_view s);

}  // namespace widget_script
