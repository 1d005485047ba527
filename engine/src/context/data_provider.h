#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "object/value.h"

namespace widget_script {

/**
 * Interface to the live data-source collaborator.
 *
 * The sandbox never subscribes itself; it only snapshots values through
 * SnapshotValues() before a run.
 */
class DataProvider {
 public:
  using Callback = std::function<void(const PrimitiveValue&)>;
  using Unsubscribe = std::function<void()>;
  using ValueMap = std::unordered_map<std::string, PrimitiveValue>;

  virtual ~DataProvider() = default;

  /**
   * Current value for a key. Unknown keys yield the empty string.
   */
  virtual PrimitiveValue GetValue(std::string_view key) const = 0;

  /**
   * Register a change listener. The returned function removes it; it may be
   * called more than once and may outlive the provider.
   */
  virtual Unsubscribe Subscribe(const std::string& key, Callback callback) = 0;

  /**
   * Copy the values of the given keys. The default reads each key with
   * GetValue(); providers that update several keys at once should override
   * this to copy under a single lock.
   */
  virtual ValueMap SnapshotValues(const std::vector<std::string>& keys) const;
};

/**
 * Thread-safe in-memory provider. Backs tests and the CLI.
 */
class InMemoryDataProvider : public DataProvider {
 public:
  InMemoryDataProvider() = default;

  PrimitiveValue GetValue(std::string_view key) const override;
  Unsubscribe Subscribe(const std::string& key, Callback callback) override;
  ValueMap SnapshotValues(const std::vector<std::string>& keys) const override;

  // Set a single value and notify its listeners
  void Set(const std::string& key, PrimitiveValue value);

  // Update several values atomically, then notify listeners
  void SetMany(const ValueMap& values);

  /**
   * Load values from a flat JSON object ({"weather.temp": 23, ...}).
   * Returns false and sets error_out on failure.
   */
  bool LoadFromJson(const std::string& json_str, std::string* error_out = nullptr);

  /**
   * Number of live listeners for a key.
   */
  size_t ListenerCount(const std::string& key) const;

 private:
  struct Listener {
    uint64_t id;
    Callback callback;
  };

  // Shared with unsubscribe functions, which only hold it weakly
  struct ListenerTable {
    std::mutex mutex;
    std::unordered_map<std::string, std::vector<Listener>> by_key;
    uint64_t next_id = 1;
  };

  mutable std::mutex mutex_;
  ValueMap values_;
  std::shared_ptr<ListenerTable> listeners_ = std::make_shared<ListenerTable>();

  void Notify(const ValueMap& changed);
};

/**
 * Derive the time.*, date.* and device.greeting fields for a timestamp
 * (ms since epoch, local time) and store them in the provider.
 */
void FillTimeFields(InMemoryDataProvider& provider, int64_t now_ms);

/**
 * Greeting for a local hour: "Good morning" before 12, "Good afternoon"
 * before 18, otherwise "Good evening".
 */
std::string GreetingForHour(int hour);

}  // namespace widget_script
