#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "object/value.h"

namespace widget_script {

class DataKeyRegistry;
class DataProvider;

/**
 * ExecutionContext - the read-only view of time and live data a script
 * sees as `context` during one run.
 *
 * The values are a copy taken when the context was built; the map is
 * shared and immutable, so copies of the context are cheap and two reads
 * of the same key always agree.
 */
class ExecutionContext {
 public:
  using Snapshot = std::unordered_map<std::string, PrimitiveValue>;

  /**
   * Context at the epoch with no data.
   */
  ExecutionContext();

  ExecutionContext(int64_t now_ms, Snapshot values);

  /**
   * Timestamp (ms since epoch) fixed at construction.
   */
  int64_t Now() const { return now_ms_; }

  /**
   * Value for a key. Unknown keys return the empty string.
   */
  PrimitiveValue Get(std::string_view key) const;

  bool Has(std::string_view key) const;

  const Snapshot& Values() const { return *values_; }

 private:
  int64_t now_ms_;
  std::shared_ptr<const Snapshot> values_;
};

/**
 * Builds ExecutionContext snapshots from a data lookup.
 *
 * Every key in the registry is copied, plus any extra keys added with
 * WithKey().
 */
class ContextSnapshotBuilder {
 public:
  using ValueLookup = std::function<PrimitiveValue(std::string_view key)>;

  ContextSnapshotBuilder() = default;
  explicit ContextSnapshotBuilder(const DataKeyRegistry& registry);

  // Also copy a key that is not in the registry
  ContextSnapshotBuilder& WithKey(std::string key);

  ExecutionContext Build(int64_t now_ms, const ValueLookup& lookup) const;

  /**
   * Snapshot through DataProvider::SnapshotValues so a provider can copy
   * all keys under one lock.
   */
  ExecutionContext Build(int64_t now_ms, const DataProvider& provider) const;

  const std::vector<std::string>& Keys() const { return keys_; }

 private:
  std::vector<std::string> keys_;
};

/**
 * Current wall-clock time in ms since epoch.
 */
int64_t CurrentTimeMs();

}  // namespace widget_script
