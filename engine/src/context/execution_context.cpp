#include "context/execution_context.h"

#include <algorithm>
#include <chrono>

#include "context/data_provider.h"
#include "keys/registry.h"

namespace widget_script {

ExecutionContext::ExecutionContext()
    : now_ms_(0), values_(std::make_shared<const Snapshot>()) {}

ExecutionContext::ExecutionContext(int64_t now_ms, Snapshot values)
    : now_ms_(now_ms), values_(std::make_shared<const Snapshot>(std::move(values))) {}

PrimitiveValue ExecutionContext::Get(std::string_view key) const {
  auto it = values_->find(std::string(key));
  if (it == values_->end()) {
    return MakeEmpty();
  }
  return it->second;
}

bool ExecutionContext::Has(std::string_view key) const {
  return values_->count(std::string(key)) > 0;
}

ContextSnapshotBuilder::ContextSnapshotBuilder(const DataKeyRegistry& registry)
    : keys_(registry.KeyNames()) {}

ContextSnapshotBuilder& ContextSnapshotBuilder::WithKey(std::string key) {
  if (std::find(keys_.begin(), keys_.end(), key) == keys_.end()) {
    keys_.push_back(std::move(key));
  }
  return *this;
}

ExecutionContext ContextSnapshotBuilder::Build(int64_t now_ms, const ValueLookup& lookup) const {
  ExecutionContext::Snapshot values;
  for (const auto& key : keys_) {
    values[key] = lookup(key);
  }
  return ExecutionContext(now_ms, std::move(values));
}

ExecutionContext ContextSnapshotBuilder::Build(int64_t now_ms,
                                               const DataProvider& provider) const {
  return ExecutionContext(now_ms, provider.SnapshotValues(keys_));
}

int64_t CurrentTimeMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace widget_script
