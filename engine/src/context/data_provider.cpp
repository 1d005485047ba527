#include "context/data_provider.h"

#include <ctime>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace widget_script {

namespace {

constexpr const char* kDayNames[] = {"Sunday", "Monday", "Tuesday", "Wednesday",
                                     "Thursday", "Friday", "Saturday"};
constexpr const char* kDayShort[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
constexpr const char* kMonthNames[] = {"January", "February", "March", "April",
                                       "May", "June", "July", "August",
                                       "September", "October", "November", "December"};
constexpr const char* kMonthShort[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                       "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

}  // namespace

DataProvider::ValueMap DataProvider::SnapshotValues(const std::vector<std::string>& keys) const {
  ValueMap out;
  for (const auto& key : keys) {
    out[key] = GetValue(key);
  }
  return out;
}

PrimitiveValue InMemoryDataProvider::GetValue(std::string_view key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = values_.find(std::string(key));
  if (it == values_.end()) {
    return MakeEmpty();
  }
  return it->second;
}

DataProvider::ValueMap InMemoryDataProvider::SnapshotValues(
    const std::vector<std::string>& keys) const {
  std::lock_guard<std::mutex> lock(mutex_);
  ValueMap out;
  for (const auto& key : keys) {
    auto it = values_.find(key);
    out[key] = it == values_.end() ? MakeEmpty() : it->second;
  }
  return out;
}

DataProvider::Unsubscribe InMemoryDataProvider::Subscribe(const std::string& key,
                                                          Callback callback) {
  std::lock_guard<std::mutex> lock(listeners_->mutex);
  uint64_t id = listeners_->next_id++;
  listeners_->by_key[key].push_back({id, std::move(callback)});

  std::weak_ptr<ListenerTable> weak_table = listeners_;
  return [weak_table, key, id]() {
    auto table = weak_table.lock();
    if (!table) return;
    std::lock_guard<std::mutex> lock(table->mutex);
    auto it = table->by_key.find(key);
    if (it == table->by_key.end()) return;
    auto& vec = it->second;
    for (auto l = vec.begin(); l != vec.end(); ++l) {
      if (l->id == id) {
        vec.erase(l);
        break;
      }
    }
    if (vec.empty()) {
      table->by_key.erase(it);
    }
  };
}

size_t InMemoryDataProvider::ListenerCount(const std::string& key) const {
  std::lock_guard<std::mutex> lock(listeners_->mutex);
  auto it = listeners_->by_key.find(key);
  return it == listeners_->by_key.end() ? 0 : it->second.size();
}

void InMemoryDataProvider::Set(const std::string& key, PrimitiveValue value) {
  SetMany({{key, std::move(value)}});
}

void InMemoryDataProvider::SetMany(const ValueMap& values) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : values) {
      values_[key] = value;
    }
  }
  Notify(values);
}

void InMemoryDataProvider::Notify(const ValueMap& changed) {
  // Callbacks run outside the lock so they may read the provider
  std::vector<std::pair<Callback, PrimitiveValue>> pending;
  {
    std::lock_guard<std::mutex> lock(listeners_->mutex);
    for (const auto& [key, value] : changed) {
      auto it = listeners_->by_key.find(key);
      if (it == listeners_->by_key.end()) continue;
      for (const auto& listener : it->second) {
        pending.emplace_back(listener.callback, value);
      }
    }
  }
  for (auto& [callback, value] : pending) {
    callback(value);
  }
}

bool InMemoryDataProvider::LoadFromJson(const std::string& json_str, std::string* error_out) {
  try {
    auto json = nlohmann::json::parse(json_str);
    if (!json.is_object()) {
      if (error_out) *error_out = "Data file must be a JSON object";
      return false;
    }

    ValueMap values;
    for (auto& [key, val] : json.items()) {
      PrimitiveValue value;
      if (!ValueFromJson(val, &value)) {
        if (error_out) *error_out = "Value for '" + key + "' must be a primitive";
        return false;
      }
      values[key] = std::move(value);
    }
    SetMany(values);
    return true;
  } catch (const std::exception& e) {
    if (error_out) *error_out = std::string("JSON parse error: ") + e.what();
    return false;
  }
}

std::string GreetingForHour(int hour) {
  if (hour < 12) return "Good morning";
  if (hour < 18) return "Good afternoon";
  return "Good evening";
}

void FillTimeFields(InMemoryDataProvider& provider, int64_t now_ms) {
  std::time_t seconds = static_cast<std::time_t>(now_ms / 1000);
  std::tm tm{};
  localtime_r(&seconds, &tm);

  int hour12 = tm.tm_hour % 12 == 0 ? 12 : tm.tm_hour % 12;
  std::string minutes = fmt::format("{:02d}", tm.tm_min);

  DataProvider::ValueMap values;
  values["time.hours"] = fmt::format("{:02d}", tm.tm_hour);
  values["time.minutes"] = minutes;
  values["time.seconds"] = fmt::format("{:02d}", tm.tm_sec);
  values["time.formatted12"] = fmt::format("{}:{}", hour12, minutes);
  values["time.formatted24"] = fmt::format("{:02d}:{}", tm.tm_hour, minutes);
  values["time.ampm"] = std::string(tm.tm_hour >= 12 ? "PM" : "AM");

  values["date.day"] = fmt::format("{}", tm.tm_mday);
  values["date.dayName"] = std::string(kDayNames[tm.tm_wday]);
  values["date.dayShort"] = std::string(kDayShort[tm.tm_wday]);
  values["date.month"] = fmt::format("{}", tm.tm_mon + 1);
  values["date.monthName"] = std::string(kMonthNames[tm.tm_mon]);
  values["date.monthShort"] = std::string(kMonthShort[tm.tm_mon]);
  values["date.year"] = fmt::format("{}", tm.tm_year + 1900);
  values["date.formatted"] =
      fmt::format("{} {}, {}", kMonthShort[tm.tm_mon], tm.tm_mday, tm.tm_year + 1900);

  values["device.greeting"] = GreetingForHour(tm.tm_hour);

  provider.SetMany(values);
}

}  // namespace widget_script
