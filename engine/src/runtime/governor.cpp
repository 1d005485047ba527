#include "runtime/governor.h"

namespace widget_script {

ResourceGovernor::ResourceGovernor(int64_t budget_ms)
    : budget_ms_(budget_ms), start_(Clock::now()) {
  // Saturate instead of overflowing the clock's representation
  auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::time_point::max() - start_);
  if (budget_ms >= headroom.count()) {
    deadline_ = Clock::time_point::max();
  } else if (budget_ms <= 0) {
    deadline_ = start_;
  } else {
    deadline_ = start_ + std::chrono::milliseconds(budget_ms);
  }
}

bool ResourceGovernor::Poll() {
  ++polls_;
  if (interrupted_.load(std::memory_order_relaxed)) {
    return true;
  }
  if (Clock::now() >= deadline_) {
    interrupted_.store(true, std::memory_order_relaxed);
    return true;
  }
  return false;
}

double ResourceGovernor::ElapsedMs() const {
  return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
}

}  // namespace widget_script
