#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace widget_script {

/**
 * ResourceGovernor - wall-clock budget for one run.
 *
 * The deadline is fixed at construction. The interpreter polls Poll()
 * from its interrupt hook regardless of what the script does; once the
 * deadline has passed Poll() keeps returning true and the run is aborted.
 * A budget too large for the clock saturates to "never"; a non-positive
 * one is already expired.
 */
class ResourceGovernor {
 public:
  using Clock = std::chrono::steady_clock;

  explicit ResourceGovernor(int64_t budget_ms);

  /**
   * Called from the interpreter's interrupt hook.
   * Returns true when execution must stop.
   */
  bool Poll();

  // True once Poll() has requested an interrupt
  bool Interrupted() const { return interrupted_.load(std::memory_order_relaxed); }

  // True if the deadline has passed, whether or not anything polled
  bool Expired() const { return Clock::now() >= deadline_; }

  bool TimedOut() const { return Interrupted() || Expired(); }

  double ElapsedMs() const;

  int64_t BudgetMs() const { return budget_ms_; }

  int64_t PollCount() const { return polls_; }

 private:
  int64_t budget_ms_;
  Clock::time_point start_;
  Clock::time_point deadline_;
  int64_t polls_ = 0;
  std::atomic<bool> interrupted_{false};
};

}  // namespace widget_script
