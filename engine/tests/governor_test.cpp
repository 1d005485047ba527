#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <thread>

#include "runtime/governor.h"

using namespace widget_script;

TEST_CASE("ResourceGovernor deadline", "[governor]") {
  SECTION("fresh budget does not fire") {
    ResourceGovernor governor(5000);
    REQUIRE_FALSE(governor.Poll());
    REQUIRE_FALSE(governor.TimedOut());
    REQUIRE(governor.BudgetMs() == 5000);
    REQUIRE(governor.PollCount() == 1);
  }

  SECTION("fires once the deadline passes and stays latched") {
    ResourceGovernor governor(5);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE(governor.Expired());
    REQUIRE(governor.Poll());
    REQUIRE(governor.Interrupted());
    REQUIRE(governor.Poll());
    REQUIRE(governor.ElapsedMs() >= 5.0);
  }

  SECTION("huge budgets saturate instead of expiring") {
    for (int64_t budget : {int64_t{10000000000000}, std::numeric_limits<int64_t>::max()}) {
      ResourceGovernor governor(budget);
      REQUIRE_FALSE(governor.Poll());
      REQUIRE_FALSE(governor.TimedOut());
      REQUIRE(governor.BudgetMs() == budget);
    }
  }

  SECTION("non-positive budget is already expired") {
    ResourceGovernor governor(0);
    REQUIRE(governor.Poll());
  }
}
