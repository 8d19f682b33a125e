/**
 * @file test_attempt.cpp
 * @brief Tests for attempt.hpp - simulated attempt executor.
 */

#include "wq/attempt.hpp"

#include <catch2/catch_test_macros.hpp>

static wq::AttemptRequest MakeRequest(uint32_t attempt) {
  wq::AttemptRequest req;
  req.task_id = "task";
  req.payload = "payload";
  req.attempt = attempt;
  req.worker_id = wq::WorkerId(1U);
  return req;
}

TEST_CASE("SimulatedExecutor never fails at 0 percent", "[attempt]") {
  wq::SimulatedExecutor exec(0U, 0U, 42U);
  for (uint32_t i = 1; i <= 200; ++i) {
    auto r = exec.Execute(MakeRequest(i));
    REQUIRE(r.has_value());
    REQUIRE(r.value().success);
  }
}

TEST_CASE("SimulatedExecutor always fails at 100 percent", "[attempt]") {
  wq::SimulatedExecutor exec(0U, 100U, 42U);
  for (uint32_t i = 1; i <= 200; ++i) {
    auto r = exec.Execute(MakeRequest(i));
    REQUIRE(r.has_value());
    REQUIRE(!r.value().success);
  }
}

TEST_CASE("SimulatedExecutor clamps the error percentage", "[attempt]") {
  wq::SimulatedExecutor exec(0U, 250U);
  REQUIRE(exec.ErrorPercentage() == 100U);
}

TEST_CASE("SimulatedExecutor failure rate tracks the percentage",
          "[attempt]") {
  wq::SimulatedExecutor exec(0U, 30U, 7U);
  int failures = 0;
  constexpr int kRuns = 5000;
  for (int i = 0; i < kRuns; ++i) {
    auto r = exec.Execute(MakeRequest(1U));
    REQUIRE(r.has_value());
    if (!r.value().success) ++failures;
  }
  // 30% of 5000 = 1500, sigma ~ 32
  REQUIRE(failures > 1300);
  REQUIRE(failures < 1700);
}

TEST_CASE("SimulatedExecutor reports measured duration", "[attempt]") {
  wq::SimulatedExecutor exec(30U, 0U);
  REQUIRE(exec.DurationMs() == 30U);
  auto r = exec.Execute(MakeRequest(1U));
  REQUIRE(r.has_value());
  REQUIRE(r.value().duration_ms >= 30U);
  REQUIRE(r.value().duration_ms < 1000U);
}
