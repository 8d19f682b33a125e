/**
 * @file attempt.hpp
 * @brief Attempt execution seam and the simulated executor.
 *
 * A worker hands each attempt to an AttemptExecutor. The production service
 * uses SimulatedExecutor (sleep, then fail with a configured probability);
 * real task execution plugs in here without touching the dispatcher.
 */

#ifndef WQ_ATTEMPT_HPP_
#define WQ_ATTEMPT_HPP_

#include "wq/task.hpp"
#include "wq/vocabulary.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <thread>

namespace wq {

enum class AttemptError : uint8_t {
  kFault = 0,     ///< Executor could not run the attempt at all.
};

struct AttemptRequest {
  TaskId task_id;
  std::string payload;
  uint32_t attempt{0U};
  WorkerId worker_id{};
};

struct AttemptOutcome {
  bool success{false};
  uint32_t duration_ms{0U};
};

/**
 * @brief Executes one attempt. Called concurrently from every worker thread.
 *
 * A returned error is an executor fault, distinct from an attempt that ran
 * and failed (AttemptOutcome::success == false).
 */
class AttemptExecutor {
 public:
  virtual ~AttemptExecutor() = default;
  virtual expected<AttemptOutcome, AttemptError> Execute(
      const AttemptRequest& request) = 0;
};

/**
 * @brief Sleeps for a fixed duration, then fails with probability
 *        error_percentage / 100.
 */
class SimulatedExecutor final : public AttemptExecutor {
 public:
  SimulatedExecutor(uint32_t duration_ms, uint32_t error_percentage,
                    uint64_t seed = std::random_device{}())
      : duration_ms_(duration_ms),
        error_percentage_(error_percentage > 100U ? 100U : error_percentage),
        engine_(seed) {}

  expected<AttemptOutcome, AttemptError> Execute(
      const AttemptRequest& /*request*/) override {
    const auto start = std::chrono::steady_clock::now();
    std::this_thread::sleep_for(std::chrono::milliseconds(duration_ms_));

    AttemptOutcome outcome;
    outcome.success = !(Draw() < static_cast<double>(error_percentage_));
    outcome.duration_ms = static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
    return expected<AttemptOutcome, AttemptError>::success(outcome);
  }

  uint32_t DurationMs() const noexcept { return duration_ms_; }
  uint32_t ErrorPercentage() const noexcept { return error_percentage_; }

 private:
  /// Uniform draw in [0, 100).
  double Draw() {
    std::lock_guard<std::mutex> lock(mtx_);
    return dist_(engine_);
  }

  const uint32_t duration_ms_;
  const uint32_t error_percentage_;
  std::mutex mtx_;
  std::mt19937_64 engine_;
  std::uniform_real_distribution<double> dist_{0.0, 100.0};
};

}  // namespace wq

#endif  // WQ_ATTEMPT_HPP_
