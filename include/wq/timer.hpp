/**
 * @file timer.hpp
 * @brief Periodic timer task scheduler driven by one background thread.
 *
 * Callbacks are plain function pointers with an opaque context so the
 * scheduler never allocates per tick. Callbacks run on the scheduler
 * thread while the slot table is locked: they must not call back into the
 * same scheduler.
 */

#ifndef WQ_TIMER_HPP_
#define WQ_TIMER_HPP_

#include "wq/platform.hpp"
#include "wq/vocabulary.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace wq {

enum class TimerError : uint8_t {
  kInvalidPeriod = 0,
  kSlotsFull,
  kNotRunning,
  kAlreadyRunning,
};

struct TimerTaskIdTag {};
using TimerTaskId = NewType<uint32_t, TimerTaskIdTag>;

/**
 * @brief Invoked by the scheduler on each period tick.
 *
 * @param ctx  User-supplied context pointer (may be nullptr).
 */
using TimerTaskFn = void (*)(void* ctx);

/**
 * @brief Fixed-capacity periodic scheduler.
 *
 *   wq::TimerScheduler<4> sched;
 *   sched.Add(5, &Dispatcher::OnRetryTick, this);
 *   sched.Start();
 *   ...
 *   sched.Stop();
 *
 * @tparam MaxTasks  Number of task slots.
 */
template <uint32_t MaxTasks>
class TimerScheduler final {
  static_assert(MaxTasks > 0U, "TimerScheduler needs at least one slot");

 public:
  TimerScheduler() = default;
  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;
  TimerScheduler(TimerScheduler&&) = delete;
  TimerScheduler& operator=(TimerScheduler&&) = delete;

  /**
   * @brief Register a periodic task; first fire is one period from now.
   *
   * @return TimerTaskId, or kInvalidPeriod (period_ms == 0) / kSlotsFull.
   */
  expected<TimerTaskId, TimerError> Add(uint32_t period_ms, TimerTaskFn fn,
                                        void* ctx = nullptr) {
    if (period_ms == 0U) {
      return expected<TimerTaskId, TimerError>::error(
          TimerError::kInvalidPeriod);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (!slot.active) {
        slot.fn = fn;
        slot.ctx = ctx;
        slot.period = std::chrono::milliseconds(period_ms);
        slot.next_fire = Clock::now() + slot.period;
        slot.id = next_id_++;
        slot.active = true;
        cv_.notify_one();
        return expected<TimerTaskId, TimerError>::success(TimerTaskId(slot.id));
      }
    }
    return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
  }

  /**
   * @brief Deactivate a task. Its slot is reusable by later Add() calls.
   *
   * @return kNotRunning if no active task carries @p task_id.
   */
  expected<void, TimerError> Remove(TimerTaskId task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (slot.active && slot.id == task_id.value()) {
        slot.active = false;
        return expected<void, TimerError>::success();
      }
    }
    return expected<void, TimerError>::error(TimerError::kNotRunning);
  }

  expected<void, TimerError> Start() {
    bool expected_state = false;
    if (!running_.compare_exchange_strong(expected_state, true,
                                          std::memory_order_acq_rel)) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /// Blocks until the scheduler thread exits. Safe when not running.
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  uint32_t TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (const auto& slot : slots_) {
      if (slot.active) ++count;
    }
    return count;
  }

 private:
  using Clock = std::chrono::steady_clock;

  struct TaskSlot {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
    Clock::duration period{};
    Clock::time_point next_fire{};
    uint32_t id = 0;
    bool active = false;
  };

  /**
   * Fires every due slot, advances it past any missed periods, then waits
   * until the earliest next deadline (or a Stop()/Add() wake-up).
   */
  void ScheduleLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load(std::memory_order_acquire)) {
      const auto now = Clock::now();
      auto earliest = Clock::time_point::max();

      for (auto& slot : slots_) {
        if (!slot.active) continue;
        if (now >= slot.next_fire) {
          slot.fn(slot.ctx);
          slot.next_fire += slot.period;
          while (slot.next_fire <= now) {
            slot.next_fire += slot.period;
          }
        }
        if (slot.next_fire < earliest) earliest = slot.next_fire;
      }

      if (earliest == Clock::time_point::max()) {
        cv_.wait_for(lock, std::chrono::milliseconds(10));
      } else {
        cv_.wait_until(lock, earliest);
      }
    }
  }

  std::array<TaskSlot, MaxTasks> slots_{};
  uint32_t next_id_ = 1;
  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

}  // namespace wq

#endif  // WQ_TIMER_HPP_
