/**
 * @file task.hpp
 * @brief Task record, identifiers and the one-way completion transition.
 */

#ifndef WQ_TASK_HPP_
#define WQ_TASK_HPP_

#include "wq/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <random>
#include <string>

namespace wq {

using TaskId = std::string;

struct WorkerIdTag {};
using WorkerId = NewType<uint32_t, WorkerIdTag>;

/// Worker id used for reports that do not originate from a pool worker.
static constexpr WorkerId kNoWorker{0U};

enum class TaskState : uint8_t {
  kQueued = 0,
  kInFlight,
  kPendingRetry,
  kCompleted,
};

inline const char* TaskStateName(TaskState s) noexcept {
  switch (s) {
    case TaskState::kQueued:       return "queued";
    case TaskState::kInFlight:     return "in-flight";
    case TaskState::kPendingRetry: return "pending-retry";
    case TaskState::kCompleted:    return "completed";
  }
  return "unknown";
}

/**
 * @brief Random (version 4) UUID in canonical 8-4-4-4-12 form.
 */
inline TaskId GenerateTaskId() {
  static std::mutex mtx;
  static std::mt19937_64 engine{std::random_device{}()};

  uint64_t hi = 0;
  uint64_t lo = 0;
  {
    std::lock_guard<std::mutex> lock(mtx);
    hi = engine();
    lo = engine();
  }
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

  char buf[37];
  (void)std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                      static_cast<unsigned>(hi >> 32),
                      static_cast<unsigned>((hi >> 16) & 0xFFFFU),
                      static_cast<unsigned>(hi & 0xFFFFU),
                      static_cast<unsigned>(lo >> 48),
                      static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return TaskId(buf);
}

/**
 * @brief One submitted unit of work.
 *
 * Everything except the state is mutated only under the Dispatcher lock.
 * Completion goes through TryFinalize(), a compare-and-set that succeeds for
 * exactly one caller, so duplicate or late reports cannot finalize twice.
 */
class Task {
 public:
  Task(TaskId id, std::string payload)
      : id_(std::move(id)),
        payload_(std::move(payload)),
        created_at_(std::chrono::system_clock::now()) {}

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  const TaskId& Id() const noexcept { return id_; }
  const std::string& Payload() const noexcept { return payload_; }
  std::chrono::system_clock::time_point CreatedAt() const noexcept {
    return created_at_;
  }

  uint32_t Attempts() const noexcept { return attempts_; }

  /// Start a new attempt; returns its 1-based number.
  uint32_t BeginAttempt() noexcept {
    ++attempts_;
    state_.store(TaskState::kInFlight, std::memory_order_release);
    return attempts_;
  }

  TaskState State() const noexcept {
    return state_.load(std::memory_order_acquire);
  }

  bool IsCompleted() const noexcept { return State() == TaskState::kCompleted; }

  /**
   * @brief Move a non-terminal task to @p next (never to kCompleted).
   * @return false if the task is already completed.
   */
  bool Transition(TaskState next) noexcept {
    WQ_ASSERT(next != TaskState::kCompleted);
    TaskState cur = state_.load(std::memory_order_acquire);
    while (cur != TaskState::kCompleted) {
      if (state_.compare_exchange_weak(cur, next, std::memory_order_acq_rel)) {
        return true;
      }
    }
    return false;
  }

  /**
   * @brief One-way transition to kCompleted.
   * @return true for the single caller that performed the transition.
   */
  bool TryFinalize() noexcept {
    TaskState cur = state_.load(std::memory_order_acquire);
    while (cur != TaskState::kCompleted) {
      if (state_.compare_exchange_weak(cur, TaskState::kCompleted,
                                       std::memory_order_acq_rel)) {
        return true;
      }
    }
    return false;
  }

 private:
  const TaskId id_;
  const std::string payload_;
  const std::chrono::system_clock::time_point created_at_;
  uint32_t attempts_{0U};
  std::atomic<TaskState> state_{TaskState::kQueued};
};

/**
 * @brief Copy of a task's observable fields, safe to hold outside the lock.
 */
struct TaskView {
  TaskId id;
  std::string payload;
  uint32_t attempts{0U};
  TaskState state{TaskState::kQueued};
  std::chrono::system_clock::time_point created_at{};
};

inline TaskView MakeTaskView(const Task& t) {
  TaskView v;
  v.id = t.Id();
  v.payload = t.Payload();
  v.attempts = t.Attempts();
  v.state = t.State();
  v.created_at = t.CreatedAt();
  return v;
}

}  // namespace wq

#endif  // WQ_TASK_HPP_
