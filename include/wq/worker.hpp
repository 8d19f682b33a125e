/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file worker.hpp
 * @brief Pool worker: one thread pulling attempts from a WorkSource.
 *
 * Lifecycle:
 *   Start() --> Idle --AcquireNext()--> Busy --ReportOutcome()--> Idle
 *                 \
 *                  +--kIdleTimeout / kShutdown--> Retired (thread exits)
 *
 * The worker never decides whether to retry; it runs one attempt and reports
 * exactly one outcome for every assignment it receives.
 */

#ifndef WQ_WORKER_HPP_
#define WQ_WORKER_HPP_

#include "wq/attempt.hpp"
#include "wq/attempt_log.hpp"
#include "wq/log.hpp"
#include "wq/task.hpp"
#include "wq/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#if defined(__cpp_exceptions)
#include <exception>
#endif

namespace wq {

// ============================================================================
// WorkSource protocol
// ============================================================================

enum class WorkerState : uint8_t {
  kIdle = 0,
  kBusy,
  kRetired,
};

inline const char* WorkerStateName(WorkerState s) noexcept {
  switch (s) {
    case WorkerState::kIdle:    return "idle";
    case WorkerState::kBusy:    return "busy";
    case WorkerState::kRetired: return "retired";
  }
  return "unknown";
}

enum class AcquireError : uint8_t {
  kIdleTimeout = 0,  ///< No work arrived within the idle timeout.
  kShutdown,         ///< Source is shutting down.
};

/// One attempt handed to a worker.
struct Assignment {
  TaskId task_id;
  std::string payload;
  uint32_t attempt{0U};
};

/// Result of one attempt, reported back exactly once.
struct AttemptReport {
  TaskId task_id;
  WorkerId worker_id{};
  uint32_t attempt{0U};
  bool success{false};
  uint32_t duration_ms{0U};
};

/**
 * @brief What a worker pulls from. Implemented by Dispatcher.
 *
 * AcquireNext() blocks until an assignment is available, the idle timeout
 * elapses or the source shuts down. Returning an error retires the worker:
 * the source has already removed it from its registry.
 */
class WorkSource {
 public:
  virtual ~WorkSource() = default;

  virtual expected<Assignment, AcquireError> AcquireNext(
      WorkerId worker, std::chrono::milliseconds idle_timeout) = 0;

  virtual void ReportOutcome(const AttemptReport& report) = 0;
};

// ============================================================================
// Worker
// ============================================================================

class Worker final {
 public:
  /**
   * @param log  Attempt log, or nullptr to skip attempt-start lines.
   */
  Worker(WorkerId id, WorkSource& source, AttemptExecutor& executor,
         AttemptLog* log, std::chrono::milliseconds idle_timeout) noexcept
      : id_(id),
        source_(source),
        executor_(executor),
        log_(log),
        idle_timeout_(idle_timeout) {}

  ~Worker() { Join(); }

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

  void Start() {
    WQ_ASSERT(!thread_.joinable());
    thread_ = std::thread(&Worker::Run, this);
  }

  /// Waits for the thread to exit. Must not be called from the worker itself.
  void Join() {
    if (thread_.joinable()) {
      WQ_ASSERT(thread_.get_id() != std::this_thread::get_id());
      thread_.join();
    }
  }

  WorkerId Id() const noexcept { return id_; }

  WorkerState State() const noexcept {
    return state_.load(std::memory_order_acquire);
  }

  uint64_t AttemptsRun() const noexcept {
    return attempts_run_.load(std::memory_order_relaxed);
  }

 private:
  void Run() {
    WQ_LOG_DEBUG("Worker", "worker-%u started", id_.value());
    while (true) {
      auto next = source_.AcquireNext(id_, idle_timeout_);
      if (!next.has_value()) {
        state_.store(WorkerState::kRetired, std::memory_order_release);
        WQ_LOG_DEBUG("Worker", "worker-%u retired (%s)", id_.value(),
                     next.get_error() == AcquireError::kIdleTimeout
                         ? "idle timeout"
                         : "shutdown");
        return;
      }

      state_.store(WorkerState::kBusy, std::memory_order_release);
      const Assignment& work = next.value();

      AttemptReport report;
      report.task_id = work.task_id;
      report.worker_id = id_;
      report.attempt = work.attempt;
      RunAttempt(work, report);

      attempts_run_.fetch_add(1U, std::memory_order_relaxed);
      state_.store(WorkerState::kIdle, std::memory_order_release);
      source_.ReportOutcome(report);
    }
  }

  void RunAttempt(const Assignment& work, AttemptReport& report) {
    if (log_ != nullptr) {
      log_->Append(FormatAttemptLine(std::chrono::system_clock::now(), id_,
                                     work.task_id, work.attempt,
                                     work.payload));
    }

    AttemptRequest request;
    request.task_id = work.task_id;
    request.payload = work.payload;
    request.attempt = work.attempt;
    request.worker_id = id_;

    const auto start = std::chrono::steady_clock::now();
#if defined(__cpp_exceptions)
    try {
#endif
      auto result = executor_.Execute(request);
      if (result.has_value()) {
        report.success = result.value().success;
        report.duration_ms = result.value().duration_ms;
        if (!report.success) {
          WQ_LOG_DEBUG("Worker", "worker-%u task %s attempt %u failed",
                       id_.value(), work.task_id.c_str(), work.attempt);
        }
        return;
      }
      WQ_LOG_ERROR("Worker", "worker-%u executor fault on task %s attempt %u",
                   id_.value(), work.task_id.c_str(), work.attempt);
#if defined(__cpp_exceptions)
    } catch (const std::exception& e) {
      WQ_LOG_ERROR("Worker", "worker-%u task %s attempt %u threw: %s",
                   id_.value(), work.task_id.c_str(), work.attempt, e.what());
    } catch (...) {
      WQ_LOG_ERROR("Worker", "worker-%u task %s attempt %u threw",
                   id_.value(), work.task_id.c_str(), work.attempt);
    }
#endif
    report.success = false;
    report.duration_ms = static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
  }

  const WorkerId id_;
  WorkSource& source_;
  AttemptExecutor& executor_;
  AttemptLog* const log_;
  const std::chrono::milliseconds idle_timeout_;

  std::thread thread_;
  std::atomic<WorkerState> state_{WorkerState::kIdle};
  std::atomic<uint64_t> attempts_run_{0U};
};

}  // namespace wq

#endif  // WQ_WORKER_HPP_
