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
 * @file dispatcher.hpp
 * @brief Task queue, elastic worker pool and retry state machine.
 *
 * Architecture:
 *
 *   CreateTask() --> [FIFO queue] <--AcquireNext()-- Worker 1..N
 *                         ^                             |
 *                         |                      ReportOutcome()
 *                         |                             v
 *   TimerScheduler --> [pending retries] <-- failed, attempt < max_retries
 *
 * One mutex guards the queue, the task table, the counters, the worker
 * registry and the pending retries, so every statistics snapshot is
 * consistent and idle + busy always equals the pool size.
 *
 * Pool growth: after every enqueue and every worker-becomes-idle event,
 * spawn one worker if queue_length > idle_workers and the pool is below
 * its cap. Workers retire themselves after idle_timeout_ms without work.
 *
 * Usage:
 * @code
 *   wq::SimulatedExecutor exec(500, 20);
 *   wq::Dispatcher dispatcher(cfg.dispatcher, exec, &attempt_log);
 *   dispatcher.Start();
 *   wq::TaskId id = dispatcher.CreateTask("hello");
 *   wq::StatisticsSnapshot s = dispatcher.GetStatistics();
 *   dispatcher.Shutdown();
 * @endcode
 */

#ifndef WQ_DISPATCHER_HPP_
#define WQ_DISPATCHER_HPP_

#include "wq/attempt.hpp"
#include "wq/attempt_log.hpp"
#include "wq/log.hpp"
#include "wq/metrics.hpp"
#include "wq/service_config.hpp"
#include "wq/task.hpp"
#include "wq/timer.hpp"
#include "wq/vocabulary.hpp"
#include "wq/worker.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wq {

enum class DispatchError : uint8_t {
  kAlreadyRunning = 0,
  kStopped,          ///< Shutdown() was called; a dispatcher is not restartable.
  kTimerFailed,
};

inline const char* DispatchErrorName(DispatchError e) noexcept {
  switch (e) {
    case DispatchError::kAlreadyRunning: return "already running";
    case DispatchError::kStopped:        return "stopped";
    case DispatchError::kTimerFailed:    return "retry timer failed";
  }
  return "unknown";
}

// ============================================================================
// Dispatcher
// ============================================================================

class Dispatcher final : public WorkSource {
 public:
  /**
   * @param executor  Runs every attempt; must outlive the dispatcher.
   * @param log       Attempt log shared by all workers, or nullptr.
   */
  Dispatcher(const DispatcherConfig& config, AttemptExecutor& executor,
             AttemptLog* log = nullptr)
      : cfg_(config),
        max_workers_(config.EffectiveMaxWorkers()),
        executor_(executor),
        log_(log) {}

  ~Dispatcher() override { Shutdown(); }

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;
  Dispatcher(Dispatcher&&) = delete;
  Dispatcher& operator=(Dispatcher&&) = delete;

  // ==========================================================================
  // Lifecycle
  // ==========================================================================

  /**
   * @brief Start the retry timer and begin dispatching. Tasks created before
   *        Start() are picked up immediately.
   */
  expected<void, DispatchError> Start() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (running_) {
        return expected<void, DispatchError>::error(
            DispatchError::kAlreadyRunning);
      }
      if (stopped_) {
        return expected<void, DispatchError>::error(DispatchError::kStopped);
      }
    }

    auto timer_id = timer_.Add(cfg_.retry_poll_ms, &Dispatcher::OnRetryTick,
                               this);
    if (!timer_id.has_value() || !timer_.Start().has_value()) {
      WQ_LOG_ERROR("Dispatch", "cannot start retry timer (poll %u ms)",
                   cfg_.retry_poll_ms);
      return expected<void, DispatchError>::error(DispatchError::kTimerFailed);
    }

    {
      std::lock_guard<std::mutex> lock(mtx_);
      running_ = true;
      for (size_t i = 0; i < queue_.size(); ++i) {
        MaybeGrowLocked();
      }
    }
    cv_.notify_all();
    WQ_LOG_INFO("Dispatch",
                "started: max_workers=%u max_retries=%u retry_delay=%ums "
                "idle_timeout=%ums",
                max_workers_, cfg_.max_retries, cfg_.retry_delay_ms,
                cfg_.idle_timeout_ms);
    return expected<void, DispatchError>::success();
  }

  /**
   * @brief Stop dispatching and join every worker.
   *
   * In-flight attempts run to completion and are reported. Queued tasks stay
   * queued; pending retries are dropped. Idempotent.
   */
  void Shutdown() {
    size_t dropped = 0U;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (!running_) {
        stopped_ = true;
        return;
      }
      running_ = false;
      stopped_ = true;
      dropped = retries_.size();
      retries_.clear();
    }
    timer_.Stop();
    cv_.notify_all();

    std::vector<std::unique_ptr<Worker>> done;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      pool_cv_.wait(lock, [this] { return pool_.empty(); });
      done.swap(retired_);
    }
    done.clear();  // joins

    WQ_LOG_INFO("Dispatch", "shut down (%zu pending retries dropped)",
                dropped);
  }

  bool IsRunning() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return running_;
  }

  // ==========================================================================
  // Submission
  // ==========================================================================

  /**
   * @brief Record a new task and queue it for its first attempt.
   * @return The new task's id; returned before any attempt starts.
   */
  TaskId CreateTask(std::string message) {
    ReapRetired();

    auto task = std::make_shared<Task>(GenerateTaskId(), std::move(message));
    const TaskId id = task->Id();
    bool notify = false;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      tasks_.emplace(id, task);
      queue_.push_back(std::move(task));
      if (running_) {
        MaybeGrowLocked();
        notify = true;
      } else if (stopped_) {
        WQ_LOG_WARN("Dispatch", "task %s created after shutdown, not processed",
                    id.c_str());
      }
    }
    if (notify) {
      cv_.notify_one();
    }
    WQ_LOG_DEBUG("Dispatch", "task %s queued", id.c_str());
    return id;
  }

  // ==========================================================================
  // WorkSource
  // ==========================================================================

  /**
   * @brief Hand the queue head to @p worker, waiting up to @p idle_timeout.
   *
   * On timeout or shutdown the worker is removed from the pool before the
   * error is returned; its thread object is joined later by ReapRetired()
   * or Shutdown().
   */
  expected<Assignment, AcquireError> AcquireNext(
      WorkerId worker, std::chrono::milliseconds idle_timeout) override {
    const auto deadline = std::chrono::steady_clock::now() + idle_timeout;
    std::unique_lock<std::mutex> lock(mtx_);

    while (true) {
      if (!running_) {
        RetireLocked(worker);
        return expected<Assignment, AcquireError>::error(
            AcquireError::kShutdown);
      }

      while (!queue_.empty() && queue_.front()->IsCompleted()) {
        queue_.pop_front();
      }

      if (!queue_.empty()) {
        std::shared_ptr<Task> task = std::move(queue_.front());
        queue_.pop_front();

        Assignment work;
        work.task_id = task->Id();
        work.payload = task->Payload();
        work.attempt = task->BeginAttempt();

        auto it = pool_.find(worker.value());
        if (it != pool_.end()) {
          it->second.state = WorkerState::kBusy;
        }
        MaybeGrowLocked();
        return expected<Assignment, AcquireError>::success(std::move(work));
      }

      if (std::chrono::steady_clock::now() >= deadline) {
        RetireLocked(worker);
        return expected<Assignment, AcquireError>::error(
            AcquireError::kIdleTimeout);
      }
      cv_.wait_until(lock, deadline);
    }
  }

  /**
   * @brief Apply the outcome of one attempt.
   *
   * Success finalizes the task (once). A failure of the task's current
   * attempt is requeued after retry_delay_ms while attempts remain, and
   * finalizes the task as failed otherwise. Reports for unknown tasks or
   * stale attempts only feed the attempt counters.
   */
  void ReportOutcome(const AttemptReport& report) override {
    bool notify = false;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      counters_.attempts += 1U;
      counters_.processing_ms += report.duration_ms;

      auto w = pool_.find(report.worker_id.value());
      if (w != pool_.end() && w->second.state == WorkerState::kBusy) {
        w->second.state = WorkerState::kIdle;
      }

      auto it = tasks_.find(report.task_id);
      if (it == tasks_.end()) {
        WQ_LOG_DEBUG("Dispatch", "report for unknown task %s ignored",
                     report.task_id.c_str());
      } else if (report.success) {
        HandleSuccessLocked(*it->second, report);
      } else {
        HandleFailureLocked(it->second, report);
      }

      if (running_) {
        MaybeGrowLocked();
        notify = !queue_.empty();
      }
    }
    if (notify) {
      cv_.notify_one();
    }
  }

  // ==========================================================================
  // Observation
  // ==========================================================================

  StatisticsSnapshot GetStatistics() const {
    std::lock_guard<std::mutex> lock(mtx_);
    uint32_t idle = 0U;
    uint32_t busy = 0U;
    CountPoolLocked(idle, busy);
    return ComputeSnapshot(counters_, queue_.size(), idle, busy);
  }

  uint32_t PoolSize() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return static_cast<uint32_t>(pool_.size());
  }

  uint32_t MaxWorkers() const noexcept { return max_workers_; }

  /// Retained tasks: every live task plus the most recent completed ones.
  std::optional<TaskView> FindTask(const TaskId& id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
      return std::nullopt;
    }
    return MakeTaskView(*it->second);
  }

  /// Retired workers whose threads have not been joined yet.
  size_t UnjoinedWorkerCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return retired_.size();
  }

  size_t RetainedTaskCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return tasks_.size();
  }

  const DispatcherConfig& Config() const noexcept { return cfg_; }

 private:
  using Clock = std::chrono::steady_clock;

  struct PoolEntry {
    std::unique_ptr<Worker> worker;
    WorkerState state{WorkerState::kIdle};
  };

  struct PendingRetry {
    std::shared_ptr<Task> task;
    Clock::time_point due;
  };

  // --------------------------------------------------------------------------
  // Pool management (mtx_ held)
  // --------------------------------------------------------------------------

  void CountPoolLocked(uint32_t& idle, uint32_t& busy) const {
    for (const auto& kv : pool_) {
      if (kv.second.state == WorkerState::kBusy) {
        ++busy;
      } else {
        ++idle;
      }
    }
  }

  void MaybeGrowLocked() {
    if (!running_ || pool_.size() >= max_workers_) {
      return;
    }
    uint32_t idle = 0U;
    uint32_t busy = 0U;
    CountPoolLocked(idle, busy);
    if (queue_.size() <= idle) {
      return;
    }

    const WorkerId id(next_worker_id_++);
    PoolEntry entry;
    entry.worker = std::make_unique<Worker>(
        id, *this, executor_, log_,
        std::chrono::milliseconds(cfg_.idle_timeout_ms));
    Worker* raw = entry.worker.get();
    pool_.emplace(id.value(), std::move(entry));
    raw->Start();
    WQ_LOG_DEBUG("Dispatch", "spawned worker-%u (pool %zu/%u, queue %zu)",
                 id.value(), pool_.size(), max_workers_, queue_.size());
  }

  void RetireLocked(WorkerId worker) {
    auto it = pool_.find(worker.value());
    if (it == pool_.end()) {
      return;
    }
    retired_.push_back(std::move(it->second.worker));
    pool_.erase(it);
    WQ_LOG_DEBUG("Dispatch", "worker-%u left the pool (pool %zu)",
                 worker.value(), pool_.size());
    if (pool_.empty()) {
      pool_cv_.notify_all();
    }
  }

  /// Join the threads of retired workers outside the lock.
  void ReapRetired() {
    std::vector<std::unique_ptr<Worker>> done;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      done.swap(retired_);
    }
  }

  // --------------------------------------------------------------------------
  // Outcome handling (mtx_ held)
  // --------------------------------------------------------------------------

  void FinalizeLocked(Task& task, bool succeeded) {
    // State only changes under mtx_, so this read cannot go stale.
    const bool was_queued = (task.State() == TaskState::kQueued);
    if (!task.TryFinalize()) {
      WQ_LOG_DEBUG("Dispatch", "task %s already completed, report ignored",
                   task.Id().c_str());
      return;
    }
    if (was_queued) {
      for (auto it = queue_.begin(); it != queue_.end(); ++it) {
        if (it->get() == &task) {
          queue_.erase(it);
          break;
        }
      }
    }
    counters_.processed_tasks += 1U;
    if (succeeded) {
      counters_.succeeded += 1U;
    } else {
      counters_.failed += 1U;
      WQ_LOG_INFO("Dispatch", "task %s failed after %u attempts",
                  task.Id().c_str(), task.Attempts());
    }

    completed_order_.push_back(task.Id());
    while (completed_order_.size() > cfg_.completed_retention) {
      tasks_.erase(completed_order_.front());
      completed_order_.pop_front();
    }
  }

  void HandleSuccessLocked(Task& task, const AttemptReport& report) {
    // Only an attempt that was actually handed out can complete the task.
    if (report.attempt == 0U || report.attempt > task.Attempts()) {
      WQ_LOG_DEBUG("Dispatch", "stale success for task %s attempt %u ignored",
                   task.Id().c_str(), report.attempt);
      return;
    }
    FinalizeLocked(task, true);
  }

  void HandleFailureLocked(const std::shared_ptr<Task>& task,
                           const AttemptReport& report) {
    if (task->State() != TaskState::kInFlight ||
        report.attempt != task->Attempts()) {
      WQ_LOG_DEBUG("Dispatch", "stale failure for task %s attempt %u ignored",
                   task->Id().c_str(), report.attempt);
      return;
    }

    if (report.attempt < cfg_.max_retries) {
      if (!task->Transition(TaskState::kPendingRetry)) {
        return;
      }
      if (!running_) {
        // Stopped: the retry would never be promoted, so it is not counted.
        WQ_LOG_DEBUG("Dispatch", "task %s attempt %u failed after shutdown",
                     task->Id().c_str(), report.attempt);
        return;
      }
      counters_.retries += 1U;
      PendingRetry retry;
      retry.task = task;
      retry.due = Clock::now() + std::chrono::milliseconds(cfg_.retry_delay_ms);
      retries_.push_back(std::move(retry));
      WQ_LOG_DEBUG("Dispatch", "task %s attempt %u failed, retry in %u ms",
                   task->Id().c_str(), report.attempt, cfg_.retry_delay_ms);
      return;
    }

    FinalizeLocked(*task, false);
  }

  // --------------------------------------------------------------------------
  // Retry promotion (timer thread)
  // --------------------------------------------------------------------------

  static void OnRetryTick(void* ctx) {
    static_cast<Dispatcher*>(ctx)->PromoteDueRetries();
  }

  void PromoteDueRetries() {
    ReapRetired();

    uint32_t promoted = 0U;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (!running_) {
        return;
      }
      const auto now = Clock::now();
      // retry_delay_ms is fixed, so retries_ is ordered by due time.
      while (!retries_.empty() && retries_.front().due <= now) {
        std::shared_ptr<Task> task = std::move(retries_.front().task);
        retries_.pop_front();
        if (!task->Transition(TaskState::kQueued)) {
          continue;
        }
        queue_.push_back(std::move(task));
        MaybeGrowLocked();
        ++promoted;
      }
    }
    if (promoted > 0U) {
      cv_.notify_all();
    }
  }

  const DispatcherConfig cfg_;
  const uint32_t max_workers_;
  AttemptExecutor& executor_;
  AttemptLog* const log_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;       ///< Work queued or shutdown.
  std::condition_variable pool_cv_;  ///< Pool became empty.
  bool running_{false};
  bool stopped_{false};

  std::deque<std::shared_ptr<Task>> queue_;
  std::unordered_map<TaskId, std::shared_ptr<Task>> tasks_;
  std::deque<TaskId> completed_order_;
  std::deque<PendingRetry> retries_;
  MetricCounters counters_;

  std::map<uint32_t, PoolEntry> pool_;
  std::vector<std::unique_ptr<Worker>> retired_;
  uint32_t next_worker_id_{1U};

  TimerScheduler<1> timer_;
};

}  // namespace wq

#endif  // WQ_DISPATCHER_HPP_
