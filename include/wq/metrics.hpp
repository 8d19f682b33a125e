/**
 * @file metrics.hpp
 * @brief Running counters and the derived statistics snapshot.
 *
 * Counters only grow. The snapshot is a pure function of the counters and
 * the live queue/pool sizes; nothing is recomputed from task history.
 */

#ifndef WQ_METRICS_HPP_
#define WQ_METRICS_HPP_

#include <cmath>
#include <cstdint>

namespace wq {

struct MetricCounters {
  uint64_t processed_tasks{0U};   ///< Tasks finalized (succeeded + failed).
  uint64_t retries{0U};           ///< Failed attempts that were requeued.
  uint64_t succeeded{0U};
  uint64_t failed{0U};
  uint64_t attempts{0U};          ///< Attempt outcomes reported.
  uint64_t processing_ms{0U};     ///< Sum of reported attempt durations.
};

struct StatisticsSnapshot {
  uint64_t processed_tasks{0U};
  uint64_t retries{0U};
  uint64_t succeeded{0U};
  uint64_t failed{0U};
  double success_rate{0.0};
  uint64_t average_processing_time_ms_per_attempt{0U};
  uint64_t queue_length{0U};
  uint32_t idle_workers{0U};
  uint32_t busy_workers{0U};

  bool operator==(const StatisticsSnapshot& rhs) const noexcept {
    return processed_tasks == rhs.processed_tasks && retries == rhs.retries &&
           succeeded == rhs.succeeded && failed == rhs.failed &&
           success_rate == rhs.success_rate &&
           average_processing_time_ms_per_attempt ==
               rhs.average_processing_time_ms_per_attempt &&
           queue_length == rhs.queue_length &&
           idle_workers == rhs.idle_workers &&
           busy_workers == rhs.busy_workers;
  }
  bool operator!=(const StatisticsSnapshot& rhs) const noexcept {
    return !(*this == rhs);
  }
};

/**
 * @brief Derive a snapshot. success_rate and the average are 0 when their
 *        denominators are 0; the average is rounded half away from zero.
 */
inline StatisticsSnapshot ComputeSnapshot(const MetricCounters& c,
                                          uint64_t queue_length,
                                          uint32_t idle_workers,
                                          uint32_t busy_workers) noexcept {
  StatisticsSnapshot s;
  s.processed_tasks = c.processed_tasks;
  s.retries = c.retries;
  s.succeeded = c.succeeded;
  s.failed = c.failed;
  s.success_rate = (c.processed_tasks > 0U)
                       ? static_cast<double>(c.succeeded) /
                             static_cast<double>(c.processed_tasks)
                       : 0.0;
  s.average_processing_time_ms_per_attempt =
      (c.attempts > 0U)
          ? static_cast<uint64_t>(std::llround(
                static_cast<double>(c.processing_ms) /
                static_cast<double>(c.attempts)))
          : 0U;
  s.queue_length = queue_length;
  s.idle_workers = idle_workers;
  s.busy_workers = busy_workers;
  return s;
}

}  // namespace wq

#endif  // WQ_METRICS_HPP_
