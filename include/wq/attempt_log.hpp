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
 * @file attempt_log.hpp
 * @brief Append-only attempt log with a single background writer.
 *
 * Architecture:
 *   Worker 0 --+
 *   Worker 1 --+--> Append() --> FIFO (mutex) --> WriterThread --> Sink
 *   Worker N --+
 *
 * Append() only enqueues, so callers never block on file I/O. The writer
 * drains the FIFO in batches, which gives one total order across threads
 * and keeps lines whole. Nothing is dropped while the log is open; a failed
 * write is counted and reported through WQ_LOG_ERROR, never to the caller.
 *
 * Line format (FormatAttemptLine):
 *   2026-10-19T08:15:30.042Z | worker-2 | task-<uuid> | attempt-1 | hello
 */

#ifndef WQ_ATTEMPT_LOG_HPP_
#define WQ_ATTEMPT_LOG_HPP_

#include "wq/log.hpp"
#include "wq/task.hpp"
#include "wq/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace wq {

// ============================================================================
// Formatting
// ============================================================================

/**
 * @brief UTC timestamp as "YYYY-MM-DDTHH:MM:SS.mmmZ".
 */
inline std::string FormatIso8601(std::chrono::system_clock::time_point tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch()).count() % 1000;
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  struct std::tm tm_utc {};
  gmtime_r(&t, &tm_utc);
  char buf[32];
  (void)std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      tm_utc.tm_year + 1900, tm_utc.tm_mon + 1,
                      tm_utc.tm_mday, tm_utc.tm_hour, tm_utc.tm_min,
                      tm_utc.tm_sec, static_cast<int>(ms));
  return std::string(buf);
}

/// One log entry; CR and LF in @p message are escaped so it stays one line.
inline std::string FormatAttemptLine(std::chrono::system_clock::time_point tp,
                                     WorkerId worker, const TaskId& task,
                                     uint32_t attempt,
                                     const std::string& message) {
  std::string line = FormatIso8601(tp);
  line += " | worker-";
  line += std::to_string(worker.value());
  line += " | task-";
  line += task;
  line += " | attempt-";
  line += std::to_string(attempt);
  line += " | ";
  for (char c : message) {
    if (c == '\n') {
      line += "\\n";
    } else if (c == '\r') {
      line += "\\r";
    } else {
      line += c;
    }
  }
  line += '\n';
  return line;
}

// ============================================================================
// Types
// ============================================================================

enum class AttemptLogError : uint8_t {
  kAlreadyOpen = 0,
  kOpenFailed,
};

/**
 * @brief Batch output sink.
 *
 * @return false when the batch could not be written.
 */
using AttemptLogSinkFn = bool (*)(const std::string* lines, uint32_t count,
                                  void* context);

struct AttemptLogStats {
  uint64_t appended;        ///< Lines accepted by Append().
  uint64_t written;         ///< Lines the sink reported as written.
  uint64_t write_failures;  ///< Lines in batches the sink failed to write.
  uint64_t rejected;        ///< Append() calls while the log was closed.
};

// ============================================================================
// AttemptLog
// ============================================================================

class AttemptLog final {
 public:
  AttemptLog() = default;
  ~AttemptLog() { Close(); }

  AttemptLog(const AttemptLog&) = delete;
  AttemptLog& operator=(const AttemptLog&) = delete;

  /**
   * @brief Open @p path for appending (parent directories are created),
   *        write the service-start banner and start the writer thread.
   */
  expected<void, AttemptLogError> Open(const std::string& path) {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, AttemptLogError>::error(
          AttemptLogError::kAlreadyOpen);
    }

    const std::filesystem::path parent =
        std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        WQ_LOG_WARN("AttemptLog", "cannot create %s: %s",
                    parent.string().c_str(), ec.message().c_str());
      }
    }

    file_ = std::fopen(path.c_str(), "a");
    if (file_ == nullptr) {
      WQ_LOG_ERROR("AttemptLog", "cannot open %s for append", path.c_str());
      return expected<void, AttemptLogError>::error(
          AttemptLogError::kOpenFailed);
    }

    StartWriter(&AttemptLog::FileSink, file_);
    Append("--- service start " +
           FormatIso8601(std::chrono::system_clock::now()) + " ---\n");
    WQ_LOG_INFO("AttemptLog", "appending attempts to %s", path.c_str());
    return expected<void, AttemptLogError>::success();
  }

  /**
   * @brief Start the writer against a custom sink (no file, no banner).
   */
  expected<void, AttemptLogError> OpenWithSink(AttemptLogSinkFn sink,
                                               void* context = nullptr) {
    WQ_ASSERT(sink != nullptr);
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, AttemptLogError>::error(
          AttemptLogError::kAlreadyOpen);
    }
    StartWriter(sink, context);
    return expected<void, AttemptLogError>::success();
  }

  /**
   * @brief Enqueue one complete line (newline included). Non-blocking.
   */
  void Append(std::string line) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (!running_.load(std::memory_order_acquire) || shutdown_) {
        ++rejected_;
        WQ_LOG_WARN("AttemptLog", "append while closed, line not recorded");
        return;
      }
      pending_.push_back(std::move(line));
      ++appended_;
    }
    cv_.notify_one();
  }

  /**
   * @brief Drain everything queued so far, stop the writer, close the file.
   */
  void Close() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (!running_.load(std::memory_order_acquire)) return;
      shutdown_ = true;
    }
    cv_.notify_all();
    if (writer_.joinable()) {
      writer_.join();
    }
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
    std::lock_guard<std::mutex> lock(mtx_);
    running_.store(false, std::memory_order_release);
  }

  bool IsOpen() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  AttemptLogStats GetStats() const {
    std::lock_guard<std::mutex> lock(mtx_);
    AttemptLogStats s;
    s.appended = appended_;
    s.written = written_;
    s.write_failures = write_failures_;
    s.rejected = rejected_;
    return s;
  }

  /// Lines accepted but not yet handed to the sink.
  size_t Pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return pending_.size();
  }

 private:
  static constexpr size_t kBatchSize = 64U;

  void StartWriter(AttemptLogSinkFn sink, void* context) {
    std::lock_guard<std::mutex> lock(mtx_);
    sink_ = sink;
    sink_context_ = context;
    shutdown_ = false;
    running_.store(true, std::memory_order_release);
    writer_ = std::thread(&AttemptLog::WriterLoop, this);
  }

  static bool FileSink(const std::string* lines, uint32_t count,
                       void* context) {
    auto* file = static_cast<FILE*>(context);
    for (uint32_t i = 0; i < count; ++i) {
      const std::string& l = lines[i];
      if (std::fwrite(l.data(), 1, l.size(), file) != l.size()) {
        return false;
      }
    }
    return std::fflush(file) == 0;
  }

  void WriterLoop() {
    std::vector<std::string> batch;
    batch.reserve(kBatchSize);

    std::unique_lock<std::mutex> lock(mtx_);
    while (true) {
      cv_.wait(lock, [this] { return !pending_.empty() || shutdown_; });
      if (pending_.empty() && shutdown_) {
        break;
      }

      while (!pending_.empty() && batch.size() < kBatchSize) {
        batch.push_back(std::move(pending_.front()));
        pending_.pop_front();
      }

      lock.unlock();
      const bool ok =
          sink_(batch.data(), static_cast<uint32_t>(batch.size()), sink_context_);
      if (!ok) {
        WQ_LOG_ERROR("AttemptLog", "failed to write %u attempt line(s)",
                     static_cast<unsigned>(batch.size()));
      }
      lock.lock();

      if (ok) {
        written_ += batch.size();
      } else {
        write_failures_ += batch.size();
      }
      batch.clear();
    }
  }

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<std::string> pending_;
  bool shutdown_{false};
  std::atomic<bool> running_{false};
  std::thread writer_;

  FILE* file_{nullptr};
  AttemptLogSinkFn sink_{nullptr};
  void* sink_context_{nullptr};

  uint64_t appended_{0U};
  uint64_t written_{0U};
  uint64_t write_failures_{0U};
  uint64_t rejected_{0U};
};

}  // namespace wq

#endif  // WQ_ATTEMPT_LOG_HPP_
