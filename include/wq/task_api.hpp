/**
 * @file task_api.hpp
 * @brief Transport-neutral request handling for the task service.
 *
 * Routes:
 *   POST /tasks       {"message": "..."}  -> 201 {"id": "<uuid>"}
 *   GET  /statistics                      -> 200 statistics object
 *
 * Validation happens here; a rejected request never reaches the
 * Dispatcher. Bodies are built with nlohmann/json.
 */

#ifndef WQ_TASK_API_HPP_
#define WQ_TASK_API_HPP_

#include "wq/dispatcher.hpp"
#include "wq/log.hpp"
#include "wq/metrics.hpp"
#include "wq/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <utility>

namespace wq {

enum class ApiError : uint8_t {
  kInvalidJson = 0,
  kMissingMessage,
  kMessageNotString,
  kEmptyMessage,
};

struct ApiResponse {
  int32_t status{200};
  std::string body;
};

/// Error text returned for every rejected submission.
constexpr const char* kMessageRequiredError =
    "message is required and must be a string";

/**
 * @brief Extract the task message from a POST /tasks body.
 *
 * The message is returned as sent; trimming is only used to reject
 * whitespace-only messages.
 */
inline expected<std::string, ApiError> ParseSubmission(
    const std::string& body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return expected<std::string, ApiError>::error(ApiError::kInvalidJson);
  }
  auto it = j.find("message");
  if (it == j.end()) {
    return expected<std::string, ApiError>::error(ApiError::kMissingMessage);
  }
  if (!it->is_string()) {
    return expected<std::string, ApiError>::error(
        ApiError::kMessageNotString);
  }
  std::string message = it->get<std::string>();
  if (message.find_first_not_of(" \t\r\n\v\f") == std::string::npos) {
    return expected<std::string, ApiError>::error(ApiError::kEmptyMessage);
  }
  return expected<std::string, ApiError>::success(std::move(message));
}

inline nlohmann::json StatisticsToJson(const StatisticsSnapshot& s) {
  nlohmann::json j;
  j["processedTasks"] = s.processed_tasks;
  j["retries"] = s.retries;
  j["succeeded"] = s.succeeded;
  j["failed"] = s.failed;
  j["successRate"] = s.success_rate;
  j["averageProcessingTimeMsPerAttempt"] =
      s.average_processing_time_ms_per_attempt;
  j["queueLength"] = s.queue_length;
  j["idleWorkers"] = s.idle_workers;
  j["busyWorkers"] = s.busy_workers;
  return j;
}

// ============================================================================
// TaskApi
// ============================================================================

class TaskApi final {
 public:
  explicit TaskApi(Dispatcher& dispatcher) noexcept : dispatcher_(dispatcher) {}

  TaskApi(const TaskApi&) = delete;
  TaskApi& operator=(const TaskApi&) = delete;

  /**
   * @brief Dispatch one request. Any query string in @p target is ignored.
   */
  ApiResponse Route(const std::string& method, const std::string& target,
                    const std::string& body) {
    const std::string path = target.substr(0, target.find('?'));

    if (path == "/tasks") {
      if (method != "POST") return MethodNotAllowed();
      return SubmitTask(body);
    }
    if (path == "/statistics") {
      if (method != "GET") return MethodNotAllowed();
      return Statistics();
    }
    return Error(404, "not found");
  }

  ApiResponse SubmitTask(const std::string& body) {
    auto message = ParseSubmission(body);
    if (!message.has_value()) {
      WQ_LOG_DEBUG("Http", "rejected submission (reason %u)",
                   static_cast<unsigned>(message.get_error()));
      return Error(400, kMessageRequiredError);
    }
    const TaskId id = dispatcher_.CreateTask(std::move(message).value());

    nlohmann::json j;
    j["id"] = id;
    ApiResponse resp;
    resp.status = 201;
    resp.body = j.dump();
    return resp;
  }

  ApiResponse Statistics() const {
    ApiResponse resp;
    resp.status = 200;
    resp.body = StatisticsToJson(dispatcher_.GetStatistics()).dump();
    return resp;
  }

 private:
  static ApiResponse Error(int32_t status, const char* message) {
    nlohmann::json j;
    j["error"] = message;
    ApiResponse resp;
    resp.status = status;
    resp.body = j.dump();
    return resp;
  }

  static ApiResponse MethodNotAllowed() {
    return Error(405, "method not allowed");
  }

  Dispatcher& dispatcher_;
};

}  // namespace wq

#endif  // WQ_TASK_API_HPP_
