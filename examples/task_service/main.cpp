/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 */

/**
 * @file main.cpp
 * @brief Task service: HTTP front end over the dispatcher and worker pool.
 *
 *   POST /tasks       {"message": "..."}   -> 201 {"id": "..."}
 *   GET  /statistics                       -> 200 {...}
 *
 * Settings come from defaults, then the config file, then the environment
 * (TASK_SIMULATED_DURATION, WORKER_TIMEOUT, SERVER_PORT, LOG_PATH, ...).
 *
 * Run: ./workq_task_service [config/task_service.json]
 */

#include "wq/attempt.hpp"
#include "wq/attempt_log.hpp"
#include "wq/dispatcher.hpp"
#include "wq/http_server.hpp"
#include "wq/log.hpp"
#include "wq/service_config.hpp"
#include "wq/shutdown.hpp"
#include "wq/task_api.hpp"

#include <cstdio>
#include <cstdlib>
#include <utility>

static constexpr const char* kDefaultConfigPath = "config/task_service.json";

static wq::HttpResponse HandleRequest(const wq::HttpRequest& req, void* ctx) {
  auto* api = static_cast<wq::TaskApi*>(ctx);
  wq::ApiResponse r = api->Route(req.method, req.target, req.body);
  wq::HttpResponse resp;
  resp.status = r.status;
  resp.body = std::move(r.body);
  return resp;
}

int main(int argc, char* argv[]) {
  wq::log::Init();

  // ---- 1. Configuration ----
  const char* config_path = (argc > 1) ? argv[1] : kDefaultConfigPath;
  auto loaded = wq::LoadServiceConfig(config_path);
  if (!loaded.has_value()) {
    WQ_LOG_ERROR("Service", "invalid configuration: %s",
                 wq::ConfigErrorName(loaded.get_error()));
    return EXIT_FAILURE;
  }
  const wq::ServiceConfig cfg = std::move(loaded).value();
  wq::log::SetLevel(cfg.log_level);

  // ---- 2. Attempt log ----
  wq::AttemptLog attempt_log;
  auto opened = attempt_log.Open(cfg.log_path);
  if (!opened.has_value()) {
    WQ_LOG_WARN("Service", "attempt log %s unavailable, attempts not recorded",
                cfg.log_path.c_str());
  }

  // ---- 3. Dispatcher ----
  wq::SimulatedExecutor executor(cfg.dispatcher.simulated_duration_ms,
                                 cfg.dispatcher.simulated_error_percentage);
  wq::Dispatcher dispatcher(cfg.dispatcher, executor,
                            attempt_log.IsOpen() ? &attempt_log : nullptr);
  auto started = dispatcher.Start();
  if (!started.has_value()) {
    WQ_LOG_ERROR("Service", "dispatcher failed to start: %s",
                 wq::DispatchErrorName(started.get_error()));
    return EXIT_FAILURE;
  }

  // ---- 4. HTTP ----
  wq::ShutdownSignal stop;
  auto installed = stop.InstallSignalHandlers();
  if (!installed.has_value()) {
    WQ_LOG_WARN("Service", "signal handlers not installed, stop with SIGKILL");
  }

  wq::TaskApi api(dispatcher);
  wq::HttpServer server(&HandleRequest, &api);
  auto listening = server.Start(cfg.host, cfg.port);
  if (!listening.has_value()) {
    WQ_LOG_ERROR("Service", "cannot serve on %s:%u: %s", cfg.host.c_str(),
                 static_cast<unsigned>(cfg.port),
                 wq::SocketErrorName(listening.get_error()));
    dispatcher.Shutdown();
    return EXIT_FAILURE;
  }
  WQ_LOG_INFO("Service", "task service listening on port %u (max %u workers)",
              static_cast<unsigned>(server.Port()), dispatcher.MaxWorkers());

  // ---- 5. Run until SIGINT / SIGTERM ----
  stop.Wait();
  WQ_LOG_INFO("Service", "signal %d received, shutting down", stop.Signal());

  server.Stop();
  dispatcher.Shutdown();
  attempt_log.Close();

  const wq::StatisticsSnapshot s = dispatcher.GetStatistics();
  WQ_LOG_INFO("Service",
              "processed=%llu succeeded=%llu failed=%llu retries=%llu",
              static_cast<unsigned long long>(s.processed_tasks),
              static_cast<unsigned long long>(s.succeeded),
              static_cast<unsigned long long>(s.failed),
              static_cast<unsigned long long>(s.retries));
  wq::log::Shutdown();
  return EXIT_SUCCESS;
}
