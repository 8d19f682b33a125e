/**
 * @file test_http_server.cpp
 * @brief Tests for http_server.hpp: request parsing, response formatting
 *        and a loopback round trip through the task API.
 */

#include "wq/http_server.hpp"
#include "wq/task_api.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

// ============================================================================
// ParseHttpRequest
// ============================================================================

TEST_CASE("ParseHttpRequest parses a complete POST", "[http]") {
  const std::string raw =
      "POST /tasks HTTP/1.1\r\n"
      "Host: localhost\r\n"
      "content-length: 17\r\n"
      "Content-Type:application/json\r\n"
      "\r\n"
      "{\"message\":\"hi\"}X";

  auto r = wq::ParseHttpRequest(raw);
  REQUIRE(r.has_value());
  const wq::HttpRequest& req = r.value();
  REQUIRE(req.method == "POST");
  REQUIRE(req.target == "/tasks");
  REQUIRE(req.version == "HTTP/1.1");
  REQUIRE(req.headers.size() == 3U);
  REQUIRE(req.body == "{\"message\":\"hi\"}X");

  const std::string* ct = req.FindHeader("CONTENT-TYPE");
  REQUIRE(ct != nullptr);
  REQUIRE(*ct == "application/json");
  REQUIRE(req.FindHeader("Accept") == nullptr);
}

TEST_CASE("ParseHttpRequest without a body", "[http]") {
  auto r = wq::ParseHttpRequest("GET /statistics HTTP/1.0\r\n\r\n");
  REQUIRE(r.has_value());
  REQUIRE(r.value().method == "GET");
  REQUIRE(r.value().body.empty());
}

TEST_CASE("ParseHttpRequest waits for the full message", "[http]") {
  auto empty = wq::ParseHttpRequest("");
  REQUIRE(!empty.has_value());
  REQUIRE(empty.get_error() == wq::HttpParseError::kIncomplete);

  auto head_only = wq::ParseHttpRequest("GET /statistics HTTP/1.1\r\nHost: x");
  REQUIRE(!head_only.has_value());
  REQUIRE(head_only.get_error() == wq::HttpParseError::kIncomplete);

  auto short_body = wq::ParseHttpRequest(
      "POST /tasks HTTP/1.1\r\nContent-Length: 10\r\n\r\n{\"m\"");
  REQUIRE(!short_body.has_value());
  REQUIRE(short_body.get_error() == wq::HttpParseError::kIncomplete);
}

TEST_CASE("ParseHttpRequest rejects malformed requests", "[http]") {
  const char* cases[] = {
      "GET\r\n\r\n",
      "GET /a b HTTP/1.1\r\n\r\n",
      "get /tasks HTTP/1.1\r\n\r\n",
      "GET tasks HTTP/1.1\r\n\r\n",
      "GET /tasks HTTP/2\r\n\r\n",
      "GET /tasks HTTP/1.1\r\nNoColonHere\r\n\r\n",
      "GET /tasks HTTP/1.1\r\n: empty-name\r\n\r\n",
      "POST /tasks HTTP/1.1\r\nContent-Length: 12a\r\n\r\n",
      "POST /tasks HTTP/1.1\r\nContent-Length: -1\r\n\r\n",
      "POST /tasks HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n",
  };
  for (const char* raw : cases) {
    auto r = wq::ParseHttpRequest(raw);
    CHECK(!r.has_value());
    if (!r.has_value()) {
      CHECK(r.get_error() == wq::HttpParseError::kMalformed);
    }
  }
}

TEST_CASE("ParseHttpRequest enforces size limits", "[http]") {
  const std::string big_body =
      "POST /tasks HTTP/1.1\r\nContent-Length: " +
      std::to_string(wq::kHttpMaxBodyBytes + 1U) + "\r\n\r\n";
  auto r = wq::ParseHttpRequest(big_body);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == wq::HttpParseError::kBodyTooLarge);

  const std::string endless_head =
      "GET /statistics HTTP/1.1\r\nX-Pad: " +
      std::string(wq::kHttpMaxHeaderBytes, 'a');
  auto h = wq::ParseHttpRequest(endless_head);
  REQUIRE(!h.has_value());
  REQUIRE(h.get_error() == wq::HttpParseError::kMalformed);
}

// ============================================================================
// FormatHttpResponse
// ============================================================================

TEST_CASE("FormatHttpResponse writes status, headers and body", "[http]") {
  wq::HttpResponse resp;
  resp.status = 201;
  resp.body = "{\"id\":\"abc\"}";
  const std::string wire = wq::FormatHttpResponse(resp);

  REQUIRE(wire.rfind("HTTP/1.1 201 Created\r\n", 0) == 0U);
  REQUIRE(wire.find("Content-Type: application/json\r\n") != std::string::npos);
  REQUIRE(wire.find("Content-Length: 12\r\n") != std::string::npos);
  REQUIRE(wire.find("Connection: close\r\n") != std::string::npos);
  REQUIRE(wire.size() >= resp.body.size());
  REQUIRE(wire.compare(wire.size() - resp.body.size(), resp.body.size(),
                       resp.body) == 0);
}

TEST_CASE("HttpStatusText knows the service's statuses", "[http]") {
  REQUIRE(std::string(wq::HttpStatusText(200)) == "OK");
  REQUIRE(std::string(wq::HttpStatusText(400)) == "Bad Request");
  REQUIRE(std::string(wq::HttpStatusText(404)) == "Not Found");
  REQUIRE(std::string(wq::HttpStatusText(405)) == "Method Not Allowed");
  REQUIRE(std::string(wq::HttpStatusText(413)) == "Payload Too Large");
  REQUIRE(std::string(wq::HttpStatusText(299)) == "Unknown");
}

// ============================================================================
// Loopback
// ============================================================================

#if WQ_HAS_NETWORK

namespace {

wq::HttpResponse RouteToApi(const wq::HttpRequest& req, void* ctx) {
  auto* api = static_cast<wq::TaskApi*>(ctx);
  wq::ApiResponse r = api->Route(req.method, req.target, req.body);
  wq::HttpResponse resp;
  resp.status = r.status;
  resp.body = std::move(r.body);
  return resp;
}

/// Send @p raw to 127.0.0.1:@p port and read until the server closes.
std::string Exchange(uint16_t port, const std::string& raw) {
  auto created = wq::TcpSocket::Create();
  REQUIRE(created.has_value());
  wq::TcpSocket sock = std::move(created).value();
  auto addr = wq::SocketAddress::FromIpv4("127.0.0.1", port);
  REQUIRE(addr.has_value());
  REQUIRE(sock.Connect(addr.value()).has_value());
  REQUIRE(sock.SendAll(raw.data(), raw.size()).has_value());

  std::string out;
  char buf[1024];
  while (true) {
    auto ready = sock.WaitReadable(3000);
    REQUIRE(ready.has_value());
    if (!ready.value()) break;
    auto n = sock.Recv(buf, sizeof(buf));
    REQUIRE(n.has_value());
    if (n.value() == 0) break;
    out.append(buf, static_cast<size_t>(n.value()));
  }
  return out;
}

std::string BodyOf(const std::string& wire) {
  const size_t pos = wire.find("\r\n\r\n");
  return (pos == std::string::npos) ? std::string() : wire.substr(pos + 4U);
}

}  // namespace

TEST_CASE("HttpServer serves the task API over loopback",
          "[http][loopback]") {
  wq::SimulatedExecutor exec(1U, 0U, 1U);
  wq::Dispatcher dispatcher(wq::DispatcherConfig{}, exec);
  wq::TaskApi api(dispatcher);

  wq::HttpServerConfig cfg;
  cfg.poll_interval_ms = 10U;
  cfg.read_timeout_ms = 500U;
  wq::HttpServer server(&RouteToApi, &api, cfg);
  REQUIRE(server.Start("127.0.0.1", 0).has_value());
  REQUIRE(server.IsRunning());
  REQUIRE(server.Port() != 0U);

  const std::string body = "{\"message\":\"over the wire\"}";
  const std::string created = Exchange(
      server.Port(),
      "POST /tasks HTTP/1.1\r\nHost: localhost\r\nContent-Length: " +
          std::to_string(body.size()) + "\r\n\r\n" + body);
  REQUIRE(created.rfind("HTTP/1.1 201 Created\r\n", 0) == 0U);
  auto id = nlohmann::json::parse(BodyOf(created))["id"].get<std::string>();
  REQUIRE(dispatcher.FindTask(id).has_value());

  const std::string stats =
      Exchange(server.Port(), "GET /statistics HTTP/1.1\r\n\r\n");
  REQUIRE(stats.rfind("HTTP/1.1 200 OK\r\n", 0) == 0U);
  auto j = nlohmann::json::parse(BodyOf(stats));
  REQUIRE(j["queueLength"] == 1);

  const std::string bad =
      Exchange(server.Port(), "POST /tasks HTTP/1.1\r\nContent-Length: 2\r\n"
                              "\r\n{}");
  REQUIRE(bad.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0U);

  const std::string garbage = Exchange(server.Port(), "HELLO\r\n\r\n");
  REQUIRE(garbage.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0U);

  const std::string too_large = Exchange(
      server.Port(), "POST /tasks HTTP/1.1\r\nContent-Length: 999999\r\n\r\n");
  REQUIRE(too_large.rfind("HTTP/1.1 413 Payload Too Large\r\n", 0) == 0U);

  server.Stop();
  REQUIRE(!server.IsRunning());
  REQUIRE(server.RequestsServed() == 5U);
  server.Stop();  // idempotent
}

TEST_CASE("HttpServer rejects an invalid listen address", "[http]") {
  wq::SimulatedExecutor exec(1U, 0U, 1U);
  wq::Dispatcher dispatcher(wq::DispatcherConfig{}, exec);
  wq::TaskApi api(dispatcher);
  wq::HttpServer server(&RouteToApi, &api);

  auto r = server.Start("not-an-ip", 0);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == wq::SocketError::kInvalidAddress);
  REQUIRE(!server.IsRunning());
}

#endif  // WQ_HAS_NETWORK
