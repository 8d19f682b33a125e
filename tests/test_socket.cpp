/**
 * @file test_socket.cpp
 * @brief Tests for socket.hpp: SocketAddress, TcpSocket, TcpListener.
 */

#include "wq/socket.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>
#include <thread>
#include <utility>

// ============================================================================
// Helpers
// ============================================================================

/// Listener bound to 127.0.0.1 on a kernel-chosen port.
static wq::TcpListener MakeLoopbackListener(uint16_t& port) {
  auto created = wq::TcpListener::Create();
  REQUIRE(created.has_value());
  wq::TcpListener listener = std::move(created).value();
  REQUIRE(listener.SetReuseAddr(true).has_value());

  auto addr = wq::SocketAddress::FromIpv4("127.0.0.1", 0);
  REQUIRE(addr.has_value());
  REQUIRE(listener.Bind(addr.value()).has_value());
  REQUIRE(listener.Listen().has_value());

  auto bound = listener.LocalPort();
  REQUIRE(bound.has_value());
  port = bound.value();
  return listener;
}

// ============================================================================
// Creation and addresses
// ============================================================================

TEST_CASE("socket - TcpSocket and TcpListener create valid fds",
          "[socket]") {
  auto sock = wq::TcpSocket::Create();
  REQUIRE(sock.has_value());
  REQUIRE(sock.value().IsValid());
  REQUIRE(sock.value().Fd() >= 0);

  auto listener = wq::TcpListener::Create();
  REQUIRE(listener.has_value());
  REQUIRE(listener.value().IsValid());
}

TEST_CASE("socket - SocketAddress::FromIpv4", "[socket][address]") {
  auto ok = wq::SocketAddress::FromIpv4("127.0.0.1", 3000);
  REQUIRE(ok.has_value());
  REQUIRE(ok.value().Port() == 3000);
  REQUIRE(ok.value().Size() == sizeof(sockaddr_in));

  auto any = wq::SocketAddress::FromIpv4("0.0.0.0", 0);
  REQUIRE(any.has_value());

  auto bad = wq::SocketAddress::FromIpv4("localhost", 80);
  REQUIRE(!bad.has_value());
  REQUIRE(bad.get_error() == wq::SocketError::kInvalidAddress);
}

TEST_CASE("socket - SocketErrorName covers every error", "[socket]") {
  REQUIRE(std::strcmp(wq::SocketErrorName(wq::SocketError::kBindFailed),
                      "bind failed") == 0);
  REQUIRE(std::strcmp(wq::SocketErrorName(wq::SocketError::kTimeout),
                      "timeout") == 0);
}

// ============================================================================
// Ownership
// ============================================================================

TEST_CASE("socket - TcpSocket move transfers the fd", "[socket]") {
  auto created = wq::TcpSocket::Create();
  REQUIRE(created.has_value());
  wq::TcpSocket a = std::move(created).value();
  const int32_t fd = a.Fd();

  wq::TcpSocket b(std::move(a));
  REQUIRE(!a.IsValid());
  REQUIRE(b.Fd() == fd);

  wq::TcpSocket c;
  c = std::move(b);
  REQUIRE(!b.IsValid());
  REQUIRE(c.Fd() == fd);

  c.Close();
  REQUIRE(!c.IsValid());
  c.Close();  // second close is a no-op
}

TEST_CASE("socket - operations on a closed socket report kInvalidFd",
          "[socket]") {
  wq::TcpSocket sock;
  char buf[4] = {};
  auto sent = sock.Send("x", 1);
  REQUIRE(!sent.has_value());
  REQUIRE(sent.get_error() == wq::SocketError::kInvalidFd);

  auto got = sock.Recv(buf, sizeof(buf));
  REQUIRE(!got.has_value());
  REQUIRE(got.get_error() == wq::SocketError::kInvalidFd);

  auto wait = sock.WaitReadable(0);
  REQUIRE(!wait.has_value());
  REQUIRE(wait.get_error() == wq::SocketError::kInvalidFd);
}

// ============================================================================
// Loopback
// ============================================================================

TEST_CASE("socket - listener reports the kernel-chosen port", "[socket]") {
  uint16_t port = 0U;
  wq::TcpListener listener = MakeLoopbackListener(port);
  REQUIRE(port != 0U);

  auto idle = listener.WaitReadable(10);
  REQUIRE(idle.has_value());
  REQUIRE(idle.value() == false);
}

TEST_CASE("socket - loopback send and receive", "[socket][loopback]") {
  uint16_t port = 0U;
  wq::TcpListener listener = MakeLoopbackListener(port);

  std::string received;
  std::thread server([&listener, &received]() {
    auto ready = listener.WaitReadable(2000);
    if (!ready.has_value() || !ready.value()) return;
    auto accepted = listener.Accept();
    if (!accepted.has_value()) return;
    wq::TcpSocket conn = std::move(accepted).value();

    char buf[64];
    while (true) {
      auto n = conn.Recv(buf, sizeof(buf));
      if (!n.has_value() || n.value() == 0) break;
      received.append(buf, static_cast<size_t>(n.value()));
    }
    const char kReply[] = "pong";
    (void)conn.SendAll(kReply, sizeof(kReply) - 1U);
  });

  auto created = wq::TcpSocket::Create();
  REQUIRE(created.has_value());
  wq::TcpSocket client = std::move(created).value();
  auto addr = wq::SocketAddress::FromIpv4("127.0.0.1", port);
  REQUIRE(addr.has_value());
  REQUIRE(client.Connect(addr.value()).has_value());

  const std::string msg = "ping ping ping";
  REQUIRE(client.SendAll(msg.data(), msg.size()).has_value());
  client.ShutdownWrite();

  std::string reply;
  char buf[16];
  while (true) {
    auto ready = client.WaitReadable(2000);
    REQUIRE(ready.has_value());
    if (!ready.value()) break;
    auto n = client.Recv(buf, sizeof(buf));
    REQUIRE(n.has_value());
    if (n.value() == 0) break;
    reply.append(buf, static_cast<size_t>(n.value()));
  }
  server.join();

  REQUIRE(received == msg);
  REQUIRE(reply == "pong");
}

TEST_CASE("socket - connect to a closed port fails", "[socket][loopback]") {
  uint16_t port = 0U;
  {
    wq::TcpListener listener = MakeLoopbackListener(port);
  }  // closed: nothing listens on port any more

  auto created = wq::TcpSocket::Create();
  REQUIRE(created.has_value());
  wq::TcpSocket client = std::move(created).value();
  auto addr = wq::SocketAddress::FromIpv4("127.0.0.1", port);
  REQUIRE(addr.has_value());

  auto r = client.Connect(addr.value());
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == wq::SocketError::kConnectFailed);
}
