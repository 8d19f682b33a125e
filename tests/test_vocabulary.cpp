/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp types
 */

#include "wq/config.hpp"
#include "wq/timer.hpp"
#include "wq/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

// ============================================================================
// expected<V, E> tests
// ============================================================================

TEST_CASE("expected success path", "[vocabulary][expected]") {
  auto r = wq::expected<int, wq::ConfigError>::success(42);
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 42);
}

TEST_CASE("expected error path", "[vocabulary][expected]") {
  auto r = wq::expected<int, wq::ConfigError>::error(
      wq::ConfigError::kFileNotFound);
  REQUIRE(!r.has_value());
  REQUIRE(!static_cast<bool>(r));
  REQUIRE(r.get_error() == wq::ConfigError::kFileNotFound);
}

TEST_CASE("expected void specialization", "[vocabulary][expected]") {
  auto ok = wq::expected<void, wq::TimerError>::success();
  REQUIRE(ok.has_value());

  auto err =
      wq::expected<void, wq::TimerError>::error(wq::TimerError::kSlotsFull);
  REQUIRE(!err.has_value());
  REQUIRE(err.get_error() == wq::TimerError::kSlotsFull);
}

TEST_CASE("expected value_or", "[vocabulary][expected]") {
  auto ok = wq::expected<int, wq::ConfigError>::success(10);
  REQUIRE(ok.value_or(99) == 10);

  auto err =
      wq::expected<int, wq::ConfigError>::error(wq::ConfigError::kParseError);
  REQUIRE(err.value_or(99) == 99);
}

TEST_CASE("expected holds std::string by value", "[vocabulary][expected]") {
  auto r1 = wq::expected<std::string, wq::ConfigError>::success(
      std::string("payload"));
  auto r2 = r1;  // copy
  REQUIRE(r1.value() == "payload");
  REQUIRE(r2.value() == "payload");

  std::string moved = std::move(r2).value();
  REQUIRE(moved == "payload");

  r1 = wq::expected<std::string, wq::ConfigError>::error(
      wq::ConfigError::kInvalidValue);
  REQUIRE(!r1.has_value());
  REQUIRE(r1.get_error() == wq::ConfigError::kInvalidValue);
}

TEST_CASE("expected move-only value", "[vocabulary][expected]") {
  using Ptr = std::unique_ptr<int>;
  auto r = wq::expected<Ptr, wq::ConfigError>::success(Ptr(new int(5)));
  REQUIRE(r.has_value());
  Ptr p = std::move(r).value();
  REQUIRE(*p == 5);
}

// ============================================================================
// NewType<T, Tag> tests
// ============================================================================

struct AlphaTag {};
using AlphaId = wq::NewType<uint32_t, AlphaTag>;

TEST_CASE("NewType compares by wrapped value", "[vocabulary][newtype]") {
  constexpr AlphaId a(3U);
  constexpr AlphaId b(3U);
  constexpr AlphaId c(4U);
  STATIC_REQUIRE(a == b);
  STATIC_REQUIRE(a != c);
  STATIC_REQUIRE(a < c);
  STATIC_REQUIRE(AlphaId().value() == 0U);
}
