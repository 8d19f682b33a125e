/**
 * @file vocabulary.hpp
 * @brief Core vocabulary types: expected<V,E> and NewType<T,Tag>.
 *
 * Library code reports failures by value rather than by throwing:
 * every fallible operation returns expected<V, E> with a per-module
 * error enum.
 *
 * Usage:
 * @code
 *   expected<int32_t, ConfigError> r = Parse(text);
 *   if (!r.has_value()) return r.get_error();
 *   use(r.value());
 * @endcode
 */

#ifndef WQ_VOCABULARY_HPP_
#define WQ_VOCABULARY_HPP_

#include "wq/platform.hpp"

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace wq {

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed only through the success() / error() factories so the
 * intent is visible at every return site.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& value) {
    return expected(ValueTag{}, value);
  }

  static expected success(V&& value) {
    return expected(ValueTag{}, std::move(value));
  }

  static expected error(E err) { return expected(ErrorTag{}, err); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(other.value_);
    } else {
      ::new (static_cast<void*>(&error_)) E(other.error_);
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
    } else {
      ::new (static_cast<void*>(&error_)) E(std::move(other.error_));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(other.value_);
      } else {
        ::new (static_cast<void*>(&error_)) E(other.error_);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
      } else {
        ::new (static_cast<void*>(&error_)) E(std::move(other.error_));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    WQ_ASSERT(has_value_);
    return value_;
  }

  const V& value() const& {
    WQ_ASSERT(has_value_);
    return value_;
  }

  V&& value() && {
    WQ_ASSERT(has_value_);
    return std::move(value_);
  }

  E get_error() const noexcept {
    WQ_ASSERT(!has_value_);
    return error_;
  }

  V value_or(const V& fallback) const& {
    return has_value_ ? value_ : fallback;
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};

  template <typename U>
  expected(ValueTag, U&& v) : has_value_(true) {
    ::new (static_cast<void*>(&value_)) V(std::forward<U>(v));
  }

  expected(ErrorTag, E err) : has_value_(false) {
    ::new (static_cast<void*>(&error_)) E(err);
  }

  void Destroy() noexcept {
    if (has_value_) {
      value_.~V();
    } else {
      error_.~E();
    }
  }

  union {
    V value_;
    E error_;
  };
  bool has_value_;
};

/**
 * @brief expected<void, E>: success carries no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E err) noexcept { return expected(false, err); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    WQ_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected(bool ok, E err) noexcept : error_(err), has_value_(ok) {}

  E error_;
  bool has_value_;
};

// ============================================================================
// NewType<T, Tag> - strong typedef for identifiers
// ============================================================================

/**
 * @brief Wraps a primitive so ids of different kinds cannot be mixed up.
 */
template <typename T, typename Tag>
class NewType {
 public:
  constexpr NewType() noexcept : val_{} {}
  constexpr explicit NewType(T v) noexcept : val_(v) {}

  constexpr T value() const noexcept { return val_; }

  constexpr bool operator==(const NewType& rhs) const noexcept {
    return val_ == rhs.val_;
  }
  constexpr bool operator!=(const NewType& rhs) const noexcept {
    return val_ != rhs.val_;
  }
  constexpr bool operator<(const NewType& rhs) const noexcept {
    return val_ < rhs.val_;
  }

 private:
  T val_;
};

}  // namespace wq

#endif  // WQ_VOCABULARY_HPP_
