/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
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
 * @file vocabulary.hpp
 * @brief Vocabulary types for sessnet: ErrorCode, expected, ScopeGuard.
 *
 * All types are stack-allocated with zero heap overhead.
 */

#ifndef SESSNET_VOCABULARY_HPP_
#define SESSNET_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

// Assertion macro (no-op in release)
#ifndef SESSNET_ASSERT
#define SESSNET_ASSERT(cond) ((void)(cond))
#endif

namespace sessnet {

static constexpr size_t kCacheLine = 64;

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,
  kInvalidArgument = 1,
  kInvalidState = 2,
  kAlreadyStarted = 3,
  kDisposed = 4,
  kInactive = 5,
  kConnectionClosed = 6,
  kSocketError = 7,
  kTimeout = 8,
  kInternalError = 255
};

inline const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kInvalidArgument:
      return "invalid argument";
    case ErrorCode::kInvalidState:
      return "invalid state";
    case ErrorCode::kAlreadyStarted:
      return "already started";
    case ErrorCode::kDisposed:
      return "disposed";
    case ErrorCode::kInactive:
      return "inactive";
    case ErrorCode::kConnectionClosed:
      return "connection closed";
    case ErrorCode::kSocketError:
      return "socket error";
    case ErrorCode::kTimeout:
      return "timeout";
    case ErrorCode::kInternalError:
      return "internal error";
  }
  return "unknown";
}

// ============================================================================
// expected<V, E> - Lightweight error-or-value type
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Use static factory methods success() and error() to construct.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(val);
    return e;
  }

  static expected success(V&& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(static_cast<V&&>(val));
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  expected(const expected& other) noexcept : storage_{}, err_(other.err_),
                                             has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.value());
    }
  }

  expected& operator=(const expected& other) noexcept {
    if (this != &other) {
      if (has_value_) {
        reinterpret_cast<V*>(&storage_)->~V();
      }
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(other.value());
      }
    }
    return *this;
  }

  expected(expected&& other) noexcept : storage_{}, err_(other.err_),
                                        has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(static_cast<V&&>(other.value()));
    }
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      if (has_value_) {
        reinterpret_cast<V*>(&storage_)->~V();
      }
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(static_cast<V&&>(other.value()));
      }
    }
    return *this;
  }

  ~expected() {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
    }
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    SESSNET_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    SESSNET_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  E get_error() const noexcept {
    SESSNET_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : storage_{}, err_{}, has_value_(false) {}

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_{};
  E err_{};
  bool has_value_{false};
};

// ============================================================================
// ScopeGuard - RAII cleanup guard
// ============================================================================

/**
 * @brief Executes a cleanup callback on scope exit unless released.
 *
 * The callback runs during stack unwinding too, so it must not throw.
 */
template <typename F>
class ScopeGuard final {
 public:
  explicit ScopeGuard(F cleanup) noexcept(std::is_nothrow_move_constructible<F>::value)
      : cleanup_(std::move(cleanup)) {}

  ~ScopeGuard() {
    if (active_) {
      cleanup_();
    }
  }

  void release() noexcept { active_ = false; }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;

  ScopeGuard(ScopeGuard&& other) noexcept(std::is_nothrow_move_constructible<F>::value)
      : cleanup_(std::move(other.cleanup_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard& operator=(ScopeGuard&&) = delete;

 private:
  F cleanup_;
  bool active_{true};
};

}  // namespace sessnet

#endif  // SESSNET_VOCABULARY_HPP_
