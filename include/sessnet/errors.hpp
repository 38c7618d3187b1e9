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
 * @file errors.hpp
 * @brief Exception type raised by sessnet and the shutdown-noise classifier.
 */

#ifndef SESSNET_ERRORS_HPP_
#define SESSNET_ERRORS_HPP_

#include "vocabulary.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>

// Exception support for -fno-exceptions builds
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define SESSNET_THROW(ex) throw(ex)
#else
#include <cstdio>
#include <cstdlib>
#define SESSNET_THROW(ex)         \
  do {                            \
    std::fputs(#ex "\n", stderr); \
    std::abort();                 \
  } while (0)
#endif

namespace sessnet {

// ============================================================================
// Error - runtime error tagged with an ErrorCode
// ============================================================================

class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// Classifies an exception as a harmless consequence of teardown (listener or
// socket already gone, operation on a closing object, transport error).
// Such exceptions are logged and swallowed by the server lifecycle.
inline bool is_shutdown_noise(const std::exception& ex) noexcept {
  if (dynamic_cast<const std::system_error*>(&ex) != nullptr) {
    return true;
  }
  const auto* err = dynamic_cast<const Error*>(&ex);
  if (err == nullptr) {
    return false;
  }
  switch (err->code()) {
    case ErrorCode::kDisposed:
    case ErrorCode::kInvalidState:
    case ErrorCode::kSocketError:
    case ErrorCode::kConnectionClosed:
      return true;
    default:
      return false;
  }
}

}  // namespace sessnet

#endif  // SESSNET_ERRORS_HPP_
