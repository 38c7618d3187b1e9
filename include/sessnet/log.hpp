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
 * Logging utilities for sessnet (loghelper-compatible interface).
 * Provides SESSNET_LOG_DEBUG, SESSNET_LOG_INFO, SESSNET_LOG_WARN,
 * SESSNET_LOG_ERROR macros.
 */

#ifndef SESSNET_LOG_HPP_
#define SESSNET_LOG_HPP_

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace sessnet {

class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3, kOff = 4 };

  static void set_level(Level level) { min_level().store(level, std::memory_order_relaxed); }

  static Level level() { return min_level().load(std::memory_order_relaxed); }

  static bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(min_level().load(std::memory_order_relaxed));
  }

  static void log(Level level, const std::string& msg) {
    if (!enabled(level) || level == Level::kOff)
      return;
    const char* prefix[] = {"[SESSNET DEBUG]", "[SESSNET INFO]", "[SESSNET WARN]", "[SESSNET ERROR]"};
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << prefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

 private:
  static std::atomic<Level>& min_level() {
    static std::atomic<Level> level{Level::kInfo};
    return level;
  }

  static std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
  }
};

// Message expressions are only evaluated when the level is enabled.
#define SESSNET_LOG_AT(lvl, msg)                  \
  do {                                            \
    if (::sessnet::Logger::enabled(lvl)) {        \
      ::sessnet::Logger::log(lvl, msg);           \
    }                                             \
  } while (0)

#define SESSNET_LOG_DEBUG(msg) SESSNET_LOG_AT(::sessnet::Logger::Level::kDebug, msg)
#define SESSNET_LOG_INFO(msg) SESSNET_LOG_AT(::sessnet::Logger::Level::kInfo, msg)
#define SESSNET_LOG_WARN(msg) SESSNET_LOG_AT(::sessnet::Logger::Level::kWarn, msg)
#define SESSNET_LOG_ERROR(msg) SESSNET_LOG_AT(::sessnet::Logger::Level::kError, msg)

}  // namespace sessnet

#endif  // SESSNET_LOG_HPP_
