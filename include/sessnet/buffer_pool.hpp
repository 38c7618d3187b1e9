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

#ifndef SESSNET_BUFFER_POOL_HPP_
#define SESSNET_BUFFER_POOL_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <mutex>
#include <utility>
#include <vector>

namespace sessnet {

// ============================================================================
// BufferPool - reusable receive buffers, grows on demand
// ============================================================================

class BufferPool {
 public:
  using Buffer = std::vector<uint8_t>;

  // Returns a buffer to its pool when destroyed.
  class Lease {
   public:
    Lease(BufferPool& pool, Buffer buffer) : pool_(&pool), buffer_(std::move(buffer)) {}
    ~Lease() {
      if (pool_ != nullptr) {
        pool_->release(std::move(buffer_));
      }
    }

    Lease(Lease&& other) noexcept : pool_(other.pool_), buffer_(std::move(other.buffer_)) {
      other.pool_ = nullptr;
    }
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease& operator=(Lease&&) = delete;

    Buffer& buffer() { return buffer_; }
    const Buffer& buffer() const { return buffer_; }

   private:
    BufferPool* pool_;
    Buffer buffer_;
  };

  BufferPool(size_t initial_count, size_t buffer_size) : buffer_size_(buffer_size) {
    free_list_.reserve(initial_count);
    for (size_t i = 0; i < initial_count; ++i) {
      free_list_.emplace_back(buffer_size_);
    }
    total_allocated_ = initial_count;
  }

  BufferPool(const BufferPool&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;

  // Pops a free buffer, allocating a new one when the pool is exhausted
  Buffer acquire() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++acquires_;
      if (!free_list_.empty()) {
        Buffer buffer = std::move(free_list_.back());
        free_list_.pop_back();
        return buffer;
      }
      ++total_allocated_;
    }
    return Buffer(buffer_size_);
  }

  Lease lease() { return Lease(*this, acquire()); }

  // Buffers of a foreign size are dropped rather than pooled
  void release(Buffer&& buffer) {
    if (buffer.size() != buffer_size_)
      return;
    std::lock_guard<std::mutex> lock(mutex_);
    ++releases_;
    free_list_.push_back(std::move(buffer));
  }

  // Status
  size_t buffer_size() const { return buffer_size_; }

  size_t available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return free_list_.size();
  }

  size_t total_allocated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_allocated_;
  }

  uint64_t acquires() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acquires_;
  }

  uint64_t releases() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return releases_;
  }

 private:
  const size_t buffer_size_;
  mutable std::mutex mutex_;
  std::vector<Buffer> free_list_;
  size_t total_allocated_ = 0;
  uint64_t acquires_ = 0;
  uint64_t releases_ = 0;
};

// ============================================================================
// ServerStats - Atomic counters
// ============================================================================

struct alignas(kCacheLine) ServerStats {
  // Session counters
  std::atomic<uint64_t> total_sessions{0};
  std::atomic<uint64_t> session_timeouts{0};
  std::atomic<uint64_t> session_faults{0};

  // Routing
  std::atomic<uint64_t> routing_misses{0};
  std::atomic<uint64_t> broadcast_failures{0};

  // Listener
  std::atomic<uint64_t> accept_errors{0};

  void reset() {
    total_sessions = 0;
    session_timeouts = 0;
    session_faults = 0;
    routing_misses = 0;
    broadcast_failures = 0;
    accept_errors = 0;
  }
};

}  // namespace sessnet

#endif  // SESSNET_BUFFER_POOL_HPP_
