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

#ifndef SESSNET_SESSION_HPP_
#define SESSNET_SESSION_HPP_

#include "buffer_pool.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <sockpp/tcp_socket.h>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace sessnet {

class Server;  // Forward declaration

enum class SessionState : uint8_t {
  kNew,        // Accepted, start() not called yet
  kConnected,  // Receive loop running
  kClosing,    // Close requested or stream ended, teardown pending
  kClosed      // Socket closed, on_session_closed delivered
};

// ============================================================================
// Session (owns one accepted connection end-to-end)
// ============================================================================
//
// Must be owned by a std::shared_ptr: callbacks receive shared_from_this().
//
// Thread model: start() blocks the calling thread (the session's worker)
// until the stream ends. send() and close() may be called from any thread.
// Sends are serialized by a per-session mutex so that two messages are never
// interleaved on the wire.
//

class Session : public std::enable_shared_from_this<Session> {
 public:
  Session(sockpp::tcp_socket&& sock, const ServerConfig& config, BufferPool& pool,
          std::shared_ptr<MessageDispatcher> dispatcher, Server* server = nullptr);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Runs the receive loop; returns once the session has terminated.
  // Throws Error(kTimeout) if no data arrives within receive_timeout.
  void start();

  // Writes the whole range or throws sessnet::Error
  void send(const std::vector<uint8_t>& data);
  void send(const std::vector<uint8_t>& data, size_t offset, size_t count);
  void send(std::string_view data);

  // Writes all chunks back-to-back under one lock (e.g. frames of one message)
  void send_sequence(const std::vector<std::vector<uint8_t>>& chunks);

  // Idempotent. Unblocks start(); waits for teardown unless called from
  // the session's own worker thread.
  void close();

  // Throws Error(kInvalidArgument) if [offset, offset + count) exceeds size
  static void check_range(size_t size, size_t offset, size_t count);

  // --- Getters ---

  const std::string& key() const { return key_; }
  uint64_t id() const { return id_; }
  const std::string& remote_endpoint() const { return remote_endpoint_; }
  Server* server() const { return server_; }

  SessionState state() const { return state_.load(std::memory_order_acquire); }
  bool is_connected() const { return state() == SessionState::kConnected; }

  std::string to_string() const;

 private:
  uint64_t id_;
  std::string key_;
  sockpp::tcp_socket socket_;
  std::string remote_endpoint_;

  std::chrono::milliseconds receive_timeout_;
  std::chrono::milliseconds send_timeout_;
  size_t send_buffer_size_;
  size_t receive_buffer_size_;

  BufferPool& pool_;
  std::shared_ptr<MessageDispatcher> dispatcher_;
  Server* server_;

  std::atomic<SessionState> state_{SessionState::kNew};

  // Guards socket fd lifetime against concurrent shutdown
  std::mutex fd_mutex_;
  // Serializes writes; also held while the socket is closed
  std::mutex send_mutex_;

  std::mutex lifecycle_mutex_;
  std::condition_variable closed_cv_;
  std::thread::id worker_id_;

  // --- Helper functions ---

  void receive_loop(const SessionPtr& self);

  // Caller holds send_mutex_
  void write_locked(const uint8_t* data, size_t count);

  // Returns bytes read; kConnectionClosed on EOF, kTimeout on SO_RCVTIMEO expiry
  expected<size_t, ErrorCode> receive_some(std::vector<uint8_t>& buffer);

  // Returns bytes written (always count on success)
  expected<size_t, ErrorCode> write_all(const uint8_t* data, size_t count);

  void configure_socket();
  void shutdown_connection();
  void finalize();

  static std::string generate_key();
};

}  // namespace sessnet

#endif  // SESSNET_SESSION_HPP_
