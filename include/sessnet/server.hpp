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

#ifndef SESSNET_SERVER_HPP_
#define SESSNET_SERVER_HPP_

#include "buffer_pool.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "session.hpp"
#include "session_registry.hpp"
#include "text_fragmentation.hpp"

#include <cstdint>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace sessnet {

// ============================================================================
// Server (accept loop + session registry + routing)
// ============================================================================
//
// Lifecycle: kIdle -> kListening -> kDisposed, one way only. start() binds
// the listener and returns; the accept loop runs on its own thread and every
// accepted connection gets a detached worker thread that registers the
// session, runs it to completion and deregisters it. stop() tears the
// listener down, closes each live session in turn and returns once every
// worker has deregistered.
//

class Server {
 public:
  using SessionPtr = std::shared_ptr<Session>;

  enum State : int { kIdle = 0, kListening = 1, kDisposed = 5 };

  // Empty address binds every interface; port 0 picks an ephemeral port
  Server(uint16_t port, std::shared_ptr<MessageDispatcher> dispatcher, const ServerConfig& config = ServerConfig());
  Server(const std::string& address, uint16_t port, std::shared_ptr<MessageDispatcher> dispatcher,
         const ServerConfig& config = ServerConfig());

  Server(uint16_t port, SessionCallbacks callbacks, const ServerConfig& config = ServerConfig());
  Server(const std::string& address, uint16_t port, SessionCallbacks callbacks,
         const ServerConfig& config = ServerConfig());

  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Throws Error(kDisposed) or Error(kAlreadyStarted) on misuse
  void start();

  // Idempotent; blocks until all sessions are closed and deregistered
  void stop();

  // Throws Error(kInactive) unless listening
  bool pending() const;

  // --- Routing (unknown keys are logged, never raised) ---

  void send_to(const std::string& session_key, const std::vector<uint8_t>& data);
  void send_to(const std::string& session_key, const std::vector<uint8_t>& data, size_t offset, size_t count);
  void send_to(const std::string& session_key, std::string_view data);
  void send_to(const std::string& session_key, const TextFragmentation& message);

  void send_to(const Session& session, const std::vector<uint8_t>& data);
  void send_to(const Session& session, const std::vector<uint8_t>& data, size_t offset, size_t count);
  void send_to(const Session& session, std::string_view data);

  // Sequential, in registry order; a failed recipient does not stop the rest
  void broadcast(const std::vector<uint8_t>& data);
  void broadcast(const std::vector<uint8_t>& data, size_t offset, size_t count);
  void broadcast(std::string_view data);
  void broadcast(const TextFragmentation& message);

  // --- Status ---

  // "address:port" as bound; the port is the kernel's pick when 0 was requested
  std::string listened_endpoint() const;
  uint16_t listened_port() const;
  bool active() const { return state_.load(std::memory_order_acquire) == kListening; }
  size_t session_count() const { return sessions_.size(); }
  SessionPtr find_session(const std::string& session_key) const { return sessions_.find(session_key); }

  const ServerConfig& config() const { return config_; }
  const BufferPool& buffer_pool() const { return buffer_pool_; }
  const ServerStats& stats() const { return stats_; }
  void reset_stats() { stats_.reset(); }

 private:
  std::string bind_addr_;
  uint16_t port_;
  std::shared_ptr<MessageDispatcher> dispatcher_;
  ServerConfig config_;
  BufferPool buffer_pool_;
  SessionRegistry sessions_;
  ServerStats stats_;

  std::atomic<int> state_{kIdle};

  // Guards listen_fd_, accept_thread_ and port_ during start/stop
  mutable std::mutex lifecycle_mutex_;
  int listen_fd_ = -1;
  std::thread accept_thread_;

  // Live per-session worker threads
  std::mutex workers_mutex_;
  std::condition_variable workers_cv_;
  size_t workers_ = 0;

  // Internal methods
  void open_listener();
  void accept_loop(int listen_fd);
  void spawn_worker(SessionPtr session);
  void process(const SessionPtr& session);
  void wait_for_workers();

  SessionPtr resolve(const std::string& session_key, const std::string& description);
  void broadcast_each(const std::function<void(Session&)>& send_one);

  void apply_tcp_tuning(int fd);
};

}  // namespace sessnet

#endif  // SESSNET_SERVER_HPP_
