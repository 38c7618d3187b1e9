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

#include "sessnet/server.hpp"

#include "sessnet/errors.hpp"
#include "sessnet/log.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace sessnet {

namespace {

// Set on per-session worker threads, so stop() can tell it runs inside one
thread_local const Server* t_worker_owner = nullptr;

std::shared_ptr<MessageDispatcher> require_dispatcher(std::shared_ptr<MessageDispatcher> dispatcher) {
  if (!dispatcher) {
    SESSNET_THROW(std::invalid_argument("dispatcher"));
  }
  return dispatcher;
}

// A zero-sized receive buffer would make every recv() look like end of stream
size_t require_receive_buffer_size(size_t size) {
  if (size == 0) {
    SESSNET_THROW(std::invalid_argument("receive_buffer_size must be greater than zero"));
  }
  return size;
}

}  // namespace

Server::Server(uint16_t port, std::shared_ptr<MessageDispatcher> dispatcher, const ServerConfig& config)
    : Server(std::string(), port, std::move(dispatcher), config) {}

Server::Server(const std::string& address, uint16_t port, std::shared_ptr<MessageDispatcher> dispatcher,
               const ServerConfig& config)
    : bind_addr_(address),
      port_(port),
      dispatcher_(require_dispatcher(std::move(dispatcher))),
      config_(config),
      buffer_pool_(config.initial_buffer_allocation_count, require_receive_buffer_size(config.receive_buffer_size)) {}

Server::Server(uint16_t port, SessionCallbacks callbacks, const ServerConfig& config)
    : Server(std::string(), port, std::make_shared<CallbackDispatcher>(std::move(callbacks)), config) {}

Server::Server(const std::string& address, uint16_t port, SessionCallbacks callbacks, const ServerConfig& config)
    : Server(address, port, std::make_shared<CallbackDispatcher>(std::move(callbacks)), config) {}

Server::~Server() {
  try {
    stop();
  } catch (const std::exception& ex) {
    SESSNET_LOG_ERROR(std::string("Server stop during destruction failed: ") + ex.what());
  }
  // stop() may have run earlier from a worker that is still finishing
  wait_for_workers();
}

// ============================================================================
// Lifecycle
// ============================================================================

void Server::start() {
  int origin = kIdle;
  if (!state_.compare_exchange_strong(origin, kListening)) {
    if (origin == kDisposed) {
      SESSNET_THROW(Error(ErrorCode::kDisposed, "This tcp server has been disposed."));
    }
    SESSNET_THROW(Error(ErrorCode::kAlreadyStarted, "This tcp server has already started."));
  }

  try {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!active()) {
      // stop() won the race before the listener existed
      return;
    }
    open_listener();

    int listen_fd = listen_fd_;
    accept_thread_ = std::thread([this, listen_fd]() {
      try {
        accept_loop(listen_fd);
      } catch (const std::exception& ex) {
        SESSNET_LOG_ERROR(std::string("Accept loop terminated: ") + ex.what());
      }
    });

    SESSNET_LOG_INFO("Server listening on " + bind_addr_ + ":" + std::to_string(port_));
  } catch (const std::exception& ex) {
    if (!is_shutdown_noise(ex)) {
      throw;
    }
    SESSNET_LOG_ERROR(std::string("Server failed to listen: ") + ex.what());
  }
}

void Server::stop() {
  if (state_.exchange(kDisposed) == kDisposed) {
    return;
  }

  // Runs even if teardown below throws: detached workers reference *this
  ScopeGuard wait_guard([this]() { wait_for_workers(); });

  try {
    std::thread accept_thread;
    {
      std::lock_guard<std::mutex> lock(lifecycle_mutex_);
      // Wakes the accept loop out of a blocking accept()
      if (listen_fd_ >= 0 && ::shutdown(listen_fd_, SHUT_RDWR) < 0) {
        SESSNET_LOG_DEBUG(std::string("Listener shutdown: ") + std::strerror(errno));
      }
      accept_thread = std::move(accept_thread_);
    }
    if (accept_thread.joinable()) {
      accept_thread.join();
    }
    {
      std::lock_guard<std::mutex> lock(lifecycle_mutex_);
      if (listen_fd_ >= 0) {
        if (::close(listen_fd_) < 0) {
          SESSNET_LOG_DEBUG(std::string("Listener close: ") + std::strerror(errno));
        }
        listen_fd_ = -1;
      }
    }

    // Each worker deregisters its own session once close() lets start() return
    for (const auto& session : sessions_.snapshot()) {
      session->close();
    }
  } catch (const std::exception& ex) {
    if (!is_shutdown_noise(ex)) {
      throw;
    }
    SESSNET_LOG_DEBUG(std::string("Ignored during stop: ") + ex.what());
  }

  SESSNET_LOG_INFO("Server stopped");
}

bool Server::pending() const {
  if (!active()) {
    SESSNET_THROW(Error(ErrorCode::kInactive, "The tcp server is not active."));
  }

  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (listen_fd_ < 0) {
    return false;
  }
  pollfd pfd = {listen_fd_, POLLIN, 0};
  int ret = ::poll(&pfd, 1, 0);
  if (ret < 0) {
    SESSNET_THROW(Error(ErrorCode::kSocketError, std::string("poll failed: ") + std::strerror(errno)));
  }
  return ret > 0 && (pfd.revents & POLLIN) != 0;
}

std::string Server::listened_endpoint() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return (bind_addr_.empty() ? std::string("0.0.0.0") : bind_addr_) + ":" + std::to_string(port_);
}

uint16_t Server::listened_port() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return port_;
}

// Caller holds lifecycle_mutex_
void Server::open_listener() {
  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  if (bind_addr_.empty()) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (::inet_pton(AF_INET, bind_addr_.c_str(), &addr.sin_addr) != 1) {
    SESSNET_THROW(std::invalid_argument("Invalid bind address: " + bind_addr_));
  }

  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    SESSNET_THROW(Error(ErrorCode::kSocketError, std::string("Failed to create socket: ") + std::strerror(errno)));
  }
  ScopeGuard close_on_error([fd]() {
    if (::close(fd) < 0) {
      SESSNET_LOG_DEBUG(std::string("Listener close: ") + std::strerror(errno));
    }
  });

  if (config_.reuse_address) {
    int reuse = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
      SESSNET_LOG_WARN(std::string("setsockopt SO_REUSEADDR failed: ") + std::strerror(errno));
    }
  }

  if (!config_.allow_nat_traversal) {
    SESSNET_LOG_WARN("allow_nat_traversal=false has no effect on this platform");
  }

  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    SESSNET_THROW(Error(ErrorCode::kSocketError,
                        "Failed to bind port " + std::to_string(port_) + ": " + std::strerror(err)));
  }

  if (::listen(fd, config_.pending_connection_backlog) < 0) {
    int err = errno;
    SESSNET_THROW(Error(ErrorCode::kSocketError, std::string("Failed to listen: ") + std::strerror(err)));
  }

  // Report the port the kernel actually bound (0 -> ephemeral)
  sockaddr_in bound;
  socklen_t len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
    port_ = ntohs(bound.sin_port);
  } else {
    SESSNET_LOG_WARN(std::string("getsockname failed: ") + std::strerror(errno));
  }

  close_on_error.release();
  listen_fd_ = fd;
}

// ============================================================================
// Accept loop and per-session workers
// ============================================================================

void Server::accept_loop(int listen_fd) {
  try {
    while (active()) {
      sockaddr_in client_addr;
      socklen_t client_addr_len = sizeof(client_addr);
      int client_fd = ::accept(listen_fd, reinterpret_cast<sockaddr*>(&client_addr), &client_addr_len);

      if (client_fd < 0) {
        int err = errno;
        if (active() && (err == ECONNABORTED || err == EINTR || err == EPROTO)) {
          continue;
        }
        if (active()) {
          stats_.accept_errors.fetch_add(1, std::memory_order_relaxed);
        }
        SESSNET_THROW(Error(ErrorCode::kSocketError, std::string("accept failed: ") + std::strerror(err)));
      }

      apply_tcp_tuning(client_fd);

      auto session =
          std::make_shared<Session>(sockpp::tcp_socket(client_fd), config_, buffer_pool_, dispatcher_, this);
      stats_.total_sessions.fetch_add(1, std::memory_order_relaxed);
      spawn_worker(std::move(session));
    }
  } catch (const std::exception& ex) {
    if (!is_shutdown_noise(ex)) {
      throw;
    }
    if (active()) {
      // Still listening: no further connections will be accepted
      SESSNET_LOG_ERROR(std::string("Accept loop stopped while listening: ") + ex.what());
    } else {
      SESSNET_LOG_DEBUG(std::string("Accept loop ended: ") + ex.what());
    }
  }
}

void Server::spawn_worker(SessionPtr session) {
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    ++workers_;
  }

  try {
    std::thread([this, session]() {
      t_worker_owner = this;
      try {
        process(session);
      } catch (const std::exception& ex) {
        stats_.session_faults.fetch_add(1, std::memory_order_relaxed);
        SESSNET_LOG_ERROR("Unhandled fault in session [" + session->to_string() + "]: " + ex.what());
      }
      t_worker_owner = nullptr;

      std::lock_guard<std::mutex> lock(workers_mutex_);
      --workers_;
      workers_cv_.notify_all();
    }).detach();
  } catch (const std::system_error& ex) {
    {
      std::lock_guard<std::mutex> lock(workers_mutex_);
      --workers_;
      workers_cv_.notify_all();
    }
    SESSNET_LOG_ERROR("Cannot spawn worker for session [" + session->to_string() + "]: " + ex.what());
    session->close();
  }
}

void Server::process(const SessionPtr& session) {
  if (!sessions_.try_add(session->key(), session)) {
    SESSNET_LOG_WARN("Duplicate session key [" + session->key() + "], connection dropped");
    return;
  }
  SESSNET_LOG_DEBUG("New session [" + session->to_string() + "].");

  ScopeGuard deregister([this, &session]() {
    if (sessions_.try_remove(session->key())) {
      SESSNET_LOG_DEBUG("Close session [" + session->to_string() + "].");
    }
  });

  if (!active()) {
    // Accepted just before stop(); its session snapshot may have missed us
    session->close();
    return;
  }

  try {
    session->start();
  } catch (const Error& ex) {
    if (ex.code() != ErrorCode::kTimeout) {
      throw;
    }
    stats_.session_timeouts.fetch_add(1, std::memory_order_relaxed);
    SESSNET_LOG_ERROR(ex.what());
  }
}

void Server::wait_for_workers() {
  // stop() called from a dispatcher callback cannot wait for its own worker
  size_t own = (t_worker_owner == this) ? 1 : 0;
  std::unique_lock<std::mutex> lock(workers_mutex_);
  workers_cv_.wait(lock, [this, own]() { return workers_ <= own; });
}

void Server::apply_tcp_tuning(int fd) {
  const TcpTuning& tuning = config_.tcp;
  int opt = 1;

  auto set_option = [fd](int level, int name, const int& value, const char* label) {
    if (::setsockopt(fd, level, name, &value, sizeof(value)) < 0) {
      SESSNET_LOG_WARN(std::string("setsockopt ") + label + " failed: " + std::strerror(errno));
    }
  };

  if (tuning.tcp_nodelay) {
    set_option(IPPROTO_TCP, TCP_NODELAY, opt, "TCP_NODELAY");
  }

#ifdef TCP_QUICKACK
  if (tuning.tcp_quickack) {
    set_option(IPPROTO_TCP, TCP_QUICKACK, opt, "TCP_QUICKACK");
  }
#endif

  if (tuning.so_keepalive) {
    set_option(SOL_SOCKET, SO_KEEPALIVE, opt, "SO_KEEPALIVE");

#ifdef TCP_KEEPIDLE
    set_option(IPPROTO_TCP, TCP_KEEPIDLE, tuning.keepalive_idle_s, "TCP_KEEPIDLE");
#endif
#ifdef TCP_KEEPINTVL
    set_option(IPPROTO_TCP, TCP_KEEPINTVL, tuning.keepalive_interval_s, "TCP_KEEPINTVL");
#endif
#ifdef TCP_KEEPCNT
    set_option(IPPROTO_TCP, TCP_KEEPCNT, tuning.keepalive_count, "TCP_KEEPCNT");
#endif
  }
}

// ============================================================================
// Routing
// ============================================================================

Server::SessionPtr Server::resolve(const std::string& session_key, const std::string& description) {
  SessionPtr found = sessions_.find(session_key);
  if (!found) {
    stats_.routing_misses.fetch_add(1, std::memory_order_relaxed);
    SESSNET_LOG_WARN("Cannot find session [" + description + "].");
  }
  return found;
}

void Server::send_to(const std::string& session_key, const std::vector<uint8_t>& data) {
  if (SessionPtr session = resolve(session_key, session_key)) {
    session->send(data);
  }
}

void Server::send_to(const std::string& session_key, const std::vector<uint8_t>& data, size_t offset,
                     size_t count) {
  if (SessionPtr session = resolve(session_key, session_key)) {
    session->send(data, offset, count);
  }
}

void Server::send_to(const std::string& session_key, std::string_view data) {
  if (SessionPtr session = resolve(session_key, session_key)) {
    session->send(data);
  }
}

void Server::send_to(const std::string& session_key, const TextFragmentation& message) {
  if (SessionPtr session = resolve(session_key, session_key)) {
    session->send_sequence(message.to_frames());
  }
}

void Server::send_to(const Session& session, const std::vector<uint8_t>& data) {
  if (SessionPtr found = resolve(session.key(), session.to_string())) {
    found->send(data);
  }
}

void Server::send_to(const Session& session, const std::vector<uint8_t>& data, size_t offset, size_t count) {
  if (SessionPtr found = resolve(session.key(), session.to_string())) {
    found->send(data, offset, count);
  }
}

void Server::send_to(const Session& session, std::string_view data) {
  if (SessionPtr found = resolve(session.key(), session.to_string())) {
    found->send(data);
  }
}

void Server::broadcast(const std::vector<uint8_t>& data) {
  broadcast_each([&data](Session& session) { session.send(data); });
}

void Server::broadcast(const std::vector<uint8_t>& data, size_t offset, size_t count) {
  Session::check_range(data.size(), offset, count);
  broadcast_each([&data, offset, count](Session& session) { session.send(data, offset, count); });
}

void Server::broadcast(std::string_view data) {
  broadcast_each([data](Session& session) { session.send(data); });
}

void Server::broadcast(const TextFragmentation& message) {
  std::vector<std::vector<uint8_t>> frames = message.to_frames();
  broadcast_each([&frames](Session& session) { session.send_sequence(frames); });
}

// One recipient at a time: a stalled session delays the ones after it
void Server::broadcast_each(const std::function<void(Session&)>& send_one) {
  for (const auto& session : sessions_.snapshot()) {
    try {
      send_one(*session);
    } catch (const Error& ex) {
      stats_.broadcast_failures.fetch_add(1, std::memory_order_relaxed);
      SESSNET_LOG_WARN("Broadcast to session [" + session->to_string() + "] failed: " + ex.what());
    }
  }
}

}  // namespace sessnet
