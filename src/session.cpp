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

#include "sessnet/session.hpp"

#include "sessnet/errors.hpp"
#include "sessnet/log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <random>
#include <sys/socket.h>
#include <sys/time.h>

namespace sessnet {

static std::atomic<uint64_t> g_next_session_id{1};

namespace {

timeval to_timeval(std::chrono::milliseconds timeout) {
  timeval tv;
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  return tv;
}

std::string format_peer(int fd) {
  sockaddr_in addr;
  socklen_t len = sizeof(addr);
  std::memset(&addr, 0, sizeof(addr));
  if (::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0 || addr.sin_family != AF_INET) {
    return "unknown";
  }
  char ip[INET_ADDRSTRLEN] = {0};
  if (::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip)) == nullptr) {
    return "unknown";
  }
  return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

}  // namespace

Session::Session(sockpp::tcp_socket&& sock, const ServerConfig& config, BufferPool& pool,
                 std::shared_ptr<MessageDispatcher> dispatcher, Server* server)
    : id_(g_next_session_id.fetch_add(1, std::memory_order_relaxed)),
      key_(generate_key()),
      socket_(std::move(sock)),
      receive_timeout_(config.receive_timeout),
      send_timeout_(config.send_timeout),
      send_buffer_size_(config.send_buffer_size),
      receive_buffer_size_(config.receive_buffer_size),
      pool_(pool),
      dispatcher_(std::move(dispatcher)),
      server_(server) {
  if (!dispatcher_) {
    SESSNET_THROW(std::invalid_argument("dispatcher"));
  }
  remote_endpoint_ = format_peer(socket_.handle());
}

Session::~Session() {
  std::lock_guard<std::mutex> lock(fd_mutex_);
  if (socket_.is_open()) {
    if (!socket_.close()) {
      SESSNET_LOG_DEBUG("Session [" + key_ + "] close on destruction failed");
    }
  }
}

std::string Session::to_string() const {
  return key_ + " #" + std::to_string(id_) + " " + remote_endpoint_;
}

void Session::check_range(size_t size, size_t offset, size_t count) {
  if (offset > size || count > size - offset) {
    SESSNET_THROW(Error(ErrorCode::kInvalidArgument, "range [" + std::to_string(offset) + ", +" +
                                                         std::to_string(count) + ") exceeds buffer of " +
                                                         std::to_string(size) + " bytes"));
  }
}

// ============================================================================
// Lifecycle
// ============================================================================

void Session::start() {
  SessionState current = SessionState::kNew;
  if (!state_.compare_exchange_strong(current, SessionState::kConnected)) {
    if (current == SessionState::kConnected) {
      SESSNET_THROW(Error(ErrorCode::kInvalidState, "Session [" + key_ + "] has already started"));
    }
    // Closed before it ever ran
    return;
  }

  SessionPtr self = shared_from_this();
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    worker_id_ = std::this_thread::get_id();
  }
  ScopeGuard finalizer([this]() { finalize(); });

  configure_socket();
  SESSNET_LOG_DEBUG("Session [" + to_string() + "] started");

  dispatcher_->on_session_started(self);
  receive_loop(self);
}

void Session::receive_loop(const SessionPtr& self) {
  while (state_.load(std::memory_order_acquire) == SessionState::kConnected) {
    BufferPool::Lease lease = pool_.lease();

    auto received = receive_some(lease.buffer());
    if (!received) {
      ErrorCode err = received.get_error();
      bool connected = state_.load(std::memory_order_acquire) == SessionState::kConnected;
      if (err == ErrorCode::kTimeout && connected) {
        SESSNET_THROW(Error(ErrorCode::kTimeout, "Session [" + to_string() + "] receive timed out after " +
                                                     std::to_string(receive_timeout_.count()) + " ms"));
      }
      if (err == ErrorCode::kSocketError && connected) {
        SESSNET_LOG_DEBUG("Session [" + to_string() + "] receive failed, closing");
      }
      break;
    }

    dispatcher_->on_session_data_received(self, lease.buffer(), 0, received.value());
  }
}

void Session::close() {
  SessionState current = SessionState::kNew;
  if (state_.compare_exchange_strong(current, SessionState::kClosing)) {
    // start() never ran: this thread tears the session down, and a nested
    // close() from on_session_closed must not wait for itself
    {
      std::lock_guard<std::mutex> lock(lifecycle_mutex_);
      worker_id_ = std::this_thread::get_id();
    }
    finalize();
    return;
  }
  if (current == SessionState::kConnected) {
    state_.compare_exchange_strong(current, SessionState::kClosing);
  }

  shutdown_connection();

  std::unique_lock<std::mutex> lock(lifecycle_mutex_);
  if (worker_id_ == std::this_thread::get_id()) {
    return;
  }
  closed_cv_.wait(lock, [this]() { return state_.load(std::memory_order_acquire) == SessionState::kClosed; });
}

void Session::shutdown_connection() {
  std::lock_guard<std::mutex> lock(fd_mutex_);
  if (socket_.is_open()) {
    // Unblocks a pending recv() or send() on another thread
    if (::shutdown(socket_.handle(), SHUT_RDWR) < 0 && errno != ENOTCONN) {
      SESSNET_LOG_DEBUG("Session [" + key_ + "] shutdown failed: " + std::strerror(errno));
    }
  }
}

void Session::finalize() {
  SessionState current = SessionState::kConnected;
  state_.compare_exchange_strong(current, SessionState::kClosing);

  shutdown_connection();
  {
    std::lock_guard<std::mutex> send_lock(send_mutex_);
    std::lock_guard<std::mutex> fd_lock(fd_mutex_);
    if (socket_.is_open() && !socket_.close()) {
      SESSNET_LOG_DEBUG("Session [" + key_ + "] socket close failed");
    }
  }

  SESSNET_LOG_DEBUG("Session [" + to_string() + "] closed");
  try {
    dispatcher_->on_session_closed(shared_from_this());
  } catch (const std::exception& ex) {
    SESSNET_LOG_ERROR("Session [" + key_ + "] on_session_closed threw: " + ex.what());
  }

  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    state_.store(SessionState::kClosed, std::memory_order_release);
  }
  closed_cv_.notify_all();
}

// ============================================================================
// Send
// ============================================================================

void Session::send(const std::vector<uint8_t>& data) {
  std::lock_guard<std::mutex> lock(send_mutex_);
  write_locked(data.data(), data.size());
}

void Session::send(const std::vector<uint8_t>& data, size_t offset, size_t count) {
  check_range(data.size(), offset, count);
  std::lock_guard<std::mutex> lock(send_mutex_);
  write_locked(data.data() + offset, count);
}

void Session::send(std::string_view data) {
  std::lock_guard<std::mutex> lock(send_mutex_);
  write_locked(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

void Session::send_sequence(const std::vector<std::vector<uint8_t>>& chunks) {
  std::lock_guard<std::mutex> lock(send_mutex_);
  for (const auto& chunk : chunks) {
    write_locked(chunk.data(), chunk.size());
  }
}

void Session::write_locked(const uint8_t* data, size_t count) {
  if (state_.load(std::memory_order_acquire) != SessionState::kConnected) {
    SESSNET_THROW(Error(ErrorCode::kInvalidState, "Session [" + key_ + "] is not connected"));
  }
  if (count == 0) {
    return;
  }

  auto written = write_all(data, count);
  if (!written) {
    ErrorCode err = written.get_error();
    SESSNET_LOG_WARN("Session [" + to_string() + "] send failed: " + sessnet::to_string(err));
    shutdown_connection();
    SESSNET_THROW(Error(err, "Session [" + key_ + "] send failed: " + sessnet::to_string(err)));
  }
}

// ============================================================================
// Socket I/O
// ============================================================================

expected<size_t, ErrorCode> Session::receive_some(std::vector<uint8_t>& buffer) {
  while (true) {
    ssize_t n = ::recv(socket_.handle(), buffer.data(), buffer.size(), 0);
    if (n > 0) {
      return expected<size_t, ErrorCode>::success(static_cast<size_t>(n));
    }
    if (n == 0) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
    }
    int err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err == EAGAIN || err == EWOULDBLOCK) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kTimeout);
    }
    return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
  }
}

expected<size_t, ErrorCode> Session::write_all(const uint8_t* data, size_t count) {
  size_t sent = 0;
  while (sent < count) {
    ssize_t n = ::send(socket_.handle(), data + sent, count - sent, MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    int err = errno;
    if (n < 0 && err == EINTR) {
      continue;
    }
    if (n < 0 && (err == EAGAIN || err == EWOULDBLOCK)) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kTimeout);
    }
    return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
  }
  return expected<size_t, ErrorCode>::success(sent);
}

void Session::configure_socket() {
  int fd = socket_.handle();

  if (receive_timeout_.count() > 0) {
    timeval tv = to_timeval(receive_timeout_);
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
      SESSNET_LOG_WARN("Session [" + key_ + "] SO_RCVTIMEO failed: " + std::strerror(errno));
    }
  }
  if (send_timeout_.count() > 0) {
    timeval tv = to_timeval(send_timeout_);
    if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
      SESSNET_LOG_WARN("Session [" + key_ + "] SO_SNDTIMEO failed: " + std::strerror(errno));
    }
  }

  int sndbuf = static_cast<int>(send_buffer_size_);
  if (::setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &sndbuf, sizeof(sndbuf)) < 0) {
    SESSNET_LOG_WARN("Session [" + key_ + "] SO_SNDBUF failed: " + std::strerror(errno));
  }
  int rcvbuf = static_cast<int>(receive_buffer_size_);
  if (::setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf)) < 0) {
    SESSNET_LOG_WARN("Session [" + key_ + "] SO_RCVBUF failed: " + std::strerror(errno));
  }
}

// Random RFC 4122 version 4 UUID
std::string Session::generate_key() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  uint64_t hi = rng();
  uint64_t lo = rng();
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<unsigned>(hi >> 32),
                static_cast<unsigned>((hi >> 16) & 0xFFFF), static_cast<unsigned>(hi & 0xFFFF),
                static_cast<unsigned>(lo >> 48), static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return std::string(buf);
}

}  // namespace sessnet
