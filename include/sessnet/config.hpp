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

#ifndef SESSNET_CONFIG_HPP_
#define SESSNET_CONFIG_HPP_

#include <chrono>
#include <cstddef>

namespace sessnet {

// ============================================================================
// TCP Tuning Configuration (applied to every accepted socket)
// ============================================================================

struct TcpTuning {
  bool tcp_nodelay = true;      // Disable Nagle algorithm
  bool tcp_quickack = false;    // Reduce ACK delay (Linux-specific)
  bool so_keepalive = false;    // Enable TCP keepalive

  // Keepalive parameters (Linux-specific, effective when so_keepalive=true)
  int keepalive_idle_s = 60;      // Seconds before first keepalive probe
  int keepalive_interval_s = 10;  // Seconds between probes
  int keepalive_count = 5;        // Max probes before dropping connection
};

// ============================================================================
// Server Configuration
// ============================================================================

struct ServerConfig {
  // Listener
  int pending_connection_backlog = 200;
  bool reuse_address = true;
  // Windows-only socket option (IPv6 NAT traversal); ignored on POSIX, logged when off.
  bool allow_nat_traversal = true;

  // Buffer pool
  size_t initial_buffer_allocation_count = 100;
  size_t receive_buffer_size = 8192;

  // Per-session socket
  size_t send_buffer_size = 8192;
  std::chrono::milliseconds receive_timeout{0};  // 0 = wait forever
  std::chrono::milliseconds send_timeout{0};     // 0 = wait forever
  TcpTuning tcp;
};

}  // namespace sessnet

#endif  // SESSNET_CONFIG_HPP_
