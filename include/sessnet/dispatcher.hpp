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

#ifndef SESSNET_DISPATCHER_HPP_
#define SESSNET_DISPATCHER_HPP_

#include <cstddef>
#include <cstdint>

#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace sessnet {

class Session;  // Forward declaration
using SessionPtr = std::shared_ptr<Session>;

// ============================================================================
// MessageDispatcher - session lifecycle callbacks, implemented by the app
// ============================================================================
//
// Callbacks run on the session's own worker thread. The buffer passed to
// on_session_data_received belongs to the server's pool and is only valid
// for the duration of the call.
//

class MessageDispatcher {
 public:
  virtual ~MessageDispatcher() = default;

  virtual void on_session_started(const SessionPtr& session) = 0;

  virtual void on_session_data_received(const SessionPtr& session, const std::vector<uint8_t>& buffer,
                                        size_t offset, size_t count) = 0;

  virtual void on_session_closed(const SessionPtr& session) = 0;
};

// ============================================================================
// CallbackDispatcher - adapts plain callbacks, any of which may be empty
// ============================================================================

struct SessionCallbacks {
  std::function<void(const SessionPtr&, const std::vector<uint8_t>&, size_t, size_t)> on_data_received;
  std::function<void(const SessionPtr&)> on_started;
  std::function<void(const SessionPtr&)> on_closed;
};

class CallbackDispatcher : public MessageDispatcher {
 public:
  explicit CallbackDispatcher(SessionCallbacks callbacks) : callbacks_(std::move(callbacks)) {}

  void on_session_started(const SessionPtr& session) override {
    if (callbacks_.on_started) {
      callbacks_.on_started(session);
    }
  }

  void on_session_data_received(const SessionPtr& session, const std::vector<uint8_t>& buffer, size_t offset,
                                size_t count) override {
    if (callbacks_.on_data_received) {
      callbacks_.on_data_received(session, buffer, offset, count);
    }
  }

  void on_session_closed(const SessionPtr& session) override {
    if (callbacks_.on_closed) {
      callbacks_.on_closed(session);
    }
  }

 private:
  SessionCallbacks callbacks_;
};

}  // namespace sessnet

#endif  // SESSNET_DISPATCHER_HPP_
