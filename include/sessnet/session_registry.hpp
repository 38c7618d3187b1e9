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

#ifndef SESSNET_SESSION_REGISTRY_HPP_
#define SESSNET_SESSION_REGISTRY_HPP_

#include "dispatcher.hpp"

#include <cstddef>

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sessnet {

// ============================================================================
// SessionRegistry - key -> live session, safe under concurrent use
// ============================================================================

class SessionRegistry {
 public:
  SessionRegistry() = default;
  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  // Returns false if the key is already registered
  bool try_add(const std::string& key, const SessionPtr& session);

  // Returns the removed session, or nullptr if the key was not registered
  SessionPtr try_remove(const std::string& key);

  // Returns nullptr if not found
  SessionPtr find(const std::string& key) const;

  // Consistent copy of the live set, in registry iteration order
  std::vector<SessionPtr> snapshot() const;

  size_t size() const;
  bool empty() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, SessionPtr> sessions_;
};

}  // namespace sessnet

#endif  // SESSNET_SESSION_REGISTRY_HPP_
