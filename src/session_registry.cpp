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

#include "sessnet/session_registry.hpp"

#include <utility>

namespace sessnet {

bool SessionRegistry::try_add(const std::string& key, const SessionPtr& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.emplace(key, session).second;
}

SessionPtr SessionRegistry::try_remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(key);
  if (it == sessions_.end()) {
    return nullptr;
  }
  SessionPtr removed = std::move(it->second);
  sessions_.erase(it);
  return removed;
}

SessionPtr SessionRegistry::find(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(key);
  return it == sessions_.end() ? nullptr : it->second;
}

std::vector<SessionPtr> SessionRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SessionPtr> sessions;
  sessions.reserve(sessions_.size());
  for (const auto& entry : sessions_) {
    sessions.push_back(entry.second);
  }
  return sessions;
}

size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

bool SessionRegistry::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.empty();
}

}  // namespace sessnet
