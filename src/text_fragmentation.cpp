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

#include "sessnet/text_fragmentation.hpp"

#include "sessnet/errors.hpp"

#include <stdexcept>
#include <utility>

namespace sessnet {

TextFragmentation::TextFragmentation(std::shared_ptr<const Fragments> fragments)
    : fragments_(std::move(fragments)) {
  if (!fragments_) {
    SESSNET_THROW(std::invalid_argument("fragments"));
  }
}

TextFragmentation::TextFragmentation(Fragments fragments)
    : fragments_(std::make_shared<const Fragments>(std::move(fragments))) {}

TextFragmentation::Frame TextFragmentation::frame_at(size_t index) const {
  const std::string& text = fragments_->at(index);
  // std::string already holds the UTF-8 byte representation
  return ws::encode_frame(index == 0 ? ws::OpCode::kText : ws::OpCode::kContinuation,
                          reinterpret_cast<const uint8_t*>(text.data()), 0, text.size(),
                          index + 1 == fragments_->size());
}

std::vector<TextFragmentation::Frame> TextFragmentation::to_frames() const {
  std::vector<Frame> frames;
  frames.reserve(fragments_->size());
  for (auto it = begin(); it != end(); ++it) {
    frames.push_back(*it);
  }
  return frames;
}

TextFragmentation::Frame TextFragmentation::const_iterator::operator*() const {
  return owner_->frame_at(index_);
}

}  // namespace sessnet
