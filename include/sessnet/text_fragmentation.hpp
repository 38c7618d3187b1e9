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

#ifndef SESSNET_TEXT_FRAGMENTATION_HPP_
#define SESSNET_TEXT_FRAGMENTATION_HPP_

#include "frame.hpp"

#include <cstddef>
#include <cstdint>

#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace sessnet {

// ============================================================================
// TextFragmentation
// ============================================================================
//
// One logical text message, pre-split by the caller. Iterating yields one
// encoded frame per fragment: fragment 0 is a kText frame, later fragments
// are kContinuation frames, and only the last one carries FIN. Frames are
// encoded on dereference, so the sequence is lazy and can be walked again
// from the start any number of times.
//

class TextFragmentation {
 public:
  using Fragments = std::vector<std::string>;
  using Frame = std::vector<uint8_t>;

  class const_iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Frame;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = Frame;

    const_iterator() = default;

    Frame operator*() const;

    const_iterator& operator++() {
      ++index_;
      return *this;
    }

    const_iterator operator++(int) {
      const_iterator prev = *this;
      ++index_;
      return prev;
    }

    bool operator==(const const_iterator& other) const {
      return owner_ == other.owner_ && index_ == other.index_;
    }
    bool operator!=(const const_iterator& other) const { return !(*this == other); }

   private:
    friend class TextFragmentation;
    const_iterator(const TextFragmentation* owner, size_t index) : owner_(owner), index_(index) {}

    const TextFragmentation* owner_ = nullptr;
    size_t index_ = 0;
  };

  // Throws std::invalid_argument if fragments is null
  explicit TextFragmentation(std::shared_ptr<const Fragments> fragments);
  explicit TextFragmentation(Fragments fragments);

  const Fragments& fragments() const { return *fragments_; }
  size_t size() const { return fragments_->size(); }
  bool empty() const { return fragments_->empty(); }

  const_iterator begin() const { return const_iterator(this, 0); }
  const_iterator end() const { return const_iterator(this, fragments_->size()); }

  // Encode the frame for fragment at index
  Frame frame_at(size_t index) const;

  // Materialize the whole sequence
  std::vector<Frame> to_frames() const;

 private:
  std::shared_ptr<const Fragments> fragments_;
};

}  // namespace sessnet

#endif  // SESSNET_TEXT_FRAGMENTATION_HPP_
