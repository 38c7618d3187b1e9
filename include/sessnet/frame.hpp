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

/**
 * @file frame.hpp
 * @brief WebSocket frame encoder (RFC 6455 section 5.2), server-to-client.
 *
 * Server frames are never masked. The FIN bit is explicit so that a message
 * can be split across a first frame and any number of continuation frames.
 */

#ifndef SESSNET_FRAME_HPP_
#define SESSNET_FRAME_HPP_

#include <cstddef>
#include <cstdint>

#include <string_view>
#include <vector>

namespace sessnet {
namespace ws {

// Frame types
enum class OpCode : uint8_t {
  kContinuation = 0x0,
  kText = 0x1,
  kBinary = 0x2,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA
};

struct FrameHeader {
  bool fin;
  OpCode opcode;
  bool masked;
  uint64_t payload_len;
};

// 2 bytes base + 8 bytes extended length
static constexpr size_t kMaxFrameHeaderSize = 10;

// Parse WebSocket frame header from buffer
// Returns bytes consumed, or 0 if incomplete
inline size_t parse_frame_header(std::string_view data, FrameHeader& header) {
  if (data.size() < 2) return 0;

  uint8_t byte0 = static_cast<uint8_t>(data[0]);
  uint8_t byte1 = static_cast<uint8_t>(data[1]);

  header.fin = (byte0 & 0x80) != 0;
  header.opcode = static_cast<OpCode>(byte0 & 0x0F);
  header.masked = (byte1 & 0x80) != 0;

  uint64_t len = byte1 & 0x7F;
  size_t header_size = 2;

  if (len == 126) {
    if (data.size() < 4) return 0;
    len = (static_cast<uint64_t>(static_cast<uint8_t>(data[2])) << 8) |
          static_cast<uint64_t>(static_cast<uint8_t>(data[3]));
    header_size = 4;
  } else if (len == 127) {
    if (data.size() < 10) return 0;
    len = 0;
    for (int i = 2; i < 10; ++i)
      len = (len << 8) | static_cast<uint64_t>(static_cast<uint8_t>(data[i]));
    header_size = 10;
  }

  header.payload_len = len;

  if (header.masked) {
    if (data.size() < header_size + 4) return 0;
    header_size += 4;
  }

  return header_size;
}

// Write a frame header into buf (at least kMaxFrameHeaderSize bytes)
// Returns header length
inline size_t encode_frame_header(uint8_t* buf, OpCode opcode, size_t payload_len, bool fin = true) {
  size_t pos = 0;
  buf[pos++] = static_cast<uint8_t>((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode));
  if (payload_len < 126) {
    buf[pos++] = static_cast<uint8_t>(payload_len);
  } else if (payload_len < 65536) {
    buf[pos++] = 126;
    buf[pos++] = static_cast<uint8_t>((payload_len >> 8) & 0xFF);
    buf[pos++] = static_cast<uint8_t>(payload_len & 0xFF);
  } else {
    buf[pos++] = 127;
    for (int i = 7; i >= 0; --i)
      buf[pos++] = static_cast<uint8_t>((static_cast<uint64_t>(payload_len) >> (i * 8)) & 0xFF);
  }
  return pos;
}

// Encode payload[offset, offset + count) as one frame
inline std::vector<uint8_t> encode_frame(OpCode opcode, const uint8_t* payload, size_t offset, size_t count,
                                         bool fin = true) {
  uint8_t header[kMaxFrameHeaderSize];
  size_t header_len = encode_frame_header(header, opcode, count, fin);

  std::vector<uint8_t> frame;
  frame.reserve(header_len + count);
  frame.insert(frame.end(), header, header + header_len);
  if (count > 0) {
    frame.insert(frame.end(), payload + offset, payload + offset + count);
  }
  return frame;
}

inline std::vector<uint8_t> encode_frame(OpCode opcode, std::string_view payload, bool fin = true) {
  return encode_frame(opcode, reinterpret_cast<const uint8_t*>(payload.data()), 0, payload.size(), fin);
}

}  // namespace ws
}  // namespace sessnet

#endif  // SESSNET_FRAME_HPP_
