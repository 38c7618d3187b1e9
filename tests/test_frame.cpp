#include "sessnet/frame.hpp"

#include <cstring>

#include <catch2/catch.hpp>
#include <string>
#include <string_view>
#include <vector>

using namespace sessnet;

namespace {

std::string_view as_view(const std::vector<uint8_t>& frame) {
  return std::string_view(reinterpret_cast<const char*>(frame.data()), frame.size());
}

}  // namespace

// ============================================================================
// Frame Encoding
// ============================================================================

TEST_CASE("Frame encode - final text frame", "[frame]") {
  auto frame = ws::encode_frame(ws::OpCode::kText, "Hello");
  REQUIRE(frame.size() == 7);
  REQUIRE(frame[0] == 0x81);        // FIN + text
  REQUIRE((frame[1] & 0x80) == 0);  // server frames are never masked
  REQUIRE((frame[1] & 0x7F) == 5);
  REQUIRE(std::string(frame.begin() + 2, frame.end()) == "Hello");
}

TEST_CASE("Frame encode - non-final text frame", "[frame]") {
  auto frame = ws::encode_frame(ws::OpCode::kText, "He", false);
  REQUIRE(frame[0] == 0x01);
  REQUIRE((frame[1] & 0x7F) == 2);
}

TEST_CASE("Frame encode - continuation frames", "[frame]") {
  auto middle = ws::encode_frame(ws::OpCode::kContinuation, "ll", false);
  auto last = ws::encode_frame(ws::OpCode::kContinuation, "o", true);
  REQUIRE(middle[0] == 0x00);
  REQUIRE(last[0] == 0x80);
  REQUIRE(last.size() == 3);
}

TEST_CASE("Frame encode - empty payload", "[frame]") {
  auto frame = ws::encode_frame(ws::OpCode::kText, "");
  REQUIRE(frame.size() == 2);
  REQUIRE(frame[0] == 0x81);
  REQUIRE(frame[1] == 0x00);
}

TEST_CASE("Frame encode - payload sub-range", "[frame]") {
  const uint8_t payload[] = {'x', 'a', 'b', 'c', 'y'};
  auto frame = ws::encode_frame(ws::OpCode::kBinary, payload, 1, 3);
  REQUIRE(frame.size() == 5);
  REQUIRE(frame[0] == 0x82);
  REQUIRE(frame[1] == 3);
  REQUIRE(frame[2] == 'a');
  REQUIRE(frame[4] == 'c');
}

TEST_CASE("Frame encode - 200 byte payload (16-bit length)", "[frame]") {
  std::string payload(200, 'x');
  auto frame = ws::encode_frame(ws::OpCode::kBinary, payload);
  REQUIRE(frame[1] == 126);
  uint16_t len = static_cast<uint16_t>((frame[2] << 8) | frame[3]);
  REQUIRE(len == 200);
  REQUIRE(frame.size() == 4 + 200);
}

TEST_CASE("Frame encode - 65536 byte payload (64-bit length)", "[frame]") {
  std::string payload(65536, 'z');
  auto frame = ws::encode_frame(ws::OpCode::kContinuation, payload, false);
  REQUIRE(frame[0] == 0x00);
  REQUIRE(frame[1] == 127);
  REQUIRE(frame[7] == 0x01);
  REQUIRE(frame[8] == 0x00);
  REQUIRE(frame[9] == 0x00);
  REQUIRE(frame.size() == ws::kMaxFrameHeaderSize + 65536);
}

TEST_CASE("Frame encode - header length boundaries", "[frame]") {
  uint8_t buf[ws::kMaxFrameHeaderSize];
  REQUIRE(ws::encode_frame_header(buf, ws::OpCode::kText, 125) == 2);
  REQUIRE(ws::encode_frame_header(buf, ws::OpCode::kText, 126) == 4);
  REQUIRE(ws::encode_frame_header(buf, ws::OpCode::kText, 65535) == 4);
  REQUIRE(ws::encode_frame_header(buf, ws::OpCode::kText, 65536) == 10);
}

// ============================================================================
// Frame Header Parsing
// ============================================================================

TEST_CASE("Frame parse - reads back encoded header", "[frame]") {
  auto frame = ws::encode_frame(ws::OpCode::kContinuation, std::string(300, 'q'), false);
  ws::FrameHeader header;
  size_t consumed = ws::parse_frame_header(as_view(frame), header);
  REQUIRE(consumed == 4);
  REQUIRE(header.fin == false);
  REQUIRE(header.opcode == ws::OpCode::kContinuation);
  REQUIRE(header.masked == false);
  REQUIRE(header.payload_len == 300);
}

TEST_CASE("Frame parse - masked client frame", "[frame]") {
  uint8_t frame[] = {0x81, 0x85, 0x37, 0xfa, 0x21, 0x3d, 0x7f, 0x9f, 0x4d, 0x51, 0x58};
  ws::FrameHeader header;
  size_t consumed =
      ws::parse_frame_header(std::string_view(reinterpret_cast<const char*>(frame), sizeof(frame)), header);
  REQUIRE(consumed == 6);  // 2 + 4 (mask key)
  REQUIRE(header.fin == true);
  REQUIRE(header.masked == true);
  REQUIRE(header.payload_len == 5);
}

TEST_CASE("Frame parse - incomplete input", "[frame]") {
  ws::FrameHeader header;
  uint8_t one[] = {0x81};
  REQUIRE(ws::parse_frame_header(std::string_view(reinterpret_cast<const char*>(one), 1), header) == 0);

  uint8_t short_len[] = {0x82, 126, 0x00};
  REQUIRE(ws::parse_frame_header(std::string_view(reinterpret_cast<const char*>(short_len), 3), header) == 0);

  uint8_t short_mask[] = {0x81, 0x85, 0x37, 0xfa};
  REQUIRE(ws::parse_frame_header(std::string_view(reinterpret_cast<const char*>(short_mask), 4), header) == 0);
}
