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
 * @brief RFC 6455 frame codec.
 *
 * Wire layout:
 *   byte 0      FIN(1) RSV1-3(3) OPCODE(4)
 *   byte 1      MASK(1) PAYLOAD_LEN(7)
 *   [2 | 8]     extended big-endian length when PAYLOAD_LEN is 126 | 127
 *   [4]         masking key when MASK=1
 *   payload     XOR'd with key[i % 4] when MASK=1
 *
 * The codec holds no state: encode_frame() builds one complete frame and
 * decode_frame() pulls exactly one frame from a ByteSource.
 */

#ifndef WSCHAT_FRAME_HPP_
#define WSCHAT_FRAME_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace wschat {
namespace ws {

enum class OpCode : uint8_t {
  kContinuation = 0x0,
  kText = 0x1,
  kBinary = 0x2,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA
};

using MaskKey = std::array<uint8_t, 4>;

static constexpr size_t kMaxControlPayload = 125;
static constexpr size_t kMaxHeaderSize = 14;  // 2 + 8 + 4
static constexpr uint64_t kDefaultMaxPayload = 16ULL * 1024 * 1024;

// Close status codes used by this library.
static constexpr uint16_t kCloseNormal = 1000;
static constexpr uint16_t kCloseGoingAway = 1001;
static constexpr uint16_t kCloseProtocolError = 1002;

struct Frame {
  bool fin = true;
  OpCode opcode = OpCode::kText;
  bool masked = false;
  uint64_t payload_len = 0;
  optional<MaskKey> masking_key;
  std::string payload;  // always unmasked
};

constexpr bool is_control(OpCode op) noexcept {
  return (static_cast<uint8_t>(op) & 0x08) != 0;
}

constexpr bool is_known_opcode(uint8_t raw) noexcept {
  return raw == 0x0 || raw == 0x1 || raw == 0x2 || raw == 0x8 || raw == 0x9 || raw == 0xA;
}

const char* to_string(OpCode op) noexcept;

// XOR data in place with key[i % 4]. Applying it twice restores the input.
void apply_mask(uint8_t* data, size_t len, const MaskKey& key) noexcept;

// ============================================================================
// Encoding
// ============================================================================

// Encodes a final (FIN=1) frame. When `mask` is true a fresh key is drawn
// from the OS entropy source; client-to-server frames must set it.
std::vector<uint8_t> encode_frame(OpCode opcode, std::string_view payload, bool mask);

// Encodes a masked frame with the given key.
std::vector<uint8_t> encode_frame(OpCode opcode, std::string_view payload, const MaskKey& key);

// Writes only the header (FIN, opcode, MASK bit, minimal-width length and
// optional key) into buf, which must hold kMaxHeaderSize bytes.
size_t encode_frame_header(uint8_t* buf, OpCode opcode, uint64_t payload_len,
                           const MaskKey* key) noexcept;

// CLOSE payload: 2-byte big-endian status code.
std::string make_close_payload(uint16_t code);

// Status code carried by a CLOSE payload, or 0 when none is present.
uint16_t parse_close_code(std::string_view payload) noexcept;

// ============================================================================
// Decoding
// ============================================================================

/**
 * @brief Blocking source of bytes for decode_frame().
 *
 * read_exact() either fills all `len` bytes or fails: kFrameTruncated when the
 * stream ended first, kTimeout / kSocketError for transport failures.
 */
class ByteSource {
 public:
  virtual ~ByteSource() = default;
  virtual Status read_exact(uint8_t* buf, size_t len) = 0;
};

// In-memory source over a caller-owned buffer.
class BufferSource final : public ByteSource {
 public:
  explicit BufferSource(std::string_view data) : data_(data) {}
  BufferSource(const std::vector<uint8_t>& data)  // NOLINT
      : data_(reinterpret_cast<const char*>(data.data()), data.size()) {}
  BufferSource(std::vector<uint8_t>&&) = delete;

  Status read_exact(uint8_t* buf, size_t len) override;

  size_t remaining() const { return data_.size() - pos_; }

 private:
  std::string_view data_;
  size_t pos_ = 0;
};

struct DecodeOptions {
  bool require_masked = false;  // servers must refuse unmasked client frames
  uint64_t max_payload = kDefaultMaxPayload;
};

/**
 * @brief Reads exactly one frame.
 *
 * Errors:
 *   kFrameTruncated    source ended before the frame was complete
 *   kProtocolViolation reserved opcode or RSV bits, oversized or fragmented
 *                      control frame, non-minimal or oversized length,
 *                      unmasked frame when require_masked is set
 *   kTimeout / kSocketError propagated from the source
 */
expected<Frame, ErrorCode> decode_frame(ByteSource& src, const DecodeOptions& options = {});

}  // namespace ws
}  // namespace wschat

#endif  // WSCHAT_FRAME_HPP_
