#include "wschat/frame.hpp"

#include "wschat/utils.hpp"

#include <cstring>

namespace wschat {
namespace ws {

namespace {

using FrameResult = expected<Frame, ErrorCode>;

FrameResult violation() {
  return FrameResult::error(ErrorCode::kProtocolViolation);
}

std::vector<uint8_t> build_frame(OpCode opcode, std::string_view payload, const MaskKey* key) {
  uint8_t header[kMaxHeaderSize];
  size_t header_len = encode_frame_header(header, opcode, payload.size(), key);

  std::vector<uint8_t> frame;
  frame.reserve(header_len + payload.size());
  frame.insert(frame.end(), header, header + header_len);
  frame.insert(frame.end(), payload.begin(), payload.end());

  if (key != nullptr) {
    apply_mask(frame.data() + header_len, payload.size(), *key);
  }
  return frame;
}

}  // namespace

const char* to_string(OpCode op) noexcept {
  switch (op) {
    case OpCode::kContinuation:
      return "CONTINUATION";
    case OpCode::kText:
      return "TEXT";
    case OpCode::kBinary:
      return "BINARY";
    case OpCode::kClose:
      return "CLOSE";
    case OpCode::kPing:
      return "PING";
    case OpCode::kPong:
      return "PONG";
  }
  return "RESERVED";
}

void apply_mask(uint8_t* data, size_t len, const MaskKey& key) noexcept {
  for (size_t i = 0; i < len; ++i) {
    data[i] ^= key[i % 4];
  }
}

size_t encode_frame_header(uint8_t* buf, OpCode opcode, uint64_t payload_len,
                           const MaskKey* key) noexcept {
  const uint8_t mask_bit = key != nullptr ? 0x80 : 0x00;
  size_t pos = 0;

  buf[pos++] = static_cast<uint8_t>(0x80 | static_cast<uint8_t>(opcode));

  if (payload_len <= 125) {
    buf[pos++] = static_cast<uint8_t>(mask_bit | payload_len);
  } else if (payload_len <= 0xFFFF) {
    buf[pos++] = static_cast<uint8_t>(mask_bit | 126);
    buf[pos++] = static_cast<uint8_t>((payload_len >> 8) & 0xFF);
    buf[pos++] = static_cast<uint8_t>(payload_len & 0xFF);
  } else {
    buf[pos++] = static_cast<uint8_t>(mask_bit | 127);
    for (int i = 7; i >= 0; --i) {
      buf[pos++] = static_cast<uint8_t>((payload_len >> (i * 8)) & 0xFF);
    }
  }

  if (key != nullptr) {
    std::memcpy(buf + pos, key->data(), key->size());
    pos += key->size();
  }
  return pos;
}

std::vector<uint8_t> encode_frame(OpCode opcode, std::string_view payload, bool mask) {
  if (!mask) {
    return build_frame(opcode, payload, nullptr);
  }
  MaskKey key = random_array<4>();
  return build_frame(opcode, payload, &key);
}

std::vector<uint8_t> encode_frame(OpCode opcode, std::string_view payload, const MaskKey& key) {
  return build_frame(opcode, payload, &key);
}

std::string make_close_payload(uint16_t code) {
  std::string payload(2, '\0');
  payload[0] = static_cast<char>((code >> 8) & 0xFF);
  payload[1] = static_cast<char>(code & 0xFF);
  return payload;
}

uint16_t parse_close_code(std::string_view payload) noexcept {
  if (payload.size() < 2) {
    return 0;
  }
  return static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) |
                               static_cast<uint8_t>(payload[1]));
}

// ============================================================================
// Decoding
// ============================================================================

Status BufferSource::read_exact(uint8_t* buf, size_t len) {
  if (remaining() < len) {
    pos_ = data_.size();
    return Status::error(ErrorCode::kFrameTruncated);
  }
  std::memcpy(buf, data_.data() + pos_, len);
  pos_ += len;
  return Status::success();
}

expected<Frame, ErrorCode> decode_frame(ByteSource& src, const DecodeOptions& options) {
  uint8_t header[2];
  auto r = src.read_exact(header, sizeof(header));
  if (!r) {
    return FrameResult::error(r.get_error());
  }

  Frame frame;
  frame.fin = (header[0] & 0x80) != 0;
  frame.masked = (header[1] & 0x80) != 0;

  if ((header[0] & 0x70) != 0) {
    return violation();  // no extension negotiated, RSV bits must be zero
  }
  const uint8_t raw_opcode = header[0] & 0x0F;
  if (!is_known_opcode(raw_opcode)) {
    return violation();
  }
  frame.opcode = static_cast<OpCode>(raw_opcode);

  const uint8_t base_len = header[1] & 0x7F;
  if (is_control(frame.opcode) && (base_len > kMaxControlPayload || !frame.fin)) {
    return violation();
  }
  if (options.require_masked && !frame.masked) {
    return violation();
  }

  uint64_t len = base_len;
  if (base_len == 126) {
    uint8_t ext[2];
    r = src.read_exact(ext, sizeof(ext));
    if (!r) {
      return FrameResult::error(r.get_error());
    }
    len = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
    if (len <= 125) {
      return violation();
    }
  } else if (base_len == 127) {
    uint8_t ext[8];
    r = src.read_exact(ext, sizeof(ext));
    if (!r) {
      return FrameResult::error(r.get_error());
    }
    len = 0;
    for (uint8_t b : ext) {
      len = (len << 8) | b;
    }
    if ((len >> 63) != 0 || len <= 0xFFFF) {
      return violation();
    }
  }
  if (len > options.max_payload) {
    return violation();
  }
  frame.payload_len = len;

  if (frame.masked) {
    MaskKey key{};
    r = src.read_exact(key.data(), key.size());
    if (!r) {
      return FrameResult::error(r.get_error());
    }
    frame.masking_key = key;
  }

  frame.payload.resize(static_cast<size_t>(len));
  if (len > 0) {
    r = src.read_exact(reinterpret_cast<uint8_t*>(&frame.payload[0]), frame.payload.size());
    if (!r) {
      return FrameResult::error(r.get_error());
    }
  }

  if (frame.masking_key) {
    apply_mask(reinterpret_cast<uint8_t*>(&frame.payload[0]), frame.payload.size(),
               frame.masking_key.value());
  }
  return FrameResult::success(std::move(frame));
}

}  // namespace ws
}  // namespace wschat
