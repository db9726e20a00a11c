#include "wschat/utils.hpp"

#include <cctype>

#include <random>

namespace wschat {

namespace {

constexpr const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr uint8_t kInvalid = 0xFF;

uint8_t decode_char(char c) {
  if (c >= 'A' && c <= 'Z') return static_cast<uint8_t>(c - 'A');
  if (c >= 'a' && c <= 'z') return static_cast<uint8_t>(c - 'a' + 26);
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0' + 52);
  if (c == '+') return 62;
  if (c == '/') return 63;
  return kInvalid;
}

inline uint32_t rol(uint32_t x, int n) {
  return (x << n) | (x >> (32 - n));
}

char lower(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

}  // namespace

// ============================================================================
// Base64
// ============================================================================

std::string Base64::encode(const uint8_t* data, size_t size) {
  std::string result;
  result.reserve((size + 2) / 3 * 4);

  for (size_t i = 0; i < size; i += 3) {
    uint32_t b = (static_cast<uint32_t>(data[i]) << 16);
    if (i + 1 < size) b |= (static_cast<uint32_t>(data[i + 1]) << 8);
    if (i + 2 < size) b |= static_cast<uint32_t>(data[i + 2]);

    result.push_back(kAlphabet[(b >> 18) & 0x3F]);
    result.push_back(kAlphabet[(b >> 12) & 0x3F]);
    result.push_back(i + 1 < size ? kAlphabet[(b >> 6) & 0x3F] : '=');
    result.push_back(i + 2 < size ? kAlphabet[b & 0x3F] : '=');
  }
  return result;
}

std::vector<uint8_t> Base64::decode(std::string_view encoded) {
  std::vector<uint8_t> result;
  if (encoded.size() % 4 != 0) return result;
  result.reserve(encoded.size() / 4 * 3);

  for (size_t i = 0; i < encoded.size(); i += 4) {
    const bool last = (i + 4 == encoded.size());
    const char c2 = encoded[i + 2];
    const char c3 = encoded[i + 3];

    uint8_t v0 = decode_char(encoded[i]);
    uint8_t v1 = decode_char(encoded[i + 1]);
    uint8_t v2 = (c2 == '=') ? 0 : decode_char(c2);
    uint8_t v3 = (c3 == '=') ? 0 : decode_char(c3);

    // Padding is only legal in the final quantum, and "=x" is never valid.
    bool bad_padding = (c2 == '=' || c3 == '=') && !last;
    bad_padding = bad_padding || (c2 == '=' && c3 != '=');
    if (v0 == kInvalid || v1 == kInvalid || v2 == kInvalid || v3 == kInvalid || bad_padding) {
      result.clear();
      return result;
    }

    uint32_t b = (static_cast<uint32_t>(v0) << 18) | (static_cast<uint32_t>(v1) << 12) |
                 (static_cast<uint32_t>(v2) << 6) | static_cast<uint32_t>(v3);
    result.push_back(static_cast<uint8_t>((b >> 16) & 0xFF));
    if (c2 != '=') result.push_back(static_cast<uint8_t>((b >> 8) & 0xFF));
    if (c3 != '=') result.push_back(static_cast<uint8_t>(b & 0xFF));
  }
  return result;
}

// ============================================================================
// SHA1
// ============================================================================

SHA1::Digest SHA1::compute(const uint8_t* data, size_t size) {
  SHA1 sha1;
  sha1.update(data, size);
  return sha1.finalize();
}

void SHA1::update(const uint8_t* data, size_t size) {
  total_len_ += size;
  for (size_t i = 0; i < size; ++i) {
    block_[block_len_++] = data[i];
    if (block_len_ == block_.size()) {
      process_block(block_.data());
      block_len_ = 0;
    }
  }
}

SHA1::Digest SHA1::finalize() {
  const uint64_t bit_len = total_len_ * 8;

  block_[block_len_++] = 0x80;
  if (block_len_ > 56) {
    while (block_len_ < 64) block_[block_len_++] = 0;
    process_block(block_.data());
    block_len_ = 0;
  }
  while (block_len_ < 56) block_[block_len_++] = 0;

  for (int i = 0; i < 8; ++i) {
    block_[56 + i] = static_cast<uint8_t>((bit_len >> (8 * (7 - i))) & 0xFF);
  }
  process_block(block_.data());
  block_len_ = 0;

  Digest result;
  for (int i = 0; i < 5; ++i) {
    result[i * 4] = (h_[i] >> 24) & 0xFF;
    result[i * 4 + 1] = (h_[i] >> 16) & 0xFF;
    result[i * 4 + 2] = (h_[i] >> 8) & 0xFF;
    result[i * 4 + 3] = h_[i] & 0xFF;
  }
  return result;
}

void SHA1::process_block(const uint8_t* block) {
  std::array<uint32_t, 80> w;
  for (int i = 0; i < 16; ++i) {
    w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) |
           (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
           (static_cast<uint32_t>(block[i * 4 + 2]) << 8) |
           static_cast<uint32_t>(block[i * 4 + 3]);
  }
  for (int i = 16; i < 80; ++i) {
    w[i] = rol(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
  }

  uint32_t a = h_[0], b = h_[1], c = h_[2], d = h_[3], e = h_[4];

  for (int i = 0; i < 80; ++i) {
    uint32_t f, k;
    if (i < 20) {
      f = (b & c) | ((~b) & d);
      k = 0x5a827999;
    } else if (i < 40) {
      f = b ^ c ^ d;
      k = 0x6ed9eba1;
    } else if (i < 60) {
      f = (b & c) | (b & d) | (c & d);
      k = 0x8f1bbcdc;
    } else {
      f = b ^ c ^ d;
      k = 0xca62c1d6;
    }

    uint32_t temp = rol(a, 5) + f + e + k + w[i];
    e = d;
    d = c;
    c = rol(b, 30);
    b = a;
    a = temp;
  }

  h_[0] += a;
  h_[1] += b;
  h_[2] += c;
  h_[3] += d;
  h_[4] += e;
}

// ============================================================================
// Random / string helpers
// ============================================================================

void random_bytes(uint8_t* buf, size_t len) {
  static thread_local std::random_device rd;
  size_t i = 0;
  while (i < len) {
    uint32_t word = rd();
    for (int j = 0; j < 4 && i < len; ++j, ++i) {
      buf[i] = static_cast<uint8_t>(word >> (8 * j));
    }
  }
}

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (lower(a[i]) != lower(b[i])) return false;
  }
  return true;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
  return s;
}

bool header_has_token(std::string_view value, std::string_view token) {
  while (!value.empty()) {
    size_t comma = value.find(',');
    std::string_view item = trim(value.substr(0, comma));
    if (iequals(item, token)) return true;
    if (comma == std::string_view::npos) break;
    value.remove_prefix(comma + 1);
  }
  return false;
}

}  // namespace wschat
