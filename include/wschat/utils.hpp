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

#ifndef WSCHAT_UTILS_HPP_
#define WSCHAT_UTILS_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wschat {

// ============================================================================
// Base64 encoding/decoding
// ============================================================================

class Base64 {
 public:
  static std::string encode(const uint8_t* data, size_t size);

  // Returns an empty vector if the input is not canonical padded base64.
  static std::vector<uint8_t> decode(std::string_view encoded);
};

// ============================================================================
// SHA-1 hashing (only used for the handshake accept key)
// ============================================================================

class SHA1 {
 public:
  static constexpr size_t kDigestSize = 20;
  using Digest = std::array<uint8_t, kDigestSize>;

  static Digest compute(const uint8_t* data, size_t size);
  static Digest compute(std::string_view input) {
    return compute(reinterpret_cast<const uint8_t*>(input.data()), input.size());
  }

  void update(const uint8_t* data, size_t size);
  Digest finalize();

 private:
  std::array<uint32_t, 5> h_ = {0x67452301, 0xefcdab89, 0x98badcfe,
                                 0x10325476, 0xc3d2e1f0};
  std::array<uint8_t, 64> block_{};
  size_t block_len_ = 0;
  uint64_t total_len_ = 0;

  void process_block(const uint8_t* block);
};

// ============================================================================
// Random bytes (handshake nonces and masking keys)
// ============================================================================

// Fills buf from std::random_device, which is backed by the OS entropy pool.
void random_bytes(uint8_t* buf, size_t len);

template <size_t N>
std::array<uint8_t, N> random_array() {
  std::array<uint8_t, N> out{};
  random_bytes(out.data(), out.size());
  return out;
}

// ASCII case-insensitive comparison, used for HTTP header names and tokens.
bool iequals(std::string_view a, std::string_view b);

// True if `token` occurs in the comma separated header value (case-insensitive).
bool header_has_token(std::string_view value, std::string_view token);

std::string_view trim(std::string_view s);

}  // namespace wschat

#endif  // WSCHAT_UTILS_HPP_
