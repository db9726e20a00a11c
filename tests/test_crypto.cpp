#include "wschat/utils.hpp"

#include <catch2/catch_test_macros.hpp>
#include <set>
#include <string>
#include <vector>

using namespace wschat;

namespace {

std::string b64(std::string_view text) {
  return Base64::encode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::string b64_decode_str(std::string_view encoded) {
  auto bytes = Base64::decode(encoded);
  return std::string(bytes.begin(), bytes.end());
}

std::string sha1_hex(std::string_view input) {
  std::string out;
  for (uint8_t byte : SHA1::compute(input)) {
    out += "0123456789abcdef"[byte >> 4];
    out += "0123456789abcdef"[byte & 0x0f];
  }
  return out;
}

}  // namespace

// ============================================================================
// Base64 (RFC 4648 section 10 vectors)
// ============================================================================

TEST_CASE("Base64 encode - RFC 4648 vectors", "[crypto]") {
  REQUIRE(Base64::encode(nullptr, 0).empty());
  REQUIRE(b64("f") == "Zg==");
  REQUIRE(b64("fo") == "Zm8=");
  REQUIRE(b64("foo") == "Zm9v");
  REQUIRE(b64("foob") == "Zm9vYg==");
  REQUIRE(b64("fooba") == "Zm9vYmE=");
  REQUIRE(b64("foobar") == "Zm9vYmFy");
}

TEST_CASE("Base64 encode - binary bytes", "[crypto]") {
  const uint8_t data[] = {0x00, 0xff, 0xfe, 0x10};
  REQUIRE(Base64::encode(data, sizeof(data)) == "AP/+EA==");
}

TEST_CASE("Base64 decode - RFC 4648 vectors", "[crypto]") {
  REQUIRE(Base64::decode("").empty());
  REQUIRE(b64_decode_str("Zg==") == "f");
  REQUIRE(b64_decode_str("Zm8=") == "fo");
  REQUIRE(b64_decode_str("Zm9v") == "foo");
  REQUIRE(b64_decode_str("Zm9vYmFy") == "foobar");
  REQUIRE(b64_decode_str("SGVsbG8sIFdlYlNvY2tldCE=") == "Hello, WebSocket!");
}

TEST_CASE("Base64 decode - handshake nonce is 16 bytes", "[crypto]") {
  REQUIRE(Base64::decode("dGhlIHNhbXBsZSBub25jZQ==").size() == 16);
}

TEST_CASE("Base64 decode - malformed input yields nothing", "[crypto]") {
  REQUIRE(Base64::decode("abc").empty());        // not a multiple of 4
  REQUIRE(Base64::decode("Zm9v!A==").empty());   // bad character
  REQUIRE(Base64::decode("Zg==Zm9v").empty());   // padding before the end
  REQUIRE(Base64::decode("Zm=v").empty());       // '=' followed by data
  REQUIRE(Base64::decode("Zm9v Zm9v").empty());  // whitespace
}

// ============================================================================
// SHA-1 (FIPS 180 vectors)
// ============================================================================

TEST_CASE("SHA1 - known digests", "[crypto]") {
  REQUIRE(sha1_hex("") == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
  REQUIRE(sha1_hex("abc") == "a9993e364706816aba3e25717850c26c9cd0d89d");
  REQUIRE(sha1_hex("The quick brown fox jumps over the lazy dog") ==
          "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12");
}

TEST_CASE("SHA1 - two-block message", "[crypto]") {
  // 56 bytes: the length no longer fits after the padding byte.
  REQUIRE(sha1_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
          "84983e441c3bd26ebaae4aa1f95129e5e54670f1");
  REQUIRE(sha1_hex(std::string(64, 'a')) == "0098ba824b5c16427bd7a1122a5a442a25ec644d");
}

TEST_CASE("SHA1 - one million 'a'", "[crypto]") {
  REQUIRE(sha1_hex(std::string(1000000, 'a')) == "34aa973cd4c4daa4f61eeb2bdbad27316534016f");
}

TEST_CASE("SHA1 - incremental update matches one-shot", "[crypto]") {
  const std::string text = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
  SHA1 sha1;
  // Odd split sizes so block boundaries fall inside an update.
  size_t pos = 0;
  for (size_t step : {1u, 7u, 13u, 35u}) {
    sha1.update(reinterpret_cast<const uint8_t*>(text.data() + pos), step);
    pos += step;
  }
  REQUIRE(pos == text.size());
  REQUIRE(sha1.finalize() == SHA1::compute(text));
}

TEST_CASE("SHA1 - WebSocket accept key vector", "[crypto]") {
  auto digest = SHA1::compute("dGhlIHNhbXBsZSBub25jZQ==258EAFA5-E914-47DA-95CA-C5AB0DC85B11");
  REQUIRE(Base64::encode(digest.data(), digest.size()) == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

// ============================================================================
// Random bytes and string helpers
// ============================================================================

TEST_CASE("random_array - draws differ", "[crypto]") {
  std::set<std::array<uint8_t, 16>> seen;
  for (int i = 0; i < 32; ++i) {
    seen.insert(random_array<16>());
  }
  REQUIRE(seen.size() == 32);
}

TEST_CASE("iequals - ASCII case folding", "[crypto]") {
  REQUIRE(iequals("WebSocket", "websocket"));
  REQUIRE(iequals("/EXIT", "/exit"));
  REQUIRE_FALSE(iequals("/exit", "/exit "));
  REQUIRE_FALSE(iequals("upgrade", "upgrades"));
}

TEST_CASE("header_has_token - comma separated lists", "[crypto]") {
  REQUIRE(header_has_token("Upgrade", "upgrade"));
  REQUIRE(header_has_token("keep-alive, Upgrade", "upgrade"));
  REQUIRE(header_has_token("keep-alive,upgrade", "Upgrade"));
  REQUIRE_FALSE(header_has_token("keep-alive", "upgrade"));
  REQUIRE_FALSE(header_has_token("upgraded", "upgrade"));
  REQUIRE_FALSE(header_has_token("", "upgrade"));
}

TEST_CASE("trim - spaces, tabs and trailing CR", "[crypto]") {
  REQUIRE(trim("  value\t\r") == "value");
  REQUIRE(trim("\t") == "");
  REQUIRE(trim("a b") == "a b");
}
