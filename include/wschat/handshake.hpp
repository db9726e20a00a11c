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
 * @file handshake.hpp
 * @brief HTTP/1.1 upgrade exchange (RFC 6455 section 4).
 *
 * Pure string functions: the caller owns the socket and moves the HTTP heads
 * across it (see SocketReader::read_http_head()).
 */

#ifndef WSCHAT_HANDSHAKE_HPP_
#define WSCHAT_HANDSHAKE_HPP_

#include "vocabulary.hpp"

#include <cstddef>

#include <string>
#include <string_view>

namespace wschat {
namespace handshake {

static constexpr std::string_view kGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
static constexpr size_t kMaxHeadSize = 8192;
static constexpr size_t kNonceSize = 16;

// base64(SHA1(key + GUID))
std::string compute_accept_key(std::string_view client_key);

// ---------------------------------------------------------------------------
// Server side
// ---------------------------------------------------------------------------

struct UpgradeRequest {
  std::string path;
  std::string host;
  std::string key;  // Sec-WebSocket-Key, validated to encode 16 bytes
};

/**
 * @brief Parses a client upgrade request head.
 *
 * kHandshakeFailed if the request line is not "GET <path> HTTP/1.1" or the
 * Upgrade/Connection headers do not ask for websocket; kMissingKey if
 * Sec-WebSocket-Key is absent or does not decode to a 16-byte nonce.
 */
expected<UpgradeRequest, ErrorCode> parse_upgrade_request(std::string_view head);

// "HTTP/1.1 101 Switching Protocols" with Sec-WebSocket-Accept.
std::string build_upgrade_response(std::string_view client_key);

// Sent before closing a socket whose handshake was rejected.
std::string build_rejection_response(ErrorCode reason);

// ---------------------------------------------------------------------------
// Client side
// ---------------------------------------------------------------------------

// Random 16-byte nonce, base64 encoded.
std::string generate_client_key();

std::string build_upgrade_request(std::string_view host, std::string_view path,
                                  std::string_view client_key);

/**
 * @brief Checks the server's response head against the key we sent.
 *
 * kHandshakeFailed if the status is not 101; kAcceptMismatch if
 * Sec-WebSocket-Accept is absent or differs from compute_accept_key().
 */
Status verify_upgrade_response(std::string_view head, std::string_view client_key);

}  // namespace handshake
}  // namespace wschat

#endif  // WSCHAT_HANDSHAKE_HPP_
