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

#ifndef WSCHAT_SOCKET_IO_HPP_
#define WSCHAT_SOCKET_IO_HPP_

#include "frame.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <sockpp/stream_socket.h>
#include <string>
#include <vector>

namespace wschat {

// ============================================================================
// SocketReader (buffered blocking reads from a stream socket)
// ============================================================================

/**
 * @brief ByteSource over a connected socket.
 *
 * The HTTP head and the frames that follow it share one buffer, so bytes a
 * peer sends right after its handshake are not lost. Only the thread that
 * owns the connection may read through it.
 */
class SocketReader final : public ws::ByteSource {
 public:
  static constexpr size_t kChunkSize = 4096;

  explicit SocketReader(sockpp::stream_socket& sock) : sock_(sock) {}

  Status read_exact(uint8_t* buf, size_t len) override;

  // Returns the request/status line and headers up to and including the
  // blank line. kHandshakeFailed if `max_size` bytes arrive without one.
  expected<std::string, ErrorCode> read_http_head(size_t max_size);

  size_t buffered() const { return buf_.size() - pos_; }

 private:
  sockpp::stream_socket& sock_;
  std::vector<uint8_t> buf_;
  size_t pos_ = 0;

  // One read() into the buffer. kConnectionClosed on orderly EOF.
  Status fill();
  void compact();
};

// Writes all bytes to fd without raising SIGPIPE. A send timeout configured
// on the socket surfaces as kTimeout.
Status send_all(int fd, const uint8_t* data, size_t len);

inline Status send_all(int fd, const std::vector<uint8_t>& bytes) {
  return send_all(fd, bytes.data(), bytes.size());
}

inline Status send_all(int fd, const std::string& text) {
  return send_all(fd, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

}  // namespace wschat

#endif  // WSCHAT_SOCKET_IO_HPP_
