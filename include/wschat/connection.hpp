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

#ifndef WSCHAT_CONNECTION_HPP_
#define WSCHAT_CONNECTION_HPP_

#include "frame.hpp"
#include "socket_io.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <sockpp/tcp_socket.h>
#include <string>
#include <string_view>
#include <vector>

namespace wschat {

// ============================================================================
// Connection states
// ============================================================================

enum class ConnectionState : uint8_t {
  kHandshaking,  // waiting for the HTTP upgrade request
  kOpen,         // WebSocket established
  kClosing,      // CLOSE sent, waiting for the peer or teardown
  kClosed        // socket shut down
};

const char* to_string(ConnectionState state) noexcept;

// ============================================================================
// Connection (one accepted socket on the server side)
// ============================================================================

/**
 * @brief Server side of one WebSocket connection.
 *
 * Exactly one handler thread reads from a Connection. Any thread may write to
 * it: the frame writers share one mutex, so a broadcast and the handler's own
 * PONG never interleave bytes on the wire. The descriptor is closed only when
 * the last owner drops its reference; close() merely shuts the socket down,
 * which wakes a blocked reader without racing other writers.
 */
class Connection {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  explicit Connection(sockpp::tcp_socket&& sock, std::string peer = "");
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  uint64_t get_id() const { return id_; }
  const std::string& peer() const { return peer_; }
  ConnectionState get_state() const { return state_.load(std::memory_order_acquire); }
  bool is_open() const { return get_state() == ConnectionState::kOpen; }

  // --- Handler-thread API ---

  // Reads the upgrade request and answers 101, or 400 on rejection.
  // Moves HANDSHAKING -> OPEN on success.
  Status accept_handshake(std::chrono::milliseconds timeout);

  expected<ws::Frame, ErrorCode> read_frame(const ws::DecodeOptions& options);

  // --- Any-thread API ---

  // TEXT frame; kInvalidState unless OPEN.
  Status send_text(std::string_view text);

  // Pre-encoded data frame shared by every recipient of a broadcast.
  Status send_encoded(const std::vector<uint8_t>& frame);

  Status send_pong(std::string_view payload);

  // Sends CLOSE and moves OPEN -> CLOSING. kInvalidState if a CLOSE was
  // already sent, which is how the handler knows not to echo.
  Status send_close(std::string_view payload);

  // Shuts the socket down in both directions and moves to CLOSED.
  void close();

  // Validated state transition. Returns false for an illegal move.
  bool transition_to_state(ConnectionState next);

  // Socket options applied by the server before the handler starts.
  bool set_send_timeout(std::chrono::milliseconds timeout);
  int native_handle() const { return fd_; }

 private:
  uint64_t id_;
  sockpp::tcp_socket socket_;
  int fd_;
  std::string peer_;
  SocketReader reader_;

  std::atomic<ConnectionState> state_{ConnectionState::kHandshaking};
  std::mutex write_mutex_;

  Status write_frame(ws::OpCode opcode, std::string_view payload);
  Status write_bytes(const std::vector<uint8_t>& bytes, bool require_open);
};

}  // namespace wschat

#endif  // WSCHAT_CONNECTION_HPP_
