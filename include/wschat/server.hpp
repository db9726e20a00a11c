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

#ifndef WSCHAT_SERVER_HPP_
#define WSCHAT_SERVER_HPP_

#include "connection.hpp"
#include "frame.hpp"
#include "registry.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <sockpp/tcp_acceptor.h>
#include <string>
#include <string_view>
#include <unordered_map>

namespace wschat {

// ============================================================================
// TCP Tuning Configuration
// ============================================================================

struct TcpTuning {
  bool tcp_nodelay = true;      // Chat lines are small; do not wait for Nagle
  bool so_keepalive = false;    // Enable TCP keepalive

  // Keepalive parameters (Linux-specific, effective when so_keepalive=true)
  int keepalive_idle_s = 60;      // Seconds before first keepalive probe
  int keepalive_interval_s = 10;  // Seconds between probes
  int keepalive_count = 5;        // Max probes before dropping connection
};

// ============================================================================
// ServerStats - Atomic counters
// ============================================================================

struct ServerStats {
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> active_connections{0};
  std::atomic<uint64_t> handshake_errors{0};
  std::atomic<uint64_t> frame_errors{0};
  std::atomic<uint64_t> socket_errors{0};
  std::atomic<uint64_t> messages_in{0};
  std::atomic<uint64_t> messages_out{0};

  void reset() {
    total_connections = 0;
    active_connections = 0;
    handshake_errors = 0;
    frame_errors = 0;
    socket_errors = 0;
    messages_in = 0;
    messages_out = 0;
  }
};

// ============================================================================
// Server (blocking accept loop, one handler thread per connection)
// ============================================================================

/**
 * @brief Broadcast chat server.
 *
 * Each accepted socket gets its own detached handler thread, which performs
 * the upgrade, reads the display name from the first TEXT frame, registers
 * the member and relays every further TEXT frame to all other members as
 * "<name>: <text>". The accept loop never waits on a handler.
 *
 * Usage:
 *   wschat::Server server(8000, "127.0.0.1");
 *   std::thread t([&] { server.run(); });
 *   ...
 *   server.stop();
 *   t.join();
 */
class Server {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  // Binds and listens immediately; throws std::runtime_error on failure.
  // Port 0 picks an ephemeral port, see port().
  explicit Server(uint16_t port, const std::string& bind_addr = "");
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Accept loop. Blocks until stop(), then closes every connection and
  // returns once the handlers are gone (or the grace period ran out twice).
  void run();

  // Safe from any thread, including a signal-waiting one.
  void stop();

  bool is_running() const { return is_running_.load(); }

  uint16_t port() const { return port_; }

  // --- Configuration ---

  Server& set_tcp_tuning(const TcpTuning& tuning) {
    tcp_tuning_ = tuning;
    return *this;
  }

  Server& set_handshake_timeout_ms(int timeout) {
    handshake_timeout_ = std::chrono::milliseconds(timeout);
    return *this;
  }

  Server& set_send_timeout_ms(int timeout) {
    send_timeout_ = std::chrono::milliseconds(timeout);
    return *this;
  }

  Server& set_max_payload_size(uint64_t max) {
    decode_options_.max_payload = max;
    return *this;
  }

  Server& set_require_masked_frames(bool enable) {
    decode_options_.require_masked = enable;
    return *this;
  }

  Server& set_shutdown_grace_ms(int grace) {
    shutdown_grace_ = std::chrono::milliseconds(grace);
    return *this;
  }

  // --- Observers (called on handler threads) ---

  std::function<void(const ConnPtr&, const std::string&)> on_join;
  std::function<void(const ConnPtr&, std::string_view)> on_message;
  std::function<void(const ConnPtr&, const std::string&)> on_leave;

  // --- Chat operations ---

  // Sends `message` as a TEXT frame to every member except `sender_id`.
  // Recipients whose write fails are unregistered and shut down; the
  // remaining recipients are unaffected. Returns the number reached.
  size_t broadcast(uint64_t sender_id, const std::string& message);

  ConnectionRegistry& registry() { return registry_; }
  const ConnectionRegistry& registry() const { return registry_; }

  const ServerStats& stats() const { return stats_; }
  void reset_stats() { stats_.reset(); }

 private:
  uint16_t port_;
  std::string bind_addr_;
  sockpp::tcp_acceptor acceptor_;
  int listen_fd_ = -1;

  std::atomic<bool> is_running_{false};
  std::atomic<bool> stop_requested_{false};
  std::mutex listen_mutex_;  // guards listen_fd_ against shutdown-after-close
  bool listen_closed_ = false;

  TcpTuning tcp_tuning_;
  std::chrono::milliseconds handshake_timeout_{5000};
  std::chrono::milliseconds send_timeout_{5000};
  std::chrono::milliseconds shutdown_grace_{1000};
  ws::DecodeOptions decode_options_{true, ws::kDefaultMaxPayload};

  ConnectionRegistry registry_;
  ServerStats stats_;

  // Every connection with a live handler, joined or not.
  std::mutex live_mutex_;
  std::condition_variable live_cv_;
  std::unordered_map<uint64_t, ConnPtr> live_;

  void handle_connection(const ConnPtr& conn);
  expected<std::string, ErrorCode> await_display_name(const ConnPtr& conn);
  void serve_member(const ConnPtr& conn, const std::string& name);
  bool answer_control_frame(const ConnPtr& conn, const ws::Frame& frame);

  void track(const ConnPtr& conn);
  void untrack(uint64_t id);
  bool wait_for_handlers(std::chrono::milliseconds timeout);
  void shutdown_connections();
  void close_listener();
  void apply_tcp_tuning(int fd);
};

}  // namespace wschat

#endif  // WSCHAT_SERVER_HPP_
