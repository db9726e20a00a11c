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

#ifndef WSCHAT_CLIENT_HPP_
#define WSCHAT_CLIENT_HPP_

#include "frame.hpp"
#include "socket_io.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <sockpp/tcp_connector.h>
#include <string>
#include <string_view>
#include <thread>

namespace wschat {

// ============================================================================
// ChatClient
// ============================================================================

/**
 * @brief Interactive chat client.
 *
 * connect() upgrades the socket, sends the display name and starts the
 * inbound thread. run() is the outbound flow: it reads lines from a file
 * descriptor and sends each as a TEXT frame until the exit command, EOF, or
 * the inbound side going away.
 *
 * Callbacks run on the inbound thread and must be set before connect().
 */
class ChatClient {
 public:
  static constexpr const char* kDefaultExitCommand = "/exit";

  ChatClient() = default;
  ~ChatClient();

  ChatClient(const ChatClient&) = delete;
  ChatClient& operator=(const ChatClient&) = delete;

  // --- Configuration ---

  ChatClient& set_close_timeout_ms(int timeout) {
    close_timeout_ = std::chrono::milliseconds(timeout);
    return *this;
  }

  ChatClient& set_handshake_timeout_ms(int timeout) {
    handshake_timeout_ = std::chrono::milliseconds(timeout);
    return *this;
  }

  ChatClient& set_exit_command(std::string command) {
    exit_command_ = std::move(command);
    return *this;
  }

  ChatClient& set_path(std::string path) {
    path_ = std::move(path);
    return *this;
  }

  // --- Callbacks ---

  std::function<void(std::string_view)> on_message;
  std::function<void(std::string_view)> on_pong;
  std::function<void()> on_disconnect;

  // --- Session ---

  // TCP connect, upgrade, announce `display_name`, start receiving.
  Status connect(const std::string& host, uint16_t port, const std::string& display_name);

  // Outbound flow on the caller's thread. Returns once the session is over.
  void run(int input_fd);

  Status send_text(std::string_view text);
  Status send_ping(std::string_view payload = "");

  // Sends CLOSE 1000, waits up to the close timeout for the echo, then stops.
  void close();

  // Tears the session down without the closing handshake.
  void stop();

  bool is_connected() const { return connected_.load(); }
  bool is_running() const { return running_.load(); }

 private:
  sockpp::tcp_connector conn_;
  SocketReader reader_{conn_};
  int fd_ = -1;

  std::string path_ = "/";
  std::string exit_command_ = kDefaultExitCommand;
  std::chrono::milliseconds close_timeout_{2000};
  std::chrono::milliseconds handshake_timeout_{5000};

  std::mutex write_mutex_;
  std::atomic<bool> connected_{false};
  std::atomic<bool> running_{false};
  std::atomic<bool> close_sent_{false};

  std::mutex close_mutex_;
  std::condition_variable close_cv_;
  bool close_received_ = false;

  std::thread inbound_;
  std::mutex join_mutex_;

  Status handshake(const std::string& host_header);
  void inbound_loop();
  Status write_frame(ws::OpCode opcode, std::string_view payload);
  bool handle_line(std::string_view line);
  void join_inbound();
};

}  // namespace wschat

#endif  // WSCHAT_CLIENT_HPP_
