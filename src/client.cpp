#include "wschat/client.hpp"

#include "wschat/handshake.hpp"
#include "wschat/log.hpp"
#include "wschat/utils.hpp"

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sockpp/inet_address.h>
#include <sys/socket.h>
#include <unistd.h>

namespace wschat {

namespace {

constexpr int kInputPollMs = 100;

}  // namespace

ChatClient::~ChatClient() {
  stop();
  join_inbound();
}

// ============================================================================
// Connect
// ============================================================================

Status ChatClient::connect(const std::string& host, uint16_t port, const std::string& display_name) {
  if (running_ || conn_.is_open()) {
    return Status::error(ErrorCode::kInvalidState);
  }

  sockpp::inet_address addr;
  try {
    addr = sockpp::inet_address(host, port);
  } catch (const std::exception& e) {
    WSCHAT_LOG_ERROR("Cannot resolve " + host + ": " + e.what());
    return Status::error(ErrorCode::kSocketError);
  }

  if (!conn_.connect(addr)) {
    WSCHAT_LOG_ERROR("Cannot connect to " + addr.to_string() + ": " + conn_.last_error_str());
    return Status::error(ErrorCode::kSocketError);
  }
  fd_ = conn_.handle();

  auto hs = handshake(host + ":" + std::to_string(port));
  if (!hs) {
    WSCHAT_LOG_ERROR("Handshake with " + addr.to_string() + " failed: " + to_string(hs.get_error()));
    if (!conn_.close()) {
      WSCHAT_LOG_DEBUG("close: " + conn_.last_error_str());
    }
    fd_ = -1;
    return hs;
  }

  connected_ = true;
  running_ = true;

  auto announced = write_frame(ws::OpCode::kText, display_name);
  if (!announced) {
    WSCHAT_LOG_ERROR("Cannot send display name: " + std::string(to_string(announced.get_error())));
    connected_ = false;
    stop();
    return announced;
  }

  inbound_ = std::thread(&ChatClient::inbound_loop, this);
  WSCHAT_LOG_INFO("Connected to " + addr.to_string() + " as '" + display_name + "'");
  return Status::success();
}

Status ChatClient::handshake(const std::string& host_header) {
  if (!conn_.read_timeout(handshake_timeout_)) {
    WSCHAT_LOG_WARN("Cannot set handshake timeout: " + conn_.last_error_str());
  }

  const std::string key = handshake::generate_client_key();
  auto sent = send_all(fd_, handshake::build_upgrade_request(host_header, path_, key));
  if (!sent) {
    return sent;
  }

  auto head = reader_.read_http_head(handshake::kMaxHeadSize);
  if (!head) {
    return Status::error(head.get_error());
  }

  auto verified = handshake::verify_upgrade_response(head.value(), key);
  if (!verified) {
    return verified;
  }

  if (!conn_.read_timeout(std::chrono::microseconds(0))) {
    return Status::error(ErrorCode::kSocketError);
  }
  return Status::success();
}

// ============================================================================
// Inbound flow
// ============================================================================

void ChatClient::inbound_loop() {
  const ws::DecodeOptions options;

  while (running_) {
    auto frame = ws::decode_frame(reader_, options);
    if (!frame) {
      if (running_) {
        WSCHAT_LOG_DEBUG("Receive ended: " + std::string(to_string(frame.get_error())));
      }
      break;
    }

    if (frame->opcode == ws::OpCode::kText) {
      if (on_message) {
        on_message(frame->payload);
      }
    } else if (frame->opcode == ws::OpCode::kPing) {
      auto r = write_frame(ws::OpCode::kPong, frame->payload);
      if (!r) {
        WSCHAT_LOG_DEBUG("PONG failed: " + std::string(to_string(r.get_error())));
      }
    } else if (frame->opcode == ws::OpCode::kPong) {
      if (on_pong) {
        on_pong(frame->payload);
      }
    } else if (frame->opcode == ws::OpCode::kClose) {
      if (close_sent_.exchange(true)) {
        std::lock_guard<std::mutex> lock(close_mutex_);
        close_received_ = true;
      } else {
        WSCHAT_LOG_INFO("Server closed the connection (code " +
                        std::to_string(ws::parse_close_code(frame->payload)) + ")");
        auto r = write_frame(ws::OpCode::kClose, frame->payload);
        if (!r) {
          WSCHAT_LOG_DEBUG("CLOSE echo failed: " + std::string(to_string(r.get_error())));
        }
      }
      break;
    }
  }

  {
    std::lock_guard<std::mutex> lock(close_mutex_);
    connected_ = false;
    running_ = false;
  }
  close_cv_.notify_all();
  ::shutdown(fd_, SHUT_RDWR);
  if (on_disconnect) {
    on_disconnect();
  }
}

// ============================================================================
// Outbound flow
// ============================================================================

void ChatClient::run(int input_fd) {
  std::string pending;
  char buf[1024];

  while (running_) {
    pollfd pfd{input_fd, POLLIN, 0};
    int rc = ::poll(&pfd, 1, kInputPollMs);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      WSCHAT_LOG_ERROR(std::string("poll() on input failed: ") + std::strerror(errno));
      break;
    }
    if (rc == 0) {
      continue;
    }

    ssize_t n = ::read(input_fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      WSCHAT_LOG_ERROR(std::string("read() on input failed: ") + std::strerror(errno));
      close();
      break;
    }
    if (n == 0) {
      // EOF: flush an unterminated last line, then leave like /exit.
      if (pending.empty() || handle_line(pending)) {
        close();
      }
      break;
    }

    pending.append(buf, static_cast<size_t>(n));
    bool keep_going = true;
    size_t nl;
    while (keep_going && (nl = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, nl);
      pending.erase(0, nl + 1);
      keep_going = handle_line(line);
    }
    if (!keep_going) {
      break;
    }
  }

  stop();
  join_inbound();
}

// Returns false once the session should end.
bool ChatClient::handle_line(std::string_view line) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  std::string_view trimmed = trim(line);
  if (trimmed.empty()) {
    return true;
  }
  if (iequals(trimmed, exit_command_)) {
    close();
    return false;
  }

  auto r = send_text(line);
  if (!r) {
    WSCHAT_LOG_WARN("Send failed: " + std::string(to_string(r.get_error())));
    return false;
  }
  return true;
}

// ============================================================================
// Writers
// ============================================================================

Status ChatClient::send_text(std::string_view text) {
  if (close_sent_) {
    return Status::error(ErrorCode::kInvalidState);
  }
  return write_frame(ws::OpCode::kText, text);
}

Status ChatClient::send_ping(std::string_view payload) {
  if (payload.size() > ws::kMaxControlPayload) {
    return Status::error(ErrorCode::kProtocolViolation);
  }
  return write_frame(ws::OpCode::kPing, payload);
}

Status ChatClient::write_frame(ws::OpCode opcode, std::string_view payload) {
  if (!connected_) {
    return Status::error(ErrorCode::kInvalidState);
  }
  auto bytes = ws::encode_frame(opcode, payload, true);
  std::lock_guard<std::mutex> lock(write_mutex_);
  return send_all(fd_, bytes);
}

// ============================================================================
// Teardown
// ============================================================================

void ChatClient::close() {
  if (!close_sent_.exchange(true)) {
    auto r = write_frame(ws::OpCode::kClose, ws::make_close_payload(ws::kCloseNormal));
    if (r && std::this_thread::get_id() != inbound_.get_id()) {
      std::unique_lock<std::mutex> lock(close_mutex_);
      bool acked = close_cv_.wait_for(lock, close_timeout_, [this] { return close_received_ || !connected_; });
      if (!acked) {
        WSCHAT_LOG_WARN("No CLOSE acknowledgement within " + std::to_string(close_timeout_.count()) + " ms");
      }
    } else if (!r && r.get_error() != ErrorCode::kInvalidState) {
      WSCHAT_LOG_DEBUG("CLOSE failed: " + std::string(to_string(r.get_error())));
    }
  }
  stop();
  join_inbound();
}

void ChatClient::stop() {
  running_ = false;
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
  {
    std::lock_guard<std::mutex> lock(close_mutex_);
  }
  close_cv_.notify_all();
}

void ChatClient::join_inbound() {
  std::lock_guard<std::mutex> lock(join_mutex_);
  if (inbound_.joinable() && std::this_thread::get_id() != inbound_.get_id()) {
    inbound_.join();
  }
}

}  // namespace wschat
