#include "wschat/connection.hpp"

#include "wschat/handshake.hpp"
#include "wschat/log.hpp"

#include <sys/socket.h>

namespace wschat {

static std::atomic<uint64_t> g_next_conn_id{1};

const char* to_string(ConnectionState state) noexcept {
  switch (state) {
    case ConnectionState::kHandshaking:
      return "HANDSHAKING";
    case ConnectionState::kOpen:
      return "OPEN";
    case ConnectionState::kClosing:
      return "CLOSING";
    case ConnectionState::kClosed:
      return "CLOSED";
  }
  return "UNKNOWN";
}

Connection::Connection(sockpp::tcp_socket&& sock, std::string peer)
    : id_(g_next_conn_id.fetch_add(1, std::memory_order_relaxed)),
      socket_(std::move(sock)),
      fd_(socket_.handle()),
      peer_(std::move(peer)),
      reader_(socket_) {}

Connection::~Connection() {
  if (socket_.is_open()) {
    socket_.close();
  }
}

bool Connection::transition_to_state(ConnectionState next) {
  ConnectionState current = get_state();
  while (true) {
    bool allowed = false;
    switch (next) {
      case ConnectionState::kHandshaking:
        allowed = false;
        break;
      case ConnectionState::kOpen:
        allowed = current == ConnectionState::kHandshaking;
        break;
      case ConnectionState::kClosing:
        allowed = current == ConnectionState::kOpen;
        break;
      case ConnectionState::kClosed:
        allowed = current != ConnectionState::kClosed;
        break;
    }
    if (!allowed) {
      return false;
    }
    if (state_.compare_exchange_weak(current, next, std::memory_order_acq_rel)) {
      WSCHAT_LOG_DEBUG("conn #" + std::to_string(id_) + " " + to_string(current) + " -> " +
                       to_string(next));
      return true;
    }
  }
}

Status Connection::accept_handshake(std::chrono::milliseconds timeout) {
  if (get_state() != ConnectionState::kHandshaking) {
    return Status::error(ErrorCode::kInvalidState);
  }

  if (!socket_.read_timeout(timeout)) {
    WSCHAT_LOG_WARN("conn #" + std::to_string(id_) + " cannot set handshake timeout: " +
                    socket_.last_error_str());
  }
  auto head = reader_.read_http_head(handshake::kMaxHeadSize);
  if (!socket_.read_timeout(std::chrono::microseconds(0))) {
    return Status::error(ErrorCode::kSocketError);
  }
  if (!head) {
    return Status::error(head.get_error());
  }

  auto request = handshake::parse_upgrade_request(head.value());
  if (!request) {
    // Best effort: the peer is about to be dropped either way.
    auto rejected = send_all(fd_, handshake::build_rejection_response(request.get_error()));
    if (!rejected) {
      WSCHAT_LOG_DEBUG("conn #" + std::to_string(id_) + " 400 not delivered: " +
                       to_string(rejected.get_error()));
    }
    return Status::error(request.get_error());
  }

  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto r = send_all(fd_, handshake::build_upgrade_response(request->key));
    if (!r) {
      return r;
    }
  }

  transition_to_state(ConnectionState::kOpen);
  return Status::success();
}

expected<ws::Frame, ErrorCode> Connection::read_frame(const ws::DecodeOptions& options) {
  return ws::decode_frame(reader_, options);
}

Status Connection::send_text(std::string_view text) {
  return write_bytes(ws::encode_frame(ws::OpCode::kText, text, false), true);
}

Status Connection::send_encoded(const std::vector<uint8_t>& frame) {
  return write_bytes(frame, true);
}

Status Connection::send_pong(std::string_view payload) {
  return write_frame(ws::OpCode::kPong, payload);
}

Status Connection::send_close(std::string_view payload) {
  if (!transition_to_state(ConnectionState::kClosing)) {
    return Status::error(ErrorCode::kInvalidState);
  }
  return write_bytes(ws::encode_frame(ws::OpCode::kClose, payload, false), false);
}

void Connection::close() {
  transition_to_state(ConnectionState::kClosed);
  // The descriptor stays valid until destruction, so this never hits a reused fd.
  ::shutdown(fd_, SHUT_RDWR);
}

bool Connection::set_send_timeout(std::chrono::milliseconds timeout) {
  return socket_.write_timeout(timeout);
}

Status Connection::write_frame(ws::OpCode opcode, std::string_view payload) {
  if (ws::is_control(opcode) && payload.size() > ws::kMaxControlPayload) {
    return Status::error(ErrorCode::kProtocolViolation);
  }
  return write_bytes(ws::encode_frame(opcode, payload, false), true);
}

Status Connection::write_bytes(const std::vector<uint8_t>& bytes, bool require_open) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (require_open && get_state() != ConnectionState::kOpen) {
    return Status::error(ErrorCode::kInvalidState);
  }
  return send_all(fd_, bytes);
}

}  // namespace wschat
