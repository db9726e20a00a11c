#include "wschat/server.hpp"

#include "wschat/log.hpp"

#include <cerrno>
#include <cstring>

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sockpp/inet_address.h>
#include <stdexcept>
#include <sys/socket.h>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

// Exception support for -fno-exceptions builds
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define WSCHAT_THROW(ex) throw(ex)
#else
#include <cstdio>
#include <cstdlib>
#define WSCHAT_THROW(ex)          \
  do {                            \
    std::fputs(#ex "\n", stderr); \
    std::abort();                 \
  } while (0)
#endif

namespace wschat {

Server::Server(uint16_t port, const std::string& bind_addr) : port_(port), bind_addr_(bind_addr) {
  sockpp::inet_address addr;
  if (bind_addr_.empty()) {
    addr = sockpp::inet_address(port_);
  } else {
    try {
      addr = sockpp::inet_address(bind_addr_, port_);
    } catch (const std::exception& e) {
      WSCHAT_THROW(std::runtime_error("Failed to resolve bind address " + bind_addr_ + ": " + e.what()));
    }
  }

  if (!acceptor_.open(addr)) {
    WSCHAT_THROW(std::runtime_error("Failed to bind port " + std::to_string(port_) + ": " +
                                    acceptor_.last_error_str()));
  }

  listen_fd_ = acceptor_.handle();
  port_ = acceptor_.address().port();

  WSCHAT_LOG_INFO("Server listening on " + acceptor_.address().to_string());
}

Server::~Server() {
  stop();
  // Handler threads are detached and hold `this`; outlive them.
  std::unique_lock<std::mutex> lock(live_mutex_);
  live_cv_.wait(lock, [this] { return live_.empty(); });
}

void Server::run() {
  is_running_ = true;
  WSCHAT_LOG_INFO("Server accepting on port " + std::to_string(port_));

  while (!stop_requested_) {
    sockpp::inet_address peer;
    sockpp::tcp_socket sock = acceptor_.accept(&peer);
    if (!sock) {
      if (stop_requested_) {
        break;
      }
      int err = acceptor_.last_error();
      if (err == EINTR || err == ECONNABORTED) {
        continue;
      }
      WSCHAT_LOG_WARN("accept() failed: " + acceptor_.last_error_str());
      stats_.socket_errors++;
      continue;
    }

    apply_tcp_tuning(sock.handle());
    auto conn = std::make_shared<Connection>(std::move(sock), peer.to_string());
    if (!conn->set_send_timeout(send_timeout_)) {
      WSCHAT_LOG_WARN("conn #" + std::to_string(conn->get_id()) + " cannot set send timeout");
    }

    stats_.total_connections++;
    track(conn);
    WSCHAT_LOG_INFO("New connection #" + std::to_string(conn->get_id()) + " from " + conn->peer());

    try {
      std::thread([this, conn] { handle_connection(conn); }).detach();
    } catch (const std::system_error& e) {
      WSCHAT_LOG_ERROR("conn #" + std::to_string(conn->get_id()) + " no handler thread: " + e.what());
      stats_.socket_errors++;
      untrack(conn->get_id());
      conn->close();
    }
  }

  close_listener();
  shutdown_connections();

  is_running_ = false;
  WSCHAT_LOG_INFO("Server stopped");
}

void Server::stop() {
  stop_requested_ = true;
  std::lock_guard<std::mutex> lock(listen_mutex_);
  if (!listen_closed_ && listen_fd_ >= 0) {
    // Wakes the blocked accept(); the descriptor itself is closed by run().
    ::shutdown(listen_fd_, SHUT_RDWR);
  }
}

void Server::close_listener() {
  std::lock_guard<std::mutex> lock(listen_mutex_);
  if (!listen_closed_) {
    acceptor_.close();
    listen_closed_ = true;
  }
}

// ============================================================================
// Shutdown
// ============================================================================

void Server::shutdown_connections() {
  std::vector<ConnPtr> pending;
  {
    std::lock_guard<std::mutex> lock(live_mutex_);
    pending.reserve(live_.size());
    for (const auto& kv : live_) {
      pending.push_back(kv.second);
    }
  }

  const std::string going_away = ws::make_close_payload(ws::kCloseGoingAway);
  for (const auto& conn : pending) {
    if (!registry_.contains(conn->get_id())) {
      conn->close();
      continue;
    }
    auto r = conn->send_close(going_away);
    if (!r && r.get_error() != ErrorCode::kInvalidState) {
      conn->close();
    }
  }

  if (wait_for_handlers(shutdown_grace_)) {
    return;
  }

  WSCHAT_LOG_WARN("Shutdown grace period expired, forcing remaining connections closed");
  {
    std::lock_guard<std::mutex> lock(live_mutex_);
    for (const auto& kv : live_) {
      kv.second->close();
    }
  }
  if (!wait_for_handlers(shutdown_grace_)) {
    WSCHAT_LOG_ERROR("Connection handlers still running after forced close");
  }
}

bool Server::wait_for_handlers(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(live_mutex_);
  return live_cv_.wait_for(lock, timeout, [this] { return live_.empty(); });
}

void Server::track(const ConnPtr& conn) {
  std::lock_guard<std::mutex> lock(live_mutex_);
  live_.emplace(conn->get_id(), conn);
  stats_.active_connections++;
}

void Server::untrack(uint64_t id) {
  std::lock_guard<std::mutex> lock(live_mutex_);
  if (live_.erase(id) > 0) {
    stats_.active_connections--;
  }
  // Notify under the lock: the destructor may run as soon as it can observe empty.
  live_cv_.notify_all();
}

// ============================================================================
// Per-connection handler
// ============================================================================

void Server::handle_connection(const ConnPtr& conn) {
  const uint64_t id = conn->get_id();
  ScopeGuard untrack_guard([this, id] { untrack(id); });

  auto hs = conn->accept_handshake(handshake_timeout_);
  if (!hs) {
    stats_.handshake_errors++;
    WSCHAT_LOG_WARN("conn #" + std::to_string(id) + " handshake failed: " + to_string(hs.get_error()));
    conn->close();
    return;
  }

  auto name = await_display_name(conn);
  if (!name) {
    WSCHAT_LOG_INFO("conn #" + std::to_string(id) + " left before joining: " + to_string(name.get_error()));
    conn->close();
    return;
  }

  serve_member(conn, name.value());
}

expected<std::string, ErrorCode> Server::await_display_name(const ConnPtr& conn) {
  while (true) {
    auto frame = conn->read_frame(decode_options_);
    if (!frame) {
      if (frame.get_error() == ErrorCode::kProtocolViolation) {
        stats_.frame_errors++;
      }
      return expected<std::string, ErrorCode>::error(frame.get_error());
    }

    switch (frame->opcode) {
      case ws::OpCode::kText:
        if (frame->payload.empty()) {
          return expected<std::string, ErrorCode>::success("guest-" + std::to_string(conn->get_id()));
        }
        return expected<std::string, ErrorCode>::success(std::move(frame->payload));
      case ws::OpCode::kClose:
        answer_control_frame(conn, frame.value());
        return expected<std::string, ErrorCode>::error(ErrorCode::kConnectionClosed);
      default:
        answer_control_frame(conn, frame.value());
        break;
    }
  }
}

void Server::serve_member(const ConnPtr& conn, const std::string& name) {
  const uint64_t id = conn->get_id();

  if (!registry_.register_connection(conn, name)) {
    WSCHAT_LOG_ERROR("conn #" + std::to_string(id) + " registered twice");
    conn->close();
    return;
  }
  WSCHAT_LOG_INFO("conn #" + std::to_string(id) + " joined as '" + name + "'");
  if (on_join) {
    on_join(conn, name);
  }
  broadcast(id, name + " joined the chat");

  while (true) {
    auto frame = conn->read_frame(decode_options_);
    if (!frame) {
      ErrorCode err = frame.get_error();
      if (err == ErrorCode::kProtocolViolation) {
        stats_.frame_errors++;
        WSCHAT_LOG_WARN("conn #" + std::to_string(id) + " protocol violation, dropping");
      } else {
        WSCHAT_LOG_DEBUG("conn #" + std::to_string(id) + " read ended: " + to_string(err));
      }
      break;
    }

    if (frame->opcode == ws::OpCode::kText) {
      stats_.messages_in++;
      if (on_message) {
        on_message(conn, frame->payload);
      }
      broadcast(id, name + ": " + frame->payload);
      continue;
    }
    if (!answer_control_frame(conn, frame.value())) {
      break;
    }
  }

  registry_.unregister_connection(id);
  broadcast(id, name + " has left the chat");
  WSCHAT_LOG_INFO("conn #" + std::to_string(id) + " ('" + name + "') disconnected");
  if (on_leave) {
    on_leave(conn, name);
  }
  conn->close();
}

// Returns false once the peer asked to close.
bool Server::answer_control_frame(const ConnPtr& conn, const ws::Frame& frame) {
  switch (frame.opcode) {
    case ws::OpCode::kPing: {
      auto r = conn->send_pong(frame.payload);
      if (!r && r.get_error() != ErrorCode::kInvalidState) {
        WSCHAT_LOG_DEBUG("conn #" + std::to_string(conn->get_id()) + " PONG failed: " +
                         to_string(r.get_error()));
      }
      return true;
    }
    case ws::OpCode::kClose: {
      // kInvalidState means our own CLOSE went out first; nothing to echo.
      auto r = conn->send_close(frame.payload);
      if (!r && r.get_error() != ErrorCode::kInvalidState) {
        WSCHAT_LOG_DEBUG("conn #" + std::to_string(conn->get_id()) + " CLOSE echo failed: " +
                         to_string(r.get_error()));
      }
      return false;
    }
    case ws::OpCode::kPong:
      return true;
    default:
      WSCHAT_LOG_DEBUG("conn #" + std::to_string(conn->get_id()) + " ignoring " + ws::to_string(frame.opcode) +
                       " frame");
      return true;
  }
}

// ============================================================================
// Broadcast
// ============================================================================

size_t Server::broadcast(uint64_t sender_id, const std::string& message) {
  auto recipients = registry_.snapshot(sender_id);
  if (recipients.empty()) {
    return 0;
  }

  const std::vector<uint8_t> frame = ws::encode_frame(ws::OpCode::kText, message, false);
  size_t delivered = 0;
  for (const auto& entry : recipients) {
    auto r = entry.conn->send_encoded(frame);
    if (r) {
      ++delivered;
      stats_.messages_out++;
      continue;
    }
    if (r.get_error() == ErrorCode::kInvalidState) {
      continue;  // already closing
    }
    WSCHAT_LOG_WARN("broadcast to conn #" + std::to_string(entry.conn->get_id()) + " ('" +
                    entry.display_name + "') failed: " + to_string(r.get_error()));
    stats_.socket_errors++;
    registry_.unregister_connection(entry.conn->get_id());
    entry.conn->close();
  }
  return delivered;
}

// ============================================================================
// TCP tuning
// ============================================================================

void Server::apply_tcp_tuning(int fd) {
  auto set_opt = [fd](int level, int name, int value, const char* label) {
    if (::setsockopt(fd, level, name, &value, sizeof(value)) != 0) {
      WSCHAT_LOG_DEBUG(std::string(label) + ": " + std::strerror(errno));
      return false;
    }
    return true;
  };

  if (tcp_tuning_.tcp_nodelay) {
    set_opt(IPPROTO_TCP, TCP_NODELAY, 1, "TCP_NODELAY");
  }

  if (tcp_tuning_.so_keepalive && set_opt(SOL_SOCKET, SO_KEEPALIVE, 1, "SO_KEEPALIVE")) {
#ifdef TCP_KEEPIDLE
    set_opt(IPPROTO_TCP, TCP_KEEPIDLE, tcp_tuning_.keepalive_idle_s, "TCP_KEEPIDLE");
#endif
#ifdef TCP_KEEPINTVL
    set_opt(IPPROTO_TCP, TCP_KEEPINTVL, tcp_tuning_.keepalive_interval_s, "TCP_KEEPINTVL");
#endif
#ifdef TCP_KEEPCNT
    set_opt(IPPROTO_TCP, TCP_KEEPCNT, tcp_tuning_.keepalive_count, "TCP_KEEPCNT");
#endif
  }
}

}  // namespace wschat
