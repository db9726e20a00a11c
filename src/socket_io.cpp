#include "wschat/socket_io.hpp"

#include <cerrno>
#include <cstring>

#include <algorithm>
#include <string_view>
#include <sys/socket.h>

namespace wschat {

Status SocketReader::fill() {
  uint8_t temp[kChunkSize];

  while (true) {
    ssize_t n = sock_.read(temp, sizeof(temp));
    if (n > 0) {
      compact();
      buf_.insert(buf_.end(), temp, temp + n);
      return Status::success();
    }
    if (n == 0) {
      return Status::error(ErrorCode::kConnectionClosed);
    }

    int err = sock_.last_error();
    if (err == EINTR) {
      continue;
    }
    if (err == EAGAIN || err == EWOULDBLOCK) {
      return Status::error(ErrorCode::kTimeout);
    }
    return Status::error(ErrorCode::kSocketError);
  }
}

void SocketReader::compact() {
  if (pos_ == 0) {
    return;
  }
  buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(pos_));
  pos_ = 0;
}

Status SocketReader::read_exact(uint8_t* buf, size_t len) {
  size_t copied = 0;
  while (copied < len) {
    if (buffered() == 0) {
      auto r = fill();
      if (!r) {
        // EOF mid-frame (or before one) is a truncated frame for the decoder.
        return r.get_error() == ErrorCode::kConnectionClosed
                   ? Status::error(ErrorCode::kFrameTruncated)
                   : r;
      }
    }
    size_t n = std::min(len - copied, buffered());
    std::memcpy(buf + copied, buf_.data() + pos_, n);
    pos_ += n;
    copied += n;
  }
  return Status::success();
}

expected<std::string, ErrorCode> SocketReader::read_http_head(size_t max_size) {
  using Result = expected<std::string, ErrorCode>;
  constexpr std::string_view kTerminator = "\r\n\r\n";

  size_t scanned = 0;
  while (true) {
    std::string_view pending(reinterpret_cast<const char*>(buf_.data() + pos_), buffered());
    size_t from = scanned >= kTerminator.size() ? scanned - kTerminator.size() + 1 : 0;
    size_t end = pending.find(kTerminator, from);
    if (end != std::string_view::npos) {
      size_t head_len = end + kTerminator.size();
      std::string head(pending.substr(0, head_len));
      pos_ += head_len;
      return Result::success(std::move(head));
    }
    if (pending.size() >= max_size) {
      return Result::error(ErrorCode::kHandshakeFailed);
    }
    scanned = pending.size();

    auto r = fill();
    if (!r) {
      return Result::error(r.get_error());
    }
  }
}

Status send_all(int fd, const uint8_t* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    int err = errno;
    if (n < 0 && err == EINTR) {
      continue;
    }
    if (n < 0 && (err == EAGAIN || err == EWOULDBLOCK)) {
      return Status::error(ErrorCode::kTimeout);
    }
    return Status::error(ErrorCode::kSocketError);
  }
  return Status::success();
}

}  // namespace wschat
