#include "wschat/handshake.hpp"

#include "wschat/utils.hpp"

#include <cstdint>

namespace wschat {
namespace handshake {

namespace {

// Walks the header lines of an HTTP head, skipping the first line.
// Calls fn(name, value) for each "Name: value" line until the blank line.
template <typename Fn>
void for_each_header(std::string_view head, Fn&& fn) {
  size_t pos = head.find("\r\n");
  if (pos == std::string_view::npos) {
    return;
  }
  pos += 2;

  while (pos < head.size()) {
    size_t eol = head.find("\r\n", pos);
    if (eol == std::string_view::npos) {
      eol = head.size();
    }
    std::string_view line = head.substr(pos, eol - pos);
    if (line.empty()) {
      break;
    }
    size_t colon = line.find(':');
    if (colon != std::string_view::npos) {
      fn(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
    }
    pos = eol + 2;
  }
}

std::string_view first_line(std::string_view head) {
  return head.substr(0, head.find("\r\n"));
}

}  // namespace

std::string compute_accept_key(std::string_view client_key) {
  std::string key(client_key);
  key.append(kGuid);

  auto hash = SHA1::compute(key);
  return Base64::encode(hash.data(), hash.size());
}

expected<UpgradeRequest, ErrorCode> parse_upgrade_request(std::string_view head) {
  using Result = expected<UpgradeRequest, ErrorCode>;

  // "GET <path> HTTP/1.1"
  std::string_view request_line = first_line(head);
  size_t sp1 = request_line.find(' ');
  size_t sp2 = request_line.rfind(' ');
  if (sp1 == std::string_view::npos || sp1 == sp2 || request_line.substr(0, sp1) != "GET" ||
      request_line.substr(sp2 + 1) != "HTTP/1.1") {
    return Result::error(ErrorCode::kHandshakeFailed);
  }

  UpgradeRequest request;
  request.path = std::string(request_line.substr(sp1 + 1, sp2 - sp1 - 1));

  bool has_upgrade = false;
  bool has_connection = false;
  bool has_key = false;
  for_each_header(head, [&](std::string_view name, std::string_view value) {
    if (iequals(name, "Upgrade")) {
      has_upgrade = header_has_token(value, "websocket");
    } else if (iequals(name, "Connection")) {
      has_connection = header_has_token(value, "upgrade");
    } else if (iequals(name, "Host")) {
      request.host = std::string(value);
    } else if (iequals(name, "Sec-WebSocket-Key")) {
      request.key = std::string(value);
      has_key = true;
    }
  });

  if (!has_upgrade || !has_connection) {
    return Result::error(ErrorCode::kHandshakeFailed);
  }
  if (!has_key || Base64::decode(request.key).size() != kNonceSize) {
    return Result::error(ErrorCode::kMissingKey);
  }
  return Result::success(std::move(request));
}

std::string build_upgrade_response(std::string_view client_key) {
  std::string response =
      "HTTP/1.1 101 Switching Protocols\r\n"
      "Upgrade: websocket\r\n"
      "Connection: Upgrade\r\n"
      "Sec-WebSocket-Accept: ";
  response += compute_accept_key(client_key);
  response += "\r\n\r\n";
  return response;
}

std::string build_rejection_response(ErrorCode reason) {
  std::string body = to_string(reason);
  std::string response =
      "HTTP/1.1 400 Bad Request\r\n"
      "Connection: close\r\n"
      "Sec-WebSocket-Version: 13\r\n"
      "Content-Type: text/plain\r\n"
      "Content-Length: ";
  response += std::to_string(body.size());
  response += "\r\n\r\n";
  response += body;
  return response;
}

std::string generate_client_key() {
  auto nonce = random_array<kNonceSize>();
  return Base64::encode(nonce.data(), nonce.size());
}

std::string build_upgrade_request(std::string_view host, std::string_view path,
                                  std::string_view client_key) {
  std::string request = "GET ";
  request += path.empty() ? std::string_view("/") : path;
  request += " HTTP/1.1\r\nHost: ";
  request += host;
  request +=
      "\r\n"
      "Upgrade: websocket\r\n"
      "Connection: Upgrade\r\n"
      "Sec-WebSocket-Key: ";
  request += client_key;
  request +=
      "\r\n"
      "Sec-WebSocket-Version: 13\r\n"
      "\r\n";
  return request;
}

Status verify_upgrade_response(std::string_view head, std::string_view client_key) {
  // "HTTP/1.1 101 Switching Protocols"
  std::string_view status_line = first_line(head);
  size_t sp = status_line.find(' ');
  if (sp == std::string_view::npos || status_line.substr(sp + 1, 3) != "101") {
    return Status::error(ErrorCode::kHandshakeFailed);
  }

  std::string accept;
  bool has_accept = false;
  for_each_header(head, [&](std::string_view name, std::string_view value) {
    if (iequals(name, "Sec-WebSocket-Accept")) {
      accept = std::string(value);
      has_accept = true;
    }
  });

  if (!has_accept || accept != compute_accept_key(client_key)) {
    return Status::error(ErrorCode::kAcceptMismatch);
  }
  return Status::success();
}

}  // namespace handshake
}  // namespace wschat
