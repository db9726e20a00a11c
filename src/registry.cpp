#include "wschat/registry.hpp"

namespace wschat {

bool ConnectionRegistry::register_connection(const ConnPtr& conn, std::string display_name) {
  if (!conn) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.emplace(conn->get_id(), Entry{conn, std::move(display_name)}).second;
}

bool ConnectionRegistry::unregister_connection(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.erase(id) > 0;
}

std::vector<ConnectionRegistry::Entry> ConnectionRegistry::snapshot(uint64_t except_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Entry> out;
  out.reserve(entries_.size());
  for (const auto& kv : entries_) {
    if (kv.first != except_id) {
      out.push_back(kv.second);
    }
  }
  return out;
}

bool ConnectionRegistry::contains(uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(id) > 0;
}

optional<std::string> ConnectionRegistry::display_name(uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return {};
  }
  return it->second.display_name;
}

size_t ConnectionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace wschat
