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

#ifndef WSCHAT_REGISTRY_HPP_
#define WSCHAT_REGISTRY_HPP_

#include "connection.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace wschat {

// ============================================================================
// ConnectionRegistry (joined connections -> display names)
// ============================================================================

/**
 * @brief Thread-safe map of chat members.
 *
 * Every operation holds the single registry mutex for its whole duration and
 * nothing else; in particular no socket I/O ever happens under it. Broadcasts
 * work on a snapshot() copy.
 */
class ConnectionRegistry {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  static constexpr uint64_t kNoConnection = 0;  // ids start at 1

  struct Entry {
    ConnPtr conn;
    std::string display_name;
  };

  // False if the connection is already registered.
  bool register_connection(const ConnPtr& conn, std::string display_name);

  // False if the connection was not registered.
  bool unregister_connection(uint64_t id);

  // Point-in-time copy of every entry except `except_id`.
  std::vector<Entry> snapshot(uint64_t except_id = kNoConnection) const;

  bool contains(uint64_t id) const;
  optional<std::string> display_name(uint64_t id) const;
  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<uint64_t, Entry> entries_;
};

}  // namespace wschat

#endif  // WSCHAT_REGISTRY_HPP_
