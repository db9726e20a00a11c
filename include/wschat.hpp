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

/**
 * @file wschat.hpp
 * @brief wschat - broadcast chat over raw-TCP WebSocket (RFC 6455)
 *
 * One thread per connection on the server, two on the client. Every text
 * message a member sends is relayed to all other members as "<name>: <text>".
 *
 * Usage:
 *   #include "wschat.hpp"
 *
 *   int main() {
 *     wschat::Server server(8000, "127.0.0.1");
 *     server.on_join = [](const auto& conn, const std::string& name) {
 *       std::cout << name << " is #" << conn->get_id() << "\n";
 *     };
 *     server.run();
 *   }
 *
 * @see RFC 6455: The WebSocket Protocol
 */

#ifndef WSCHAT_HPP_
#define WSCHAT_HPP_

#include "wschat/client.hpp"
#include "wschat/connection.hpp"
#include "wschat/frame.hpp"
#include "wschat/handshake.hpp"
#include "wschat/log.hpp"
#include "wschat/registry.hpp"
#include "wschat/server.hpp"
#include "wschat/socket_io.hpp"
#include "wschat/utils.hpp"
#include "wschat/vocabulary.hpp"

#endif  // WSCHAT_HPP_
