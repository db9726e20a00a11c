#include "wschat/registry.hpp"

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <set>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace wschat;

namespace {

// Connection over one end of a socketpair; the other end is closed at once.
std::shared_ptr<Connection> make_conn() {
  int fds[2];
  REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
  ::close(fds[1]);
  return std::make_shared<Connection>(sockpp::tcp_socket(fds[0]));
}

}  // namespace

TEST_CASE("Registry - register and look up", "[registry]") {
  ConnectionRegistry reg;
  auto alice = make_conn();
  auto bob = make_conn();

  REQUIRE(reg.size() == 0);
  REQUIRE(reg.register_connection(alice, "alice"));
  REQUIRE(reg.register_connection(bob, "bob"));
  REQUIRE(reg.size() == 2);
  REQUIRE(reg.contains(alice->get_id()));

  auto name = reg.display_name(bob->get_id());
  REQUIRE(name.has_value());
  REQUIRE(name.value() == "bob");
}

TEST_CASE("Registry - keys are unique", "[registry]") {
  ConnectionRegistry reg;
  auto conn = make_conn();
  REQUIRE(reg.register_connection(conn, "first"));
  REQUIRE_FALSE(reg.register_connection(conn, "second"));
  REQUIRE(reg.size() == 1);
  REQUIRE(reg.display_name(conn->get_id()).value() == "first");
}

TEST_CASE("Registry - null connection is refused", "[registry]") {
  ConnectionRegistry reg;
  REQUIRE_FALSE(reg.register_connection(nullptr, "ghost"));
  REQUIRE(reg.size() == 0);
}

TEST_CASE("Registry - unregister", "[registry]") {
  ConnectionRegistry reg;
  auto conn = make_conn();
  REQUIRE(reg.register_connection(conn, "carol"));
  REQUIRE(reg.unregister_connection(conn->get_id()));
  REQUIRE_FALSE(reg.contains(conn->get_id()));
  REQUIRE_FALSE(reg.display_name(conn->get_id()).has_value());
  REQUIRE_FALSE(reg.unregister_connection(conn->get_id()));
}

TEST_CASE("Registry - snapshot excludes the sender", "[registry]") {
  ConnectionRegistry reg;
  auto a = make_conn();
  auto b = make_conn();
  auto c = make_conn();
  reg.register_connection(a, "a");
  reg.register_connection(b, "b");
  reg.register_connection(c, "c");

  auto all = reg.snapshot();
  REQUIRE(all.size() == 3);

  auto others = reg.snapshot(a->get_id());
  REQUIRE(others.size() == 2);
  std::set<std::string> names;
  for (const auto& entry : others) {
    REQUIRE(entry.conn->get_id() != a->get_id());
    names.insert(entry.display_name);
  }
  REQUIRE(names == std::set<std::string>{"b", "c"});
}

TEST_CASE("Registry - snapshot is a point-in-time copy", "[registry]") {
  ConnectionRegistry reg;
  auto a = make_conn();
  reg.register_connection(a, "a");

  auto snap = reg.snapshot();
  reg.unregister_connection(a->get_id());

  REQUIRE(snap.size() == 1);
  REQUIRE(snap[0].conn == a);
  REQUIRE(reg.snapshot().empty());
}

TEST_CASE("Registry - connection ids increase", "[registry]") {
  auto a = make_conn();
  auto b = make_conn();
  REQUIRE(a->get_id() != ConnectionRegistry::kNoConnection);
  REQUIRE(b->get_id() > a->get_id());
}

TEST_CASE("Registry - concurrent register, unregister and snapshot", "[registry]") {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;

  ConnectionRegistry reg;
  std::vector<std::vector<std::shared_ptr<Connection>>> conns(kThreads);
  for (auto& group : conns) {
    for (int i = 0; i < kPerThread; ++i) {
      group.push_back(make_conn());
    }
  }

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&reg, &conns, t] {
      for (auto& conn : conns[t]) {
        reg.register_connection(conn, "user" + std::to_string(conn->get_id()));
        (void)reg.snapshot(conn->get_id());
      }
      // Drop every other connection again.
      for (size_t i = 0; i < conns[t].size(); i += 2) {
        reg.unregister_connection(conns[t][i]->get_id());
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  REQUIRE(reg.size() == static_cast<size_t>(kThreads * kPerThread / 2));
  for (const auto& group : conns) {
    for (size_t i = 0; i < group.size(); ++i) {
      REQUIRE(reg.contains(group[i]->get_id()) == (i % 2 == 1));
    }
  }
}
