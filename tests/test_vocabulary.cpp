#include "wschat/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>
#include <cstring>
#include <string>

using namespace wschat;

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected - success with value", "[vocabulary]") {
  auto result = expected<int, ErrorCode>::success(42);
  REQUIRE(result.has_value());
  REQUIRE(static_cast<bool>(result));
  REQUIRE(result.value() == 42);
}

TEST_CASE("expected - error", "[vocabulary]") {
  auto result = expected<int, ErrorCode>::error(ErrorCode::kFrameTruncated);
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kFrameTruncated);
}

TEST_CASE("expected - non-trivial value", "[vocabulary]") {
  auto result = expected<std::string, ErrorCode>::success(std::string(100, 'x'));
  REQUIRE(result->size() == 100);

  auto copy = result;
  REQUIRE(copy.value() == result.value());

  std::string moved = std::move(result).value();
  REQUIRE(moved.size() == 100);
}

TEST_CASE("expected - copy assignment across states", "[vocabulary]") {
  auto ok = expected<std::string, ErrorCode>::success("hello");
  auto err = expected<std::string, ErrorCode>::error(ErrorCode::kTimeout);

  err = ok;
  REQUIRE(err.has_value());
  REQUIRE(err.value() == "hello");

  ok = expected<std::string, ErrorCode>::error(ErrorCode::kSocketError);
  REQUIRE_FALSE(ok.has_value());
  REQUIRE(ok.get_error() == ErrorCode::kSocketError);
}

TEST_CASE("Status - success and error", "[vocabulary]") {
  auto ok = Status::success();
  auto bad = Status::error(ErrorCode::kInvalidState);
  REQUIRE(ok.has_value());
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.get_error() == ErrorCode::kInvalidState);
}

TEST_CASE("ErrorCode - every code has a distinct name", "[vocabulary]") {
  const ErrorCode codes[] = {ErrorCode::kOk,
                             ErrorCode::kInvalidState,
                             ErrorCode::kTimeout,
                             ErrorCode::kFrameTruncated,
                             ErrorCode::kProtocolViolation,
                             ErrorCode::kHandshakeFailed,
                             ErrorCode::kMissingKey,
                             ErrorCode::kAcceptMismatch,
                             ErrorCode::kSocketError,
                             ErrorCode::kConnectionClosed};
  for (size_t i = 0; i < sizeof(codes) / sizeof(codes[0]); ++i) {
    REQUIRE(std::strcmp(to_string(codes[i]), "unknown") != 0);
    for (size_t j = i + 1; j < sizeof(codes) / sizeof(codes[0]); ++j) {
      REQUIRE(std::strcmp(to_string(codes[i]), to_string(codes[j])) != 0);
    }
  }
}

// ============================================================================
// optional<T>
// ============================================================================

TEST_CASE("optional - empty", "[vocabulary]") {
  optional<int> opt;
  REQUIRE_FALSE(opt.has_value());
  REQUIRE_FALSE(static_cast<bool>(opt));
}

TEST_CASE("optional - with value", "[vocabulary]") {
  optional<std::string> opt(std::string("alice"));
  REQUIRE(opt.has_value());
  REQUIRE(opt.value() == "alice");
}

TEST_CASE("optional - reset", "[vocabulary]") {
  optional<std::string> opt(std::string("carol"));
  opt.reset();
  REQUIRE_FALSE(opt.has_value());
}

TEST_CASE("optional - copy and move", "[vocabulary]") {
  optional<std::string> a(std::string("dave"));
  optional<std::string> b = a;
  REQUIRE(b.value() == "dave");

  optional<std::string> c = std::move(a);
  REQUIRE(c.value() == "dave");

  optional<std::string> d;
  d = c;
  REQUIRE(d.has_value());
  REQUIRE(d.value() == "dave");
}

// ============================================================================
// ScopeGuard
// ============================================================================

TEST_CASE("ScopeGuard - executes on scope exit", "[vocabulary]") {
  int value = 0;
  {
    ScopeGuard guard([&value]() { value = 1; });
  }
  REQUIRE(value == 1);
}

TEST_CASE("ScopeGuard - release prevents execution", "[vocabulary]") {
  int value = 0;
  {
    ScopeGuard guard([&value]() { value = 1; });
    guard.release();
  }
  REQUIRE(value == 0);
}

TEST_CASE("ScopeGuard - runs on early return", "[vocabulary]") {
  int cleanups = 0;
  auto fn = [&cleanups](bool bail) {
    ScopeGuard guard([&cleanups]() { ++cleanups; });
    if (bail) {
      return 1;
    }
    return 2;
  };
  REQUIRE(fn(true) == 1);
  REQUIRE(fn(false) == 2);
  REQUIRE(cleanups == 2);
}
