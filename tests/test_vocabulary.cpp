/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp types
 */

#include "fsup/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected success path", "[vocabulary][expected]") {
  auto r = fsup::expected<int, fsup::ConfigError>::success(42);
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 42);
}

TEST_CASE("expected error path", "[vocabulary][expected]") {
  auto r = fsup::expected<int, fsup::ConfigError>::error(fsup::ConfigError::kFileNotFound);
  REQUIRE(!r.has_value());
  REQUIRE(!static_cast<bool>(r));
  REQUIRE(r.get_error() == fsup::ConfigError::kFileNotFound);
}

TEST_CASE("expected void specialization", "[vocabulary][expected]") {
  auto ok = fsup::expected<void, fsup::ConfigError>::success();
  REQUIRE(ok.has_value());

  auto err = fsup::expected<void, fsup::ConfigError>::error(fsup::ConfigError::kInvalidValue);
  REQUIRE(!err.has_value());
  REQUIRE(err.get_error() == fsup::ConfigError::kInvalidValue);
}

TEST_CASE("expected value_or", "[vocabulary][expected]") {
  auto ok = fsup::expected<int, fsup::ConfigError>::success(10);
  REQUIRE(ok.value_or(0) == 10);
  auto err = fsup::expected<int, fsup::ConfigError>::error(fsup::ConfigError::kParseError);
  REQUIRE(err.value_or(-1) == -1);
}

TEST_CASE("expected with non-trivial value copy/move", "[vocabulary][expected]") {
  auto r1 = fsup::expected<std::string, fsup::ConfigError>::success(std::string("formula"));
  auto r2 = r1;
  REQUIRE(r2.value() == "formula");
  auto r3 = static_cast<fsup::expected<std::string, fsup::ConfigError>&&>(r1);
  REQUIRE(r3.value() == "formula");

  r2 = fsup::expected<std::string, fsup::ConfigError>::error(fsup::ConfigError::kBufferFull);
  REQUIRE(r2.get_error() == fsup::ConfigError::kBufferFull);
}

// ============================================================================
// optional<T>
// ============================================================================

TEST_CASE("optional empty", "[vocabulary][optional]") {
  fsup::optional<int> o;
  REQUIRE(!o.has_value());
  REQUIRE(o.value_or(5) == 5);
}

TEST_CASE("optional with value and reset", "[vocabulary][optional]") {
  fsup::optional<int> o(-1);
  REQUIRE(o.has_value());
  REQUIRE(o.value() == -1);
  o.reset();
  REQUIRE(!o.has_value());
}

TEST_CASE("optional copy/move", "[vocabulary][optional]") {
  fsup::optional<std::string> o1(std::string("rapl"));
  fsup::optional<std::string> o2 = o1;
  REQUIRE(o2.value() == "rapl");
  fsup::optional<std::string> o3 = static_cast<fsup::optional<std::string>&&>(o1);
  REQUIRE(o3.value() == "rapl");
  o2 = fsup::optional<std::string>();
  REQUIRE(!o2.has_value());
}

// ============================================================================
// FixedString
// ============================================================================

TEST_CASE("FixedString default empty", "[vocabulary][fixed_string]") {
  fsup::FixedString<32> s;
  REQUIRE(s.empty());
  REQUIRE(s.size() == 0U);
  REQUIRE(s.capacity() == 32U);
}

TEST_CASE("FixedString from literal", "[vocabulary][fixed_string]") {
  fsup::FixedString<32> s("hello");
  REQUIRE(s.size() == 5U);
  REQUIRE(s == "hello");
}

TEST_CASE("FixedString truncation", "[vocabulary][fixed_string]") {
  fsup::FixedString<5> s(fsup::TruncateToCapacity, "hello world");
  REQUIRE(s.size() == 5U);
  REQUIRE(std::strcmp(s.c_str(), "hello") == 0);
}

TEST_CASE("FixedString assign nullptr clears", "[vocabulary][fixed_string]") {
  fsup::FixedString<8> s("abc");
  s.assign(fsup::TruncateToCapacity, nullptr);
  REQUIRE(s.empty());
}

TEST_CASE("FixedString equality across capacities", "[vocabulary][fixed_string]") {
  fsup::FixedString<8> s1("abc");
  fsup::FixedString<32> s2("abc");
  fsup::FixedString<32> s3("abd");
  REQUIRE(s1 == s2);
  REQUIRE(s2 != s3);
}

// ============================================================================
// NewType
// ============================================================================

namespace {
struct ProbeTag {};
struct SlotTag {};
}  // namespace

TEST_CASE("NewType prevents mixing", "[vocabulary][newtype]") {
  fsup::NewType<uint32_t, ProbeTag> probe(1U);
  fsup::NewType<uint32_t, SlotTag> slot(1U);
  REQUIRE(probe.value() == slot.value());

  // probe == slot;  // does not compile: distinct tags

  fsup::NewType<uint32_t, ProbeTag> probe2(2U);
  REQUIRE(probe != probe2);
  REQUIRE(probe < probe2);
}
