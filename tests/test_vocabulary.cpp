/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp
 */

#include "rsb/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

enum class TestError : uint8_t { kBad = 1, kWorse };

TEST_CASE("expected success holds value", "[vocabulary]") {
  auto r = rsb::expected<int, TestError>::success(42);
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 42);
  REQUIRE(r.value_or(7) == 42);
}

TEST_CASE("expected error holds error", "[vocabulary]") {
  auto r = rsb::expected<int, TestError>::error(TestError::kWorse);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == TestError::kWorse);
  REQUIRE(r.value_or(7) == 7);
}

TEST_CASE("expected with identical value and error types", "[vocabulary]") {
  using Result = rsb::expected<std::string, std::string>;
  Result ok = Result::success("/tmp/x.log");
  Result bad = Result::error("Permission denied");
  REQUIRE(ok.has_value());
  REQUIRE(ok.value() == "/tmp/x.log");
  REQUIRE(!bad.has_value());
  REQUIRE(bad.get_error() == "Permission denied");
}

TEST_CASE("expected moves out its value", "[vocabulary]") {
  std::vector<int> v = {1, 2, 3};
  auto r = rsb::expected<std::vector<int>, TestError>::success(std::move(v));
  std::vector<int> out = std::move(r).value();
  REQUIRE(out.size() == 3);
}

TEST_CASE("expected<void> success and error", "[vocabulary]") {
  auto ok = rsb::expected<void, TestError>::success();
  REQUIRE(ok.has_value());

  auto bad = rsb::expected<void, TestError>::error(TestError::kBad);
  REQUIRE(!bad.has_value());
  REQUIRE(bad.get_error() == TestError::kBad);
}

TEST_CASE("optional alias", "[vocabulary]") {
  rsb::optional<int> empty;
  rsb::optional<int> full = 5;
  REQUIRE(!empty.has_value());
  REQUIRE(full.value() == 5);
}
