/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "seatlink/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

TEST_CASE("Log level defaults", "[log]") {
  // In debug builds default is kDebug, in release kInfo
#ifdef NDEBUG
  REQUIRE(seatlink::log::GetLevel() == seatlink::log::Level::kInfo);
#else
  REQUIRE(seatlink::log::GetLevel() == seatlink::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = seatlink::log::GetLevel();
  seatlink::log::SetLevel(seatlink::log::Level::kError);
  REQUIRE(seatlink::log::GetLevel() == seatlink::log::Level::kError);
  seatlink::log::SetLevel(prev);  // restore
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!seatlink::log::IsInitialized());
  seatlink::log::Init(seatlink::log::Level::kWarn);
  REQUIRE(seatlink::log::IsInitialized());
  REQUIRE(seatlink::log::GetLevel() == seatlink::log::Level::kWarn);
  seatlink::log::Shutdown();
  REQUIRE(!seatlink::log::IsInitialized());
  seatlink::log::SetLevel(seatlink::log::Level::kDebug);
}

TEST_CASE("Log ParseLevel", "[log]") {
  using seatlink::log::Level;
  REQUIRE(seatlink::log::ParseLevel("debug").value() == Level::kDebug);
  REQUIRE(seatlink::log::ParseLevel("INFO").value() == Level::kInfo);
  REQUIRE(seatlink::log::ParseLevel("Warn").value() == Level::kWarn);
  REQUIRE(seatlink::log::ParseLevel("error").value() == Level::kError);
  REQUIRE(seatlink::log::ParseLevel("off").value() == Level::kOff);
  REQUIRE(!seatlink::log::ParseLevel("verbose").has_value());
  REQUIRE(!seatlink::log::ParseLevel("warning").has_value());
  REQUIRE(!seatlink::log::ParseLevel("").has_value());
  REQUIRE(!seatlink::log::ParseLevel(nullptr).has_value());
}

TEST_CASE("Log macros compile and run", "[log]") {
  seatlink::log::SetLevel(seatlink::log::Level::kDebug);
  SEATLINK_LOG_DEBUG("Test", "debug %d", 1);
  SEATLINK_LOG_INFO("Test", "info %s", "msg");
  SEATLINK_LOG_WARN("Test", "warn");
  SEATLINK_LOG_ERROR("Test", "error %d %d", 1, 2);
  // FATAL aborts
  REQUIRE(true);
}

TEST_CASE("Log level hierarchy filtering", "[log]") {
  seatlink::log::SetLevel(seatlink::log::Level::kWarn);
  SEATLINK_LOG_DEBUG("Test", "debug filtered");
  SEATLINK_LOG_INFO("Test", "info filtered");
  SEATLINK_LOG_WARN("Test", "warn passes");
  SEATLINK_LOG_ERROR("Test", "error passes");

  seatlink::log::SetLevel(seatlink::log::Level::kOff);
  SEATLINK_LOG_ERROR("Test", "should not appear");

  seatlink::log::SetLevel(seatlink::log::Level::kDebug);  // restore
  REQUIRE(true);
}

TEST_CASE("Log with very long message", "[log]") {
  seatlink::log::SetLevel(seatlink::log::Level::kDebug);
  std::string long_msg(700, 'x');
  SEATLINK_LOG_INFO("Test", "%s", long_msg.c_str());
  SEATLINK_LOG_INFO("Test", "");
  REQUIRE(true);
}
