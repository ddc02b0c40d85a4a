/**
 * @file test_correlator.cpp
 * @brief Tests for correlator.hpp
 */

#include "seatlink/correlator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>
#include <vector>

using seatlink::ByteBuffer;
using seatlink::LinkError;
using seatlink::TransactionCorrelator;
using seatlink::TransportError;

namespace {

class FakeTransport final : public seatlink::LinkTransport {
 public:
  seatlink::expected<void, TransportError> Write(const uint8_t* data,
                                                 uint32_t size) noexcept override {
    written.emplace_back(data, data + size);
    if (fail_write) {
      return seatlink::expected<void, TransportError>::error(
          TransportError::kWriteFailed);
    }
    if (on_write) on_write(written.back());
    return seatlink::expected<void, TransportError>::success();
  }

  bool IsConnected() const noexcept override { return connected; }

  std::vector<ByteBuffer> written;
  std::function<void(const ByteBuffer&)> on_write;
  bool connected = true;
  bool fail_write = false;
};

}  // namespace

TEST_CASE("correlator - timeout yields empty response", "[correlator]") {
  FakeTransport t;
  TransactionCorrelator c(t);

  auto start = std::chrono::steady_clock::now();
  auto r = c.SendAndWait(ByteBuffer{0x01, 0x00}, 50);
  auto elapsed = std::chrono::steady_clock::now() - start;

  REQUIRE(r.has_value());
  REQUIRE(!r.value().has_value());
  REQUIRE(elapsed >= std::chrono::milliseconds(50));
  REQUIRE(t.written.size() == 1U);
  REQUIRE(c.Stats().timeouts == 1U);
  REQUIRE(!c.InFlight());
}

TEST_CASE("correlator - response delivered during write", "[correlator]") {
  FakeTransport t;
  TransactionCorrelator c(t);
  t.on_write = [&c](const ByteBuffer&) { c.Deliver(ByteBuffer{0xAB}); };

  auto r = c.SendAndWait(ByteBuffer{0x01, 0x00}, 1000);
  REQUIRE(r.has_value());
  REQUIRE(r.value().has_value());
  REQUIRE(r.value().value() == ByteBuffer{0xAB});
  REQUIRE(c.Stats().responses == 1U);
}

TEST_CASE("correlator - last delivered message wins", "[correlator]") {
  FakeTransport t;
  TransactionCorrelator c(t);
  t.on_write = [&c](const ByteBuffer&) {
    c.Deliver(ByteBuffer{0x0A});
    c.Deliver(ByteBuffer{0x0B});
  };

  auto r = c.SendAndWait(ByteBuffer{0x01, 0x00}, 1000);
  REQUIRE(r.value().value() == ByteBuffer{0x0B});
  REQUIRE(c.Stats().overwritten == 1U);
}

TEST_CASE("correlator - every packet is written in order", "[correlator]") {
  FakeTransport t;
  TransactionCorrelator c(t);
  t.on_write = [&c, &t](const ByteBuffer&) {
    if (t.written.size() == 3U) c.Deliver(ByteBuffer{0x01});
  };

  std::vector<ByteBuffer> packets{{0x01, 0x00}, {0x02, 0x00}, {0x03, 0x00}};
  auto r = c.SendAndWait(packets, 1000);
  REQUIRE(r.value().has_value());
  REQUIRE(t.written == packets);
}

TEST_CASE("correlator - write failure is an error", "[correlator]") {
  FakeTransport t;
  t.fail_write = true;
  TransactionCorrelator c(t);

  auto r = c.SendAndWait(ByteBuffer{0x01, 0x00}, 1000);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == LinkError::kWriteFailed);
  REQUIRE(c.Stats().write_failures == 1U);
  REQUIRE(!c.InFlight());
}

TEST_CASE("correlator - disconnected transport is not written",
          "[correlator]") {
  FakeTransport t;
  t.connected = false;
  TransactionCorrelator c(t);

  auto r = c.SendAndWait(ByteBuffer{0x01, 0x00}, 1000);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == LinkError::kNotConnected);
  REQUIRE(t.written.empty());
}

TEST_CASE("correlator - transport error mapping", "[correlator]") {
  REQUIRE(seatlink::ToLinkError(TransportError::kNotConnected) ==
          LinkError::kNotConnected);
  REQUIRE(seatlink::ToLinkError(TransportError::kWriteFailed) ==
          LinkError::kWriteFailed);
}

TEST_CASE("correlator - unsolicited messages are dropped", "[correlator]") {
  FakeTransport t;
  TransactionCorrelator c(t);
  c.Deliver(ByteBuffer{0x55});
  REQUIRE(c.Stats().unsolicited == 1U);

  // the stale message must not answer the next request
  auto r = c.SendAndWait(ByteBuffer{0x01, 0x00}, 20);
  REQUIRE(r.has_value());
  REQUIRE(!r.value().has_value());
}

TEST_CASE("correlator - response from another thread", "[correlator]") {
  FakeTransport t;
  TransactionCorrelator c(t);

  std::thread responder([&c] {
    while (!c.InFlight()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    c.Deliver(ByteBuffer{0x42, 0x43});
  });

  auto r = c.SendAndWait(ByteBuffer{0x01, 0x00}, 2000);
  responder.join();
  REQUIRE(r.value().has_value());
  REQUIRE(r.value().value() == ByteBuffer{0x42, 0x43});
}

TEST_CASE("correlator - concurrent callers are serialized", "[correlator]") {
  FakeTransport t;
  TransactionCorrelator c(t);
  // echo the request id back as the response
  t.on_write = [&c](const ByteBuffer& pkt) { c.Deliver(ByteBuffer{pkt[0]}); };

  constexpr int kThreads = 4;
  constexpr int kRounds = 25;
  std::atomic<int> mismatches{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&c, &mismatches, i] {
      for (int k = 0; k < kRounds; ++k) {
        const uint8_t id = static_cast<uint8_t>(i + 1);
        auto r = c.SendAndWait(ByteBuffer{id, 0x00}, 1000);
        if (!r.has_value() || !r.value().has_value() ||
            r.value().value() != ByteBuffer{id}) {
          ++mismatches;
        }
      }
    });
  }
  for (auto& th : threads) th.join();

  REQUIRE(mismatches.load() == 0);
  REQUIRE(c.Stats().requests == static_cast<uint64_t>(kThreads * kRounds));
  REQUIRE(c.Stats().responses == static_cast<uint64_t>(kThreads * kRounds));
}
