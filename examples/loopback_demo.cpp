/**
 * @file loopback_demo.cpp
 * @brief Drives AquaCleanClient against an in-process appliance simulator.
 *
 * Usage: seatlink_loopback_demo [config.ini|config.json|config.yaml]
 *
 * The simulator decodes every written packet, answers device info, status,
 * command and data point requests, and feeds the stuffed response back
 * through OnNotification() from a separate thread, as a BLE stack would.
 */

#include "seatlink/client.hpp"
#include "seatlink/config.hpp"
#include "seatlink/log.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <mutex>
#include <thread>

namespace {

// ============================================================================
// Appliance simulator
// ============================================================================

class ApplianceSimulator final : public seatlink::LinkTransport {
 public:
  ApplianceSimulator() : worker_([this] { Run(); }) {}

  ~ApplianceSimulator() override {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      running_ = false;
    }
    cv_.notify_one();
    worker_.join();
  }

  /// Blocks until no notification is being dispatched to the old client.
  void Attach(seatlink::AquaCleanClient* client) {
    std::lock_guard<std::mutex> lk(client_mtx_);
    client_ = client;
  }

  seatlink::expected<void, seatlink::TransportError> Write(
      const uint8_t* data, uint32_t size) noexcept override {
    auto plain = seatlink::CobsDecode(data, size);
    if (plain.has_value()) {
      auto frame = seatlink::Frame::FromBytes(plain.value());
      if (frame.has_value()) Handle(frame.value());
    }
    return seatlink::expected<void, seatlink::TransportError>::success();
  }

  bool IsConnected() const noexcept override { return true; }

 private:
  void Handle(const seatlink::Frame& req) {
    using seatlink::ByteBuffer;
    switch (req.transaction) {
      case seatlink::kTransactionCommand:
        Queue(ByteBuffer{0x01});
        break;
      case seatlink::kTransactionDataPointRead:
        // 872 (lady shower status) is not supported by this model
        if (seatlink::ReadLE16(req.payload.data()) != 872U) {
          Queue(ByteBuffer{0x00});
        }
        break;
      case seatlink::kTransactionDataPointWrite:
        Queue(ByteBuffer{0x01});
        break;
      case seatlink::kTransactionDeviceInfo:
        Queue(ByteBuffer{0x8D, 0x5B, 0x15, 0x03, 1, 4, 2, 0, 'A', 'q', 'u',
                         'a', 'C', 'l', 'e', 'a', 'n', ' ', 'S', 'e', 'l',
                         'a', 0x00, 0x00});
        break;
      case seatlink::kTransactionSystemStatus:
        // descaling due, everything else idle
        Queue(ByteBuffer{0, 0, 0, 0, 1, 0});
        break;
      default:
        break;
    }
  }

  void Queue(seatlink::ByteBuffer payload) {
    seatlink::Frame f;
    f.kind = seatlink::FrameKind::kSingle;
    f.payload = std::move(payload);
    auto wire = seatlink::EncodeForLink(f);
    if (!wire.has_value()) return;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      outbox_.push_back(std::move(wire.value()));
    }
    cv_.notify_one();
  }

  void Run() {
    std::unique_lock<std::mutex> lk(mtx_);
    while (true) {
      cv_.wait(lk, [this] { return !running_ || !outbox_.empty(); });
      if (!running_) return;
      seatlink::ByteBuffer pkt = std::move(outbox_.front());
      outbox_.pop_front();
      lk.unlock();
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      {
        std::lock_guard<std::mutex> client_lk(client_mtx_);
        if (client_ != nullptr) client_->OnNotification(pkt);
      }
      lk.lock();
    }
  }

  std::mutex client_mtx_;
  seatlink::AquaCleanClient* client_ = nullptr;

  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<seatlink::ByteBuffer> outbox_;
  bool running_ = true;
  std::thread worker_;
};

seatlink::ClientConfig LoadConfig(int argc, char* argv[]) {
  seatlink::ClientConfig cfg;
  cfg.response_timeout_ms = 500;
  if (argc < 2) return cfg;

#ifdef SEATLINK_CONFIG_HAS_BACKEND
  seatlink::MultiConfig store;
  auto loaded = store.LoadFile(argv[1]);
  if (!loaded.has_value()) {
    SEATLINK_LOG_ERROR("Demo", "cannot load %s", argv[1]);
    return cfg;
  }
  auto parsed = seatlink::LoadClientConfig(store);
  if (!parsed.has_value()) {
    SEATLINK_LOG_ERROR("Demo", "invalid configuration in %s", argv[1]);
    return cfg;
  }
  cfg = parsed.value();
  if (cfg.log_level.has_value()) seatlink::log::SetLevel(cfg.log_level.value());
#else
  SEATLINK_LOG_WARN("Demo", "no config backend compiled in, ignoring %s",
                    argv[1]);
#endif
  return cfg;
}

const char* OnOff(bool v) { return v ? "on" : "off"; }

}  // namespace

// ============================================================================
// main
// ============================================================================

int main(int argc, char* argv[]) {
  seatlink::log::Init(seatlink::log::Level::kInfo);
  SEATLINK_LOG_INFO("Demo", "=== seatlink loopback demo start ===");

  const seatlink::ClientConfig cfg = LoadConfig(argc, argv);
  ApplianceSimulator sim;
  seatlink::AquaCleanClient client(sim, cfg);
  sim.Attach(&client);

  // ---- Step 1: identification ----
  auto id = client.RequestDeviceIdentification();
  if (!id.has_value() || !id.value().has_value()) {
    SEATLINK_LOG_ERROR("Demo", "device did not identify itself");
    sim.Attach(nullptr);
    seatlink::log::Shutdown();
    return 1;
  }

  // ---- Step 2: status, toggle, status ----
  auto before = client.RequestSystemParameters();
  if (before.has_value() && before.value().has_value()) {
    SEATLINK_LOG_INFO("Demo", "sitting=%s descaling=%s",
                      OnOff(before.value().value().user_is_sitting),
                      OnOff(before.value().value().descaling_needed));
  }

  auto ack = client.SendCommand(seatlink::HighLevelCommand::kToggleLidPosition);
  if (ack.has_value() && ack.value()) {
    SEATLINK_LOG_INFO("Demo", "lid toggled, tentative lid=%s",
                      OnOff(client.EffectiveState().lid_position));
  }
  (void)client.RequestSystemParameters();

  // ---- Step 3: setters ----
  auto temp = client.SetWaterTemperature(38);
  SEATLINK_LOG_INFO("Demo", "water temperature 38: %s",
                    (temp.has_value() && temp.value()) ? "acked" : "failed");
  auto bad = client.SetWaterTemperature(45);
  if (!bad.has_value()) {
    SEATLINK_LOG_INFO("Demo", "water temperature 45 rejected locally");
  }

  // ---- Step 4: feature probe ----
  auto features = client.ProbeFeatures({564, 872, 875, 585}, 200);
  if (features.has_value()) {
    for (uint16_t dp : features.value()) {
      const seatlink::DataPointInfo* info = seatlink::FindDataPoint(dp);
      SEATLINK_LOG_INFO("Demo", "supported: %u %s", static_cast<unsigned>(dp),
                        info != nullptr ? info->name : "?");
    }
  }

  const auto rx = client.GetRxStats();
  const auto cs = client.GetCorrelatorStats();
  std::printf("notifications=%llu delivered=%llu requests=%llu timeouts=%llu\n",
              static_cast<unsigned long long>(rx.notifications),
              static_cast<unsigned long long>(rx.messages_delivered),
              static_cast<unsigned long long>(cs.requests),
              static_cast<unsigned long long>(cs.timeouts));

  sim.Attach(nullptr);
  SEATLINK_LOG_INFO("Demo", "=== seatlink loopback demo done ===");
  seatlink::log::Shutdown();
  return 0;
}
