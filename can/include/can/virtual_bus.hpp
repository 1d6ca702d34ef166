#pragma once
#include <can/frame.hpp>
#include <can/frame_codec.hpp>
#include <can/trace_log.hpp>
#include <vhil/core/result.hpp>
#include <log.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace vhil::can {

// Subscriber capability: an error result (or a thrown exception) is recorded
// as a DeliveryFailure and delivery to later subscribers continues.
using FrameCallback = std::function<core::Result<void>(const CanFrame&)>;
using SubscriptionToken = std::uint64_t;

// Wall-clock seconds; replaceable for deterministic tests
using Clock = std::function<double()>;

struct BusConfig {
  std::string channel{"virtual0"};
  uint32_t bitrate{500000};
  std::size_t trace_capacity{kDefaultTraceCapacity};
};

struct BusStatistics {
  uint64_t tx_count{0};
  uint64_t rx_count{0};
  double bus_load{0.0};   // % of bitrate over the trailing second
  std::string channel;
  uint32_t bitrate{0};
  std::size_t trace_size{0};
  std::size_t trace_evicted{0};
  std::size_t delivery_failures{0};
};

struct DeliveryFailure {
  uint32_t frame_id{0};
  SubscriptionToken token{0};
  std::string reason;
};

inline constexpr std::size_t kMaxDeliveryFailures = 256;

// Loopback CAN bus with observation. Transmitted frames are traced, counted and
// fanned out synchronously to subscribers of the exact id and of kWildcardId,
// each group in registration order.
class VirtualCanBus {
public:
  explicit VirtualCanBus(BusConfig cfg = {}, Clock clock = {});
  ~VirtualCanBus();

  VirtualCanBus(const VirtualCanBus&) = delete;
  VirtualCanBus& operator=(const VirtualCanBus&) = delete;

  void Start();
  // Wakes every outstanding AwaitFrame; later waits return at once
  void Shutdown();
  bool Running() const;

  // False (and no state change) when data exceeds 8 bytes
  bool Transmit(uint32_t id, const std::vector<uint8_t>& data, bool extended = false);

  // Reception path used by gateways; stamps the frame Rx and counts it
  bool DeliverExternal(CanFrame frame);

  bool TransmitBatteryStatus(double soc, double voltage, double current, double temperature);
  bool TransmitDoorStatus(const DoorStatus& doors);

  SubscriptionToken Subscribe(uint32_t id, FrameCallback cb);
  // Once this returns the callback is not running on any other thread and is
  // never invoked again. Calling it from inside the callback itself is allowed.
  void Unsubscribe(uint32_t id, SubscriptionToken token);

  // The bus is push-only: this never yields a frame. It blocks for the timeout
  // (or until Shutdown) and returns nullopt.
  std::optional<CanFrame> AwaitFrame(std::chrono::milliseconds timeout);

  BusStatistics Statistics() const;
  double BusLoad() const;

  std::vector<CanFrame> Trace(std::optional<uint32_t> id = std::nullopt) const;
  std::optional<CanFrame> LastFrame(std::optional<uint32_t> id = std::nullopt) const;
  std::size_t FrameCount(std::optional<uint32_t> id = std::nullopt) const;
  // Does not reset counters
  void ClearTrace();

  std::vector<DeliveryFailure> DeliveryFailures() const;

  const BusConfig& Config() const noexcept { return cfg_; }

private:
  struct Subscriber {
    SubscriptionToken token;
    FrameCallback cb;
    bool removed{false};
    std::vector<std::thread::id> active;  // threads currently inside cb
  };
  using SubscriberPtr = std::shared_ptr<Subscriber>;

  // Appends + counts under the lock, then fans out without it
  void Dispatch(CanFrame frame);
  void Notify(const CanFrame& frame, const std::vector<SubscriberPtr>& targets);
  void RecordFailure(const CanFrame& frame, SubscriptionToken token, std::string reason);
  double LoadNoLock_(double now) const;

  BusConfig cfg_;
  Clock clock_;
  vhil::log::Logger log_;

  mutable std::mutex mu_;
  std::condition_variable wake_;
  std::condition_variable idle_;
  bool running_{false};
  bool shutdown_{false};

  std::map<uint32_t, std::vector<SubscriberPtr>> subscribers_;
  SubscriptionToken next_token_{1};
  TraceLog trace_;
  uint64_t tx_count_{0};
  uint64_t rx_count_{0};
  std::deque<DeliveryFailure> failures_;
};

} // namespace vhil::can
