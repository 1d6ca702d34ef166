#include <can/virtual_bus.hpp>

#include <algorithm>
#include <exception>
#include <sstream>
#include <utility>

using vhil::log::Hex;

namespace vhil::can {

namespace {

double wall_clock_seconds() {
  using namespace std::chrono;
  return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

std::string to_hex(const std::vector<uint8_t>& data) {
  static const char* digits = "0123456789abcdef";
  std::string s;
  s.reserve(data.size() * 2);
  for (auto b : data) { s.push_back(digits[b >> 4]); s.push_back(digits[b & 0x0F]); }
  return s;
}

} // namespace

VirtualCanBus::VirtualCanBus(BusConfig cfg, Clock clock)
  : cfg_(std::move(cfg)),
    clock_(clock ? std::move(clock) : Clock(wall_clock_seconds)),
    log_(vhil::log::Logger::CreateLogger("CANB", "Virtual CAN bus")),
    trace_(cfg_.trace_capacity) {}

VirtualCanBus::~VirtualCanBus() {
  Shutdown();
}

void VirtualCanBus::Start() {
  {
    std::scoped_lock lk(mu_);
    running_ = true;
    shutdown_ = false;
  }
  VHIL_LOGINFO(log_, "CAN interface started on {} at {} bps", cfg_.channel, cfg_.bitrate);
}

void VirtualCanBus::Shutdown() {
  bool was_running = false;
  {
    std::scoped_lock lk(mu_);
    was_running = running_;
    running_ = false;
    shutdown_ = true;
  }
  wake_.notify_all();
  if (was_running) VHIL_LOGINFO(log_, "CAN interface stopped on {}", cfg_.channel);
}

bool VirtualCanBus::Running() const {
  std::scoped_lock lk(mu_);
  return running_;
}

bool VirtualCanBus::Transmit(uint32_t id, const std::vector<uint8_t>& data, bool extended) {
  if (data.size() > kMaxPayload) {
    VHIL_LOGERROR(log_, "Data too long for {}: {} bytes", Hex(id, 3), data.size());
    return false;
  }
  auto frame = MakeFrame(id, data, clock_(), extended, Direction::kTx);
  VHIL_LOGVERBOSE(log_, "TX: {} - {}", Hex(id, 3), to_hex(frame.data));
  Dispatch(std::move(frame));
  return true;
}

bool VirtualCanBus::DeliverExternal(CanFrame frame) {
  if (frame.data.size() > kMaxPayload) {
    VHIL_LOGERROR(log_, "Dropping external frame {}: {} bytes", Hex(frame.id, 3), frame.data.size());
    return false;
  }
  frame.dlc = static_cast<uint8_t>(frame.data.size());
  frame.direction = Direction::kRx;
  VHIL_LOGVERBOSE(log_, "RX: {} - {}", Hex(frame.id, 3), to_hex(frame.data));
  Dispatch(std::move(frame));
  return true;
}

bool VirtualCanBus::TransmitBatteryStatus(double soc, double voltage, double current, double temperature) {
  const auto payload = EncodeBatteryStatus(soc, voltage, current, temperature);
  return Transmit(kBmsStatusId, std::vector<uint8_t>(payload.begin(), payload.end()));
}

bool VirtualCanBus::TransmitDoorStatus(const DoorStatus& doors) {
  const auto payload = EncodeDoorStatus(doors);
  return Transmit(kBdcStatusId, std::vector<uint8_t>(payload.begin(), payload.end()));
}

void VirtualCanBus::Dispatch(CanFrame frame) {
  std::vector<SubscriberPtr> targets;
  {
    std::scoped_lock lk(mu_);
    if (frame.direction == Direction::kTx) ++tx_count_;
    else ++rx_count_;
    trace_.Append(frame);

    if (auto it = subscribers_.find(frame.id); it != subscribers_.end())
      targets.insert(targets.end(), it->second.begin(), it->second.end());
    if (frame.id != kWildcardId) {
      if (auto it = subscribers_.find(kWildcardId); it != subscribers_.end())
        targets.insert(targets.end(), it->second.begin(), it->second.end());
    }
  }
  Notify(frame, targets);
}

void VirtualCanBus::Notify(const CanFrame& frame, const std::vector<SubscriberPtr>& targets) {
  const auto self = std::this_thread::get_id();
  for (const auto& sub : targets) {
    {
      std::scoped_lock lk(mu_);
      if (sub->removed) continue;
      sub->active.push_back(self);
    }
    try {
      auto r = sub->cb(frame);
      if (!r) RecordFailure(frame, sub->token, r.Error().Message());
    } catch (const std::exception& e) {
      RecordFailure(frame, sub->token, e.what());
    } catch (...) {
      RecordFailure(frame, sub->token, "unknown exception");
    }
    {
      std::scoped_lock lk(mu_);
      auto& a = sub->active;
      a.erase(std::find(a.begin(), a.end(), self));
    }
    idle_.notify_all();
  }
}

void VirtualCanBus::RecordFailure(const CanFrame& frame, SubscriptionToken token, std::string reason) {
  VHIL_LOGERROR(log_, "Callback error for ID {} (subscription {}): {}", Hex(frame.id, 3), token, reason);
  std::scoped_lock lk(mu_);
  if (failures_.size() == kMaxDeliveryFailures) failures_.pop_front();
  failures_.push_back(DeliveryFailure{frame.id, token, std::move(reason)});
}

SubscriptionToken VirtualCanBus::Subscribe(uint32_t id, FrameCallback cb) {
  std::scoped_lock lk(mu_);
  const auto tok = next_token_++;
  subscribers_[id].push_back(std::make_shared<Subscriber>(Subscriber{tok, std::move(cb), false, {}}));
  return tok;
}

void VirtualCanBus::Unsubscribe(uint32_t id, SubscriptionToken token) {
  std::unique_lock lk(mu_);
  auto it = subscribers_.find(id);
  if (it == subscribers_.end()) return;
  auto& list = it->second;
  auto s = std::find_if(list.begin(), list.end(), [token](const SubscriberPtr& p) { return p->token == token; });
  if (s == list.end()) return;
  SubscriberPtr sub = *s;
  sub->removed = true;
  list.erase(s);
  if (list.empty()) subscribers_.erase(it);

  // Deliveries already under way on other threads finish first
  const auto self = std::this_thread::get_id();
  idle_.wait(lk, [&] {
    return std::all_of(sub->active.begin(), sub->active.end(),
                       [self](std::thread::id t) { return t == self; });
  });
}

std::optional<CanFrame> VirtualCanBus::AwaitFrame(std::chrono::milliseconds timeout) {
  std::unique_lock lk(mu_);
  wake_.wait_for(lk, timeout, [this] { return shutdown_; });
  return std::nullopt;
}

double VirtualCanBus::LoadNoLock_(double now) const {
  if (cfg_.bitrate == 0) return 0.0;
  const uint64_t bits = trace_.BitsSince(now, 1.0);
  return static_cast<double>(bits) / cfg_.bitrate * 100.0;
}

BusStatistics VirtualCanBus::Statistics() const {
  const double now = clock_();
  std::scoped_lock lk(mu_);
  BusStatistics s;
  s.tx_count = tx_count_;
  s.rx_count = rx_count_;
  s.bus_load = LoadNoLock_(now);
  s.channel = cfg_.channel;
  s.bitrate = cfg_.bitrate;
  s.trace_size = trace_.Size();
  s.trace_evicted = trace_.Evicted();
  s.delivery_failures = failures_.size();
  return s;
}

double VirtualCanBus::BusLoad() const {
  const double now = clock_();
  std::scoped_lock lk(mu_);
  return LoadNoLock_(now);
}

std::vector<CanFrame> VirtualCanBus::Trace(std::optional<uint32_t> id) const {
  std::scoped_lock lk(mu_);
  return trace_.Snapshot(id);
}

std::optional<CanFrame> VirtualCanBus::LastFrame(std::optional<uint32_t> id) const {
  std::scoped_lock lk(mu_);
  return trace_.Last(id);
}

std::size_t VirtualCanBus::FrameCount(std::optional<uint32_t> id) const {
  std::scoped_lock lk(mu_);
  return trace_.Count(id);
}

void VirtualCanBus::ClearTrace() {
  std::scoped_lock lk(mu_);
  trace_.Clear();
}

std::vector<DeliveryFailure> VirtualCanBus::DeliveryFailures() const {
  std::scoped_lock lk(mu_);
  return {failures_.begin(), failures_.end()};
}

} // namespace vhil::can
