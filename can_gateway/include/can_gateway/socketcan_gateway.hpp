#pragma once
#include <can/virtual_bus.hpp>
#include <vhil/core/result.hpp>
#include <log.hpp>

#include <linux/can.h>

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace vhil::can_gateway {

// Frame conversion helpers. ToSocketCanFrame fails for payloads over 8 bytes.
std::optional<can_frame> ToSocketCanFrame(const can::CanFrame& frame);
can::CanFrame FromSocketCanFrame(const can_frame& raw, double timestamp);

// Bridges a VirtualCanBus to a Linux SocketCAN interface (e.g. vcan0).
// Tx frames of the bus go out on the socket; frames read from the socket are
// handed to VirtualCanBus::DeliverExternal. Rx frames are never written back.
class SocketCanGateway {
public:
  SocketCanGateway(can::VirtualCanBus& bus, std::string iface = "vcan0");
  ~SocketCanGateway();

  SocketCanGateway(const SocketCanGateway&) = delete;
  SocketCanGateway& operator=(const SocketCanGateway&) = delete;

  core::Result<void> Start();
  void Stop();
  bool Running() const noexcept { return running_.load(); }

  const std::string& Interface() const noexcept { return iface_; }
  uint64_t Forwarded() const noexcept { return forwarded_.load(); }
  uint64_t Received() const noexcept { return received_.load(); }

private:
  core::Result<void> Forward(const can::CanFrame& frame);
  void RxLoop();

  can::VirtualCanBus& bus_;
  std::string iface_;
  vhil::log::Logger log_;

  std::mutex start_mu_;
  std::mutex tx_mu_;  // guards sock_ against Stop() while forwarding
  int sock_{-1};
  std::atomic<bool> running_{false};
  std::optional<can::SubscriptionToken> token_;
  std::thread rx_thread_;
  std::atomic<uint64_t> forwarded_{0};
  std::atomic<uint64_t> received_{0};
};

} // namespace vhil::can_gateway
