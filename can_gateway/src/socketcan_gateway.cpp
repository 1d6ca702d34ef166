#include <can_gateway/socketcan_gateway.hpp>

#include <linux/can/raw.h>
#include <net/if.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>

using vhil::core::ErrorCode;
using vhil::core::Errc;
using vhil::log::Hex;

namespace vhil::can_gateway {

namespace {

constexpr int kRxPollMs = 100;

double now_seconds() {
  using namespace std::chrono;
  return duration<double>(system_clock::now().time_since_epoch()).count();
}

core::Result<int> open_can(const std::string& iface) {
  int s = ::socket(PF_CAN, SOCK_RAW, CAN_RAW);
  if (s < 0) return ErrorCode(Errc::kUnavailable, std::string("socket(PF_CAN): ") + std::strerror(errno));
  ifreq ifr{};
  std::snprintf(ifr.ifr_name, IFNAMSIZ, "%s", iface.c_str());
  if (::ioctl(s, SIOCGIFINDEX, &ifr) < 0) {
    auto err = std::string("SIOCGIFINDEX ") + iface + ": " + std::strerror(errno);
    ::close(s);
    return ErrorCode(Errc::kUnavailable, err);
  }
  sockaddr_can addr{};
  addr.can_family = AF_CAN;
  addr.can_ifindex = ifr.ifr_ifindex;
  if (::bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    auto err = std::string("bind(PF_CAN): ") + std::strerror(errno);
    ::close(s);
    return ErrorCode(Errc::kUnavailable, err);
  }
  return s;
}

} // namespace

std::optional<can_frame> ToSocketCanFrame(const can::CanFrame& frame) {
  if (frame.data.size() > CAN_MAX_DLEN) return std::nullopt;
  can_frame f{};
  if (frame.extended) f.can_id = (frame.id & CAN_EFF_MASK) | CAN_EFF_FLAG;
  else f.can_id = frame.id & CAN_SFF_MASK;
  f.can_dlc = static_cast<uint8_t>(frame.data.size());
  std::memcpy(f.data, frame.data.data(), frame.data.size());
  return f;
}

can::CanFrame FromSocketCanFrame(const can_frame& raw, double timestamp) {
  const bool extended = (raw.can_id & CAN_EFF_FLAG) != 0;
  const uint32_t id = extended ? (raw.can_id & CAN_EFF_MASK) : (raw.can_id & CAN_SFF_MASK);
  const auto len = std::min<std::size_t>(raw.can_dlc, CAN_MAX_DLEN);
  std::vector<uint8_t> data(raw.data, raw.data + len);
  return can::MakeFrame(id, std::move(data), timestamp, extended, can::Direction::kRx);
}

SocketCanGateway::SocketCanGateway(can::VirtualCanBus& bus, std::string iface)
  : bus_(bus), iface_(std::move(iface)),
    log_(vhil::log::Logger::CreateLogger("GW", "SocketCAN gateway")) {}

SocketCanGateway::~SocketCanGateway() {
  Stop();
}

core::Result<void> SocketCanGateway::Start() {
  std::scoped_lock lk(start_mu_);
  if (running_) return {};

  auto s = open_can(iface_);
  if (!s) {
    VHIL_LOGERROR(log_, "Cannot open {}: {}", iface_, s.Error().Message());
    return s.Error();
  }
  sock_ = *s;
  running_ = true;
  token_ = bus_.Subscribe(can::kWildcardId, [this](const can::CanFrame& f) { return Forward(f); });
  rx_thread_ = std::thread([this] { RxLoop(); });
  VHIL_LOGINFO(log_, "Bridging {} to {}", bus_.Config().channel, iface_);
  return {};
}

void SocketCanGateway::Stop() {
  std::scoped_lock lk(start_mu_);
  if (token_) {
    bus_.Unsubscribe(can::kWildcardId, *token_);
    token_.reset();
  }
  running_ = false;
  if (rx_thread_.joinable()) rx_thread_.join();
  std::scoped_lock tx(tx_mu_);
  if (sock_ >= 0) {
    ::close(sock_);
    sock_ = -1;
    VHIL_LOGINFO(log_, "Gateway on {} stopped", iface_);
  }
}

core::Result<void> SocketCanGateway::Forward(const can::CanFrame& frame) {
  if (frame.direction == can::Direction::kRx) return {};  // came from the socket
  std::scoped_lock lk(tx_mu_);
  if (!running_ || sock_ < 0) return {};

  auto raw = ToSocketCanFrame(frame);
  if (!raw) return ErrorCode(Errc::kInvalidArgument, "payload does not fit a CAN frame");
  const ssize_t n = ::write(sock_, &*raw, sizeof(can_frame));
  if (n != static_cast<ssize_t>(sizeof(can_frame))) {
    return ErrorCode(Errc::kIoError, std::string("write ") + iface_ + ": " + std::strerror(errno));
  }
  forwarded_++;
  return {};
}

void SocketCanGateway::RxLoop() {
  while (running_) {
    pollfd p{sock_, POLLIN, 0};
    const int rc = ::poll(&p, 1, kRxPollMs);
    if (rc == 0) continue;
    if (rc < 0) {
      if (errno == EINTR) continue;
      VHIL_LOGERROR(log_, "poll on {} failed: {}", iface_, std::strerror(errno));
      return;
    }

    can_frame f{};
    const ssize_t n = ::read(sock_, &f, sizeof(f));
    if (n != static_cast<ssize_t>(sizeof(f))) continue;
    if (f.can_id & (CAN_RTR_FLAG | CAN_ERR_FLAG)) continue;

    auto frame = FromSocketCanFrame(f, now_seconds());
    VHIL_LOGVERBOSE(log_, "RX {} [{}]", Hex(frame.id, frame.extended ? 8 : 3), frame.dlc);
    if (bus_.DeliverExternal(std::move(frame))) received_++;
  }
}

} // namespace vhil::can_gateway
