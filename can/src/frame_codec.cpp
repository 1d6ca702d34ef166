#include <can/frame_codec.hpp>
#include <algorithm>
#include <cmath>

namespace vhil::can {

namespace {

inline long scaled(double v, double factor, double lo, double hi) {
  return std::lround(std::clamp(v, lo, hi) * factor);
}

inline uint8_t bit(bool on, unsigned pos) {
  return on ? static_cast<uint8_t>(1u << pos) : 0;
}

} // namespace

std::array<uint8_t, 8> EncodeBatteryStatus(double soc, double voltage, double current,
                                           double temperature, uint8_t soh) {
  const auto soc_raw  = static_cast<uint8_t>(scaled(soc, 2.0, 0.0, 127.5));
  const auto volt_raw = static_cast<uint16_t>(scaled(voltage, 10.0, 0.0, 6553.5));
  const auto curr_raw = static_cast<int16_t>(scaled(current, 10.0, -3276.8, 3276.7));
  const auto temp_raw = static_cast<uint8_t>(std::lround(std::clamp(temperature, -40.0, 215.0) + 40.0));
  const auto curr_u   = static_cast<uint16_t>(curr_raw);

  return {
    soc_raw,
    soh,
    static_cast<uint8_t>(volt_raw & 0xFF),
    static_cast<uint8_t>(volt_raw >> 8),
    static_cast<uint8_t>(curr_u & 0xFF),
    static_cast<uint8_t>(curr_u >> 8),
    temp_raw,
    0x00,
  };
}

std::optional<BatteryStatus> DecodeBatteryStatus(const std::vector<uint8_t>& data) {
  if (data.size() < 8) return std::nullopt;

  const auto volt_raw = static_cast<uint16_t>(data[2] | (data[3] << 8));
  const auto curr_raw = static_cast<int16_t>(static_cast<uint16_t>(data[4] | (data[5] << 8)));

  BatteryStatus s;
  s.soc = data[0] / 2.0;
  s.soh = data[1];
  s.voltage = volt_raw / 10.0;
  s.current = curr_raw / 10.0;
  s.temperature = static_cast<double>(data[6]) - 40.0;
  s.status = data[7];
  return s;
}

std::array<uint8_t, 4> EncodeDoorStatus(const DoorStatus& d) {
  const uint8_t open = bit(d.fl_open, 0) | bit(d.fr_open, 1) | bit(d.rl_open, 2) | bit(d.rr_open, 3);
  const uint8_t lock = bit(d.fl_locked, 0) | bit(d.fr_locked, 1) | bit(d.rl_locked, 2) | bit(d.rr_locked, 3);
  return {open, lock, 0x00, 0x00};
}

std::optional<DoorStatus> DecodeDoorStatus(const std::vector<uint8_t>& data) {
  if (data.size() < 4) return std::nullopt;

  DoorStatus d;
  d.fl_open   = data[0] & 0x01;
  d.fr_open   = data[0] & 0x02;
  d.rl_open   = data[0] & 0x04;
  d.rr_open   = data[0] & 0x08;
  d.fl_locked = data[1] & 0x01;
  d.fr_locked = data[1] & 0x02;
  d.rl_locked = data[1] & 0x04;
  d.rr_locked = data[1] & 0x08;
  return d;
}

} // namespace vhil::can
