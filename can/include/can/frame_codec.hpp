#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace vhil::can {

// Battery management status (id 0x100), 8 bytes:
//   [0] SOC x2   [1] SOH %   [2..3] voltage x10 (LE, unsigned)
//   [4..5] current x10 (LE, signed)   [6] temperature +40   [7] status flags
struct BatteryStatus {
  double soc = 0.0;          // %
  uint8_t soh = 100;         // %
  double voltage = 0.0;      // V
  double current = 0.0;      // A, positive = charging
  double temperature = 0.0;  // degC
  uint8_t status = 0;
};

// Body controller door status (id 0x200), >= 4 bytes:
//   [0] bits 0..3 open (FL, FR, RL, RR)   [1] bits 0..3 locked   [2..3] reserved
struct DoorStatus {
  bool fl_open = false;
  bool fr_open = false;
  bool rl_open = false;
  bool rr_open = false;
  bool fl_locked = false;
  bool fr_locked = false;
  bool rl_locked = false;
  bool rr_locked = false;
};

// Out-of-range inputs are clamped to the representable range
std::array<uint8_t, 8> EncodeBatteryStatus(double soc, double voltage, double current,
                                           double temperature, uint8_t soh = 100);

// Shorter than 8 bytes -> nullopt
std::optional<BatteryStatus> DecodeBatteryStatus(const std::vector<uint8_t>& data);

std::array<uint8_t, 4> EncodeDoorStatus(const DoorStatus& doors);

// Shorter than 4 bytes -> nullopt
std::optional<DoorStatus> DecodeDoorStatus(const std::vector<uint8_t>& data);

} // namespace vhil::can
