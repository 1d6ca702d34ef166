#pragma once
#include <cstdint>
#include <cstddef>
#include <utility>
#include <vector>

namespace vhil::can {

// Standard message identifiers on the virtual body/battery bus
inline constexpr uint32_t kBmsStatusId     = 0x100;
inline constexpr uint32_t kBmsCellDataId   = 0x101;
inline constexpr uint32_t kBmsFaultId      = 0x102;
inline constexpr uint32_t kBdcStatusId     = 0x200;
inline constexpr uint32_t kBdcDoorPosId    = 0x201;
inline constexpr uint32_t kBdcLockStatusId = 0x202;

// Subscription key that matches every identifier
inline constexpr uint32_t kWildcardId = 0xFFFFFFFF;

inline constexpr std::size_t kMaxPayload = 8;

enum class Direction : uint8_t { kTx, kRx };

struct CanFrame {
  uint32_t id = 0;               // 11 or 29 significant bits, caller-declared
  std::vector<uint8_t> data;     // 0..8 bytes
  uint8_t dlc = 0;               // always data.size()
  double timestamp = 0.0;        // seconds since epoch
  bool extended = false;
  Direction direction = Direction::kTx;
};

// Builds a frame, correcting a declared length that disagrees with the payload.
// Caller guarantees data.size() <= kMaxPayload.
inline CanFrame MakeFrame(uint32_t id, std::vector<uint8_t> data, double timestamp,
                          bool extended = false, Direction dir = Direction::kTx) {
  CanFrame f;
  f.id = id;
  f.dlc = static_cast<uint8_t>(data.size());
  f.data = std::move(data);
  f.timestamp = timestamp;
  f.extended = extended;
  f.direction = dir;
  return f;
}

} // namespace vhil::can
