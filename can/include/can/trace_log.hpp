#pragma once
#include <can/frame.hpp>
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace vhil::can {

inline constexpr std::size_t kDefaultTraceCapacity = 10000;

// Bounded FIFO of frames in arrival order; the oldest frame is evicted on overflow.
// Not synchronized; the owning bus serializes access.
class TraceLog {
public:
  explicit TraceLog(std::size_t capacity = kDefaultTraceCapacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

  void Append(CanFrame f) {
    if (frames_.size() == capacity_) {
      frames_.pop_front();
      ++evicted_;
    }
    frames_.push_back(std::move(f));
  }

  void Clear() { frames_.clear(); }

  std::size_t Size() const noexcept { return frames_.size(); }
  std::size_t Capacity() const noexcept { return capacity_; }
  std::size_t Evicted() const noexcept { return evicted_; }

  std::vector<CanFrame> Snapshot(std::optional<uint32_t> id = std::nullopt) const {
    std::vector<CanFrame> out;
    if (!id) {
      out.assign(frames_.begin(), frames_.end());
      return out;
    }
    for (const auto& f : frames_)
      if (f.id == *id) out.push_back(f);
    return out;
  }

  std::optional<CanFrame> Last(std::optional<uint32_t> id = std::nullopt) const {
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it)
      if (!id || it->id == *id) return *it;
    return std::nullopt;
  }

  std::size_t Count(std::optional<uint32_t> id = std::nullopt) const {
    if (!id) return frames_.size();
    std::size_t n = 0;
    for (const auto& f : frames_) if (f.id == *id) ++n;
    return n;
  }

  // Payload bits (dlc*8 + 47 overhead) of frames stamped within (now - window, now]
  uint64_t BitsSince(double now, double window_s) const {
    uint64_t bits = 0;
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
      if (now - it->timestamp >= window_s) continue;
      bits += static_cast<uint64_t>(it->dlc) * 8u + 47u;
    }
    return bits;
  }

private:
  std::size_t capacity_;
  std::size_t evicted_ = 0;
  std::deque<CanFrame> frames_;
};

} // namespace vhil::can
