#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace vhil::diag {

// Services handled by DiagServer. Every enumerator must have a case in
// DiagServer::Dispatch; the switch there has no default so -Wswitch flags gaps.
enum class Sid : uint8_t {
  kDiagnosticSessionControl = 0x10,
  kClearDiagnosticInformation = 0x14,
  kReadDtcInformation = 0x19,
  kReadDataByIdentifier = 0x22,
  kSecurityAccess = 0x27,
  kWriteDataByIdentifier = 0x2E,
  kRoutineControl = 0x31,
  kTesterPresent = 0x3E,
  kControlDtcSetting = 0x85,
};

inline std::optional<Sid> ToSid(uint8_t raw) {
  switch (static_cast<Sid>(raw)) {
    case Sid::kDiagnosticSessionControl:
    case Sid::kClearDiagnosticInformation:
    case Sid::kReadDtcInformation:
    case Sid::kReadDataByIdentifier:
    case Sid::kSecurityAccess:
    case Sid::kWriteDataByIdentifier:
    case Sid::kRoutineControl:
    case Sid::kTesterPresent:
    case Sid::kControlDtcSetting:
      return static_cast<Sid>(raw);
  }
  return std::nullopt;
}

inline constexpr uint8_t kNegativeResponseSid = 0x7F;
inline constexpr uint8_t kPositiveResponseOffset = 0x40;
inline constexpr uint8_t kSuppressPositiveResponse = 0x80;

// Negative response codes (ISO 14229-1 Annex A subset)
enum class Nrc : uint8_t {
  kPositiveResponse = 0x00,
  kGeneralReject = 0x10,
  kServiceNotSupported = 0x11,
  kSubFunctionNotSupported = 0x12,
  kConditionsNotCorrect = 0x22,
  kRequestSequenceError = 0x24,
  kSecurityAccessDenied = 0x33,
  kInvalidKey = 0x35,
  kExceededNumberOfAttempts = 0x36,
  kRequiredTimeDelayNotExpired = 0x37,
};

enum class Session : uint8_t {
  kDefault = 0x01,
  kProgramming = 0x02,
  kExtended = 0x03,
  kSafetySystem = 0x04,
};

inline std::optional<Session> ToSession(uint8_t raw) {
  switch (static_cast<Session>(raw)) {
    case Session::kDefault:
    case Session::kProgramming:
    case Session::kExtended:
    case Session::kSafetySystem:
      return static_cast<Session>(raw);
  }
  return std::nullopt;
}

inline constexpr std::string_view ToString(Session s) {
  switch (s) {
    case Session::kDefault:      return "DEFAULT";
    case Session::kProgramming:  return "PROGRAMMING";
    case Session::kExtended:     return "EXTENDED";
    case Session::kSafetySystem: return "SAFETY_SYSTEM";
  }
  return "UNKNOWN";
}

struct UdsResponse {
  bool negative = false;     // true => 0x7F, else positive (sid + 0x40)
  uint8_t sid = 0;           // original SID (not +0x40)
  uint8_t nrc = 0;           // negative response code if negative==true
  std::vector<uint8_t> data; // positive payload after the response SID
  bool suppressed = false;   // no bytes go on the wire

  static UdsResponse Positive(uint8_t sid, std::vector<uint8_t> payload = {}) {
    return UdsResponse{false, sid, 0x00, std::move(payload), false};
  }
  static UdsResponse Negative(uint8_t sid, Nrc nrc) {
    return UdsResponse{true, sid, static_cast<uint8_t>(nrc), {}, false};
  }
  static UdsResponse Suppressed(uint8_t sid) {
    return UdsResponse{false, sid, 0x00, {}, true};
  }

  std::vector<uint8_t> ToBytes() const {
    if (suppressed) return {};
    if (negative) return {kNegativeResponseSid, sid, nrc};
    std::vector<uint8_t> out;
    out.reserve(1 + data.size());
    out.push_back(static_cast<uint8_t>(sid + kPositiveResponseOffset));
    out.insert(out.end(), data.begin(), data.end());
    return out;
  }
};

} // namespace vhil::diag
