// diag/include/diag/diag_server.hpp
#pragma once
#include <diag/dtc.hpp>
#include <diag/uds_types.hpp>
#include <vhil/core/result.hpp>
#include <log.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vhil::diag {

// Standard identifiers seeded at start
inline constexpr uint16_t kDidSessionStatus   = 0xF10B;
inline constexpr uint16_t kDidEcuSerialNumber = 0xF10C;
inline constexpr uint16_t kDidHardwareNumber  = 0xF187;
inline constexpr uint16_t kDidSupplier        = 0xF198;
inline constexpr uint16_t kDidSoftwareVersion = 0xF19E;

// ReadDTCInformation sub-functions
inline constexpr uint8_t kReportDtcByStatusMask = 0x02;
inline constexpr uint8_t kReportDtcStatusAvailability = 0x0A;
inline constexpr uint8_t kDtcStatusAvailabilityMask = 0xFF;

// Fixed seed handed out on odd SecurityAccess sub-functions
inline constexpr std::array<uint8_t, 4> kSecuritySeed{0x01, 0x02, 0x03, 0x04};

// Routine handler: (control type, parameter bytes) -> result bytes or error.
// An error or a thrown exception turns into NRC 0x22.
using RoutineHandler =
    std::function<core::Result<std::vector<uint8_t>>(uint8_t control_type, const std::vector<uint8_t>& params)>;

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

// UDS (ISO 14229) service dispatcher for one virtual ECU. Operates on raw
// request bytes and never touches the bus. Each request runs to completion
// under one mutex, so fixture calls from other threads are safe.
class DiagServer {
public:
  explicit DiagServer(std::string ecu_name = "VirtualECU", SteadyClock clock = {});

  DiagServer(const DiagServer&) = delete;
  DiagServer& operator=(const DiagServer&) = delete;

  UdsResponse ProcessRequest(const std::vector<uint8_t>& request);

  // --- Fault/fixture surface ---
  core::Result<void> StoreDtc(const std::string& code, uint8_t status = 0x01,
                              std::optional<std::string> snapshot = std::nullopt);
  void ClearDtc(const std::string& code);
  bool HasDtc(const std::string& code) const;
  std::vector<DtcRecord> Dtcs() const;

  void SetDid(uint16_t did, std::vector<uint8_t> value);
  std::optional<std::vector<uint8_t>> ReadDid(uint16_t did) const;

  void RegisterRoutine(uint16_t rid, RoutineHandler handler);
  void UnregisterRoutine(uint16_t rid);

  // --- Observers ---
  Session CurrentSession() const;
  int SecurityLevel() const;
  bool DtcSettingEnabled() const;
  std::chrono::steady_clock::time_point LastActivity() const;
  const std::string& EcuName() const noexcept { return ecu_name_; }

private:
  UdsResponse Dispatch(Sid sid, const std::vector<uint8_t>& req);

  UdsResponse HandleSessionControl(const std::vector<uint8_t>& req);
  UdsResponse HandleClearDtc(const std::vector<uint8_t>& req);
  UdsResponse HandleReadDtc(const std::vector<uint8_t>& req);
  UdsResponse HandleReadDid(const std::vector<uint8_t>& req);
  UdsResponse HandleSecurityAccess(const std::vector<uint8_t>& req);
  UdsResponse HandleWriteDid(const std::vector<uint8_t>& req);
  UdsResponse HandleRoutineControl(const std::vector<uint8_t>& req);
  UdsResponse HandleTesterPresent(const std::vector<uint8_t>& req);
  UdsResponse HandleDtcSetting(const std::vector<uint8_t>& req);

  void SeedStandardDids();

  std::string ecu_name_;
  SteadyClock clock_;
  vhil::log::Logger log_;

  // recursive: routine handlers may call back into the fixture surface
  mutable std::recursive_mutex mu_;
  Session session_{Session::kDefault};
  int security_level_{0};
  bool dtc_setting_enabled_{true};
  std::chrono::steady_clock::time_point last_activity_{};
  std::map<std::string, DtcRecord> dtcs_;
  std::unordered_map<uint16_t, std::vector<uint8_t>> dids_;
  std::unordered_map<uint16_t, RoutineHandler> routines_;
};

} // namespace vhil::diag
