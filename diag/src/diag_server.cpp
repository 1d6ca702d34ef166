// diag/src/diag_server.cpp
#include <diag/diag_server.hpp>

#include <exception>
#include <stdexcept>
#include <utility>

using vhil::log::Hex;

namespace vhil::diag {

namespace {

inline uint16_t be16(const std::vector<uint8_t>& v, std::size_t at) {
  return static_cast<uint16_t>((v[at] << 8) | v[at + 1]);
}

inline void push_be16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline std::vector<uint8_t> ascii(const char* s) {
  std::string str(s);
  return {str.begin(), str.end()};
}

std::string to_hex(const std::vector<uint8_t>& data) {
  static const char* digits = "0123456789abcdef";
  std::string s;
  for (auto b : data) { s.push_back(digits[b >> 4]); s.push_back(digits[b & 0x0F]); }
  return s;
}

// Too short for the service -> invalid-key class NRC
inline UdsResponse too_short(Sid sid) {
  return UdsResponse::Negative(static_cast<uint8_t>(sid), Nrc::kInvalidKey);
}

} // namespace

DiagServer::DiagServer(std::string ecu_name, SteadyClock clock)
  : ecu_name_(std::move(ecu_name)),
    clock_(clock ? std::move(clock) : SteadyClock([] { return std::chrono::steady_clock::now(); })),
    log_(vhil::log::Logger::CreateLogger("DIAG", "UDS diagnostic server")) {
  last_activity_ = clock_();
  SeedStandardDids();
  VHIL_LOGINFO(log_, "Diagnostic server started for {}", ecu_name_);
}

void DiagServer::SeedStandardDids() {
  dids_[kDidEcuSerialNumber] = ascii("Virtual ECU v1.0");
  dids_[kDidHardwareNumber]  = ascii("VIRTECU");
  dids_[kDidSoftwareVersion] = ascii("1.0.0");
  dids_[kDidSupplier]        = ascii("Virtual HIL Framework");
  dids_[kDidSessionStatus]   = {0x01};
}

UdsResponse DiagServer::ProcessRequest(const std::vector<uint8_t>& request) {
  if (request.empty()) {
    VHIL_LOGWARN(log_, "Empty diagnostic request rejected");
    return UdsResponse::Negative(0x00, Nrc::kGeneralReject);
  }

  const uint8_t raw_sid = request[0];
  std::scoped_lock lk(mu_);
  last_activity_ = clock_();

  const auto sid = ToSid(raw_sid);
  if (!sid) {
    VHIL_LOGDEBUG(log_, "Service {} not supported", Hex(raw_sid));
    return UdsResponse::Negative(raw_sid, Nrc::kServiceNotSupported);
  }

  try {
    return Dispatch(*sid, request);
  } catch (const std::exception& e) {
    VHIL_LOGERROR(log_, "Error processing request {}: {}", Hex(raw_sid), e.what());
  } catch (...) {
    VHIL_LOGERROR(log_, "Error processing request {}: unknown exception", Hex(raw_sid));
  }
  return UdsResponse::Negative(raw_sid, Nrc::kGeneralReject);
}

UdsResponse DiagServer::Dispatch(Sid sid, const std::vector<uint8_t>& req) {
  switch (sid) {
    case Sid::kDiagnosticSessionControl:  return HandleSessionControl(req);
    case Sid::kClearDiagnosticInformation: return HandleClearDtc(req);
    case Sid::kReadDtcInformation:        return HandleReadDtc(req);
    case Sid::kReadDataByIdentifier:      return HandleReadDid(req);
    case Sid::kSecurityAccess:            return HandleSecurityAccess(req);
    case Sid::kWriteDataByIdentifier:     return HandleWriteDid(req);
    case Sid::kRoutineControl:            return HandleRoutineControl(req);
    case Sid::kTesterPresent:             return HandleTesterPresent(req);
    case Sid::kControlDtcSetting:         return HandleDtcSetting(req);
  }
  return UdsResponse::Negative(static_cast<uint8_t>(sid), Nrc::kServiceNotSupported);
}

// 0x10
UdsResponse DiagServer::HandleSessionControl(const std::vector<uint8_t>& req) {
  constexpr auto sid = Sid::kDiagnosticSessionControl;
  if (req.size() < 2) return too_short(sid);

  const auto target = ToSession(req[1]);
  if (!target) return UdsResponse::Negative(static_cast<uint8_t>(sid), Nrc::kSubFunctionNotSupported);

  session_ = *target;
  VHIL_LOGINFO(log_, "Session changed to {}", ToString(session_));
  // P2 / P2* timing bytes are not simulated
  return UdsResponse::Positive(static_cast<uint8_t>(sid), {req[1], 0x00, 0x00});
}

// 0x14
UdsResponse DiagServer::HandleClearDtc(const std::vector<uint8_t>& /*req*/) {
  constexpr auto sid = Sid::kClearDiagnosticInformation;
  if (!dtc_setting_enabled_)
    return UdsResponse::Negative(static_cast<uint8_t>(sid), Nrc::kConditionsNotCorrect);

  dtcs_.clear();
  VHIL_LOGINFO(log_, "All DTCs cleared");
  return UdsResponse::Positive(static_cast<uint8_t>(sid));
}

// 0x19
UdsResponse DiagServer::HandleReadDtc(const std::vector<uint8_t>& req) {
  constexpr auto sid = Sid::kReadDtcInformation;
  if (req.size() < 2) return too_short(sid);

  const uint8_t sub = req[1];
  if (sub == kReportDtcByStatusMask) {
    std::vector<uint8_t> out{sub, kDtcStatusAvailabilityMask};
    out.reserve(2 + dtcs_.size() * 4);
    for (const auto& [code, rec] : dtcs_) {
      auto raw = EncodeDtc(code);
      if (!raw) throw std::runtime_error("stored DTC '" + code + "' is not encodable");
      out.insert(out.end(), raw->begin(), raw->end());
      out.push_back(rec.status);
    }
    return UdsResponse::Positive(static_cast<uint8_t>(sid), std::move(out));
  }
  if (sub == kReportDtcStatusAvailability) {
    return UdsResponse::Positive(static_cast<uint8_t>(sid), {sub, 0x00, 0x00, kDtcStatusAvailabilityMask});
  }
  return UdsResponse::Negative(static_cast<uint8_t>(sid), Nrc::kSubFunctionNotSupported);
}

// 0x22
UdsResponse DiagServer::HandleReadDid(const std::vector<uint8_t>& req) {
  constexpr auto sid = Sid::kReadDataByIdentifier;
  if (req.size() < 3) return too_short(sid);

  std::vector<uint8_t> out;
  // A trailing odd byte is ignored
  for (std::size_t i = 1; i + 1 < req.size(); i += 2) {
    const uint16_t did = be16(req, i);
    auto it = dids_.find(did);
    if (it == dids_.end()) {
      // First miss short-circuits: echo only the missing identifier, still positive
      VHIL_LOGDEBUG(log_, "DID {} not found", Hex(did, 4));
      std::vector<uint8_t> miss;
      push_be16(miss, did);
      return UdsResponse::Positive(static_cast<uint8_t>(sid), std::move(miss));
    }
    push_be16(out, did);
    out.insert(out.end(), it->second.begin(), it->second.end());
  }
  return UdsResponse::Positive(static_cast<uint8_t>(sid), std::move(out));
}

// 0x27
UdsResponse DiagServer::HandleSecurityAccess(const std::vector<uint8_t>& req) {
  constexpr auto sid = Sid::kSecurityAccess;
  if (req.size() < 2) return too_short(sid);

  const uint8_t sub = req[1];
  if (sub % 2 == 1) {
    std::vector<uint8_t> out{sub};
    out.insert(out.end(), kSecuritySeed.begin(), kSecuritySeed.end());
    return UdsResponse::Positive(static_cast<uint8_t>(sid), std::move(out));
  }
  // The submitted key is not checked against the seed
  security_level_ = sub / 2;
  VHIL_LOGINFO(log_, "Security level unlocked: {}", security_level_);
  return UdsResponse::Positive(static_cast<uint8_t>(sid), {sub});
}

// 0x2E
UdsResponse DiagServer::HandleWriteDid(const std::vector<uint8_t>& req) {
  constexpr auto sid = Sid::kWriteDataByIdentifier;
  if (req.size() < 3) return too_short(sid);

  const uint16_t did = be16(req, 1);
  std::vector<uint8_t> value(req.begin() + 3, req.end());
  VHIL_LOGINFO(log_, "Wrote DID {}: {}", Hex(did, 4), to_hex(value));
  dids_[did] = std::move(value);

  std::vector<uint8_t> out;
  push_be16(out, did);
  return UdsResponse::Positive(static_cast<uint8_t>(sid), std::move(out));
}

// 0x31
UdsResponse DiagServer::HandleRoutineControl(const std::vector<uint8_t>& req) {
  constexpr auto sid = Sid::kRoutineControl;
  if (req.size() < 4) return too_short(sid);

  const uint8_t control = req[1];
  const uint16_t rid = be16(req, 2);
  auto it = routines_.find(rid);
  if (it == routines_.end())
    return UdsResponse::Negative(static_cast<uint8_t>(sid), Nrc::kRequestSequenceError);

  // Copy: the handler may (un)register routines while running
  const RoutineHandler handler = it->second;
  const std::vector<uint8_t> params(req.begin() + 4, req.end());

  std::optional<core::Result<std::vector<uint8_t>>> result;
  try {
    result.emplace(handler(control, params));
  } catch (const std::exception& e) {
    VHIL_LOGERROR(log_, "Routine {} error: {}", Hex(rid, 4), e.what());
    return UdsResponse::Negative(static_cast<uint8_t>(sid), Nrc::kConditionsNotCorrect);
  } catch (...) {
    VHIL_LOGERROR(log_, "Routine {} threw a non-standard exception", Hex(rid, 4));
    return UdsResponse::Negative(static_cast<uint8_t>(sid), Nrc::kConditionsNotCorrect);
  }
  if (!result->HasValue()) {
    VHIL_LOGERROR(log_, "Routine {} failed: {}", Hex(rid, 4), result->Error().Message());
    return UdsResponse::Negative(static_cast<uint8_t>(sid), Nrc::kConditionsNotCorrect);
  }

  std::vector<uint8_t> out{control};
  push_be16(out, rid);
  const auto& bytes = result->Value();
  out.insert(out.end(), bytes.begin(), bytes.end());
  return UdsResponse::Positive(static_cast<uint8_t>(sid), std::move(out));
}

// 0x3E
UdsResponse DiagServer::HandleTesterPresent(const std::vector<uint8_t>& req) {
  constexpr auto sid = Sid::kTesterPresent;
  last_activity_ = clock_();
  if (req.size() > 1 && req[1] == kSuppressPositiveResponse)
    return UdsResponse::Suppressed(static_cast<uint8_t>(sid));
  return UdsResponse::Positive(static_cast<uint8_t>(sid), {0x00});
}

// 0x85
UdsResponse DiagServer::HandleDtcSetting(const std::vector<uint8_t>& req) {
  constexpr auto sid = Sid::kControlDtcSetting;
  if (req.size() < 2) return too_short(sid);

  const uint8_t setting = req[1];
  dtc_setting_enabled_ = setting != 0;
  VHIL_LOGINFO(log_, "DTC setting: {}", dtc_setting_enabled_ ? "ON" : "OFF");
  return UdsResponse::Positive(static_cast<uint8_t>(sid), {setting});
}

core::Result<void> DiagServer::StoreDtc(const std::string& code, uint8_t status,
                                        std::optional<std::string> snapshot) {
  if (!IsValidDtcCode(code))
    return core::ErrorCode(core::Errc::kInvalidArgument, "malformed DTC code '" + code + "'");

  auto key = NormalizeDtcCode(code);
  std::scoped_lock lk(mu_);
  dtcs_[key] = DtcRecord{key, status, std::move(snapshot)};
  VHIL_LOGWARN(log_, "DTC stored: {} (status {})", key, Hex(status));
  return {};
}

void DiagServer::ClearDtc(const std::string& code) {
  const auto key = NormalizeDtcCode(code);
  std::scoped_lock lk(mu_);
  if (dtcs_.erase(key) > 0) VHIL_LOGINFO(log_, "DTC cleared: {}", key);
}

bool DiagServer::HasDtc(const std::string& code) const {
  const auto key = NormalizeDtcCode(code);
  std::scoped_lock lk(mu_);
  return dtcs_.count(key) > 0;
}

std::vector<DtcRecord> DiagServer::Dtcs() const {
  std::scoped_lock lk(mu_);
  std::vector<DtcRecord> out;
  out.reserve(dtcs_.size());
  for (const auto& [code, rec] : dtcs_) out.push_back(rec);
  return out;
}

void DiagServer::SetDid(uint16_t did, std::vector<uint8_t> value) {
  std::scoped_lock lk(mu_);
  dids_[did] = std::move(value);
}

std::optional<std::vector<uint8_t>> DiagServer::ReadDid(uint16_t did) const {
  std::scoped_lock lk(mu_);
  auto it = dids_.find(did);
  if (it == dids_.end()) return std::nullopt;
  return it->second;
}

void DiagServer::RegisterRoutine(uint16_t rid, RoutineHandler handler) {
  std::scoped_lock lk(mu_);
  routines_[rid] = std::move(handler);
}

void DiagServer::UnregisterRoutine(uint16_t rid) {
  std::scoped_lock lk(mu_);
  routines_.erase(rid);
}

Session DiagServer::CurrentSession() const {
  std::scoped_lock lk(mu_);
  return session_;
}

int DiagServer::SecurityLevel() const {
  std::scoped_lock lk(mu_);
  return security_level_;
}

bool DiagServer::DtcSettingEnabled() const {
  std::scoped_lock lk(mu_);
  return dtc_setting_enabled_;
}

std::chrono::steady_clock::time_point DiagServer::LastActivity() const {
  std::scoped_lock lk(mu_);
  return last_activity_;
}

} // namespace vhil::diag
