#include <fixture/virtual_ecu.hpp>

using vhil::log::Hex;

namespace vhil::fixture {

namespace {

can::BusConfig to_bus_config(const config::BusConfig& c) {
    can::BusConfig b;
    b.channel = c.channel;
    b.bitrate = c.bitrate;
    b.trace_capacity = c.trace_capacity;
    return b;
}

} // namespace

VirtualEcu::VirtualEcu(const config::EcuConfig& cfg, can::Clock bus_clock, diag::SteadyClock diag_clock)
    : cfg_(cfg),
      log_(vhil::log::Logger::CreateLogger("ECU", "Virtual ECU fixture")),
      bus_(to_bus_config(cfg_.bus), std::move(bus_clock)),
      diag_(cfg_.ecu_name, diag_clock),
      supervisor_(diag_, phm::SessionSupervisor::Config{cfg_.diag.session_timeout_ms}, diag_clock) {
    for (const auto& [did, value] : cfg_.diag.dids) {
        diag_.SetDid(did, value);
        VHIL_LOGDEBUG(log_, "Seeded DID {} ({} bytes)", Hex(did, 4), value.size());
    }
    supervisor_.set_violation_callback([this](diag::Session s, std::chrono::milliseconds idle) {
        VHIL_LOGWARN(log_, "{}: tester inactive for {} ms in {} session",
                     cfg_.ecu_name, idle.count(), diag::ToString(s));
    });
}

VirtualEcu::~VirtualEcu() {
    Shutdown();
}

void VirtualEcu::Start() {
    bus_.Start();
    VHIL_LOGINFO(log_, "{} up on {}", cfg_.ecu_name, cfg_.bus.channel);
}

void VirtualEcu::Shutdown() {
    bus_.Shutdown();
}

core::Result<void> VirtualEcu::StoreDtc(const std::string& code, uint8_t status,
                                        std::optional<std::string> snapshot) {
    auto r = diag_.StoreDtc(code, status, std::move(snapshot));
    if (!r) VHIL_LOGERROR(log_, "DTC injection rejected: {}", r.Error().Message());
    return r;
}

void VirtualEcu::ClearDtc(const std::string& code) {
    diag_.ClearDtc(code);
}

void VirtualEcu::RegisterRoutine(uint16_t rid, diag::RoutineHandler handler) {
    diag_.RegisterRoutine(rid, std::move(handler));
}

void VirtualEcu::SetDid(uint16_t did, std::vector<uint8_t> value) {
    diag_.SetDid(did, std::move(value));
}

std::optional<std::vector<uint8_t>> VirtualEcu::ReadDid(uint16_t did) const {
    return diag_.ReadDid(did);
}

std::vector<uint8_t> VirtualEcu::ProcessRequest(const std::vector<uint8_t>& request) {
    return diag_.ProcessRequest(request).ToBytes();
}

can::BusStatistics VirtualEcu::BusStatistics() const {
    return bus_.Statistics();
}

std::vector<can::CanFrame> VirtualEcu::Trace(std::optional<uint32_t> id) const {
    return bus_.Trace(id);
}

void VirtualEcu::ClearTrace() {
    bus_.ClearTrace();
}

core::Result<void> VirtualEcu::ExportTrace(const std::string& path, can::TraceFormat format) const {
    auto r = can::SaveTrace(bus_.Trace(), format, cfg_.bus.channel, path);
    if (r) VHIL_LOGINFO(log_, "Trace exported to {}", path);
    else VHIL_LOGERROR(log_, "Trace export to {} failed: {}", path, r.Error().Message());
    return r;
}

void VirtualEcu::Tick() {
    supervisor_.MaintenanceTick();
}

} // namespace vhil::fixture
