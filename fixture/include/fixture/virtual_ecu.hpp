#pragma once
#include <can/trace_export.hpp>
#include <can/virtual_bus.hpp>
#include <config/ecu_config.hpp>
#include <diag/diag_server.hpp>
#include <phm/session_supervisor.hpp>
#include <vhil/core/result.hpp>
#include <log.hpp>

#include <optional>
#include <string>
#include <vector>

namespace vhil::fixture {

// One virtual ECU: a CAN bus, a UDS server and its session supervision.
// This is the injection surface test harnesses drive.
class VirtualEcu {
public:
    explicit VirtualEcu(const config::EcuConfig& cfg = {}, can::Clock bus_clock = {},
                        diag::SteadyClock diag_clock = {});
    ~VirtualEcu();

    VirtualEcu(const VirtualEcu&) = delete;
    VirtualEcu& operator=(const VirtualEcu&) = delete;

    void Start();
    void Shutdown();

    // --- Faults ---
    core::Result<void> StoreDtc(const std::string& code, uint8_t status = 0x01,
                                std::optional<std::string> snapshot = std::nullopt);
    void ClearDtc(const std::string& code);

    // --- Diagnostics ---
    void RegisterRoutine(uint16_t rid, diag::RoutineHandler handler);
    void SetDid(uint16_t did, std::vector<uint8_t> value);
    std::optional<std::vector<uint8_t>> ReadDid(uint16_t did) const;
    std::vector<uint8_t> ProcessRequest(const std::vector<uint8_t>& request);

    // --- Bus observation ---
    can::BusStatistics BusStatistics() const;
    std::vector<can::CanFrame> Trace(std::optional<uint32_t> id = std::nullopt) const;
    void ClearTrace();
    core::Result<void> ExportTrace(const std::string& path, can::TraceFormat format = can::TraceFormat::kCsv) const;

    // Periodic housekeeping (session supervision)
    void Tick();

    can::VirtualCanBus& Bus() noexcept { return bus_; }
    diag::DiagServer& Diagnostics() noexcept { return diag_; }
    phm::SessionSupervisor& Supervisor() noexcept { return supervisor_; }
    const config::EcuConfig& Config() const noexcept { return cfg_; }

private:
    config::EcuConfig cfg_;
    vhil::log::Logger log_;
    can::VirtualCanBus bus_;
    diag::DiagServer diag_;
    phm::SessionSupervisor supervisor_;
};

} // namespace vhil::fixture
