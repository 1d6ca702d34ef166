#pragma once
#include <vhil/core/result.hpp>
#include <log.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace vhil::config {

struct LogConfig {
    std::string ecu_id{"VECU"};
    std::string app_id{"VHIL"};
    vhil::log::LogLevel level{vhil::log::LogLevel::kInfo};
    bool console{true};
    bool dlt{false};
};

struct BusConfig {
    std::string channel{"virtual0"};
    uint32_t bitrate{500000};
    std::size_t trace_capacity{10000};
};

struct DiagConfig {
    std::string bind{"127.0.0.1"};
    uint16_t port{13400};
    int session_timeout_ms{5000};  // 0 disables supervision
    std::map<uint16_t, std::vector<uint8_t>> dids;  // extra DIDs seeded at start
};

struct GatewayConfig {
    bool enabled{false};
    std::string iface{"vcan0"};
};

struct EcuConfig {
    std::string ecu_name{"VirtualECU"};
    LogConfig log;
    BusConfig bus;
    DiagConfig diag;
    GatewayConfig gateway;
};

// Missing file -> kNotFound, JSON syntax error -> kCorruption,
// wrong type or out-of-range value -> kInvalidArgument.
core::Result<EcuConfig> LoadEcuConfig(const std::string& path);
core::Result<EcuConfig> ParseEcuConfig(const nlohmann::json& j);

// Installs console / DLT sinks and global ids from the log section
void ApplyLogConfig(const LogConfig& cfg);

} // namespace vhil::config
