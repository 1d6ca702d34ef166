#include <config/ecu_config.hpp>
#include <sinks_console.hpp>
#include <sinks_dlt.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <fstream>
#include <limits>
#include <memory>

using nlohmann::json;
using vhil::core::ErrorCode;
using vhil::core::Errc;

namespace vhil::config {

namespace {

// Thrown inside the parser only; converted to kInvalidArgument at the boundary
struct BadValue {
    std::string what;
};

const json& section(const json& j, const char* key) {
    static const json kEmpty = json::object();
    if (!j.contains(key)) return kEmpty;
    const auto& s = j.at(key);
    if (!s.is_object()) throw BadValue{std::string("'") + key + "' must be an object"};
    return s;
}

template <typename T>
T integer(const json& s, const char* key, T def, long long min, long long max) {
    if (!s.contains(key)) return def;
    const auto& v = s.at(key);
    if (!v.is_number_integer()) throw BadValue{std::string("'") + key + "' must be an integer"};
    const auto n = v.get<long long>();
    if (n < min || n > max) throw BadValue{std::string("'") + key + "' out of range"};
    return static_cast<T>(n);
}

uint16_t parse_did_key(const std::string& key) {
    std::string digits = key;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X'))
        digits = digits.substr(2);
    if (digits.empty() || digits.size() > 4) throw BadValue{"malformed DID '" + key + "'"};
    for (char c : digits)
        if (!std::isxdigit(static_cast<unsigned char>(c))) throw BadValue{"malformed DID '" + key + "'"};
    return static_cast<uint16_t>(std::stoul(digits, nullptr, 16));
}

std::vector<uint8_t> parse_did_value(const std::string& key, const json& v) {
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        return {s.begin(), s.end()};
    }
    if (!v.is_array()) throw BadValue{"DID '" + key + "' must be a string or a byte array"};
    std::vector<uint8_t> out;
    out.reserve(v.size());
    for (const auto& b : v) {
        if (!b.is_number_integer()) throw BadValue{"DID '" + key + "' holds a non-integer byte"};
        const auto n = b.get<long long>();
        if (n < 0 || n > 0xFF) throw BadValue{"DID '" + key + "' byte out of range"};
        out.push_back(static_cast<uint8_t>(n));
    }
    return out;
}

// Created per use so that sinks installed by ApplyLogConfig are picked up
vhil::log::Logger cfg_log() {
    return vhil::log::Logger::CreateLogger("CFG", "Configuration");
}

} // namespace

core::Result<EcuConfig> ParseEcuConfig(const json& j) {
    if (!j.is_object()) return ErrorCode(Errc::kInvalidArgument, "top level must be an object");

    EcuConfig c;
    try {
        c.ecu_name = j.value("ecu_name", c.ecu_name);

        const auto& lg = section(j, "log");
        c.log.ecu_id  = lg.value("ecu_id", c.log.ecu_id);
        c.log.app_id  = lg.value("app_id", c.log.app_id);
        c.log.console = lg.value("console", c.log.console);
        c.log.dlt     = lg.value("dlt", c.log.dlt);
        if (lg.contains("level")) {
            const auto name = lg.at("level").get<std::string>();
            auto lvl = vhil::log::ParseLogLevel(name);
            if (!lvl) throw BadValue{"unknown log level '" + name + "'"};
            c.log.level = *lvl;
        }

        const auto& bus = section(j, "bus");
        c.bus.channel = bus.value("channel", c.bus.channel);
        c.bus.bitrate = integer<uint32_t>(bus, "bitrate", c.bus.bitrate, 1, std::numeric_limits<uint32_t>::max());
        c.bus.trace_capacity = integer<std::size_t>(bus, "trace_capacity", c.bus.trace_capacity, 1,
                                                    std::numeric_limits<int32_t>::max());

        const auto& diag = section(j, "diag");
        c.diag.bind = diag.value("bind", c.diag.bind);
        c.diag.port = integer<uint16_t>(diag, "port", c.diag.port, 0, 0xFFFF);
        c.diag.session_timeout_ms =
            integer<int>(diag, "session_timeout_ms", c.diag.session_timeout_ms, 0, std::numeric_limits<int>::max());
        if (diag.contains("dids")) {
            const auto& dids = diag.at("dids");
            if (!dids.is_object()) throw BadValue{"'dids' must be an object"};
            for (const auto& [key, value] : dids.items())
                c.diag.dids[parse_did_key(key)] = parse_did_value(key, value);
        }

        const auto& gw = section(j, "gateway");
        c.gateway.enabled = gw.value("enabled", c.gateway.enabled);
        c.gateway.iface   = gw.value("iface", c.gateway.iface);
    } catch (const BadValue& e) {
        return ErrorCode(Errc::kInvalidArgument, e.what);
    } catch (const json::exception& e) {
        // type_error from value()/get() on a mismatched type
        return ErrorCode(Errc::kInvalidArgument, e.what());
    }
    return c;
}

core::Result<EcuConfig> LoadEcuConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        VHIL_LOGERROR(cfg_log(), "Config not found: {}", path);
        return ErrorCode(Errc::kNotFound, path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        VHIL_LOGERROR(cfg_log(), "Config {} is not valid JSON: {}", path, e.what());
        return ErrorCode(Errc::kCorruption, e.what());
    }

    auto res = ParseEcuConfig(j);
    if (!res) VHIL_LOGERROR(cfg_log(), "Config {} rejected: {}", path, res.Error().Message());
    return res;
}

void ApplyLogConfig(const LogConfig& cfg) {
    auto& mgr = vhil::log::LogManager::Instance();
    mgr.ClearSinks();
    mgr.SetGlobalIds(cfg.ecu_id, cfg.app_id);
    mgr.SetDefaultLevel(cfg.level);
    if (cfg.console) mgr.AddSink(std::make_shared<vhil::log::ConsoleSink>());
    if (cfg.dlt) mgr.AddSink(std::make_shared<vhil::log::DltSink>());
}

} // namespace vhil::config
