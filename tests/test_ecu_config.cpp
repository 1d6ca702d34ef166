#include <gtest/gtest.h>
#include <config/ecu_config.hpp>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <string>

using namespace vhil::config;
using vhil::core::Errc;
using nlohmann::json;

namespace {

std::string write_temp(const std::string& name, const std::string& text) {
  const std::string path = ::testing::TempDir() + name;
  std::ofstream(path) << text;
  return path;
}

} // namespace

TEST(EcuConfig, EmptyObjectYieldsDefaults) {
  auto r = ParseEcuConfig(json::object());
  ASSERT_TRUE(r.HasValue()) << r.Error().Message();
  const auto& c = r.Value();
  EXPECT_EQ(c.ecu_name, "VirtualECU");
  EXPECT_EQ(c.log.ecu_id, "VECU");
  EXPECT_EQ(c.log.app_id, "VHIL");
  EXPECT_EQ(c.log.level, vhil::log::LogLevel::kInfo);
  EXPECT_TRUE(c.log.console);
  EXPECT_FALSE(c.log.dlt);
  EXPECT_EQ(c.bus.channel, "virtual0");
  EXPECT_EQ(c.bus.bitrate, 500000u);
  EXPECT_EQ(c.bus.trace_capacity, 10000u);
  EXPECT_EQ(c.diag.bind, "127.0.0.1");
  EXPECT_EQ(c.diag.port, 13400);
  EXPECT_EQ(c.diag.session_timeout_ms, 5000);
  EXPECT_TRUE(c.diag.dids.empty());
  EXPECT_FALSE(c.gateway.enabled);
  EXPECT_EQ(c.gateway.iface, "vcan0");
}

TEST(EcuConfig, FullDocument) {
  const auto j = json::parse(R"({
    "ecu_name": "BDC_ECU",
    "log": {"ecu_id": "BDC1", "app_id": "HIL", "level": "debug", "console": false, "dlt": true},
    "bus": {"channel": "body", "bitrate": 250000, "trace_capacity": 64},
    "diag": {"bind": "0.0.0.0", "port": 0, "session_timeout_ms": 0,
             "dids": {"0xF190": "VIN123", "F18C": [1, 2, 255]}},
    "gateway": {"enabled": true, "iface": "vcan1"}
  })");
  auto r = ParseEcuConfig(j);
  ASSERT_TRUE(r.HasValue()) << r.Error().Message();
  const auto& c = r.Value();
  EXPECT_EQ(c.ecu_name, "BDC_ECU");
  EXPECT_EQ(c.log.ecu_id, "BDC1");
  EXPECT_EQ(c.log.level, vhil::log::LogLevel::kDebug);
  EXPECT_FALSE(c.log.console);
  EXPECT_TRUE(c.log.dlt);
  EXPECT_EQ(c.bus.channel, "body");
  EXPECT_EQ(c.bus.bitrate, 250000u);
  EXPECT_EQ(c.bus.trace_capacity, 64u);
  EXPECT_EQ(c.diag.port, 0);
  EXPECT_EQ(c.diag.session_timeout_ms, 0);
  ASSERT_EQ(c.diag.dids.size(), 2u);
  EXPECT_EQ(c.diag.dids.at(0xF190), (std::vector<uint8_t>{'V', 'I', 'N', '1', '2', '3'}));
  EXPECT_EQ(c.diag.dids.at(0xF18C), (std::vector<uint8_t>{1, 2, 255}));
  EXPECT_TRUE(c.gateway.enabled);
  EXPECT_EQ(c.gateway.iface, "vcan1");
}

TEST(EcuConfig, InvalidValuesAreRejected) {
  const char* bad[] = {
    R"({"bus": {"bitrate": 0}})",
    R"({"bus": {"trace_capacity": 0}})",
    R"({"bus": {"bitrate": "fast"}})",
    R"({"diag": {"port": 70000}})",
    R"({"diag": {"session_timeout_ms": -1}})",
    R"({"diag": {"dids": {"0xZZ": "x"}}})",
    R"({"diag": {"dids": {"0x12345": "x"}}})",
    R"({"diag": {"dids": {"0xF190": [1, 256]}}})",
    R"({"diag": {"dids": {"0xF190": 5}}})",
    R"({"log": {"level": "chatty"}})",
    R"({"log": "verbose"})",
    R"({"ecu_name": 42})",
    R"([1, 2, 3])",
  };
  for (const char* text : bad) {
    auto r = ParseEcuConfig(json::parse(text));
    ASSERT_FALSE(r.HasValue()) << text;
    EXPECT_EQ(r.Error().value, Errc::kInvalidArgument) << text;
  }
}

TEST(EcuConfig, LoadMissingFileIsNotFound) {
  auto r = LoadEcuConfig(::testing::TempDir() + "no_such_vhil_config.json");
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, Errc::kNotFound);
}

TEST(EcuConfig, LoadSyntaxErrorIsCorruption) {
  const auto path = write_temp("vhil_broken.json", "{ \"ecu_name\": ");
  auto r = LoadEcuConfig(path);
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, Errc::kCorruption);
  std::remove(path.c_str());
}

TEST(EcuConfig, LoadFromFile) {
  const auto path = write_temp("vhil_ok.json", R"({"ecu_name": "FileECU", "diag": {"port": 14000}})");
  auto r = LoadEcuConfig(path);
  ASSERT_TRUE(r.HasValue()) << r.Error().Message();
  EXPECT_EQ(r->ecu_name, "FileECU");
  EXPECT_EQ(r->diag.port, 14000);
  std::remove(path.c_str());
}

TEST(EcuConfig, ApplyLogConfigInstallsGlobalIds) {
  LogConfig lc;
  lc.ecu_id = "TST";
  lc.app_id = "CFGT";
  lc.level = vhil::log::LogLevel::kWarn;
  lc.console = false;
  ApplyLogConfig(lc);

  auto lg = vhil::log::Logger::CreateLogger("CFG");
  EXPECT_EQ(lg.Level(), vhil::log::LogLevel::kWarn);

  vhil::log::LogManager::Instance().ClearSinks();
  vhil::log::LogManager::Instance().SetGlobalIds("VECU", "VHIL");
  vhil::log::LogManager::Instance().SetDefaultLevel(vhil::log::LogLevel::kInfo);
}
