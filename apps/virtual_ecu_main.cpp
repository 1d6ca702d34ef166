#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

#include "log.hpp"
#include "sinks_console.hpp"

#include <can_gateway/socketcan_gateway.hpp>
#include <config/ecu_config.hpp>
#include <diag/diag_transport.hpp>
#include <fixture/virtual_ecu.hpp>

// graceful shutdown flag
static std::atomic<bool> running{true};
static void on_sig(int) { running.store(false, std::memory_order_relaxed); }

int main(int argc, char** argv) {
  std::signal(SIGINT,  on_sig);
  std::signal(SIGTERM, on_sig);

  // Console logging until the configuration says otherwise
  auto &LM = vhil::log::LogManager::Instance();
  LM.AddSink(std::make_shared<vhil::log::ConsoleSink>());

  vhil::config::EcuConfig cfg;
  if (argc > 1) {
    auto loaded = vhil::config::LoadEcuConfig(argv[1]);
    if (loaded) {
      cfg = std::move(*loaded);
    } else {
      auto lg = vhil::log::Logger::CreateLogger("ECU");
      VHIL_LOGERROR(lg, "Using defaults, config load failed: {}", loaded.Error().Message());
    }
  }
  vhil::config::ApplyLogConfig(cfg.log);
  auto lg = vhil::log::Logger::CreateLogger("ECU", "Virtual ECU application");

  vhil::fixture::VirtualEcu ecu(cfg);
  ecu.Start();

  vhil::diag::DiagTcpServer transport(ecu.Diagnostics(), cfg.diag.bind, cfg.diag.port);
  if (auto r = transport.Start(); !r) {
    VHIL_LOGFATAL(lg, "Diagnostic transport failed: {}", r.Error().Message());
    return 1;
  }

  std::unique_ptr<vhil::can_gateway::SocketCanGateway> gateway;
  if (cfg.gateway.enabled) {
    gateway = std::make_unique<vhil::can_gateway::SocketCanGateway>(ecu.Bus(), cfg.gateway.iface);
    if (auto r = gateway->Start(); !r) {
      VHIL_LOGWARN(lg, "Continuing without gateway: {}", r.Error().Message());
      gateway.reset();
    }
  }

  VHIL_LOGINFO(lg, "{} ready, UDS on {}:{}", cfg.ecu_name, cfg.diag.bind, transport.Port());

  using namespace std::chrono_literals;
  while (running.load(std::memory_order_relaxed)) {
    ecu.Tick();
    std::this_thread::sleep_for(100ms);
  }

  if (gateway) gateway->Stop();
  transport.Stop();
  ecu.Shutdown();

  const auto stats = ecu.BusStatistics();
  VHIL_LOGINFO(lg, "Shutdown (tx={} rx={})", stats.tx_count, stats.rx_count);
  return 0;
}
