#pragma once
#include <diag/diag_server.hpp>
#include <vhil/core/result.hpp>
#include <log.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vhil::diag {

// Serves a DiagServer over TCP. Each APDU is framed as [u16 big-endian length][bytes],
// in both directions; a suppressed response is sent as length 0.
class DiagTcpServer {
public:
  DiagTcpServer(DiagServer& server, std::string bind_addr = "127.0.0.1", uint16_t port = 13400);
  ~DiagTcpServer();

  DiagTcpServer(const DiagTcpServer&) = delete;
  DiagTcpServer& operator=(const DiagTcpServer&) = delete;

  // Port 0 binds an ephemeral port; Port() reports the bound one
  core::Result<void> Start();
  void Stop();

  bool Running() const noexcept { return running_.load(); }
  uint16_t Port() const noexcept { return bound_port_.load(); }

private:
  void AcceptLoop();
  void ServeConnection(int fd);

  DiagServer& server_;
  std::string bind_addr_;
  uint16_t port_;
  vhil::log::Logger log_;

  std::mutex start_mu_;
  int listen_fd_{-1};
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> bound_port_{0};
  std::thread accept_thread_;
};

// One-shot client: connects, sends one framed request, reads one framed reply
core::Result<std::vector<uint8_t>> SendDiagRequest(const std::string& host, uint16_t port,
                                                   const std::vector<uint8_t>& request,
                                                   std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

} // namespace vhil::diag
