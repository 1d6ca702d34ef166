// diag/src/diag_transport.cpp
#include <diag/diag_transport.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

using vhil::core::ErrorCode;
using vhil::core::Errc;

namespace vhil::diag {

namespace {

constexpr int kPollIntervalMs = 100;
// Pause after a failed poll/accept on the listen socket; the condition
// (EMFILE, ENOBUFS, ...) usually persists and would otherwise spin
constexpr std::chrono::milliseconds kAcceptBackoff{100};

// Waits until fd is readable, honouring `keep_going` every poll interval.
// Returns false on timeout, error or cancellation.
template <typename Pred>
bool wait_readable(int fd, int timeout_ms, Pred keep_going) {
  int waited = 0;
  while (keep_going()) {
    pollfd p{fd, POLLIN, 0};
    const int slice = (timeout_ms < 0) ? kPollIntervalMs : std::min(kPollIntervalMs, timeout_ms - waited);
    const int rc = ::poll(&p, 1, slice);
    if (rc > 0) return true;
    if (rc < 0 && errno != EINTR) return false;
    if (timeout_ms >= 0) {
      waited += slice;
      if (waited >= timeout_ms) return false;
    }
  }
  return false;
}

template <typename Pred>
bool read_exact(int fd, uint8_t* buf, std::size_t n, int timeout_ms, Pred keep_going) {
  std::size_t got = 0;
  while (got < n) {
    if (!wait_readable(fd, timeout_ms, keep_going)) return false;
    const ssize_t r = ::read(fd, buf + got, n - got);
    if (r == 0) return false;  // peer closed
    if (r < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    got += static_cast<std::size_t>(r);
  }
  return true;
}

bool write_all(int fd, const uint8_t* buf, std::size_t n) {
  std::size_t sent = 0;
  while (sent < n) {
    const ssize_t w = ::send(fd, buf + sent, n - sent, MSG_NOSIGNAL);
    if (w < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    sent += static_cast<std::size_t>(w);
  }
  return true;
}

bool write_frame(int fd, const std::vector<uint8_t>& payload) {
  const auto len = static_cast<uint16_t>(payload.size());
  const uint8_t hdr[2] = {static_cast<uint8_t>(len >> 8), static_cast<uint8_t>(len & 0xFF)};
  if (!write_all(fd, hdr, sizeof(hdr))) return false;
  return len == 0 || write_all(fd, payload.data(), len);
}

std::string errno_text(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

DiagTcpServer::DiagTcpServer(DiagServer& server, std::string bind_addr, uint16_t port)
  : server_(server), bind_addr_(std::move(bind_addr)), port_(port),
    log_(vhil::log::Logger::CreateLogger("DTCP", "Diagnostic TCP transport")) {}

DiagTcpServer::~DiagTcpServer() {
  Stop();
}

core::Result<void> DiagTcpServer::Start() {
  std::scoped_lock lk(start_mu_);
  if (running_) return {};

  int s = ::socket(AF_INET, SOCK_STREAM, 0);
  if (s < 0) return ErrorCode(Errc::kIoError, errno_text("socket"));
  int opt = 1;
  if (::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    VHIL_LOGWARN(log_, "SO_REUSEADDR failed: {}", std::strerror(errno));
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  if (::inet_pton(AF_INET, bind_addr_.c_str(), &addr.sin_addr) != 1) {
    ::close(s);
    return ErrorCode(Errc::kInvalidArgument, "bad bind address '" + bind_addr_ + "'");
  }
  if (::bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    auto err = errno_text("bind");
    ::close(s);
    return ErrorCode(Errc::kUnavailable, err);
  }
  if (::listen(s, 4) < 0) {
    auto err = errno_text("listen");
    ::close(s);
    return ErrorCode(Errc::kIoError, err);
  }

  sockaddr_in bound{};
  socklen_t blen = sizeof(bound);
  if (::getsockname(s, reinterpret_cast<sockaddr*>(&bound), &blen) == 0)
    bound_port_ = ntohs(bound.sin_port);
  else
    bound_port_ = port_;

  listen_fd_ = s;
  running_ = true;
  accept_thread_ = std::thread([this] { AcceptLoop(); });
  VHIL_LOGINFO(log_, "UDS transport listening on {}:{}", bind_addr_, bound_port_.load());
  return {};
}

void DiagTcpServer::Stop() {
  std::scoped_lock lk(start_mu_);
  if (!running_.exchange(false) && !accept_thread_.joinable()) return;
  if (accept_thread_.joinable()) accept_thread_.join();
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
  VHIL_LOGINFO(log_, "UDS transport stopped");
}

void DiagTcpServer::AcceptLoop() {
  auto keep_going = [this] { return running_.load(); };
  while (running_) {
    if (!wait_readable(listen_fd_, -1, keep_going)) {
      if (!running_) break;
      VHIL_LOGWARN(log_, "poll on listen socket failed: {}", std::strerror(errno));
      std::this_thread::sleep_for(kAcceptBackoff);
      continue;
    }
    int c = ::accept(listen_fd_, nullptr, nullptr);
    if (c < 0) {
      if (errno == EINTR) continue;
      VHIL_LOGWARN(log_, "accept failed: {}", std::strerror(errno));
      std::this_thread::sleep_for(kAcceptBackoff);
      continue;
    }
    VHIL_LOGDEBUG(log_, "Tester connected");
    ServeConnection(c);
    ::close(c);
    VHIL_LOGDEBUG(log_, "Tester disconnected");
  }
}

// A connection carries any number of requests until the peer closes it
void DiagTcpServer::ServeConnection(int fd) {
  auto keep_going = [this] { return running_.load(); };
  while (running_) {
    uint8_t hdr[2];
    if (!read_exact(fd, hdr, 2, -1, keep_going)) return;
    const uint16_t len = static_cast<uint16_t>((hdr[0] << 8) | hdr[1]);

    std::vector<uint8_t> req(len);
    if (len > 0 && !read_exact(fd, req.data(), len, -1, keep_going)) return;

    const auto rsp = server_.ProcessRequest(req).ToBytes();
    if (!write_frame(fd, rsp)) {
      VHIL_LOGWARN(log_, "Reply write failed: {}", std::strerror(errno));
      return;
    }
  }
}

core::Result<std::vector<uint8_t>> SendDiagRequest(const std::string& host, uint16_t port,
                                                   const std::vector<uint8_t>& request,
                                                   std::chrono::milliseconds timeout) {
  if (request.size() > 0xFFFF) return ErrorCode(Errc::kInvalidArgument, "request too long");

  int s = ::socket(AF_INET, SOCK_STREAM, 0);
  if (s < 0) return ErrorCode(Errc::kIoError, errno_text("socket"));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    ::close(s);
    return ErrorCode(Errc::kInvalidArgument, "bad host '" + host + "'");
  }
  if (::connect(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    auto err = errno_text("connect");
    ::close(s);
    return ErrorCode(Errc::kUnavailable, err);
  }

  if (!write_frame(s, request)) {
    auto err = errno_text("send");
    ::close(s);
    return ErrorCode(Errc::kIoError, err);
  }

  const int tmo = static_cast<int>(timeout.count());
  auto always = [] { return true; };
  uint8_t hdr[2];
  if (!read_exact(s, hdr, 2, tmo, always)) {
    ::close(s);
    return ErrorCode(Errc::kIoError, "no reply");
  }
  const uint16_t len = static_cast<uint16_t>((hdr[0] << 8) | hdr[1]);
  std::vector<uint8_t> rsp(len);
  if (len > 0 && !read_exact(s, rsp.data(), len, tmo, always)) {
    ::close(s);
    return ErrorCode(Errc::kIoError, "truncated reply");
  }
  ::close(s);
  return rsp;
}

} // namespace vhil::diag
