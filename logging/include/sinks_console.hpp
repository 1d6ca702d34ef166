#pragma once
#include "log.hpp"
#include <iostream>
#include <mutex>

namespace vhil::log {

struct ConsoleSink : ISink {
  void write(const LogRecord& r) noexcept override {
    std::scoped_lock lk(mu_);
    std::cout << "[" << ToString(r.level) << "] "
              << r.app_id << "/" << r.ctx_id << ": " << r.message << std::endl;
  }

private:
  std::mutex mu_;  // bus, transport and gateway threads share one stream
};

} // namespace vhil::log
