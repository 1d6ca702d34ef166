#pragma once
#include "log.hpp"
#include <mutex>
#include <unordered_map>
#include <string>

namespace vhil::log {

// Forwards records to the COVESA DLT daemon. Contexts are registered lazily
// the first time a record with a new ctx_id arrives.
class DltSink : public ISink {
public:
  explicit DltSink(std::string app_description = "Virtual HIL ECU");
  ~DltSink() override;

  void write(const LogRecord& r) noexcept override;

private:
  void ensureAppRegistered(const std::string& app_id);
  void ensureCtxRegistered(const std::string& ctx_id, const std::string& ctx_desc);

  struct CtxHandle { void* h = nullptr; }; // opaque to avoid including dlt headers here
  std::mutex mu_;
  std::string app_desc_;
  std::string registered_app_id_;
  std::unordered_map<std::string, CtxHandle> ctx_by_id_;
};

} // namespace vhil::log
