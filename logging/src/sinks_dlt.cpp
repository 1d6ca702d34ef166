#include "sinks_dlt.hpp"
#include <cstring>
#include <iostream>

#ifdef HAVE_DLT
  #include <dlt/dlt_user.h>
#endif

namespace vhil::log {

#ifdef HAVE_DLT
static DltLogLevelType to_dlt_level(LogLevel l) {
  switch (l) {
    case LogLevel::kFatal:   return DLT_LOG_FATAL;
    case LogLevel::kError:   return DLT_LOG_ERROR;
    case LogLevel::kWarn:    return DLT_LOG_WARN;
    case LogLevel::kInfo:    return DLT_LOG_INFO;
    case LogLevel::kDebug:   return DLT_LOG_DEBUG;
    case LogLevel::kVerbose: return DLT_LOG_VERBOSE;
    default:                 return DLT_LOG_INFO;
  }
}
#endif

DltSink::DltSink(std::string app_description)
  : app_desc_(std::move(app_description)) {}

DltSink::~DltSink() {
#ifdef HAVE_DLT
  std::scoped_lock lk(mu_);
  for (auto& [id, handle] : ctx_by_id_) {
    auto* ctx = static_cast<DltContext*>(handle.h);
    if (!ctx) continue;
    dlt_unregister_context(ctx);
    delete ctx;
  }
  ctx_by_id_.clear();
  if (!registered_app_id_.empty()) dlt_unregister_app();
#endif
}

void DltSink::ensureAppRegistered(const std::string& app_id) {
#ifdef HAVE_DLT
  if (registered_app_id_ == app_id) return;
  dlt_register_app(app_id.c_str(), app_desc_.c_str());
  registered_app_id_ = app_id;
#else
  (void)app_id;
#endif
}

void DltSink::ensureCtxRegistered(const std::string& ctx_id, const std::string& ctx_desc) {
#ifdef HAVE_DLT
  if (ctx_by_id_.find(ctx_id) != ctx_by_id_.end()) return;
  auto* ctx = new DltContext();
  std::memset(ctx, 0, sizeof(DltContext));
  const std::string& desc = ctx_desc.empty() ? ctx_id : ctx_desc;
  dlt_register_context(ctx, ctx_id.c_str(), desc.c_str());
  ctx_by_id_[ctx_id] = CtxHandle{ctx};
#else
  (void)ctx_id; (void)ctx_desc;
#endif
}

void DltSink::write(const LogRecord& r) noexcept {
#ifdef HAVE_DLT
  std::scoped_lock lk(mu_);
  ensureAppRegistered(r.app_id);
  ensureCtxRegistered(r.ctx_id, r.ctx_desc);

  auto it = ctx_by_id_.find(r.ctx_id);
  if (it == ctx_by_id_.end() || it->second.h == nullptr) return;
  auto* ctx = static_cast<DltContext*>(it->second.h);

  DLT_LOG(*ctx, to_dlt_level(r.level), DLT_STRING(r.message.c_str()));
#else
  static bool warned = false;
  if (!warned) {
    std::cerr << "[DLT] Built without DLT support (automotive-dlt not found at configure time). "
                 "Install libdlt-dev and reconfigure\n";
    warned = true;
  }
  (void)r;
#endif
}

} // namespace vhil::log
