#include <phm/session_supervisor.hpp>

namespace vhil::phm {

SessionSupervisor::SessionSupervisor(const diag::DiagServer& server, const Config& cfg, Clock clock)
    : server_(server), cfg_(cfg),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })),
      log_(vhil::log::Logger::CreateLogger("PHM", "Session supervision")) {}

void SessionSupervisor::MaintenanceTick() {
    if (cfg_.timeout_ms <= 0) return;

    const auto session = server_.CurrentSession();
    const auto last = server_.LastActivity();

    if (violated_) {
        // re-arm once the tester talks again or the session falls back
        if (last != episode_activity_ || session == diag::Session::kDefault) violated_ = false;
        else return;
    }
    if (session == diag::Session::kDefault) return;

    const auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - last);
    if (idle <= std::chrono::milliseconds(cfg_.timeout_ms)) return;

    violated_ = true;
    episode_activity_ = last;
    violations_++;
    VHIL_LOGWARN(log_, "Session {} idle for {} ms (timeout {} ms)",
                 diag::ToString(session), idle.count(), cfg_.timeout_ms);
    if (on_violation_) on_violation_(session, idle);
}

} // namespace vhil::phm
