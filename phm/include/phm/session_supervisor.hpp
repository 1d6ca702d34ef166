#pragma once
#include <diag/diag_server.hpp>
#include <log.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace vhil::phm {

// Watches a DiagServer for non-default sessions left idle longer than the
// configured timeout. Purely observational: the session is never changed.
class SessionSupervisor {
public:
    struct Config {
        int timeout_ms{5000};  // 0 disables supervision
    };

    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using ViolationCallback = std::function<void(diag::Session session, std::chrono::milliseconds idle)>;

    SessionSupervisor(const diag::DiagServer& server, const Config& cfg, Clock clock = {});

    // Driven by the owner; one violation is reported per inactivity episode
    void MaintenanceTick();

    void set_violation_callback(ViolationCallback cb) { on_violation_ = std::move(cb); }

    bool Violated() const noexcept { return violated_; }
    std::uint64_t ViolationCount() const noexcept { return violations_; }
    const Config& config() const noexcept { return cfg_; }

private:
    const diag::DiagServer& server_;
    Config cfg_{};
    Clock clock_;
    vhil::log::Logger log_;

    bool violated_{false};
    std::chrono::steady_clock::time_point episode_activity_{};
    std::uint64_t violations_{0};
    ViolationCallback on_violation_{};
};

} // namespace vhil::phm
