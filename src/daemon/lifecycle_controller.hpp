#pragma once

#include "daemon/health_probe.hpp"
#include "daemon/log_multiplexer.hpp"
#include "daemon/supervisor_state.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

enum class SupervisorError {
    None,
    AlreadyRunning,
    NotRunning,
    SpawnFailure,
    LockFailure,
};

const char* to_string(SupervisorError error);

struct SupervisorOptions {
    std::vector<std::string> worker_command = {"pnpm", "run", "dev"};
    std::chrono::milliseconds grace_period{500};
    std::chrono::milliseconds restart_pause{300};
    HealthEndpoint health;
};

struct LifecycleResult {
    bool success = false;
    SupervisorError error = SupervisorError::None;
    std::string message;
    std::optional<pid_t> pid;
};

struct WorkerStatus {
    bool is_running = false;
    uint64_t uptime_seconds = 0;
    std::optional<pid_t> pid;
    bool external = false;  // running according to the fallback probe only
};

struct WorkerHealth {
    bool is_running = false;
    bool is_responsive = false;
    uint64_t uptime_seconds = 0;
    std::optional<pid_t> pid;
    std::optional<double> memory_mb;
};

struct StatusResult {
    bool success = false;
    SupervisorError error = SupervisorError::None;
    std::string message;
    WorkerStatus status;
};

struct HealthResult {
    bool success = false;
    SupervisorError error = SupervisorError::None;
    std::string message;
    WorkerHealth health;
};

struct LifecycleEvent {
    enum class Kind { Started, Stopped, Error };
    Kind kind = Kind::Started;
    std::string message;

    /// "started", "stopped" or "error:<message>"
    std::string to_string() const;
};

/// Start/stop/restart/status/health over one SupervisorState.
///
/// Every read or write of the state happens with its mutex held, so at most
/// one worker is ever alive and callers never see worker and started_at
/// disagree. stop() and restart() block for the grace window / pause; call
/// them off any interactive thread.
class LifecycleController {
public:
    LifecycleController(SupervisorState& state, SupervisorOptions options, LogSink sink);
    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    LifecycleResult start(const std::string& working_dir);
    LifecycleResult stop();
    LifecycleResult restart(const std::string& working_dir);
    StatusResult status();
    HealthResult health();

    /// Listener pairs whose pipes are still open
    size_t active_listener_count();

    /// Block until every attached listener has reached end-of-stream
    void wait_for_listeners();

    /// Invoked after each lifecycle operation completes. Must not call back
    /// into the controller.
    std::function<void(const LifecycleEvent&)> on_lifecycle;

private:
    SupervisorState& state_;
    SupervisorOptions options_;
    LogSink sink_;
    HealthProbe probe_;

    std::mutex listeners_mutex_;
    std::vector<std::unique_ptr<LogMultiplexer>> listeners_;

    LifecycleResult do_start(const std::string& working_dir);
    LifecycleResult do_stop();
    void attach_listeners(int stdout_fd, int stderr_fd);
    void prune_listeners();
    void notify(LifecycleEvent::Kind kind, const std::string& message);

    static bool lock_state(std::unique_lock<std::mutex>& lock, std::string& err);
    static uint64_t uptime_of(const std::optional<std::chrono::steady_clock::time_point>& started_at);
};
