#include "daemon/lifecycle_controller.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>
#include <thread>
#include <sys/wait.h>

const char* to_string(SupervisorError error) {
    switch (error) {
        case SupervisorError::None:           return "none";
        case SupervisorError::AlreadyRunning: return "already_running";
        case SupervisorError::NotRunning:     return "not_running";
        case SupervisorError::SpawnFailure:   return "spawn_failure";
        case SupervisorError::LockFailure:    return "lock_failure";
    }
    return "unknown";
}

std::string LifecycleEvent::to_string() const {
    switch (kind) {
        case Kind::Started: return "started";
        case Kind::Stopped: return "stopped";
        case Kind::Error:   return "error:" + message;
    }
    return "error:" + message;
}

LifecycleController::LifecycleController(SupervisorState& state,
                                         SupervisorOptions options,
                                         LogSink sink)
    : state_(state),
      options_(std::move(options)),
      sink_(std::move(sink)),
      probe_(options_.health) {}

LifecycleController::~LifecycleController() {
    // Listeners only end once the worker's pipes close
    auto result = do_stop();
    if (!result.success && result.error != SupervisorError::NotRunning) {
        spdlog::warn("Stopping worker on shutdown failed: {}", result.message);
    }
    wait_for_listeners();
}

bool LifecycleController::lock_state(std::unique_lock<std::mutex>& lock, std::string& err) {
    try {
        lock.lock();
        return true;
    } catch (const std::system_error& e) {
        err = std::string("Supervisor state lock unusable: ") + e.what();
        spdlog::error("{}", err);
        return false;
    }
}

uint64_t LifecycleController::uptime_of(
    const std::optional<std::chrono::steady_clock::time_point>& started_at) {
    if (!started_at) return 0;
    auto elapsed = std::chrono::steady_clock::now() - *started_at;
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(elapsed).count());
}

// ── start ───────────────────────────────────────────────────

LifecycleResult LifecycleController::do_start(const std::string& working_dir) {
    LifecycleResult result;

    std::unique_lock<std::mutex> lock(state_.mutex, std::defer_lock);
    if (!lock_state(lock, result.message)) {
        result.error = SupervisorError::LockFailure;
        return result;
    }

    if (state_.worker) {
        result.error = SupervisorError::AlreadyRunning;
        result.message = "Worker is already running";
        return result;
    }

    ProcessHandle handle;
    std::string err;
    if (!ProcessHandle::spawn(options_.worker_command, working_dir, handle, err)) {
        result.error = SupervisorError::SpawnFailure;
        result.message = err;
        spdlog::error("{}", err);
        return result;
    }

    pid_t pid = handle.pid();
    int stdout_fd = handle.take_stdout();
    int stderr_fd = handle.take_stderr();

    state_.worker = std::move(handle);
    state_.started_at = std::chrono::steady_clock::now();
    lock.unlock();

    attach_listeners(stdout_fd, stderr_fd);

    spdlog::info("Worker started with PID {} in {}", pid, working_dir);
    result.success = true;
    result.pid = pid;
    result.message = "Worker started with PID: " + std::to_string(pid);
    return result;
}

LifecycleResult LifecycleController::start(const std::string& working_dir) {
    auto result = do_start(working_dir);
    if (result.success) {
        notify(LifecycleEvent::Kind::Started, result.message);
    } else {
        notify(LifecycleEvent::Kind::Error, result.message);
    }
    return result;
}

// ── stop ────────────────────────────────────────────────────

LifecycleResult LifecycleController::do_stop() {
    LifecycleResult result;

    // Held for the whole sequence: nobody may start a second worker, or see
    // a half-cleared state, while the first one is being killed.
    std::unique_lock<std::mutex> lock(state_.mutex, std::defer_lock);
    if (!lock_state(lock, result.message)) {
        result.error = SupervisorError::LockFailure;
        return result;
    }

    if (!state_.worker) {
        result.error = SupervisorError::NotRunning;
        result.message = "Worker is not running";
        return result;
    }

    ProcessHandle handle = std::move(*state_.worker);
    state_.worker.reset();
    pid_t pid = handle.pid();

    // 1. Graceful phase
    if (!handle.terminate()) {
        spdlog::debug("SIGTERM to worker {} not delivered", pid);
    }

    // 2. Grace window
    std::this_thread::sleep_for(options_.grace_period);

    // 3. Forced phase, unconditionally, then reap
    handle.kill();
    int status = handle.wait();

    state_.started_at.reset();
    lock.unlock();

    if (status >= 0 && WIFEXITED(status)) {
        spdlog::info("Worker {} stopped (exit code {})", pid, WEXITSTATUS(status));
    } else if (status >= 0 && WIFSIGNALED(status)) {
        spdlog::info("Worker {} stopped (signal {})", pid, WTERMSIG(status));
    } else {
        spdlog::info("Worker {} stopped", pid);
    }

    result.success = true;
    result.pid = pid;
    result.message = "Worker stopped successfully";
    return result;
}

LifecycleResult LifecycleController::stop() {
    auto result = do_stop();
    if (result.success) {
        notify(LifecycleEvent::Kind::Stopped, result.message);
    } else {
        notify(LifecycleEvent::Kind::Error, result.message);
    }
    return result;
}

// ── restart ─────────────────────────────────────────────────

LifecycleResult LifecycleController::restart(const std::string& working_dir) {
    auto stopped = do_stop();
    if (stopped.success) {
        notify(LifecycleEvent::Kind::Stopped, stopped.message);
    } else {
        spdlog::debug("Restart: stop phase skipped: {}", stopped.message);
    }

    // Give ports and file locks a moment to be released
    std::this_thread::sleep_for(options_.restart_pause);

    return start(working_dir);
}

// ── status / health ─────────────────────────────────────────

StatusResult LifecycleController::status() {
    StatusResult result;
    {
        std::unique_lock<std::mutex> lock(state_.mutex, std::defer_lock);
        if (!lock_state(lock, result.message)) {
            result.error = SupervisorError::LockFailure;
            return result;
        }
        result.status.is_running = state_.worker.has_value();
        if (state_.worker) {
            result.status.pid = state_.worker->pid();
        }
        result.status.uptime_seconds = uptime_of(state_.started_at);
    }

    // Network probe runs without the lock; it is never merged into the state
    if (!result.status.is_running && probe_.external_worker_running()) {
        result.status.is_running = true;
        result.status.external = true;
    }

    result.success = true;
    return result;
}

HealthResult LifecycleController::health() {
    HealthResult result;

    // Probes run under the lock so the pid can't be reaped (and reused) meanwhile
    std::unique_lock<std::mutex> lock(state_.mutex, std::defer_lock);
    if (!lock_state(lock, result.message)) {
        result.error = SupervisorError::LockFailure;
        return result;
    }

    auto& h = result.health;
    h.is_running = state_.worker.has_value();
    h.uptime_seconds = uptime_of(state_.started_at);
    if (state_.worker) {
        pid_t pid = state_.worker->pid();
        h.pid = pid;
        h.is_responsive = HealthProbe::is_responsive(pid);
        h.memory_mb = HealthProbe::resident_memory_mb(pid);
    }

    result.success = true;
    return result;
}

// ── listeners ───────────────────────────────────────────────

void LifecycleController::attach_listeners(int stdout_fd, int stderr_fd) {
    auto mux = std::make_unique<LogMultiplexer>(stdout_fd, stderr_fd, sink_);

    std::lock_guard<std::mutex> lock(listeners_mutex_);
    prune_listeners();
    listeners_.push_back(std::move(mux));
}

void LifecycleController::prune_listeners() {
    for (auto it = listeners_.begin(); it != listeners_.end();) {
        if ((*it)->finished()) {
            (*it)->join();
            it = listeners_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t LifecycleController::active_listener_count() {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return static_cast<size_t>(std::count_if(
        listeners_.begin(), listeners_.end(),
        [](const std::unique_ptr<LogMultiplexer>& mux) { return !mux->finished(); }));
}

void LifecycleController::wait_for_listeners() {
    std::vector<std::unique_ptr<LogMultiplexer>> pending;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        pending.swap(listeners_);
    }
    for (auto& mux : pending) {
        mux->join();
    }
}

void LifecycleController::notify(LifecycleEvent::Kind kind, const std::string& message) {
    LifecycleEvent event;
    event.kind = kind;
    event.message = message;

    if (!on_lifecycle) return;
    try {
        on_lifecycle(event);
    } catch (const std::exception& e) {
        spdlog::debug("Lifecycle observer failed on '{}': {}", event.to_string(), e.what());
    }
}
