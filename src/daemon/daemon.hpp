#pragma once

#include "core/config.hpp"
#include "daemon/lifecycle_controller.hpp"
#include "daemon/supervisor_state.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

class Daemon {
public:
    explicit Daemon(Config& config);
    ~Daemon();

    /// Main loop; blocks until stop is requested
    int run();

    /// Request graceful stop (called from signal handler)
    void request_stop();

    /// Dispatch one JSON request line, return one JSON response (no newline)
    std::string handle_command(const std::string& json_line);

    LifecycleController& controller() { return *controller_; }

    static SupervisorOptions options_from(const AppConfig& cfg);

private:
    Config& config_;
    SupervisorState state_;
    std::unique_ptr<LifecycleController> controller_;
    std::atomic<bool> stop_flag_{false};
    int socket_fd_ = -1;

    // IPC
    bool start_ipc_server();
    void ipc_loop();
    void cleanup_socket();

    // Auto-start
    std::thread auto_start_thread_;
    void auto_start();
};
