#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>

class DaemonClient {
public:
    DaemonClient();
    explicit DaemonClient(std::string socket_path);

    /// Check if the daemon is running (socket exists and responds)
    bool is_daemon_running();

    struct CommandResult {
        bool success = false;
        std::string message;  // success message or error text
        std::string kind;     // error category, empty on success
        std::optional<int> pid;
    };

    /// Lifecycle commands; path empty = daemon's configured project path
    CommandResult start(const std::string& path = "");
    CommandResult stop();
    CommandResult restart(const std::string& path = "");

    struct StatusInfo {
        bool reachable = false;
        bool is_running = false;
        uint64_t uptime_seconds = 0;
        std::optional<int> pid;
        bool external = false;
    };
    StatusInfo status();

    struct HealthInfo {
        bool reachable = false;
        bool is_running = false;
        bool is_responsive = false;
        uint64_t uptime_seconds = 0;
        std::optional<int> pid;
        std::optional<double> memory_mb;
    };
    HealthInfo health();

    /// Send a JSON command and receive response.
    /// Returns empty json on connection failure
    nlohmann::json send_command(const nlohmann::json& cmd);

private:
    std::string socket_path_;

    CommandResult lifecycle_command(const nlohmann::json& cmd);
};
