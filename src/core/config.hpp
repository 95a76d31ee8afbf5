#pragma once

#include <string>
#include <vector>

struct AppConfig {
    // Project (worker working directory); empty = resolve from environment
    std::string project_path;

    // Worker
    std::vector<std::string> worker_command = {"pnpm", "run", "dev"};

    // Supervisor
    int grace_period_ms = 500;
    int restart_pause_ms = 300;
    bool auto_start = true;
    int auto_start_delay_ms = 500;

    // Health endpoint (fallback probe + metrics)
    std::string health_host = "127.0.0.1";
    int health_port = 3002;
    std::string health_path = "/metrics";
    int health_connect_timeout_ms = 2000;
    int health_read_timeout_ms = 5000;

    // Logging
    std::string log_level = "info";
    std::string log_file;  // empty = console only
};

class Config {
public:
    Config();
    ~Config();

    bool load();
    bool save();

    AppConfig& data();
    const AppConfig& data() const;

    /// project_path if set, otherwise default_project_path()
    std::string resolve_project_path() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string socket_path();
    static std::string expand_home(const std::string& path);

    /// $C2ME_PROJECT_PATH, then $HOME/Project/c2me, then /tmp/c2me
    static std::string default_project_path();

private:
    AppConfig config_;
};
