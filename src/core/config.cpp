#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/botwarden";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/botwarden";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::socket_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/botwarden.sock";
}

std::string Config::default_project_path() {
    if (const char* p = std::getenv("C2ME_PROJECT_PATH")) {
        return p;
    }
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/Project/c2me";
    }
    return "/tmp/c2me";
}

std::string Config::resolve_project_path() const {
    if (!config_.project_path.empty()) {
        return expand_home(config_.project_path);
    }
    return default_project_path();
}

bool Config::load() {
    std::string path = config_path();
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    // Parse into a copy so a half-read file leaves the defaults intact
    AppConfig cfg = config_;
    try {
        YAML::Node root = YAML::LoadFile(path);

        // Project section
        if (auto project = root["project"]) {
            cfg.project_path = project["path"].as<std::string>(cfg.project_path);
        }

        // Worker section
        if (auto worker = root["worker"]) {
            if (auto cmd = worker["command"]) {
                // All-or-nothing: one non-scalar argument keeps the default command
                if (cmd.IsSequence() && cmd.size() > 0) {
                    std::vector<std::string> argv;
                    bool valid = true;
                    for (const auto& arg : cmd) {
                        if (!arg.IsScalar()) {
                            valid = false;
                            break;
                        }
                        argv.push_back(arg.Scalar());
                    }
                    if (valid) {
                        cfg.worker_command = std::move(argv);
                    }
                }
            }
        }

        // Supervisor section
        if (auto sup = root["supervisor"]) {
            cfg.grace_period_ms = sup["grace_period_ms"].as<int>(cfg.grace_period_ms);
            cfg.restart_pause_ms = sup["restart_pause_ms"].as<int>(cfg.restart_pause_ms);
            cfg.auto_start = sup["auto_start"].as<bool>(cfg.auto_start);
            cfg.auto_start_delay_ms = sup["auto_start_delay_ms"].as<int>(cfg.auto_start_delay_ms);
        }

        // Health section
        if (auto health = root["health"]) {
            cfg.health_host = health["host"].as<std::string>(cfg.health_host);
            cfg.health_port = health["port"].as<int>(cfg.health_port);
            cfg.health_path = health["path"].as<std::string>(cfg.health_path);
            cfg.health_connect_timeout_ms = health["connect_timeout_ms"].as<int>(cfg.health_connect_timeout_ms);
            cfg.health_read_timeout_ms = health["read_timeout_ms"].as<int>(cfg.health_read_timeout_ms);
        }

        // Logging section
        if (auto logging = root["logging"]) {
            cfg.log_level = logging["level"].as<std::string>(cfg.log_level);
            cfg.log_file = logging["file"].as<std::string>(cfg.log_file);
        }
    } catch (const YAML::Exception&) {
        // Parse failed, keep defaults
        return false;
    }

    config_ = std::move(cfg);
    return true;
}

bool Config::save() {
    std::string dir = config_dir();
    std::string path = config_path();
    if (dir.empty() || path.empty()) return false;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return false;

    YAML::Emitter out;
    out << YAML::BeginMap;

    // Project section
    out << YAML::Key << "project" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "path" << YAML::Value << config_.project_path;
    out << YAML::EndMap;

    // Worker section
    out << YAML::Key << "worker" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "command" << YAML::Value << YAML::Flow << config_.worker_command;
    out << YAML::EndMap;

    // Supervisor section
    out << YAML::Key << "supervisor" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "grace_period_ms" << YAML::Value << config_.grace_period_ms;
    out << YAML::Key << "restart_pause_ms" << YAML::Value << config_.restart_pause_ms;
    out << YAML::Key << "auto_start" << YAML::Value << config_.auto_start;
    out << YAML::Key << "auto_start_delay_ms" << YAML::Value << config_.auto_start_delay_ms;
    out << YAML::EndMap;

    // Health section
    out << YAML::Key << "health" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "host" << YAML::Value << config_.health_host;
    out << YAML::Key << "port" << YAML::Value << config_.health_port;
    out << YAML::Key << "path" << YAML::Value << config_.health_path;
    out << YAML::Key << "connect_timeout_ms" << YAML::Value << config_.health_connect_timeout_ms;
    out << YAML::Key << "read_timeout_ms" << YAML::Value << config_.health_read_timeout_ms;
    out << YAML::EndMap;

    // Logging section
    out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << config_.log_level;
    out << YAML::Key << "file" << YAML::Value << config_.log_file;
    out << YAML::EndMap;

    out << YAML::EndMap;

    std::ofstream fout(path);
    if (!fout.is_open()) return false;
    fout << out.c_str();
    return fout.good();
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
