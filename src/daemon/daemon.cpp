#include "daemon/daemon.hpp"
#include "api/bot_api_client.hpp"
#include "core/env_file.hpp"
#include "core/logging.hpp"
#include "core/prerequisites.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <poll.h>
#include <filesystem>
#include <chrono>
#include <cerrno>
#include <cstring>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json to_json(const std::optional<pid_t>& pid) {
    return pid ? json(*pid) : json(nullptr);
}

json lifecycle_response(const LifecycleResult& result) {
    if (result.success) {
        return json({{"ok", true}, {"message", result.message}, {"pid", to_json(result.pid)}});
    }
    return json({{"ok", false}, {"error", result.message}, {"kind", to_string(result.error)}});
}

json error_response(const std::string& message, const std::string& kind) {
    return json({{"ok", false}, {"error", message}, {"kind", kind}});
}

} // namespace

SupervisorOptions Daemon::options_from(const AppConfig& cfg) {
    SupervisorOptions options;
    options.worker_command = cfg.worker_command;
    options.grace_period = std::chrono::milliseconds(cfg.grace_period_ms);
    options.restart_pause = std::chrono::milliseconds(cfg.restart_pause_ms);
    options.health.host = cfg.health_host;
    options.health.port = cfg.health_port;
    options.health.path = cfg.health_path;
    options.health.connect_timeout_ms = cfg.health_connect_timeout_ms;
    options.health.read_timeout_ms = cfg.health_read_timeout_ms;
    return options;
}

Daemon::Daemon(Config& config)
    : config_(config),
      controller_(std::make_unique<LifecycleController>(
          state_, options_from(config.data()), make_worker_log_sink())) {
    controller_->on_lifecycle = [](const LifecycleEvent& event) {
        if (event.kind == LifecycleEvent::Kind::Error) {
            spdlog::warn("Lifecycle event: {}", event.to_string());
        } else {
            spdlog::info("Lifecycle event: {}", event.to_string());
        }
    };
}

Daemon::~Daemon() {
    request_stop();
    if (auto_start_thread_.joinable()) {
        auto_start_thread_.join();
    }
    cleanup_socket();
}

void Daemon::cleanup_socket() {
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
        std::string path = Config::socket_path();
        if (!path.empty()) {
            unlink(path.c_str());
        }
    }
}

bool Daemon::start_ipc_server() {
    std::string path = Config::socket_path();
    if (path.empty()) {
        spdlog::error("Cannot determine socket path (HOME not set?)");
        return false;
    }

    // Clean up any existing socket
    unlink(path.c_str());

    // Ensure directory exists
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        spdlog::error("Cannot create {}: {}", fs::path(path).parent_path().string(), ec.message());
        return false;
    }

    socket_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (socket_fd_ < 0) {
        spdlog::error("socket() failed: {}", std::strerror(errno));
        return false;
    }

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(socket_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("Cannot bind {}: {}", path, std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        return false;
    }

    // Restrict permissions to owner only
    chmod(path.c_str(), 0600);

    if (listen(socket_fd_, 5) < 0) {
        spdlog::error("listen() failed: {}", std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        unlink(path.c_str());
        return false;
    }

    spdlog::info("Listening on {}", path);
    return true;
}

void Daemon::ipc_loop() {
    struct pollfd pfd;
    pfd.fd = socket_fd_;
    pfd.events = POLLIN;

    while (!stop_flag_.load()) {
        int ret = poll(&pfd, 1, 500); // 500ms timeout
        if (ret <= 0) continue;

        if (pfd.revents & POLLIN) {
            int client_fd = accept4(socket_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (client_fd < 0) continue;

            // Read a single JSON line
            std::string buffer;
            char c;
            while (read(client_fd, &c, 1) == 1) {
                if (c == '\n') break;
                buffer += c;
                if (buffer.size() > 65536) break; // prevent abuse
            }

            if (!buffer.empty()) {
                std::string response = handle_command(buffer);
                response += "\n";
                ssize_t total = 0;
                while (total < (ssize_t)response.size()) {
                    ssize_t n = send(client_fd, response.data() + total,
                                     response.size() - total, MSG_NOSIGNAL);
                    if (n <= 0) {
                        spdlog::debug("Client went away before the response was written");
                        break;
                    }
                    total += n;
                }
            }

            close(client_fd);
        }
    }
}

std::string Daemon::handle_command(const std::string& json_line) {
    json req;
    try {
        req = json::parse(json_line);
    } catch (const json::exception& e) {
        return error_response(std::string("Parse error: ") + e.what(), "bad_request").dump();
    }
    if (!req.is_object()) {
        return error_response("Request must be a JSON object", "bad_request").dump();
    }

    try {
        std::string cmd = req.value("cmd", "");
        spdlog::debug("IPC command: {}", cmd);

        // An empty directory would run the worker in the daemon's own cwd
        std::string path = req.value("path", config_.resolve_project_path());
        bool takes_path = cmd == "start" || cmd == "restart" || cmd == "config_get" ||
                          cmd == "config_set" || cmd == "prereqs";
        if (takes_path && path.empty()) {
            return error_response("Project path must not be empty", "bad_request").dump();
        }

        if (cmd == "ping") {
            return json({{"ok", true}}).dump();
        }

        if (cmd == "status") {
            auto result = controller_->status();
            if (!result.success) {
                return error_response(result.message, to_string(result.error)).dump();
            }
            const auto& st = result.status;
            json data;
            data["is_running"] = st.is_running;
            data["uptime_seconds"] = st.uptime_seconds;
            data["pid"] = to_json(st.pid);
            data["external"] = st.external;
            return json({{"ok", true}, {"data", data}}).dump();
        }

        if (cmd == "health") {
            auto result = controller_->health();
            if (!result.success) {
                return error_response(result.message, to_string(result.error)).dump();
            }
            const auto& h = result.health;
            json data;
            data["is_running"] = h.is_running;
            data["is_responsive"] = h.is_responsive;
            data["uptime_seconds"] = h.uptime_seconds;
            data["pid"] = to_json(h.pid);
            data["memory_mb"] = h.memory_mb ? json(*h.memory_mb) : json(nullptr);
            return json({{"ok", true}, {"data", data}}).dump();
        }

        if (cmd == "start") {
            return lifecycle_response(controller_->start(path)).dump();
        }

        if (cmd == "stop") {
            return lifecycle_response(controller_->stop()).dump();
        }

        if (cmd == "restart") {
            return lifecycle_response(controller_->restart(path)).dump();
        }

        if (cmd == "config_get") {
            auto result = EnvFile::load(path);
            if (!result.success) {
                return error_response(result.error, "io").dump();
            }
            return json({{"ok", true}, {"data", result.values}}).dump();
        }

        if (cmd == "config_set") {
            if (!req.contains("values") || !req["values"].is_object()) {
                return error_response("Missing 'values' object", "bad_request").dump();
            }
            // Merge into whatever is already there
            auto existing = EnvFile::load(path);
            EnvFile::Values values = existing.success ? existing.values : EnvFile::Values{};
            for (auto& [key, value] : req["values"].items()) {
                values[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
            std::string err;
            if (!EnvFile::save(path, values, err)) {
                return error_response(err, "io").dump();
            }
            return json({{"ok", true}}).dump();
        }

        if (cmd == "prereqs") {
            auto st = Prerequisites::check(path);
            json data;
            data["node_installed"] = st.node_installed;
            data["node_version"] = st.node_version;
            data["pnpm_installed"] = st.pnpm_installed;
            data["pnpm_version"] = st.pnpm_version;
            data["project_exists"] = st.project_exists;
            data["dependencies_installed"] = st.dependencies_installed;
            data["env_configured"] = st.env_configured;
            data["claude_code_path"] = st.claude_code_path;
            data["setup_complete"] = Prerequisites::is_setup_complete();
            return json({{"ok", true}, {"data", data}}).dump();
        }

        if (cmd == "metrics") {
            const auto& d = config_.data();
            BotApiClient client(d.health_host, d.health_port,
                                d.health_connect_timeout_ms, d.health_read_timeout_ms);
            auto metrics = client.fetch_metrics();
            if (metrics.counters.is_null() && metrics.gauges.is_null() &&
                metrics.histograms.is_null()) {
                return error_response("Metrics endpoint unavailable", "unavailable").dump();
            }
            json data;
            data["counters"] = metrics.counters;
            data["histograms"] = metrics.histograms;
            data["gauges"] = metrics.gauges;
            data["timestamp"] = metrics.timestamp;
            return json({{"ok", true}, {"data", data}}).dump();
        }

        return error_response("Unknown command: " + cmd, "bad_request").dump();

    } catch (const json::exception& e) {
        return error_response(std::string("Bad request: ") + e.what(), "bad_request").dump();
    }
}

void Daemon::auto_start() {
    const auto& d = config_.data();
    for (int waited = 0; waited < d.auto_start_delay_ms && !stop_flag_.load(); waited += 50) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (stop_flag_.load()) return;

    if (!Prerequisites::is_setup_complete()) {
        spdlog::info("Setup not complete, skipping worker auto-start");
        return;
    }

    auto result = controller_->start(config_.resolve_project_path());
    if (result.success) {
        spdlog::info("Worker auto-started (PID {})", *result.pid);
    } else if (result.error == SupervisorError::AlreadyRunning) {
        spdlog::info("Worker already running, auto-start not needed");
    } else {
        spdlog::error("Failed to auto-start worker: {}", result.message);
    }
}

void Daemon::request_stop() {
    stop_flag_.store(true);
}

int Daemon::run() {
    // 1. Start IPC server
    if (!start_ipc_server()) {
        return 1;
    }

    // 2. Auto-start the worker in the background
    if (config_.data().auto_start) {
        auto_start_thread_ = std::thread(&Daemon::auto_start, this);
    }

    // 3. IPC main loop
    ipc_loop();

    // 4. Cleanup
    stop_flag_.store(true);

    if (auto_start_thread_.joinable()) {
        auto_start_thread_.join();
    }

    // Best-effort: don't leak the worker past the daemon
    auto stopped = controller_->stop();
    if (!stopped.success && stopped.error != SupervisorError::NotRunning) {
        spdlog::warn("Stopping worker on exit failed: {}", stopped.message);
    }
    controller_->wait_for_listeners();

    cleanup_socket();
    spdlog::info("Daemon exited");

    return 0;
}
