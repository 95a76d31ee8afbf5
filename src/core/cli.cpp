#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/env_file.hpp"
#include "core/prerequisites.hpp"
#include "api/bot_api_client.hpp"
#include "daemon/ipc_client.hpp"

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iostream>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

namespace {

const char* kNoDaemon =
    "Daemon is not running. Start it with 'botwarden daemon'.\n";

int print_lifecycle(const DaemonClient::CommandResult& result) {
    if (result.success) {
        std::cout << result.message << "\n";
        return 0;
    }
    if (result.kind == "unreachable") {
        std::cerr << kNoDaemon;
    } else {
        std::cerr << "Error: " << result.message << "\n";
    }
    return 1;
}

} // namespace

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return 1;
    }

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "daemon") == 0 || std::strcmp(cmd, "--daemon") == 0) {
        return -2;  // special: caller handles daemon mode
    }
    if (std::strcmp(cmd, "start") == 0) {
        return cmd_start(argc, argv);
    }
    if (std::strcmp(cmd, "stop") == 0) {
        return cmd_stop();
    }
    if (std::strcmp(cmd, "restart") == 0) {
        return cmd_restart(argc, argv);
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status();
    }
    if (std::strcmp(cmd, "health") == 0) {
        return cmd_health();
    }
    if (std::strcmp(cmd, "config") == 0) {
        return cmd_config(argc, argv);
    }
    if (std::strcmp(cmd, "doctor") == 0) {
        return cmd_doctor();
    }
    if (std::strcmp(cmd, "setup-complete") == 0) {
        return cmd_setup_complete();
    }
    if (std::strcmp(cmd, "metrics") == 0) {
        return cmd_metrics(argc, argv);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'botwarden help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "botwarden: supervisor for the chat bot worker process\n"
        "\n"
        "Usage:\n"
        "  botwarden daemon              Run the supervisor daemon\n"
        "  botwarden start [path]        Start the worker (default: project path)\n"
        "  botwarden stop                Stop the worker (SIGTERM, then SIGKILL)\n"
        "  botwarden restart [path]      Stop, pause, start\n"
        "  botwarden status              Show running state, PID and uptime\n"
        "  botwarden health              Status plus responsiveness and memory\n"
        "  botwarden config get [KEY]    Show the worker's .env values\n"
        "  botwarden config set KEY VAL  Set one .env value\n"
        "  botwarden config init K=V...  Create .env from .env.example / template\n"
        "                                (CLAUDE_CODE_PATH is detected if not given)\n"
        "  botwarden doctor              Check node, pnpm, claude and the project setup\n"
        "  botwarden setup-complete      Mark first-run setup as done\n"
        "  botwarden metrics [analytics|extended]  Query the worker's HTTP API\n"
        "  botwarden version             Show version\n"
        "  botwarden help                Show this help\n"
        "\n"
        "Project path: project.path in ~/.config/botwarden/config.yaml,\n"
        "else $C2ME_PROJECT_PATH, else ~/Project/c2me.\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "botwarden " << APP_VERSION << "\n";
    return 0;
}

// ── lifecycle ───────────────────────────────────────────────

std::string CLI::path_argument(int argc, char* argv[]) {
    if (argc < 3 || argv[2][0] == '\0') return "";
    std::error_code ec;
    auto path = std::filesystem::absolute(argv[2], ec);
    if (ec) return argv[2];
    return path.lexically_normal().string();
}

int CLI::cmd_start(int argc, char* argv[]) {
    DaemonClient dc;
    return print_lifecycle(dc.start(path_argument(argc, argv)));
}

int CLI::cmd_stop() {
    DaemonClient dc;
    return print_lifecycle(dc.stop());
}

int CLI::cmd_restart(int argc, char* argv[]) {
    DaemonClient dc;
    return print_lifecycle(dc.restart(path_argument(argc, argv)));
}

std::string CLI::format_uptime(unsigned long long seconds) {
    char buf[64];
    unsigned long long h = seconds / 3600;
    unsigned long long m = (seconds % 3600) / 60;
    unsigned long long s = seconds % 60;
    if (h > 0) {
        std::snprintf(buf, sizeof(buf), "%lluh %llum %llus", h, m, s);
    } else if (m > 0) {
        std::snprintf(buf, sizeof(buf), "%llum %llus", m, s);
    } else {
        std::snprintf(buf, sizeof(buf), "%llus", s);
    }
    return buf;
}

// ── status ──────────────────────────────────────────────────

int CLI::cmd_status() {
    DaemonClient dc;
    auto st = dc.status();

    if (st.reachable) {
        std::cout << "Daemon:  running\n";
        if (!st.is_running) {
            std::cout << "Worker:  stopped\n";
        } else if (st.external) {
            std::cout << "Worker:  running (not started by this daemon)\n";
        } else {
            std::cout << "Worker:  running (pid " << (st.pid ? std::to_string(*st.pid) : "?") << ")\n";
            std::cout << "Uptime:  " << format_uptime(st.uptime_seconds) << "\n";
        }
        return 0;
    }

    // No daemon: ask the worker's endpoint directly
    std::cout << "Daemon:  stopped\n";
    Config config;
    config.load();
    auto& d = config.data();
    BotApiClient client(d.health_host, d.health_port,
                        d.health_connect_timeout_ms, d.health_read_timeout_ms);
    if (client.ping(d.health_path)) {
        std::cout << "Worker:  running (endpoint " << d.health_host << ":" << d.health_port << ")\n";
    } else {
        std::cout << "Worker:  not reachable\n";
    }
    return 0;
}

int CLI::cmd_health() {
    DaemonClient dc;
    auto h = dc.health();
    if (!h.reachable) {
        std::cerr << kNoDaemon;
        return 1;
    }

    std::cout << "Running:    " << (h.is_running ? "yes" : "no") << "\n";
    if (h.pid) {
        std::cout << "PID:        " << *h.pid << "\n";
    }
    std::cout << "Responsive: " << (h.is_responsive ? "yes" : "no") << "\n";
    std::cout << "Uptime:     " << format_uptime(h.uptime_seconds) << "\n";
    if (h.memory_mb) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f MB", *h.memory_mb);
        std::cout << "Memory:     " << buf << "\n";
    } else {
        std::cout << "Memory:     unknown\n";
    }
    return 0;
}

// ── config (.env) ───────────────────────────────────────────

int CLI::cmd_config(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: botwarden config <get [KEY]|set KEY VALUE|init KEY=VALUE...>\n";
        return 1;
    }

    Config config;
    config.load();
    std::string dir = config.resolve_project_path();
    const char* sub = argv[2];

    if (std::strcmp(sub, "get") == 0) {
        auto result = EnvFile::load(dir);
        if (!result.success) {
            std::cerr << result.error << "\n";
            return 1;
        }
        if (argc >= 4) {
            auto it = result.values.find(argv[3]);
            if (it == result.values.end()) {
                std::cerr << "Key not set: " << argv[3] << "\n";
                return 1;
            }
            std::cout << it->second << "\n";
            return 0;
        }
        for (const auto& [key, value] : result.values) {
            std::cout << key << "=" << value << "\n";
        }
        return 0;
    }

    if (std::strcmp(sub, "set") == 0) {
        if (argc < 5) {
            std::cerr << "Usage: botwarden config set KEY VALUE\n";
            return 1;
        }
        auto result = EnvFile::load(dir);
        EnvFile::Values values = result.success ? result.values : EnvFile::Values{};
        values[argv[3]] = argv[4];
        std::string err;
        if (!EnvFile::save(dir, values, err)) {
            std::cerr << err << "\n";
            return 1;
        }
        return 0;
    }

    if (std::strcmp(sub, "init") == 0) {
        EnvFile::Values values;
        for (int i = 3; i < argc; ++i) {
            std::string arg = argv[i];
            auto eq = arg.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Expected KEY=VALUE, got: " << arg << "\n";
                return 1;
            }
            values[arg.substr(0, eq)] = arg.substr(eq + 1);
        }
        if (values.find("CLAUDE_CODE_PATH") == values.end()) {
            std::string claude = Prerequisites::detect_claude_code_path();
            if (!claude.empty()) {
                values["CLAUDE_CODE_PATH"] = claude;
            }
        }
        std::string err;
        if (!EnvFile::create(dir, values, err)) {
            std::cerr << err << "\n";
            return 1;
        }
        std::cout << "Wrote " << EnvFile::path_in(dir) << "\n";
        return 0;
    }

    std::cerr << "Unknown config subcommand: " << sub << "\n";
    return 1;
}

// ── doctor / setup ──────────────────────────────────────────

int CLI::cmd_doctor() {
    Config config;
    config.load();
    std::string dir = config.resolve_project_path();
    auto st = Prerequisites::check(dir);

    auto mark = [](bool ok) { return ok ? "ok     " : "missing"; };
    std::cout << "Project:      " << dir << "\n";
    std::cout << "node          " << mark(st.node_installed) << " " << st.node_version << "\n";
    std::cout << "pnpm          " << mark(st.pnpm_installed) << " " << st.pnpm_version << "\n";
    std::cout << "project dir   " << mark(st.project_exists) << "\n";
    std::cout << "node_modules  " << mark(st.dependencies_installed) << "\n";
    std::cout << ".env          " << mark(st.env_configured) << "\n";
    std::cout << "claude        " << mark(!st.claude_code_path.empty()) << " " << st.claude_code_path << "\n";
    std::cout << "setup flag    " << mark(Prerequisites::is_setup_complete()) << "\n";

    bool ready = st.node_installed && st.pnpm_installed && st.project_exists &&
                 st.dependencies_installed && st.env_configured;
    return ready ? 0 : 1;
}

int CLI::cmd_setup_complete() {
    std::string err;
    if (!Prerequisites::mark_setup_complete(err)) {
        std::cerr << err << "\n";
        return 1;
    }
    std::cout << "Setup marked complete\n";
    return 0;
}

// ── metrics ─────────────────────────────────────────────────

int CLI::cmd_metrics(int argc, char* argv[]) {
    Config config;
    config.load();
    auto& d = config.data();
    BotApiClient client(d.health_host, d.health_port,
                        d.health_connect_timeout_ms, d.health_read_timeout_ms);

    nlohmann::json out;
    if (argc >= 3 && std::strcmp(argv[2], "analytics") == 0) {
        out = client.fetch_analytics();
    } else if (argc >= 3 && std::strcmp(argv[2], "extended") == 0) {
        out = client.fetch_extended_metrics();
    } else if (argc >= 3) {
        std::cerr << "Usage: botwarden metrics [analytics|extended]\n";
        return 1;
    } else {
        auto m = client.fetch_metrics();
        if (!m.counters.is_null() || !m.histograms.is_null() || !m.gauges.is_null()) {
            out = {{"counters", m.counters}, {"histograms", m.histograms},
                   {"gauges", m.gauges}, {"timestamp", m.timestamp}};
        }
    }

    if (out.is_null()) {
        std::cerr << "Worker API not reachable at " << d.health_host << ":" << d.health_port << "\n";
        return 1;
    }
    std::cout << out.dump(2) << "\n";
    return 0;
}
