#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "daemon/daemon.hpp"

#include <spdlog/spdlog.h>
#include <signal.h>
#include <filesystem>

static Daemon* g_daemon = nullptr;

static void signal_handler(int /*sig*/) {
    if (g_daemon) {
        g_daemon->request_stop();
    }
}

static int run_daemon() {
    Config config;
    bool loaded = config.load();
    init_logging(config.data());
    if (!loaded && std::filesystem::exists(Config::config_path())) {
        spdlog::warn("Could not parse {}, using defaults", Config::config_path());
    }

    Daemon daemon(config);
    g_daemon = &daemon;

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    // A client hanging up mid-response must not kill the daemon
    signal(SIGPIPE, SIG_IGN);

    spdlog::info("botwarden daemon starting (project: {})", config.resolve_project_path());
    int ret = daemon.run();
    g_daemon = nullptr;
    return ret;
}

int main(int argc, char* argv[]) {
    int cli_result = CLI::run(argc, argv);

    if (cli_result == -2) {
        // daemon subcommand
        return run_daemon();
    }
    return cli_result;
}
