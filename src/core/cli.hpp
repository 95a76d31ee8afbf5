#pragma once

#include <string>

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -2 for `daemon` (caller runs the daemon).
    static int run(int argc, char* argv[]);

    /// Optional project path in argv[2], made absolute against our cwd
    /// since the daemon runs elsewhere. Empty if not given.
    static std::string path_argument(int argc, char* argv[]);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_start(int argc, char* argv[]);
    static int cmd_stop();
    static int cmd_restart(int argc, char* argv[]);
    static int cmd_status();
    static int cmd_health();
    static int cmd_config(int argc, char* argv[]);
    static int cmd_doctor();
    static int cmd_setup_complete();
    static int cmd_metrics(int argc, char* argv[]);

    static std::string format_uptime(unsigned long long seconds);
};
