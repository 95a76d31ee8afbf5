#include "daemon/health_probe.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <fstream>
#include <iterator>
#include <sstream>

HealthProbe::HealthProbe(const HealthEndpoint& endpoint)
    : endpoint_(endpoint),
      client_(endpoint.host, endpoint.port,
              endpoint.connect_timeout_ms, endpoint.read_timeout_ms) {}

bool HealthProbe::external_worker_running() {
    bool running = client_.ping(endpoint_.path);
    spdlog::debug("External worker check on {}:{}{}: is_running={}",
                  endpoint_.host, endpoint_.port, endpoint_.path, running);
    return running;
}

#if defined(__linux__)

std::optional<char> HealthProbe::process_state(pid_t pid) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
    if (!in.is_open()) return std::nullopt;

    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    // Format: "pid (comm) S ..."; comm may itself contain ')' or spaces
    auto close_paren = content.rfind(')');
    if (close_paren == std::string::npos || close_paren + 2 >= content.size()) {
        return std::nullopt;
    }
    return content[close_paren + 2];
}

bool HealthProbe::is_responsive(pid_t pid) {
    if (pid <= 0) return false;
    if (::kill(pid, 0) != 0 && errno != EPERM) {
        return false;
    }
    // A zombie still answers kill(0); unreadable state counts as alive
    auto state = process_state(pid);
    return !state || (*state != 'Z' && *state != 'X');
}

std::optional<double> HealthProbe::resident_memory_mb(pid_t pid) {
    if (pid <= 0) return std::nullopt;

    std::ifstream in("/proc/" + std::to_string(pid) + "/status");
    if (!in.is_open()) return std::nullopt;

    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("VmRSS:", 0) == 0) {
            std::istringstream iss(line.substr(6));
            double kb = 0;
            if (iss >> kb) {
                return kb / 1024.0;
            }
            return std::nullopt;
        }
    }
    // Zombies and kernel threads have no VmRSS line
    return std::nullopt;
}

#else

std::optional<char> HealthProbe::process_state(pid_t /*pid*/) {
    return std::nullopt;
}

bool HealthProbe::is_responsive(pid_t /*pid*/) {
    return true;
}

std::optional<double> HealthProbe::resident_memory_mb(pid_t /*pid*/) {
    return std::nullopt;
}

#endif
