#pragma once

#include "api/bot_api_client.hpp"

#include <optional>
#include <string>
#include <sys/types.h>

struct HealthEndpoint {
    std::string host = "127.0.0.1";
    int port = 3002;
    std::string path = "/metrics";
    int connect_timeout_ms = 2000;
    int read_timeout_ms = 5000;
};

/// Read-only, point-in-time checks. Nothing here touches SupervisorState.
class HealthProbe {
public:
    explicit HealthProbe(const HealthEndpoint& endpoint);

    /// Fallback for when no worker is tracked locally: asks the worker's HTTP
    /// endpoint whether something (e.g. an orphan from an earlier supervisor)
    /// is serving. Any failure counts as "not running".
    bool external_worker_running();

    /// Zero-signal probe plus zombie check. Optimistic (true) where the
    /// platform has no such checks.
    static bool is_responsive(pid_t pid);

    /// Resident set size in MiB, or nullopt if it can't be read
    static std::optional<double> resident_memory_mb(pid_t pid);

    /// Single-letter state from /proc/<pid>/stat ('R', 'S', 'Z', ...)
    static std::optional<char> process_state(pid_t pid);

private:
    HealthEndpoint endpoint_;
    BotApiClient client_;
};
