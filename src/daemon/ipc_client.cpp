#include "daemon/ipc_client.hpp"
#include "core/config.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>

using json = nlohmann::json;

namespace {

std::optional<int> pid_from(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_number_integer()) {
        return j[key].get<int>();
    }
    return std::nullopt;
}

} // namespace

DaemonClient::DaemonClient() : socket_path_(Config::socket_path()) {}

DaemonClient::DaemonClient(std::string socket_path) : socket_path_(std::move(socket_path)) {}

json DaemonClient::send_command(const json& cmd) {
    if (socket_path_.empty()) return json();

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return json();

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        return json();
    }

    // Set read timeout; restart/stop block on the daemon side for a while
    struct timeval tv;
    tv.tv_sec = 30;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    // Send command
    std::string msg = cmd.dump() + "\n";
    ssize_t total = 0;
    while (total < (ssize_t)msg.size()) {
        ssize_t n = send(fd, msg.data() + total, msg.size() - total, MSG_NOSIGNAL);
        if (n <= 0) {
            close(fd);
            return json();
        }
        total += n;
    }

    // Read response
    std::string buffer;
    char c;
    while (read(fd, &c, 1) == 1) {
        if (c == '\n') break;
        buffer += c;
        if (buffer.size() > 65536) break;
    }

    close(fd);

    if (buffer.empty()) return json();

    try {
        return json::parse(buffer);
    } catch (const json::parse_error&) {
        return json();
    }
}

bool DaemonClient::is_daemon_running() {
    auto resp = send_command({{"cmd", "ping"}});
    return !resp.empty() && resp.value("ok", false);
}

DaemonClient::CommandResult DaemonClient::lifecycle_command(const json& cmd) {
    CommandResult result;
    auto resp = send_command(cmd);
    if (resp.empty()) {
        result.message = "Cannot connect to daemon";
        result.kind = "unreachable";
        return result;
    }
    if (resp.value("ok", false)) {
        result.success = true;
        result.message = resp.value("message", "");
        result.pid = pid_from(resp, "pid");
        return result;
    }
    result.message = resp.value("error", "Unknown error");
    result.kind = resp.value("kind", "");
    return result;
}

DaemonClient::CommandResult DaemonClient::start(const std::string& path) {
    json cmd = {{"cmd", "start"}};
    if (!path.empty()) cmd["path"] = path;
    return lifecycle_command(cmd);
}

DaemonClient::CommandResult DaemonClient::stop() {
    return lifecycle_command({{"cmd", "stop"}});
}

DaemonClient::CommandResult DaemonClient::restart(const std::string& path) {
    json cmd = {{"cmd", "restart"}};
    if (!path.empty()) cmd["path"] = path;
    return lifecycle_command(cmd);
}

DaemonClient::StatusInfo DaemonClient::status() {
    StatusInfo info;
    auto resp = send_command({{"cmd", "status"}});
    if (resp.empty() || !resp.value("ok", false)) return info;

    try {
        const auto& data = resp.at("data");
        info.reachable = true;
        info.is_running = data.value("is_running", false);
        info.uptime_seconds = data.value("uptime_seconds", uint64_t{0});
        info.pid = pid_from(data, "pid");
        info.external = data.value("external", false);
    } catch (const json::exception&) {
        info.reachable = false;
    }
    return info;
}

DaemonClient::HealthInfo DaemonClient::health() {
    HealthInfo info;
    auto resp = send_command({{"cmd", "health"}});
    if (resp.empty() || !resp.value("ok", false)) return info;

    try {
        const auto& data = resp.at("data");
        info.reachable = true;
        info.is_running = data.value("is_running", false);
        info.is_responsive = data.value("is_responsive", false);
        info.uptime_seconds = data.value("uptime_seconds", uint64_t{0});
        info.pid = pid_from(data, "pid");
        if (data.contains("memory_mb") && data["memory_mb"].is_number()) {
            info.memory_mb = data["memory_mb"].get<double>();
        }
    } catch (const json::exception&) {
        info.reachable = false;
    }
    return info;
}
