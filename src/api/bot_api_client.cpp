#include "api/bot_api_client.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

struct BotApiClient::Impl {
    std::string host;
    int port;
    int connect_timeout_ms;
    int read_timeout_ms;

    std::unique_ptr<httplib::Client> make_client() {
        auto cli = std::make_unique<httplib::Client>(host, port);
        cli->set_connection_timeout(connect_timeout_ms / 1000, (connect_timeout_ms % 1000) * 1000);
        cli->set_read_timeout(read_timeout_ms / 1000, (read_timeout_ms % 1000) * 1000);
        cli->set_write_timeout(read_timeout_ms / 1000, (read_timeout_ms % 1000) * 1000);
        return cli;
    }

    json get_json(const std::string& path) {
        try {
            auto cli = make_client();
            auto res = cli->Get(path);
            if (!res) {
                spdlog::warn("GET {}:{}{} failed: {}", host, port, path,
                             httplib::to_string(res.error()));
                return json();
            }
            if (res->status < 200 || res->status >= 300) {
                spdlog::warn("GET {}:{}{} returned status {}", host, port, path, res->status);
                return json();
            }
            return json::parse(res->body);
        } catch (const std::exception& e) {
            spdlog::warn("GET {}:{}{} failed: {}", host, port, path, e.what());
            return json();
        }
    }
};

BotApiClient::BotApiClient(const std::string& host, int port,
                           int connect_timeout_ms, int read_timeout_ms)
    : impl_(std::make_unique<Impl>()) {
    impl_->host = host;
    impl_->port = port;
    impl_->connect_timeout_ms = connect_timeout_ms;
    impl_->read_timeout_ms = read_timeout_ms;
}

BotApiClient::~BotApiClient() = default;

// ── Liveness ────────────────────────────────────────────────

bool BotApiClient::ping(const std::string& path) {
    try {
        auto cli = impl_->make_client();
        auto res = cli->Get(path);
        if (!res) {
            spdlog::debug("Worker endpoint {}:{}{} unreachable: {}", impl_->host, impl_->port,
                          path, httplib::to_string(res.error()));
            return false;
        }
        return res->status >= 200 && res->status < 300;
    } catch (const std::exception& e) {
        spdlog::debug("Worker endpoint probe failed: {}", e.what());
        return false;
    }
}

// ── Metrics ─────────────────────────────────────────────────

BotMetrics BotApiClient::fetch_metrics() {
    BotMetrics metrics;
    auto j = impl_->get_json("/metrics");
    if (!j.is_object()) return metrics;

    metrics.counters = j.value("counters", json());
    metrics.histograms = j.value("histograms", json());
    metrics.gauges = j.value("gauges", json());
    if (j.contains("timestamp") && j["timestamp"].is_string()) {
        metrics.timestamp = j["timestamp"].get<std::string>();
    }
    return metrics;
}

json BotApiClient::fetch_analytics() {
    return impl_->get_json("/analytics");
}

json BotApiClient::fetch_extended_metrics() {
    return impl_->get_json("/metrics/extended");
}
