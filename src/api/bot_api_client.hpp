#pragma once

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

struct BotMetrics {
    nlohmann::json counters;
    nlohmann::json histograms;
    nlohmann::json gauges;
    std::string timestamp;
};

/// Blocking client for the worker's local HTTP API (metrics/analytics).
/// Every call has bounded connect/read timeouts and never throws.
class BotApiClient {
public:
    BotApiClient(const std::string& host, int port,
                 int connect_timeout_ms = 2000, int read_timeout_ms = 5000);
    ~BotApiClient();

    BotApiClient(const BotApiClient&) = delete;
    BotApiClient& operator=(const BotApiClient&) = delete;

    /// GET path; true on any 2xx status, false on network error or other status
    bool ping(const std::string& path = "/metrics");

    /// GET /metrics. Fields stay null on failure.
    BotMetrics fetch_metrics();

    /// GET /analytics. Null json on failure.
    nlohmann::json fetch_analytics();

    /// GET /metrics/extended. Null json on failure.
    nlohmann::json fetch_extended_metrics();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
