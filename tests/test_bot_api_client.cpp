#include <gtest/gtest.h>
#include "api/bot_api_client.hpp"

#include <httplib.h>

#include <chrono>
#include <thread>

// Runs an httplib server on an ephemeral port for the lifetime of the fixture
class BotApiClientTest : public ::testing::Test {
protected:
    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;

    void SetUp() override {
        server_.Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(
                R"({"counters":{"messages_total":12},"histograms":{"latency_ms":{"p50":40}},)"
                R"("gauges":{"active_sessions":2},"timestamp":"2026-01-01T00:00:00.000Z"})",
                "application/json");
        });
        server_.Get("/analytics", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"users":3})", "application/json");
        });
        server_.Get("/metrics/extended", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("not json", "text/plain");
        });
        server_.Get("/broken", [](const httplib::Request&, httplib::Response& res) {
            res.status = 500;
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    void TearDown() override {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }
};

TEST(BotApiClientOfflineTest, PingNoServer) {
    BotApiClient client("127.0.0.1", 1, 200, 200); // Port 1 = unlikely to have server
    EXPECT_FALSE(client.ping());
}

TEST(BotApiClientOfflineTest, FetchNoServerLeavesNulls) {
    BotApiClient client("127.0.0.1", 1, 200, 200);
    auto metrics = client.fetch_metrics();
    EXPECT_TRUE(metrics.counters.is_null());
    EXPECT_TRUE(metrics.histograms.is_null());
    EXPECT_TRUE(metrics.gauges.is_null());
    EXPECT_TRUE(metrics.timestamp.empty());
    EXPECT_TRUE(client.fetch_analytics().is_null());
}

TEST_F(BotApiClientTest, PingSuccess) {
    BotApiClient client("127.0.0.1", port_);
    EXPECT_TRUE(client.ping());
    EXPECT_TRUE(client.ping("/analytics"));
}

TEST_F(BotApiClientTest, PingNon2xxIsFailure) {
    BotApiClient client("127.0.0.1", port_);
    EXPECT_FALSE(client.ping("/broken"));
    EXPECT_FALSE(client.ping("/missing"));
}

TEST_F(BotApiClientTest, FetchMetrics) {
    BotApiClient client("127.0.0.1", port_);
    auto metrics = client.fetch_metrics();
    EXPECT_EQ(metrics.counters.value("messages_total", 0), 12);
    EXPECT_EQ(metrics.gauges.value("active_sessions", 0), 2);
    EXPECT_EQ(metrics.histograms["latency_ms"].value("p50", 0), 40);
    EXPECT_EQ(metrics.timestamp, "2026-01-01T00:00:00.000Z");
}

TEST_F(BotApiClientTest, FetchAnalytics) {
    BotApiClient client("127.0.0.1", port_);
    auto analytics = client.fetch_analytics();
    ASSERT_TRUE(analytics.is_object());
    EXPECT_EQ(analytics.value("users", 0), 3);
}

TEST_F(BotApiClientTest, UnparseableBodyIsNull) {
    BotApiClient client("127.0.0.1", port_);
    EXPECT_TRUE(client.fetch_extended_metrics().is_null());
}
