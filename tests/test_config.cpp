#include <gtest/gtest.h>
#include "core/config.hpp"

#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string original_home;
    bool had_home = false;
    std::string original_project;
    bool had_project = false;

    void SetUp() override {
        // Create a temp directory for test config
        test_dir = fs::temp_directory_path() / ("botwarden-test-config-" + std::to_string(::getpid()));
        fs::create_directories(test_dir);

        // Save and override HOME
        const char* home = std::getenv("HOME");
        if (home) {
            had_home = true;
            original_home = home;
        }
        setenv("HOME", test_dir.c_str(), 1);

        const char* project = std::getenv("C2ME_PROJECT_PATH");
        if (project) {
            had_project = true;
            original_project = project;
        }
        unsetenv("C2ME_PROJECT_PATH");
    }

    void TearDown() override {
        // Restore HOME
        if (had_home) {
            setenv("HOME", original_home.c_str(), 1);
        }
        if (had_project) {
            setenv("C2ME_PROJECT_PATH", original_project.c_str(), 1);
        }
        // Cleanup
        fs::remove_all(test_dir);
    }
};

TEST_F(ConfigTest, DefaultValues) {
    Config cfg;
    EXPECT_TRUE(cfg.data().project_path.empty());
    EXPECT_EQ(cfg.data().worker_command, (std::vector<std::string>{"pnpm", "run", "dev"}));
    EXPECT_EQ(cfg.data().grace_period_ms, 500);
    EXPECT_EQ(cfg.data().restart_pause_ms, 300);
    EXPECT_TRUE(cfg.data().auto_start);
    EXPECT_EQ(cfg.data().auto_start_delay_ms, 500);
    EXPECT_EQ(cfg.data().health_host, "127.0.0.1");
    EXPECT_EQ(cfg.data().health_port, 3002);
    EXPECT_EQ(cfg.data().health_path, "/metrics");
    EXPECT_EQ(cfg.data().health_connect_timeout_ms, 2000);
    EXPECT_EQ(cfg.data().health_read_timeout_ms, 5000);
    EXPECT_EQ(cfg.data().log_level, "info");
    EXPECT_TRUE(cfg.data().log_file.empty());
}

TEST_F(ConfigTest, ConfigDirPath) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    std::string dir = Config::config_dir();
    EXPECT_FALSE(dir.empty());
    EXPECT_NE(dir.find(".config/botwarden"), std::string::npos);
}

TEST_F(ConfigTest, ConfigFileAndSocketPaths) {
    std::string path = Config::config_path();
    EXPECT_FALSE(path.empty());
    EXPECT_NE(path.find("config.yaml"), std::string::npos);
    EXPECT_NE(Config::socket_path().find("botwarden.sock"), std::string::npos);
}

TEST_F(ConfigTest, ExpandHome) {
    EXPECT_EQ(Config::expand_home("~/bot"), test_dir + "/bot");
    EXPECT_EQ(Config::expand_home("/abs/bot"), "/abs/bot");
    EXPECT_EQ(Config::expand_home(""), "");
}

TEST_F(ConfigTest, DefaultProjectPathUnderHome) {
    EXPECT_EQ(Config::default_project_path(), test_dir + "/Project/c2me");
}

TEST_F(ConfigTest, DefaultProjectPathFromEnvironment) {
    setenv("C2ME_PROJECT_PATH", "/srv/c2me", 1);
    EXPECT_EQ(Config::default_project_path(), "/srv/c2me");
    unsetenv("C2ME_PROJECT_PATH");
}

TEST_F(ConfigTest, DefaultProjectPathWithoutHome) {
    unsetenv("HOME");
    EXPECT_EQ(Config::default_project_path(), "/tmp/c2me");
    setenv("HOME", test_dir.c_str(), 1);
}

TEST_F(ConfigTest, ConfiguredProjectPathWins) {
    setenv("C2ME_PROJECT_PATH", "/srv/c2me", 1);
    Config cfg;
    EXPECT_EQ(cfg.resolve_project_path(), "/srv/c2me");
    cfg.data().project_path = "~/bots/c2me";
    EXPECT_EQ(cfg.resolve_project_path(), test_dir + "/bots/c2me");
    unsetenv("C2ME_PROJECT_PATH");
}

TEST_F(ConfigTest, LoadNonExistentReturnsFalse) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    Config cfg;
    EXPECT_FALSE(cfg.load());
}

TEST_F(ConfigTest, SaveAndLoad) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    // Save
    Config cfg1;
    cfg1.data().project_path = "/srv/c2me";
    cfg1.data().worker_command = {"node", "dist/index.js"};
    cfg1.data().grace_period_ms = 1500;
    cfg1.data().auto_start = false;
    cfg1.data().health_port = 4000;
    cfg1.data().log_level = "debug";
    cfg1.data().log_file = "~/.config/botwarden/botwarden.log";

    ASSERT_TRUE(cfg1.save());

    // Verify file exists
    EXPECT_TRUE(fs::exists(Config::config_path()));

    // Load into new instance
    Config cfg2;
    ASSERT_TRUE(cfg2.load());
    EXPECT_EQ(cfg2.data().project_path, "/srv/c2me");
    EXPECT_EQ(cfg2.data().worker_command, (std::vector<std::string>{"node", "dist/index.js"}));
    EXPECT_EQ(cfg2.data().grace_period_ms, 1500);
    EXPECT_EQ(cfg2.data().restart_pause_ms, 300);
    EXPECT_FALSE(cfg2.data().auto_start);
    EXPECT_EQ(cfg2.data().health_port, 4000);
    EXPECT_EQ(cfg2.data().log_level, "debug");
    EXPECT_EQ(cfg2.data().log_file, "~/.config/botwarden/botwarden.log");
}

TEST_F(ConfigTest, PartialFileKeepsOtherDefaults) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    fs::create_directories(Config::config_dir());
    std::ofstream out(Config::config_path());
    out << "supervisor:\n  grace_period_ms: 250\n";
    out.close();

    Config cfg;
    ASSERT_TRUE(cfg.load());
    EXPECT_EQ(cfg.data().grace_period_ms, 250);
    EXPECT_EQ(cfg.data().restart_pause_ms, 300);
    EXPECT_EQ(cfg.data().health_port, 3002);
    EXPECT_EQ(cfg.data().worker_command.size(), 3u);
}

TEST_F(ConfigTest, SaveCreatesDirectory) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    // Remove config dir if it exists
    fs::remove_all(Config::config_dir());
    EXPECT_FALSE(fs::exists(Config::config_dir()));

    Config cfg;
    ASSERT_TRUE(cfg.save());
    EXPECT_TRUE(fs::exists(Config::config_dir()));
}

TEST_F(ConfigTest, LoadMalformedYamlUsesDefaults) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    // Write invalid YAML
    fs::create_directories(Config::config_dir());
    std::ofstream out(Config::config_path());
    out << "{{{{invalid yaml!!!!";
    out.close();

    Config cfg;
    EXPECT_FALSE(cfg.load());
    // Should still have defaults
    EXPECT_EQ(cfg.data().health_host, "127.0.0.1");
    EXPECT_EQ(cfg.data().health_port, 3002);
}

TEST_F(ConfigTest, WrongTypeKeepsDefault) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    fs::create_directories(Config::config_dir());
    std::ofstream out(Config::config_path());
    out << "health:\n  port: not-a-number\n";
    out.close();

    // Unconvertible scalars fall back to the default for that key only
    Config cfg;
    EXPECT_TRUE(cfg.load());
    EXPECT_EQ(cfg.data().health_port, 3002);
}

TEST_F(ConfigTest, NonScalarCommandArgumentKeepsDefaultCommand) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    fs::create_directories(Config::config_dir());
    std::ofstream out(Config::config_path());
    out << "supervisor:\n  grace_period_ms: 42\n"
           "worker:\n  command: [pnpm, {a: b}]\n";
    out.close();

    // The rest of the file still loads
    Config cfg;
    EXPECT_TRUE(cfg.load());
    EXPECT_EQ(cfg.data().grace_period_ms, 42);
    std::vector<std::string> expected = {"pnpm", "run", "dev"};
    EXPECT_EQ(cfg.data().worker_command, expected);
}
