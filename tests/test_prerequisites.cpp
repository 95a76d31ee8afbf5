#include <gtest/gtest.h>
#include "core/prerequisites.hpp"

#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

class PrerequisitesTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string original_home;
    bool had_home = false;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("botwarden-test-prereq-" + std::to_string(::getpid()));
        fs::create_directories(test_dir);

        const char* home = std::getenv("HOME");
        if (home) {
            had_home = true;
            original_home = home;
        }
        setenv("HOME", test_dir.c_str(), 1);
    }

    void TearDown() override {
        if (had_home) {
            setenv("HOME", original_home.c_str(), 1);
        }
        fs::remove_all(test_dir);
    }
};

TEST_F(PrerequisitesTest, SetupFlagPath) {
    EXPECT_EQ(Prerequisites::setup_flag_path(), test_dir + "/.chatcode/setup_complete");
}

TEST_F(PrerequisitesTest, MarkSetupComplete) {
    EXPECT_FALSE(Prerequisites::is_setup_complete());

    std::string err;
    ASSERT_TRUE(Prerequisites::mark_setup_complete(err)) << err;
    EXPECT_TRUE(Prerequisites::is_setup_complete());

    // Idempotent
    ASSERT_TRUE(Prerequisites::mark_setup_complete(err)) << err;
    EXPECT_TRUE(Prerequisites::is_setup_complete());
}

TEST_F(PrerequisitesTest, MissingProject) {
    auto st = Prerequisites::check(test_dir + "/no-such-project");
    EXPECT_FALSE(st.project_exists);
    EXPECT_FALSE(st.dependencies_installed);
    EXPECT_FALSE(st.env_configured);
}

TEST_F(PrerequisitesTest, ConfiguredProject) {
    std::string project = test_dir + "/c2me";
    fs::create_directories(project + "/node_modules");
    std::ofstream(project + "/.env") << "TG_BOT_TOKEN=t\nCLAUDE_CODE_PATH=/c\n";

    auto st = Prerequisites::check(project);
    EXPECT_TRUE(st.project_exists);
    EXPECT_TRUE(st.dependencies_installed);
    EXPECT_TRUE(st.env_configured);
    // Versions are reported exactly when the tool was found
    EXPECT_EQ(st.node_installed, !st.node_version.empty());
    EXPECT_EQ(st.pnpm_installed, !st.pnpm_version.empty());
}

TEST_F(PrerequisitesTest, MissingToolHasNoVersion) {
    EXPECT_TRUE(Prerequisites::tool_version("botwarden-no-such-tool").empty());
}

TEST_F(PrerequisitesTest, ToolVersionTrimsOutput) {
    // `sh --version` isn't portable; use a script that behaves like a tool
    std::string tool = test_dir + "/fake-tool";
    {
        std::ofstream out(tool);
        out << "#!/bin/sh\necho v9.9.9\n";
    }
    fs::permissions(tool, fs::perms::owner_all);
    EXPECT_EQ(Prerequisites::tool_version(tool), "v9.9.9");
}

TEST_F(PrerequisitesTest, ClaudeCandidatesInProbeOrder) {
    auto candidates = Prerequisites::claude_code_candidates();
    ASSERT_EQ(candidates.size(), 5u);
    EXPECT_EQ(candidates[0], "/opt/homebrew/bin/claude");
    EXPECT_EQ(candidates[1], "/usr/local/bin/claude");
    EXPECT_EQ(candidates[2], "/usr/local/bin/claude-code");
    EXPECT_EQ(candidates[3], test_dir + "/.local/bin/claude");
    EXPECT_EQ(candidates[4], test_dir + "/.cargo/bin/claude");
}

TEST_F(PrerequisitesTest, DetectsClaudeInHomeLocalBin) {
    std::string claude = test_dir + "/.local/bin/claude";
    fs::create_directories(fs::path(claude).parent_path());
    std::ofstream(claude) << "#!/bin/sh\n";
    fs::permissions(claude, fs::perms::owner_all);

    // A system-wide install earlier in the probe order still wins
    std::string expected = claude;
    for (const auto& candidate : Prerequisites::claude_code_candidates()) {
        if (fs::exists(candidate)) {
            expected = candidate;
            break;
        }
    }
    EXPECT_EQ(Prerequisites::detect_claude_code_path(), expected);
    EXPECT_EQ(Prerequisites::check(test_dir).claude_code_path, expected);
}

TEST_F(PrerequisitesTest, DetectedClaudePathExists) {
    std::string path = Prerequisites::detect_claude_code_path();
    if (path.empty()) GTEST_SKIP() << "claude is not installed here";
    EXPECT_TRUE(fs::exists(path));
}
