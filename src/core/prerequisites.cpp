#include "core/prerequisites.hpp"
#include "core/env_file.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sys/wait.h>

namespace fs = std::filesystem;

std::string Prerequisites::run_command_output(const std::string& cmd, int& exit_code) {
    exit_code = -1;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return "";

    char buffer[256];
    std::string result;
    while (fgets(buffer, sizeof(buffer), pipe)) {
        result += buffer;
    }
    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }

    // Trim trailing newline
    while (!result.empty() && (result.back() == '\n' || result.back() == '\r')) {
        result.pop_back();
    }
    return result;
}

std::string Prerequisites::tool_version(const std::string& tool) {
    int exit_code = -1;
    std::string out = run_command_output(tool + " --version 2>/dev/null", exit_code);
    if (exit_code != 0) return "";
    return out;
}

std::vector<std::string> Prerequisites::claude_code_candidates() {
    const char* home_env = std::getenv("HOME");
    std::string home = home_env ? home_env : "";
    return {
        "/opt/homebrew/bin/claude",     // Homebrew, Apple Silicon
        "/usr/local/bin/claude",        // Homebrew, Intel
        "/usr/local/bin/claude-code",   // npm global
        home + "/.local/bin/claude",
        home + "/.cargo/bin/claude",
    };
}

std::string Prerequisites::detect_claude_code_path() {
    std::error_code ec;
    for (const auto& candidate : claude_code_candidates()) {
        if (fs::exists(candidate, ec)) {
            return candidate;
        }
    }

    int exit_code = -1;
    std::string out = run_command_output("which claude 2>/dev/null", exit_code);
    if (exit_code != 0) return "";
    return out;
}

PrerequisiteStatus Prerequisites::check(const std::string& project_dir) {
    PrerequisiteStatus status;

    status.node_version = tool_version("node");
    status.node_installed = !status.node_version.empty();

    status.pnpm_version = tool_version("pnpm");
    status.pnpm_installed = !status.pnpm_version.empty();

    std::error_code ec;
    status.project_exists = fs::exists(project_dir, ec);
    status.dependencies_installed = fs::exists(fs::path(project_dir) / "node_modules", ec);
    status.env_configured = EnvFile::is_configured(project_dir);
    status.claude_code_path = detect_claude_code_path();

    return status;
}

std::string Prerequisites::setup_flag_path() {
    const char* home = std::getenv("HOME");
    return std::string(home ? home : "") + "/.chatcode/setup_complete";
}

bool Prerequisites::is_setup_complete() {
    std::error_code ec;
    return fs::exists(setup_flag_path(), ec);
}

bool Prerequisites::mark_setup_complete(std::string& err) {
    fs::path flag = setup_flag_path();

    std::error_code ec;
    fs::create_directories(flag.parent_path(), ec);
    if (ec) {
        err = "Failed to create " + flag.parent_path().string() + ": " + ec.message();
        return false;
    }

    std::ofstream out(flag);
    if (!out.is_open()) {
        err = "Failed to write setup flag " + flag.string();
        return false;
    }
    out << "1";
    return true;
}
