#pragma once

#include <string>
#include <vector>

struct PrerequisiteStatus {
    bool node_installed = false;
    std::string node_version;
    bool pnpm_installed = false;
    std::string pnpm_version;
    bool project_exists = false;
    bool dependencies_installed = false;  // node_modules present
    bool env_configured = false;
    std::string claude_code_path;  // empty if not found
};

class Prerequisites {
public:
    /// Inspect the toolchain and the worker project in project_dir
    static PrerequisiteStatus check(const std::string& project_dir);

    /// True once first-run setup has been marked complete
    static bool is_setup_complete();
    static bool mark_setup_complete(std::string& err);

    /// ~/.chatcode/setup_complete
    static std::string setup_flag_path();

    /// Well-known install locations of the claude binary, in probe order
    static std::vector<std::string> claude_code_candidates();

    /// First existing candidate, else `which claude`; empty if neither finds it
    static std::string detect_claude_code_path();

    /// Run `<tool> --version`; empty if the tool is missing or fails
    static std::string tool_version(const std::string& tool);

private:
    static std::string run_command_output(const std::string& cmd, int& exit_code);
};
