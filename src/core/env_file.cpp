#include "core/env_file.hpp"

#include <cstring>
#include <fstream>
#include <sstream>
#include <cerrno>

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool read_file(const std::string& path, std::string& content) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    content = ss.str();
    return true;
}

bool write_file(const std::string& path, const std::string& content, std::string& err) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        err = "Failed to write .env file: " + std::string(std::strerror(errno));
        return false;
    }
    out << content;
    if (!out.good()) {
        err = "Failed to write .env file: write error";
        return false;
    }
    return true;
}

} // namespace

const char* EnvFile::default_template() {
    return
        "# Telegram Bot Token (required)\n"
        "TG_BOT_TOKEN=\n"
        "\n"
        "# Claude Code binary path (required)\n"
        "CLAUDE_CODE_PATH=\n"
        "\n"
        "# Working directory for projects\n"
        "WORK_DIR=\n"
        "\n"
        "# Storage type: redis or memory\n"
        "STORAGE_TYPE=memory\n"
        "\n"
        "# Redis URL (optional, for production)\n"
        "# REDIS_URL=redis://localhost:6379\n";
}

std::string EnvFile::path_in(const std::string& dir) {
    return dir + "/.env";
}

EnvFile::Values EnvFile::parse(const std::string& content) {
    Values values;
    std::istringstream in(content);
    std::string raw;
    while (std::getline(in, raw)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        values[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }
    return values;
}

EnvFile::LoadResult EnvFile::load(const std::string& dir) {
    LoadResult result{false, "", {}};
    std::string content;
    if (!read_file(path_in(dir), content)) {
        result.error = "Failed to read .env file: " + std::string(std::strerror(errno));
        return result;
    }
    result.values = parse(content);
    result.success = true;
    return result;
}

bool EnvFile::save(const std::string& dir, const Values& values, std::string& err) {
    std::string content;
    for (const auto& [key, value] : values) {
        if (!content.empty()) content += "\n";
        content += key + "=" + value;
    }
    return write_file(path_in(dir), content, err);
}

std::string EnvFile::fill_template(std::string content, const Values& values) {
    for (const auto& [key, value] : values) {
        const std::string pattern = key + "=";
        const std::string commented = "# " + pattern;
        const std::string replacement = key + "=" + value;

        std::istringstream in(content);
        std::string out;
        std::string line;
        bool replaced = false;
        while (std::getline(in, line)) {
            if (line.rfind(pattern, 0) == 0 || line.rfind(commented, 0) == 0) {
                line = replacement;
                replaced = true;
            }
            out += line;
            out += "\n";
        }
        if (!replaced) {
            out += replacement;
            out += "\n";
        }
        content = std::move(out);
    }
    return content;
}

bool EnvFile::create(const std::string& dir, const Values& values, std::string& err) {
    std::string content;
    if (!read_file(dir + "/.env.example", content)) {
        content = default_template();
    }
    return write_file(path_in(dir), fill_template(std::move(content), values), err);
}

bool EnvFile::is_configured(const std::string& dir) {
    std::string content;
    if (!read_file(path_in(dir), content)) return false;
    return content.find("TG_BOT_TOKEN=") != std::string::npos &&
           content.find("CLAUDE_CODE_PATH=") != std::string::npos;
}
