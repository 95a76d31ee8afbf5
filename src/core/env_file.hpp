#pragma once

#include <map>
#include <string>

/// The worker's flat KEY=VALUE `.env` file inside its project directory.
class EnvFile {
public:
    using Values = std::map<std::string, std::string>;

    struct LoadResult { bool success; std::string error; Values values; };

    /// Parse <dir>/.env. Blank lines and '#' comments are skipped; key and
    /// value are split on the first '=' and trimmed.
    static LoadResult load(const std::string& dir);

    /// Overwrite <dir>/.env with one KEY=VALUE line per entry (sorted by key)
    static bool save(const std::string& dir, const Values& values, std::string& err);

    /// Create <dir>/.env from <dir>/.env.example (or the built-in template),
    /// filling in `values`. "KEY=" and "# KEY=" lines are replaced in place;
    /// keys not present in the template are appended.
    static bool create(const std::string& dir, const Values& values, std::string& err);

    /// .env exists and carries both TG_BOT_TOKEN= and CLAUDE_CODE_PATH=
    static bool is_configured(const std::string& dir);

    /// Parse .env-formatted text
    static Values parse(const std::string& content);

    /// Apply `values` to template text as create() does
    static std::string fill_template(std::string content, const Values& values);

    static std::string path_in(const std::string& dir);
    static const char* default_template();
};
