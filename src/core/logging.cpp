#include "core/logging.hpp"
#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr size_t kLogFileMaxSize = 5 * 1024 * 1024;
constexpr size_t kLogFileMaxFiles = 3;
constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

std::mutex g_logging_mutex;

} // namespace

void init_logging(const AppConfig& config) {
    std::lock_guard<std::mutex> lock(g_logging_mutex);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string file_error;
    if (!config.log_file.empty()) {
        std::string path = Config::expand_home(config.log_file);
        try {
            std::error_code ec;
            fs::create_directories(fs::path(path).parent_path(), ec);
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path, kLogFileMaxSize, kLogFileMaxFiles));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = "Cannot open log file " + path + ": " + e.what();
        }
    }

    // Shared by both loggers; %n tells daemon and worker lines apart
    for (auto& sink : sinks) {
        sink->set_pattern(kLogPattern);
    }

    // from_str maps unknown names to off; only an explicit "off" silences
    auto level = spdlog::level::from_str(config.log_level);
    bool unknown_level = level == spdlog::level::off && config.log_level != "off";
    if (unknown_level) {
        level = spdlog::level::info;
    }

    auto main_logger = std::make_shared<spdlog::logger>("botwarden", sinks.begin(), sinks.end());
    main_logger->set_level(level);
    spdlog::drop("botwarden");
    spdlog::set_default_logger(main_logger);
    if (!file_error.empty()) {
        main_logger->warn("{}", file_error);
    }
    if (unknown_level) {
        main_logger->warn("Unknown log level '{}', using info", config.log_level);
    }

    auto worker = std::make_shared<spdlog::logger>("worker", sinks.begin(), sinks.end());
    worker->set_level(level);
    spdlog::drop("worker");
    spdlog::register_logger(worker);
}

std::shared_ptr<spdlog::logger> worker_logger() {
    std::lock_guard<std::mutex> lock(g_logging_mutex);
    auto logger = spdlog::get("worker");
    if (!logger) {
        logger = spdlog::stderr_color_mt("worker");
        logger->set_pattern(kLogPattern);
    }
    return logger;
}

LogSink make_worker_log_sink() {
    auto logger = worker_logger();
    return [logger](const LogEvent& event) {
        if (event.level == LogLevel::Error) {
            logger->error("{}", event.message);
        } else {
            logger->info("{}", event.message);
        }
    };
}
