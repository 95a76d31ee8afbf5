#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>

enum class LogLevel {
    Info,
    Error,
};

const char* to_string(LogLevel level);

struct LogEvent {
    LogLevel level = LogLevel::Info;
    std::string message;
    std::string timestamp;  // ISO-8601 UTC, millisecond precision
};

/// Called concurrently from the stdout and stderr listener threads
using LogSink = std::function<void(const LogEvent&)>;

/// Reads one pipe line by line on a background thread and forwards each line
/// to the sink. Owns the fd. The thread ends on its own at end-of-stream;
/// there is no way to cancel it.
class LogListener {
public:
    LogListener(int fd, LogLevel level, LogSink sink);
    ~LogListener();

    LogListener(const LogListener&) = delete;
    LogListener& operator=(const LogListener&) = delete;

    bool finished() const { return finished_.load(); }

    /// Block until end-of-stream has been reached
    void join();

private:
    int fd_;
    LogLevel level_;
    LogSink sink_;
    std::atomic<bool> finished_{false};
    std::thread thread_;

    void run();
    void emit(std::string line);
};

/// The stdout (Info) and stderr (Error) listeners of one worker.
class LogMultiplexer {
public:
    LogMultiplexer(int stdout_fd, int stderr_fd, LogSink sink);

    bool finished() const;
    void join();

private:
    LogListener stdout_listener_;
    LogListener stderr_listener_;
};

/// Current wall-clock time as "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string log_timestamp_now();

/// True if s is well-formed UTF-8
bool is_valid_utf8(const std::string& s);
