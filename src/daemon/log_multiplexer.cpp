#include "daemon/log_multiplexer.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstring>
#include <unistd.h>

const char* to_string(LogLevel level) {
    return level == LogLevel::Error ? "error" : "info";
}

std::string log_timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + len, sizeof(buf) - len, ".%03dZ", static_cast<int>(ms));
    return buf;
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len;
        unsigned int cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) return false;

        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong encodings, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

// ── LogListener ─────────────────────────────────────────────

LogListener::LogListener(int fd, LogLevel level, LogSink sink)
    : fd_(fd), level_(level), sink_(std::move(sink)) {
    thread_ = std::thread(&LogListener::run, this);
}

LogListener::~LogListener() {
    join();
}

void LogListener::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void LogListener::emit(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    // Lines that don't decode are dropped; the stream keeps going
    if (!is_valid_utf8(line)) return;

    LogEvent event;
    event.level = level_;
    event.message = std::move(line);
    event.timestamp = log_timestamp_now();

    if (!sink_) return;
    try {
        sink_(event);
    } catch (const std::exception& e) {
        spdlog::debug("Log sink rejected a {} line: {}", to_string(level_), e.what());
    }
}

void LogListener::run() {
    if (fd_ < 0) {
        finished_.store(true);
        return;
    }

    std::string buffer;
    char chunk[4096];

    while (true) {
        ssize_t n = read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::debug("Worker {} pipe read failed: {}", to_string(level_), std::strerror(errno));
            break;
        }
        if (n == 0) break; // end-of-stream: the worker side is closed

        buffer.append(chunk, static_cast<size_t>(n));

        size_t start = 0;
        size_t pos;
        while ((pos = buffer.find('\n', start)) != std::string::npos) {
            emit(buffer.substr(start, pos - start));
            start = pos + 1;
        }
        buffer.erase(0, start);
    }

    // Unterminated last line
    if (!buffer.empty()) {
        emit(std::move(buffer));
    }

    close(fd_);
    fd_ = -1;
    finished_.store(true);
}

// ── LogMultiplexer ──────────────────────────────────────────

LogMultiplexer::LogMultiplexer(int stdout_fd, int stderr_fd, LogSink sink)
    : stdout_listener_(stdout_fd, LogLevel::Info, sink),
      stderr_listener_(stderr_fd, LogLevel::Error, sink) {}

bool LogMultiplexer::finished() const {
    return stdout_listener_.finished() && stderr_listener_.finished();
}

void LogMultiplexer::join() {
    stdout_listener_.join();
    stderr_listener_.join();
}
