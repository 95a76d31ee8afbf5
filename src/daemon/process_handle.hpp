#pragma once

#include <string>
#include <vector>
#include <sys/types.h>

/// Owned handle to one spawned worker process plus the read ends of its
/// stdout/stderr pipes. Move-only. A handle that still owns an unreaped
/// process kills and reaps it on destruction.
class ProcessHandle {
public:
    ProcessHandle() = default;
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;
    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;

    /// Spawn argv[0] (resolved through PATH) in working_dir, in a new process
    /// group, with stdout/stderr redirected into pipes and stdin on /dev/null.
    /// chdir/exec failures in the child are reported back synchronously.
    static bool spawn(const std::vector<std::string>& argv,
                      const std::string& working_dir,
                      ProcessHandle& out,
                      std::string& err);

    pid_t pid() const { return pid_; }
    bool valid() const { return pid_ > 0; }

    /// Hand the pipe read ends to a reader; the caller owns the returned fd.
    int take_stdout();
    int take_stderr();

    /// SIGTERM to the worker's process group. Fire-and-forget.
    bool terminate();

    /// SIGKILL to the worker's process group.
    void kill();

    /// Block until the direct child has exited and been reaped.
    /// Returns the raw wait status, or -1 if there was nothing to reap.
    int wait();

private:
    pid_t pid_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool reaped_ = false;

    bool send_signal(int sig);
    void close_pipes();
    void release();
};
