#include "daemon/process_handle.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace {

enum : int {
    kStageChdir = 1,
    kStageExec = 2,
};

// Written by the child into the status pipe when it cannot become the worker.
// A successful exec closes the pipe instead (O_CLOEXEC), so the parent reads EOF.
struct ExecFailure {
    int stage;
    int error;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

ProcessHandle::~ProcessHandle() {
    release();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      stdout_fd_(std::exchange(other.stdout_fd_, -1)),
      stderr_fd_(std::exchange(other.stderr_fd_, -1)),
      reaped_(std::exchange(other.reaped_, false)) {}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        release();
        pid_ = std::exchange(other.pid_, -1);
        stdout_fd_ = std::exchange(other.stdout_fd_, -1);
        stderr_fd_ = std::exchange(other.stderr_fd_, -1);
        reaped_ = std::exchange(other.reaped_, false);
    }
    return *this;
}

bool ProcessHandle::spawn(const std::vector<std::string>& argv,
                          const std::string& working_dir,
                          ProcessHandle& out,
                          std::string& err) {
    if (argv.empty() || argv[0].empty()) {
        err = "Failed to start worker: empty worker command";
        return false;
    }

    // Build everything the child needs before fork; the child only makes
    // async-signal-safe calls.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);
    const char* dir = working_dir.empty() ? nullptr : working_dir.c_str();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (pipe2(out_pipe, O_CLOEXEC) < 0 ||
        pipe2(err_pipe, O_CLOEXEC) < 0 ||
        pipe2(status_pipe, O_CLOEXEC) < 0) {
        int e = errno;
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                        &status_pipe[0], &status_pipe[1]}) {
            close_fd(*fd);
        }
        err = std::string("Failed to start worker: pipe: ") + std::strerror(e);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                        &status_pipe[0], &status_pipe[1]}) {
            close_fd(*fd);
        }
        err = std::string("Failed to start worker: fork: ") + std::strerror(e);
        return false;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);

        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }

        ExecFailure failure{0, 0};
        if (dir && chdir(dir) != 0) {
            failure = {kStageChdir, errno};
        } else {
            execvp(cargv[0], cargv.data());
            failure = {kStageExec, errno};
        }
        ssize_t ignored = write(status_pipe[1], &failure, sizeof(failure));
        (void)ignored;
        _exit(127);
    }

    // Parent process. Both sides call setpgid so the group exists before
    // anyone signals it.
    setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    ExecFailure failure{0, 0};
    ssize_t n;
    do {
        n = read(status_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);

        if (failure.stage == kStageChdir) {
            err = "Failed to start worker: cannot enter '" + working_dir + "': " +
                  std::strerror(failure.error);
        } else {
            err = "Failed to start worker: cannot execute '" + argv[0] + "': " +
                  std::strerror(failure.error);
        }
        return false;
    }

    ProcessHandle handle;
    handle.pid_ = pid;
    handle.stdout_fd_ = out_pipe[0];
    handle.stderr_fd_ = err_pipe[0];
    out = std::move(handle);
    return true;
}

int ProcessHandle::take_stdout() {
    return std::exchange(stdout_fd_, -1);
}

int ProcessHandle::take_stderr() {
    return std::exchange(stderr_fd_, -1);
}

bool ProcessHandle::send_signal(int sig) {
    // Never signal a reaped pid: it may already belong to someone else
    if (pid_ <= 0 || reaped_) return false;

    if (::kill(-pid_, sig) == 0) {
        return true;
    }
    // Group not set up (setpgid lost a race with exec); fall back to the child
    return ::kill(pid_, sig) == 0;
}

bool ProcessHandle::terminate() {
    return send_signal(SIGTERM);
}

void ProcessHandle::kill() {
    send_signal(SIGKILL);
}

int ProcessHandle::wait() {
    if (pid_ <= 0 || reaped_) return -1;

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    reaped_ = true;
    return result == pid_ ? status : -1;
}

void ProcessHandle::close_pipes() {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void ProcessHandle::release() {
    close_pipes();
    if (pid_ > 0 && !reaped_) {
        kill();
        wait();
    }
    pid_ = -1;
    reaped_ = false;
}
