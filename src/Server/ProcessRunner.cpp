/**
 * @file ProcessRunner.cpp
 * @brief Implementation of ProcessRunner and ProcessHandle
 * @version 1.0
 * @date 2025-01-01
 */

#include "ProcessRunner.hpp"

#include <unistd.h>     // fork, execvp, chdir, pipe2, dup2
#include <fcntl.h>      // O_CLOEXEC, open
#include <signal.h>     // kill, SIGTERM, SIGKILL
#include <sys/wait.h>   // waitpid
#include <cstring>      // strerror
#include <cerrno>       // errno
#include <iostream>     // std::cerr
#include <sstream>      // std::istringstream
#include <thread>       // std::this_thread::sleep_for
#include <algorithm>    // std::min
#include <utility>

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);

/// Written by the child into the exec pipe when it cannot exec
struct ChildFailure {
    int stage;
    int err;
};

enum ChildStage {
    STAGE_REDIRECT = 1,
    STAGE_CHDIR = 2,
    STAGE_EXEC = 3
};

const char* stageName(int stage) {
    switch (stage) {
        case STAGE_REDIRECT: return "redirecting output";
        case STAGE_CHDIR:    return "chdir";
        case STAGE_EXEC:     return "execvp";
        default:             return "child setup";
    }
}

// Only async-signal-safe calls from here on: the server is multithreaded.
[[noreturn]] void failChild(int fd, int stage) {
    ChildFailure failure{stage, errno};
    ssize_t written = write(fd, &failure, sizeof(failure));
    (void)written;
    _exit(127);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ProcessHandle
// ---------------------------------------------------------------------------

ProcessHandle::ProcessHandle(pid_t pid) : pid_(pid) {}

ProcessHandle::~ProcessHandle() {
    release();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_), waitStatus_(other.waitStatus_) {
    other.pid_ = -1;
    other.reaped_ = false;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        release();
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        waitStatus_ = other.waitStatus_;
        other.pid_ = -1;
        other.reaped_ = false;
    }
    return *this;
}

bool ProcessHandle::poll() {
    if (pid_ <= 0 || reaped_) {
        return true;
    }

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        reaped_ = true;
        waitStatus_ = status;
        return true;
    }
    if (result < 0 && errno == ECHILD) {
        // Not our child any more; nothing left to reap.
        reaped_ = true;
        return true;
    }
    return false;
}

bool ProcessHandle::signal(int sig) const {
    if (pid_ <= 0 || reaped_) {
        return false;
    }

    // Children lead their own process group; signal the whole group so
    // helpers forked by the script go down with it.
    if (::kill(-pid_, sig) == 0) {
        return true;
    }
    return ::kill(pid_, sig) == 0;
}

void ProcessHandle::release() {
    if (pid_ <= 0 || reaped_) {
        return;
    }

    std::cerr << "ProcessHandle: killing unreaped child (PID: " << pid_ << ")" << std::endl;
    signal(SIGKILL);

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    reaped_ = true;
    waitStatus_ = status;
}

// ---------------------------------------------------------------------------
// ProcessRunner
// ---------------------------------------------------------------------------

ProcessRunner::ProcessRunner(std::string workDir,
                             std::chrono::milliseconds stopTimeout,
                             std::chrono::milliseconds killGrace)
    : workDir_(std::move(workDir)), stopTimeout_(stopTimeout), killGrace_(killGrace) {}

std::vector<std::string> ProcessRunner::splitCommand(const std::string& cmdline) {
    std::istringstream iss(cmdline);
    std::vector<std::string> tokens;
    std::string token;

    // Simple whitespace-based splitting
    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

std::vector<std::string> ProcessRunner::launchArgs(const std::string& command,
                                                   const std::string& scriptPath) {
    auto parts = splitCommand(command);
    if (parts.empty()) {
        return parts;
    }
    parts.push_back(scriptPath);
    return parts;
}

std::optional<ProcessHandle> ProcessRunner::start(const std::vector<std::string>& argv,
                                                  int logFd,
                                                  std::string& error) const {
    if (argv.empty()) {
        error = "Empty command";
        return std::nullopt;
    }

    // Prepare argv array before forking; the child must not allocate
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& part : argv) {
        cargv.push_back(const_cast<char*>(part.c_str()));
    }
    cargv.push_back(nullptr);
    const char* workDir = workDir_.c_str();

    int execPipe[2];
    if (pipe2(execPipe, O_CLOEXEC) < 0) {
        error = std::string("pipe failed: ") + strerror(errno);
        return std::nullopt;
    }

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + strerror(errno);
        close(execPipe[0]);
        close(execPipe[1]);
        return std::nullopt;
    }

    if (pid == 0) {
        // CHILD PROCESS
        close(execPipe[0]);
        setpgid(0, 0);

        // The server blocks its shutdown signals; bots must see them
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        if (dup2(logFd, STDOUT_FILENO) < 0 || dup2(logFd, STDERR_FILENO) < 0) {
            failChild(execPipe[1], STAGE_REDIRECT);
        }
        if (chdir(workDir) != 0) {
            failChild(execPipe[1], STAGE_CHDIR);
        }

        execvp(cargv[0], cargv.data());
        failChild(execPipe[1], STAGE_EXEC);
    }

    // PARENT PROCESS
    close(execPipe[1]);

    ChildFailure failure{};
    ssize_t n;
    do {
        n = read(execPipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        // Child could not exec; collect it right away
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        error = std::string(stageName(failure.stage)) + " failed for '" + argv[0] +
                "': " + strerror(failure.err);
        return std::nullopt;
    }
    if (n < 0) {
        std::cerr << "ProcessRunner::start: could not read exec status for PID " << pid
                  << ": " << strerror(errno) << std::endl;
    }

    std::cout << "ProcessRunner::start: started " << argv[0] << " (PID: " << pid << ")" << std::endl;
    return ProcessHandle(pid);
}

bool ProcessRunner::waitForExit(ProcessHandle& handle, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (handle.poll()) {
            return true;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(POLL_INTERVAL, remaining));
    }
}

TerminationResult ProcessRunner::terminate(ProcessHandle& handle) const {
    if (handle.poll()) {
        return TerminationResult::Graceful;
    }

    std::cout << "ProcessRunner::terminate: sending SIGTERM (PID: " << handle.pid() << ")" << std::endl;
    handle.signal(SIGTERM);
    if (waitForExit(handle, stopTimeout_)) {
        return TerminationResult::Graceful;
    }

    std::cerr << "ProcessRunner::terminate: PID " << handle.pid() << " ignored SIGTERM for "
              << stopTimeout_.count() << "ms, sending SIGKILL" << std::endl;
    handle.signal(SIGKILL);
    if (waitForExit(handle, killGrace_)) {
        return TerminationResult::Forced;
    }

    std::cerr << "ProcessRunner::terminate: PID " << handle.pid()
              << " still not reaped after SIGKILL" << std::endl;
    return TerminationResult::Unreaped;
}
