/**
 * @file ProcessRunner.hpp
 * @brief Spawning and terminating bot processes
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

/**
 * @brief Move-only owner of one spawned child process
 *
 * The handle is the only thing allowed to reap its child. A handle that
 * still owns an unreaped child when destroyed kills the process group and
 * waits for it, so dropping a handle never leaves a zombie behind.
 */
class ProcessHandle {
public:
    ProcessHandle() = default;
    explicit ProcessHandle(pid_t pid);
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    pid_t pid() const { return pid_; }

    /**
     * @brief Check whether the child has exited, reaping it if so
     * @return true once the child has been reaped
     */
    bool poll();

    /**
     * @brief Send a signal to the child's process group
     * @return true if the signal was delivered
     */
    bool signal(int sig) const;

    bool reaped() const { return reaped_; }

    /**
     * @brief Raw waitpid status, meaningful once reaped() is true
     */
    int waitStatus() const { return waitStatus_; }

private:
    void release();

    pid_t pid_ = -1;
    bool reaped_ = false;
    int waitStatus_ = 0;
};

/**
 * @brief How a termination request ended
 */
enum class TerminationResult {
    Graceful,  ///< Exited within the timeout after SIGTERM
    Forced,    ///< Needed SIGKILL after the timeout
    Unreaped   ///< Still not reaped after SIGKILL and the grace period
};

/**
 * @brief Process management class for bot runtimes
 *
 * Builds the launch command for a runtime, forks the child with its
 * output redirected into a log file, and terminates it with a bounded
 * SIGTERM-then-SIGKILL sequence.
 */
class ProcessRunner {
public:
    /**
     * @brief Constructor
     * @param workDir Working directory of every spawned child
     * @param stopTimeout How long to wait after SIGTERM before SIGKILL
     * @param killGrace How long to wait after SIGKILL before giving up
     */
    ProcessRunner(std::string workDir,
                  std::chrono::milliseconds stopTimeout,
                  std::chrono::milliseconds killGrace);

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    /**
     * @brief Build argv for running a script
     * @param command Runtime command line, e.g. "python3 -u"
     * @param scriptPath Script appended as the last argument
     * @return argv, empty when no runtime command is configured
     */
    static std::vector<std::string> launchArgs(const std::string& command,
                                               const std::string& scriptPath);

    /**
     * @brief Fork and exec a child process
     * @param argv Program and arguments, argv[0] is looked up in PATH
     * @param logFd Descriptor that becomes the child's stdout and stderr
     * @param error Receives the failure reason when std::nullopt is returned
     * @return Handle owning the child on success
     *
     * The child runs in its own process group with the working directory
     * set to workDir. Exec failures are reported back through a
     * close-on-exec pipe, so a missing interpreter is an error here rather
     * than a child that exits immediately.
     */
    std::optional<ProcessHandle> start(const std::vector<std::string>& argv,
                                       int logFd,
                                       std::string& error) const;

    /**
     * @brief Terminate a child: SIGTERM, bounded wait, then SIGKILL
     *
     * Returns once the child is reaped or both waits have expired; never
     * blocks longer than stopTimeout + killGrace.
     */
    TerminationResult terminate(ProcessHandle& handle) const;

private:
    /**
     * @brief Split command line into individual arguments
     */
    static std::vector<std::string> splitCommand(const std::string& cmdline);

    static bool waitForExit(ProcessHandle& handle, std::chrono::milliseconds timeout);

    std::string workDir_;
    std::chrono::milliseconds stopTimeout_;
    std::chrono::milliseconds killGrace_;
};
