#include <gtest/gtest.h>

#include "ProcessRunner.hpp"
#include "test_support.hpp"

#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <filesystem>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class ProcessRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = test_support::makeTempDir("runner");
        logPath_ = root_ / "child.log";
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    int openLog() {
        return open(logPath_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_APPEND | O_CLOEXEC, 0644);
    }

    std::optional<ProcessHandle> launch(const ProcessRunner& runner, const std::vector<std::string>& argv) {
        int fd = openLog();
        EXPECT_GE(fd, 0);
        std::string error;
        auto handle = runner.start(argv, fd, error);
        close(fd);
        EXPECT_TRUE(handle.has_value()) << error;
        return handle;
    }

    fs::path root_;
    fs::path logPath_;
};

// ─── Command lines ──────────────────────────────────────────────────────────

TEST(ProcessRunnerArgsTest, CommandIsSplitAndScriptAppended) {
    auto argv = ProcessRunner::launchArgs("python3  -u", "/tmp/bots/a.py");
    ASSERT_EQ(argv.size(), 3u);
    EXPECT_EQ(argv[0], "python3");
    EXPECT_EQ(argv[1], "-u");
    EXPECT_EQ(argv[2], "/tmp/bots/a.py");
}

TEST(ProcessRunnerArgsTest, EmptyCommandYieldsNothing) {
    EXPECT_TRUE(ProcessRunner::launchArgs("", "/tmp/bots/a.js").empty());
    EXPECT_TRUE(ProcessRunner::launchArgs("   ", "/tmp/bots/a.js").empty());
}

// ─── Launch ─────────────────────────────────────────────────────────────────

TEST_F(ProcessRunnerTest, OutputAndErrorsGoToLog) {
    ProcessRunner runner(root_.string(), 2000ms, 2000ms);
    auto handle = launch(runner, {"/bin/sh", "-c", "echo to-stdout; echo to-stderr 1>&2"});
    ASSERT_TRUE(handle.has_value());

    ASSERT_TRUE(test_support::waitUntil([&] { return handle->poll(); }));
    const std::string log = test_support::readFile(logPath_);
    EXPECT_NE(log.find("to-stdout"), std::string::npos);
    EXPECT_NE(log.find("to-stderr"), std::string::npos);
    EXPECT_TRUE(WIFEXITED(handle->waitStatus()));
    EXPECT_EQ(WEXITSTATUS(handle->waitStatus()), 0);
}

TEST_F(ProcessRunnerTest, ChildRunsInWorkDirectory) {
    ProcessRunner runner(root_.string(), 2000ms, 2000ms);
    auto handle = launch(runner, {"/bin/sh", "-c", "pwd -P"});
    ASSERT_TRUE(handle.has_value());

    ASSERT_TRUE(test_support::waitUntil([&] { return handle->poll(); }));
    EXPECT_EQ(test_support::readFile(logPath_), fs::canonical(root_).string() + "\n");
}

TEST_F(ProcessRunnerTest, ExitCodeIsRecorded) {
    ProcessRunner runner(root_.string(), 2000ms, 2000ms);
    auto handle = launch(runner, {"/bin/sh", "-c", "exit 7"});
    ASSERT_TRUE(handle.has_value());

    ASSERT_TRUE(test_support::waitUntil([&] { return handle->poll(); }));
    EXPECT_TRUE(handle->reaped());
    EXPECT_EQ(WEXITSTATUS(handle->waitStatus()), 7);
}

TEST_F(ProcessRunnerTest, MissingProgramIsReportedSynchronously) {
    ProcessRunner runner(root_.string(), 2000ms, 2000ms);
    int fd = openLog();
    ASSERT_GE(fd, 0);

    std::string error;
    auto handle = runner.start({"/nonexistent/bot-runtime", "bot.py"}, fd, error);
    close(fd);

    EXPECT_FALSE(handle.has_value());
    EXPECT_NE(error.find("execvp"), std::string::npos) << error;
    EXPECT_NE(error.find("/nonexistent/bot-runtime"), std::string::npos) << error;
}

TEST_F(ProcessRunnerTest, MissingWorkDirectoryFailsLaunch) {
    ProcessRunner runner((root_ / "gone").string(), 2000ms, 2000ms);
    int fd = openLog();
    ASSERT_GE(fd, 0);

    std::string error;
    auto handle = runner.start({"/bin/sh", "-c", "true"}, fd, error);
    close(fd);

    EXPECT_FALSE(handle.has_value());
    EXPECT_FALSE(error.empty());
}

TEST_F(ProcessRunnerTest, EmptyArgvIsRejected) {
    ProcessRunner runner(root_.string(), 2000ms, 2000ms);
    std::string error;
    EXPECT_FALSE(runner.start({}, -1, error).has_value());
    EXPECT_FALSE(error.empty());
}

// ─── Termination ────────────────────────────────────────────────────────────

TEST_F(ProcessRunnerTest, CooperativeChildStopsGracefully) {
    ProcessRunner runner(root_.string(), 2000ms, 2000ms);
    auto handle = launch(runner, {"sleep", "30"});
    ASSERT_TRUE(handle.has_value());

    EXPECT_EQ(runner.terminate(*handle), TerminationResult::Graceful);
    EXPECT_TRUE(handle->reaped());
    EXPECT_TRUE(WIFSIGNALED(handle->waitStatus()));
    EXPECT_EQ(WTERMSIG(handle->waitStatus()), SIGTERM);
}

TEST_F(ProcessRunnerTest, StubbornChildIsKilled) {
    ProcessRunner runner(root_.string(), 300ms, 2000ms);
    auto handle = launch(runner, {"/bin/sh", "-c", "trap '' TERM; echo ready; while true; do sleep 0.05; done"});
    ASSERT_TRUE(handle.has_value());
    ASSERT_TRUE(test_support::waitUntil([&] {
        return test_support::readFile(logPath_).find("ready") != std::string::npos;
    }));

    const auto begin = std::chrono::steady_clock::now();
    EXPECT_EQ(runner.terminate(*handle), TerminationResult::Forced);
    EXPECT_GE(std::chrono::steady_clock::now() - begin, 300ms);
    EXPECT_TRUE(handle->reaped());
    EXPECT_EQ(WTERMSIG(handle->waitStatus()), SIGKILL);
}

TEST_F(ProcessRunnerTest, TerminatingExitedChildIsGraceful) {
    ProcessRunner runner(root_.string(), 300ms, 300ms);
    auto handle = launch(runner, {"/bin/sh", "-c", "exit 0"});
    ASSERT_TRUE(handle.has_value());
    ASSERT_TRUE(test_support::waitUntil([&] { return handle->poll(); }));

    EXPECT_EQ(runner.terminate(*handle), TerminationResult::Graceful);
}

TEST_F(ProcessRunnerTest, DroppedHandleReapsChild) {
    ProcessRunner runner(root_.string(), 2000ms, 2000ms);
    pid_t pid = -1;
    {
        auto handle = launch(runner, {"sleep", "30"});
        ASSERT_TRUE(handle.has_value());
        pid = handle->pid();
        ASSERT_EQ(kill(pid, 0), 0);
    }

    errno = 0;
    EXPECT_EQ(kill(pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST_F(ProcessRunnerTest, MovedHandleKeepsOwnership) {
    ProcessRunner runner(root_.string(), 2000ms, 2000ms);
    auto handle = launch(runner, {"sleep", "30"});
    ASSERT_TRUE(handle.has_value());
    const pid_t pid = handle->pid();

    ProcessHandle owner = std::move(*handle);
    EXPECT_EQ(owner.pid(), pid);
    EXPECT_EQ(handle->pid(), -1);
    EXPECT_EQ(kill(pid, 0), 0);

    EXPECT_EQ(runner.terminate(owner), TerminationResult::Graceful);
}
