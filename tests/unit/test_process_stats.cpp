#include <gtest/gtest.h>

#include "ProcessStats.hpp"

#include <chrono>
#include <sys/wait.h>
#include <unistd.h>

namespace {

/// PID of a child that has already exited and been reaped
pid_t reapedChildPid() {
    pid_t pid = fork();
    if (pid == 0) {
        _exit(0);
    }
    int status = 0;
    waitpid(pid, &status, 0);
    return pid;
}

}  // namespace

TEST(ProcessStatsTest, GoneProcessSamplesAsZero) {
    ProcessStats stats(std::chrono::milliseconds(10));
    const pid_t pid = reapedChildPid();
    ASSERT_GT(pid, 0);

    ProcessSample sample = stats.sample(pid);
    EXPECT_DOUBLE_EQ(sample.cpuPercent, 0.0);
    EXPECT_DOUBLE_EQ(sample.memoryMb, 0.0);
}

TEST(ProcessStatsTest, InvalidPidSamplesAsZero) {
    ProcessStats stats(std::chrono::milliseconds(0));
    ProcessSample sample = stats.sample(-1);
    EXPECT_DOUBLE_EQ(sample.cpuPercent, 0.0);
    EXPECT_DOUBLE_EQ(sample.memoryMb, 0.0);
    EXPECT_DOUBLE_EQ(ProcessStats::residentMb(0), 0.0);
}

TEST(ProcessStatsTest, OwnProcessHasResidentMemory) {
    ProcessStats stats(std::chrono::milliseconds(10));
    ProcessSample sample = stats.sample(getpid());

    EXPECT_GT(sample.memoryMb, 0.0);
    EXPECT_GE(sample.cpuPercent, 0.0);
}

TEST(ProcessStatsTest, BatchKeepsInputOrder) {
    ProcessStats stats(std::chrono::milliseconds(10));
    auto samples = stats.sample(std::vector<pid_t>{-1, getpid(), -1});

    ASSERT_EQ(samples.size(), 3u);
    EXPECT_DOUBLE_EQ(samples[0].memoryMb, 0.0);
    EXPECT_GT(samples[1].memoryMb, 0.0);
    EXPECT_DOUBLE_EQ(samples[2].memoryMb, 0.0);
    EXPECT_TRUE(stats.sample(std::vector<pid_t>{}).empty());
}
