/**
 * @file ProcessStats.hpp
 * @brief CPU and memory sampling of bot processes via /proc
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <chrono>
#include <sys/types.h>
#include <vector>

/**
 * @brief One CPU/memory observation, both rounded to two decimals
 */
struct ProcessSample {
    double cpuPercent = 0.0;
    double memoryMb = 0.0;
};

/**
 * @brief CPU and memory sampler for running bots
 *
 * Sampling never fails: a pid that vanished or cannot be read yields a
 * zero sample. CPU is measured over a short window rather than since
 * process start, so each call blocks for that window.
 */
class ProcessStats {
public:
    explicit ProcessStats(std::chrono::milliseconds window);

    ProcessSample sample(pid_t pid) const;

    /**
     * @brief Sample several processes over one shared window
     * @return Samples in the order of @p pids
     */
    std::vector<ProcessSample> sample(const std::vector<pid_t>& pids) const;

    /**
     * @brief Resident set size of a process in MiB, 0 if unreadable
     */
    static double residentMb(pid_t pid);

private:
    /// utime + stime of a process in clock ticks, -1 if unreadable
    static long long cpuTicks(pid_t pid);

    static double round2(double value);

    std::chrono::milliseconds window_;
};
