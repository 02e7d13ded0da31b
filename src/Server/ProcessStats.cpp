/**
 * @file ProcessStats.cpp
 * @brief Implementation of ProcessStats
 * @version 1.0
 * @date 2025-01-01
 */

#include "ProcessStats.hpp"

#include <unistd.h>     // sysconf
#include <cmath>        // std::round
#include <exception>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

namespace {

std::string procPath(pid_t pid, const char* entry) {
    return "/proc/" + std::to_string(pid) + "/" + entry;
}

} // anonymous namespace

ProcessStats::ProcessStats(std::chrono::milliseconds window)
    : window_(window) {}

double ProcessStats::round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

long long ProcessStats::cpuTicks(pid_t pid) {
    if (pid <= 0) {
        return -1;
    }

    std::ifstream file(procPath(pid, "stat"));
    std::string line;
    if (!file.is_open() || !std::getline(file, line)) {
        return -1;
    }

    // The command name may contain spaces; fields resume after the last ')'
    auto endParen = line.rfind(')');
    if (endParen == std::string::npos || endParen + 2 >= line.size()) {
        return -1;
    }

    std::istringstream fields(line.substr(endParen + 2));
    std::string field;
    long long utime = 0;
    long long stime = 0;
    // state(3) ... utime is field 14, stime field 15 of the full line
    for (int index = 3; index <= 15 && (fields >> field); ++index) {
        try {
            if (index == 14) {
                utime = std::stoll(field);
            } else if (index == 15) {
                stime = std::stoll(field);
                return utime + stime;
            }
        } catch (const std::exception&) {
            return -1;
        }
    }
    return -1;
}

double ProcessStats::residentMb(pid_t pid) {
    if (pid <= 0) {
        return 0.0;
    }

    std::ifstream file(procPath(pid, "statm"));
    long long sizePages = 0;
    long long residentPages = 0;
    if (!file.is_open() || !(file >> sizePages >> residentPages)) {
        return 0.0;
    }

    const long pageSize = sysconf(_SC_PAGESIZE);
    if (pageSize <= 0) {
        return 0.0;
    }
    return round2(static_cast<double>(residentPages) * pageSize / (1024.0 * 1024.0));
}

ProcessSample ProcessStats::sample(pid_t pid) const {
    return sample(std::vector<pid_t>{pid}).front();
}

std::vector<ProcessSample> ProcessStats::sample(const std::vector<pid_t>& pids) const {
    std::vector<ProcessSample> samples(pids.size());
    if (pids.empty()) {
        return samples;
    }

    std::vector<long long> before(pids.size());
    for (size_t i = 0; i < pids.size(); ++i) {
        before[i] = cpuTicks(pids[i]);
    }

    const auto start = std::chrono::steady_clock::now();
    std::this_thread::sleep_for(window_);
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    const long ticksPerSecond = sysconf(_SC_CLK_TCK);
    for (size_t i = 0; i < pids.size(); ++i) {
        const long long after = cpuTicks(pids[i]);
        if (before[i] < 0 || after < 0) {
            continue;  // gone or unreadable: zero sample
        }

        if (elapsed > 0.0 && ticksPerSecond > 0 && after >= before[i]) {
            const double cpuSeconds = static_cast<double>(after - before[i]) / ticksPerSecond;
            samples[i].cpuPercent = round2(cpuSeconds / elapsed * 100.0);
        }
        samples[i].memoryMb = residentMb(pids[i]);
    }
    return samples;
}
