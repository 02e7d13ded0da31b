/**
 * @file BotRecord.hpp
 * @brief Bot metadata, live-process entry and merged status view
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>

#include "ProcessRunner.hpp"

using Clock = std::chrono::system_clock;

/**
 * @brief Supported script runtimes
 */
enum class FileType {
    Python,     ///< .py scripts
    JavaScript  ///< .js scripts
};

/**
 * @brief Map an upload extension ("py", "JS", ...) to a runtime
 * @return Runtime, or std::nullopt for anything unsupported
 */
std::optional<FileType> fileTypeFromExtension(const std::string& extension);

/**
 * @brief Canonical extension for a runtime ("py" or "js")
 */
const char* fileTypeExtension(FileType type);

/**
 * @brief Metadata of one uploaded bot, owned by BotRegistry
 *
 * Lifecycle status is deliberately absent: a bot is running exactly when
 * ProcessTable holds an entry for its id.
 */
struct BotRecord {
    std::string id;             ///< {owner}_{name}_{unix_timestamp}, immutable
    std::string name;           ///< User supplied label
    std::string owner;          ///< Username
    std::string filePath;       ///< Absolute path of the stored script
    FileType fileType = FileType::Python;
    Clock::time_point createdAt;
};

/**
 * @brief One live bot process, owned by ProcessTable
 */
struct RunningProcess {
    std::string botId;
    ProcessHandle handle;       ///< Exclusive owner of the child
    std::string logPath;
    Clock::time_point startedAt;

    pid_t pid() const { return handle.pid(); }
};

/**
 * @brief Derived lifecycle state
 */
enum class BotStatus {
    Stopped = 0,
    Running = 1
};

/**
 * @brief BotRecord merged with its derived runtime fields
 */
struct BotView {
    BotRecord record;
    BotStatus status = BotStatus::Stopped;
    double cpuPercent = 0.0;
    double memoryMb = 0.0;
    pid_t pid = -1;
    std::optional<Clock::time_point> startedAt;
};
