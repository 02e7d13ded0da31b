/**
 * @file LogSink.hpp
 * @brief Per-bot output log files
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <cstddef>
#include <string>

#include "BotResult.hpp"

/**
 * @brief Tail of a bot log
 */
struct LogTail {
    bool available = false;  ///< false: the bot has never been started
    std::string text;
};

/**
 * @brief Captures combined stdout/stderr of each bot run
 *
 * Every bot writes to {root}/{bot_id}.log. The file is truncated when a
 * run starts and is read back with a bounded tail.
 */
class LogSink {
public:
    explicit LogSink(std::string root);

    std::string logPath(const std::string& botId) const;

    /**
     * @brief Create or truncate the log for a new run
     * @param error Receives the reason when -1 is returned
     * @return Write descriptor (close-on-exec, append mode) or -1
     *
     * The caller owns the descriptor and closes it once the child has
     * inherited it.
     */
    int openForRun(const std::string& botId, std::string& error) const;

    /**
     * @brief Last lines of a bot log
     * @return available == false if no log exists, StorageFailure if the
     *         file exists but cannot be read
     */
    Result<LogTail> tail(const std::string& botId, size_t maxLines) const;

    /**
     * @brief Last @p maxLines lines of a file, in file order
     *
     * A final newline does not count as an extra empty line. The file is
     * scanned backwards in chunks, so only the returned tail is loaded.
     */
    static Result<LogTail> tailFile(const std::string& path, size_t maxLines);

    /**
     * @brief Remove a bot log; a missing file is not an error
     */
    bool remove(const std::string& botId) const;

private:
    std::string root_;
};
