/**
 * @file LogSink.cpp
 * @brief Implementation of LogSink
 * @version 1.0
 * @date 2025-01-01
 */

#include "LogSink.hpp"

#include <fcntl.h>      // open
#include <algorithm>
#include <cerrno>
#include <cstring>      // strerror
#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr std::streamoff TAIL_CHUNK = 64 * 1024;

} // anonymous namespace

LogSink::LogSink(std::string root)
    : root_(std::move(root)) {}

std::string LogSink::logPath(const std::string& botId) const {
    return (fs::path(root_) / (botId + ".log")).string();
}

int LogSink::openForRun(const std::string& botId, std::string& error) const {
    const std::string path = logPath(botId);
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = "Cannot open log file " + path + ": " + strerror(errno);
    }
    return fd;
}

Result<LogTail> LogSink::tail(const std::string& botId, size_t maxLines) const {
    return tailFile(logPath(botId), maxLines);
}

Result<LogTail> LogSink::tailFile(const std::string& path, size_t maxLines) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<LogTail>::success(LogTail{});
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<LogTail>::failure(BotError::StorageFailure,
            "Failed to read logs: cannot open " + path);
    }

    LogTail result;
    result.available = true;

    file.seekg(0, std::ios::end);
    const std::streamoff size = file.tellg();
    if (size <= 0 || maxLines == 0) {
        return Result<LogTail>::success(std::move(result));
    }

    char last = '\0';
    file.seekg(size - 1);
    file.get(last);
    const size_t target = maxLines + (last == '\n' ? 1 : 0);

    // Walk backwards until `target` newlines are seen; the tail starts
    // right after the last one found.
    std::vector<char> buffer(static_cast<size_t>(TAIL_CHUNK));
    std::streamoff start = 0;
    std::streamoff pos = size;
    size_t found = 0;
    bool done = false;
    while (pos > 0 && !done) {
        const std::streamoff len = std::min(TAIL_CHUNK, pos);
        pos -= len;
        file.seekg(pos);
        file.read(buffer.data(), len);
        if (!file) {
            return Result<LogTail>::failure(BotError::StorageFailure,
                "Failed to read logs: read error in " + path);
        }
        for (std::streamoff i = len - 1; i >= 0; --i) {
            if (buffer[static_cast<size_t>(i)] == '\n' && ++found == target) {
                start = pos + i + 1;
                done = true;
                break;
            }
        }
    }

    result.text.resize(static_cast<size_t>(size - start));
    file.seekg(start);
    file.read(&result.text[0], size - start);
    if (!file) {
        return Result<LogTail>::failure(BotError::StorageFailure,
            "Failed to read logs: read error in " + path);
    }
    return Result<LogTail>::success(std::move(result));
}

bool LogSink::remove(const std::string& botId) const {
    std::error_code ec;
    fs::remove(logPath(botId), ec);
    if (ec) {
        std::cerr << "LogSink::remove: " << logPath(botId) << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}
