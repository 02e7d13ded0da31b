/**
 * @file ProcessTable.cpp
 * @brief Implementation of ProcessTable
 * @version 1.0
 * @date 2025-01-01
 */

#include "ProcessTable.hpp"

#include <utility>

bool ProcessTable::insert(RunningProcess&& process) {
    if (entries_.count(process.botId) != 0) {
        return false;
    }
    std::string key = process.botId;
    entries_.emplace(std::move(key), std::move(process));
    return true;
}

RunningProcess* ProcessTable::get(const std::string& botId) {
    auto it = entries_.find(botId);
    return it == entries_.end() ? nullptr : &it->second;
}

const RunningProcess* ProcessTable::get(const std::string& botId) const {
    auto it = entries_.find(botId);
    return it == entries_.end() ? nullptr : &it->second;
}

Result<RunningProcess> ProcessTable::remove(const std::string& botId) {
    auto it = entries_.find(botId);
    if (it == entries_.end()) {
        return Result<RunningProcess>::failure(BotError::NotRunning, "Bot is not running");
    }

    RunningProcess process = std::move(it->second);
    entries_.erase(it);
    return Result<RunningProcess>::success(std::move(process));
}

bool ProcessTable::contains(const std::string& botId) const {
    return entries_.count(botId) != 0;
}

std::vector<std::string> ProcessTable::ids() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}
