/**
 * @file ProcessTable.hpp
 * @brief Table of currently running bot processes
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "BotRecord.hpp"
#include "BotResult.hpp"

/**
 * @brief Mapping from bot id to its live process
 *
 * An id is present exactly while its bot counts as running. The table owns
 * each RunningProcess and thereby its ProcessHandle; it never signals a
 * process itself. Not synchronised: BotSupervisor holds the lock.
 */
class ProcessTable {
public:
    /**
     * @brief Add a live process
     * @return false (AlreadyRunning) if the bot already has an entry; the
     *         passed process is left untouched in that case
     */
    bool insert(RunningProcess&& process);

    /**
     * @brief Entry for a bot, or nullptr if it is not running
     *
     * The pointer stays valid until the entry is removed.
     */
    RunningProcess* get(const std::string& botId);
    const RunningProcess* get(const std::string& botId) const;

    /**
     * @brief Detach an entry, handing ownership of the process to the caller
     */
    Result<RunningProcess> remove(const std::string& botId);

    bool contains(const std::string& botId) const;

    std::vector<std::string> ids() const;

    size_t size() const { return entries_.size(); }

private:
    std::unordered_map<std::string, RunningProcess> entries_;
};
