/**
 * @file BotSupervisor.hpp
 * @brief Orchestrates bot uploads, process lifecycles and status queries
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <condition_variable>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <unordered_set>
#include <vector>

#include "BotRecord.hpp"
#include "BotRegistry.hpp"
#include "BotResult.hpp"
#include "LogSink.hpp"
#include "ProcessRunner.hpp"
#include "ProcessStats.hpp"
#include "ProcessTable.hpp"
#include "ScriptStore.hpp"
#include "ServerConfig.hpp"

/**
 * @brief The bot process supervisor
 *
 * Owns the registry and the process table behind a single mutex. Slow
 * work (writing scripts, fork/exec, the bounded stop wait) runs with the
 * mutex released while the bot id is marked busy; other mutating calls on
 * that id wait until it is idle again and then re-check their
 * preconditions. Reads take a consistent snapshot of both tables and do
 * their probing afterwards.
 *
 * No operation throws; failures come back as Result error codes.
 */
class BotSupervisor {
public:
    /**
     * @brief Constructor
     * @param config Settings; a relative storageRoot is resolved against
     *               the current directory once, here
     */
    explicit BotSupervisor(const ServerConfig& config);

    /**
     * @brief Destructor - stops the reconciler and every running bot
     */
    ~BotSupervisor();

    BotSupervisor(const BotSupervisor&) = delete;
    BotSupervisor& operator=(const BotSupervisor&) = delete;

    /**
     * @brief Create the storage root and start the reconciliation thread
     * @return false if storage cannot be prepared
     */
    bool initialize();

    /**
     * @brief Register a bot and store its script
     * @param fileType Upload extension, "py" or "js" (case-insensitive)
     *
     * Fails with InvalidFileType, QuotaExceeded or StorageFailure.
     */
    Result<BotRecord> upload(const std::string& owner,
                             const std::string& name,
                             const std::string& fileBytes,
                             const std::string& fileType);

    /**
     * @brief Launch a bot
     * @return PID of the new process
     *
     * Fails with NotFound, AlreadyRunning, UnsupportedFileType,
     * StorageFailure (log file) or SpawnFailure.
     */
    Result<pid_t> start(const std::string& botId);

    /**
     * @brief Terminate a running bot, escalating to SIGKILL after the timeout
     *
     * Fails only with NotRunning. On success the bot is no longer in the
     * process table. A child that survives SIGKILL and the grace period is
     * parked for the reconciler to reap, so the call never blocks longer
     * than stopTimeout + killGrace.
     */
    Result<TerminationResult> stop(const std::string& botId);

    /**
     * @brief Remove a bot: stop it if running, delete its files and record
     *
     * Termination and file removal problems are logged and do not abort
     * the delete. Fails only with NotFound.
     */
    Result<BotRecord> deleteBot(const std::string& botId);

    /**
     * @brief Record, run state and resource usage of one bot
     * @return NotFound for an unknown id
     *
     * CPU and memory are sampled over statsWindow for a running bot and
     * are zero for a stopped one.
     */
    Result<BotView> status(const std::string& botId);

    /**
     * @brief Status views of all bots of an owner, in upload order
     */
    std::vector<BotView> listByOwner(const std::string& owner);

    /**
     * @brief Tail of the bot's log; available == false before the first start
     */
    Result<LogTail> logs(const std::string& botId);

    /**
     * @brief Drop process table entries whose process already exited
     * @return Number of entries removed
     *
     * Bots with an operation in flight are skipped. Also reaps children
     * parked by a stop that outlived SIGKILL.
     */
    size_t reconcile();

    /**
     * @brief Stop the reconciler and terminate every running bot
     */
    void shutdown();

    /**
     * @brief Check whether the process table holds the bot
     * @return true until a stop, delete or sweep removes the entry
     */
    bool isRunning(const std::string& botId) const;

    /**
     * @brief Number of process table entries
     */
    size_t runningCount() const;

    /**
     * @brief Children that were SIGKILLed but not yet reaped
     */
    size_t unreapedCount() const;

private:
    class BusyGuard;

    void waitUntilIdle(std::unique_lock<std::mutex>& lock, const std::string& botId);
    void reconcileLoop();

    ServerConfig config_;
    BotRegistry registry_;
    ProcessTable table_;
    ProcessRunner runner_;
    ProcessStats stats_;
    LogSink logSink_;
    ScriptStore scripts_;

    mutable std::mutex mutex_;                 ///< Guards registry_, table_, busy_ and unreaped_
    std::condition_variable idleCv_;
    std::unordered_set<std::string> busy_;     ///< Bots with a blocking operation in flight
    std::vector<ProcessHandle> unreaped_;      ///< Killed children awaiting a sweep

    std::mutex reconcileMutex_;
    std::condition_variable reconcileCv_;
    bool stopping_ = false;
    std::thread reconciler_;
};
