/**
 * @file BotSupervisor.cpp
 * @brief Implementation of BotSupervisor
 * @version 1.0
 * @date 2025-01-01
 */

#include "BotSupervisor.hpp"

#include <unistd.h>     // close
#include <sys/wait.h>   // WIFEXITED, WEXITSTATUS, WIFSIGNALED, WTERMSIG
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

namespace {

/// Scripts are addressed by absolute path while the child runs inside the root
ServerConfig withAbsoluteRoot(ServerConfig config) {
    std::error_code ec;
    auto root = std::filesystem::absolute(config.storageRoot, ec);
    if (ec) {
        std::cerr << "BotSupervisor: cannot resolve storage root " << config.storageRoot
                  << ": " << ec.message() << std::endl;
        return config;
    }
    config.storageRoot = root.lexically_normal().string();
    return config;
}

void logExit(const std::string& what, pid_t pid, int status) {
    std::cout << "BotSupervisor::reconcile: " << what << " (PID: " << pid << ") ";
    if (WIFEXITED(status)) {
        std::cout << "exited with code " << WEXITSTATUS(status) << std::endl;
    } else if (WIFSIGNALED(status)) {
        std::cout << "killed by signal " << WTERMSIG(status) << std::endl;
    } else {
        std::cout << "is gone" << std::endl;
    }
}

} // anonymous namespace

/**
 * @brief Marks a bot busy for the lifetime of the guard
 *
 * Must be created with the supervisor mutex held. On destruction it
 * re-acquires the mutex if the owning lock has been released, clears the
 * mark and wakes waiters.
 */
class BotSupervisor::BusyGuard {
public:
    BusyGuard(BotSupervisor& owner, std::unique_lock<std::mutex>& lock, std::string botId)
        : owner_(owner), lock_(lock), botId_(std::move(botId)) {
        owner_.busy_.insert(botId_);
    }

    ~BusyGuard() {
        if (!lock_.owns_lock()) {
            lock_.lock();
        }
        owner_.busy_.erase(botId_);
        owner_.idleCv_.notify_all();
    }

    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

private:
    BotSupervisor& owner_;
    std::unique_lock<std::mutex>& lock_;
    std::string botId_;
};

BotSupervisor::BotSupervisor(const ServerConfig& config)
    : config_(withAbsoluteRoot(config)),
      registry_(config_.maxBotsPerUser),
      runner_(config_.storageRoot, config_.stopTimeout, config_.killGrace),
      stats_(config_.statsWindow),
      logSink_(config_.storageRoot),
      scripts_(config_.storageRoot) {}

BotSupervisor::~BotSupervisor() {
    shutdown();
}

bool BotSupervisor::initialize() {
    if (!scripts_.prepare()) {
        return false;
    }

    if (config_.reconcileInterval.count() > 0 && !reconciler_.joinable()) {
        std::lock_guard<std::mutex> lock(reconcileMutex_);
        stopping_ = false;
        reconciler_ = std::thread(&BotSupervisor::reconcileLoop, this);
    }
    return true;
}

void BotSupervisor::waitUntilIdle(std::unique_lock<std::mutex>& lock, const std::string& botId) {
    idleCv_.wait(lock, [this, &botId] { return busy_.count(botId) == 0; });
}

Result<BotRecord> BotSupervisor::upload(const std::string& owner,
                                        const std::string& name,
                                        const std::string& fileBytes,
                                        const std::string& fileType) {
    auto type = fileTypeFromExtension(fileType);
    if (!type) {
        return Result<BotRecord>::failure(BotError::InvalidFileType, "Invalid file type");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    auto created = registry_.create(owner, name, *type, "");
    if (!created.ok()) {
        std::cerr << "BotSupervisor::upload: rejected bot for " << owner << ": "
                  << botErrorName(created.error) << " (" << created.message << ")" << std::endl;
        return created;
    }

    BotRecord record = std::move(*created.value);
    record.filePath = scripts_.scriptPath(record.id, *type);
    registry_.setFilePath(record.id, record.filePath);

    BusyGuard busy(*this, lock, record.id);
    lock.unlock();

    auto written = scripts_.write(record.filePath, fileBytes);
    if (!written.ok()) {
        std::cerr << "BotSupervisor::upload: " << written.message << std::endl;
        lock.lock();
        registry_.remove(record.id);  // give the quota slot back
        return Result<BotRecord>::failure(written.error, written.message);
    }

    std::cout << "BotSupervisor::upload: stored bot " << record.id << " (" << fileBytes.size()
              << " bytes)" << std::endl;
    return Result<BotRecord>::success(std::move(record), "Bot uploaded successfully");
}

Result<pid_t> BotSupervisor::start(const std::string& botId) {
    std::unique_lock<std::mutex> lock(mutex_);
    waitUntilIdle(lock, botId);

    auto found = registry_.get(botId);
    if (!found.ok()) {
        return Result<pid_t>::failure(found.error, found.message);
    }
    if (table_.contains(botId)) {
        return Result<pid_t>::failure(BotError::AlreadyRunning, "Bot already running");
    }

    const BotRecord& record = *found.value;
    auto argv = ProcessRunner::launchArgs(config_.launchCommand(record.fileType), record.filePath);
    if (argv.empty()) {
        return Result<pid_t>::failure(BotError::UnsupportedFileType, "Unsupported file type");
    }

    BusyGuard busy(*this, lock, botId);
    lock.unlock();

    std::string error;
    int logFd = logSink_.openForRun(botId, error);
    if (logFd < 0) {
        std::cerr << "BotSupervisor::start: " << error << std::endl;
        return Result<pid_t>::failure(BotError::StorageFailure, "Failed to start bot: " + error);
    }

    auto handle = runner_.start(argv, logFd, error);
    close(logFd);
    if (!handle) {
        std::cerr << "BotSupervisor::start: bot " << botId << ": "
                  << botErrorName(BotError::SpawnFailure) << ": " << error << std::endl;
        return Result<pid_t>::failure(BotError::SpawnFailure, "Failed to start bot: " + error);
    }

    RunningProcess process;
    process.botId = botId;
    process.handle = std::move(*handle);
    process.logPath = logSink_.logPath(botId);
    process.startedAt = Clock::now();
    const pid_t pid = process.pid();

    lock.lock();
    if (!table_.insert(std::move(process))) {
        // Unreachable while the bot is marked busy; the handle kills the child
        lock.unlock();
        return Result<pid_t>::failure(BotError::AlreadyRunning, "Bot already running");
    }

    std::cout << "BotSupervisor::start: bot " << botId << " running (PID: " << pid << ")" << std::endl;
    return Result<pid_t>::success(pid, "Bot started successfully");
}

Result<TerminationResult> BotSupervisor::stop(const std::string& botId) {
    std::unique_lock<std::mutex> lock(mutex_);
    waitUntilIdle(lock, botId);

    RunningProcess* process = table_.get(botId);
    if (process == nullptr) {
        return Result<TerminationResult>::failure(BotError::NotRunning, "Bot is not running");
    }

    BusyGuard busy(*this, lock, botId);
    lock.unlock();

    // The entry cannot be erased while the bot is busy, so the handle
    // stays valid without the lock.
    const TerminationResult outcome = runner_.terminate(process->handle);

    // Destroy the detached entry only after the lock is released
    lock.lock();
    auto removed = table_.remove(botId);
    if (outcome == TerminationResult::Unreaped && removed.ok()) {
        unreaped_.push_back(std::move(removed.value->handle));
    }
    lock.unlock();

    if (outcome == TerminationResult::Graceful) {
        std::cout << "BotSupervisor::stop: bot " << botId << " stopped" << std::endl;
        return Result<TerminationResult>::success(outcome, "Bot stopped successfully");
    }

    std::cerr << "BotSupervisor::stop: bot " << botId << " did not stop within "
              << config_.stopTimeout.count() << "ms, force-stopped" << std::endl;
    return Result<TerminationResult>::success(outcome, "Bot force-stopped");
}

Result<BotRecord> BotSupervisor::deleteBot(const std::string& botId) {
    std::unique_lock<std::mutex> lock(mutex_);
    waitUntilIdle(lock, botId);

    auto found = registry_.get(botId);
    if (!found.ok()) {
        return found;
    }
    const BotRecord record = *found.value;

    BusyGuard busy(*this, lock, botId);
    RunningProcess* process = table_.get(botId);
    lock.unlock();

    if (process != nullptr) {
        const TerminationResult outcome = runner_.terminate(process->handle);
        if (outcome == TerminationResult::Unreaped) {
            std::cerr << "BotSupervisor::deleteBot: bot " << botId
                      << " not reaped after SIGKILL, deleting anyway" << std::endl;
        }

        lock.lock();
        auto removed = table_.remove(botId);
        if (outcome == TerminationResult::Unreaped && removed.ok()) {
            unreaped_.push_back(std::move(removed.value->handle));
        }
        lock.unlock();
    }

    // Best effort: a file that is already gone must not block the delete
    scripts_.remove(record.filePath);
    logSink_.remove(botId);

    lock.lock();
    registry_.remove(botId);

    std::cout << "BotSupervisor::deleteBot: bot " << botId << " deleted" << std::endl;
    return Result<BotRecord>::success(record, "Bot deleted successfully");
}

Result<BotView> BotSupervisor::status(const std::string& botId) {
    BotView view;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = registry_.get(botId);
        if (!found.ok()) {
            return Result<BotView>::failure(found.error, found.message);
        }
        view.record = std::move(*found.value);

        if (const RunningProcess* process = table_.get(botId)) {
            view.status = BotStatus::Running;
            view.pid = process->pid();
            view.startedAt = process->startedAt;
        }
    }

    if (view.status == BotStatus::Running) {
        const ProcessSample sample = stats_.sample(view.pid);
        view.cpuPercent = sample.cpuPercent;
        view.memoryMb = sample.memoryMb;
    }
    return Result<BotView>::success(std::move(view));
}

std::vector<BotView> BotSupervisor::listByOwner(const std::string& owner) {
    std::vector<BotView> views;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& record : registry_.listByOwner(owner)) {
            BotView view;
            if (const RunningProcess* process = table_.get(record.id)) {
                view.status = BotStatus::Running;
                view.pid = process->pid();
                view.startedAt = process->startedAt;
            }
            view.record = std::move(record);
            views.push_back(std::move(view));
        }
    }

    std::vector<pid_t> pids;
    for (const auto& view : views) {
        if (view.status == BotStatus::Running) {
            pids.push_back(view.pid);
        }
    }

    const auto samples = stats_.sample(pids);
    size_t next = 0;
    for (auto& view : views) {
        if (view.status == BotStatus::Running) {
            view.cpuPercent = samples[next].cpuPercent;
            view.memoryMb = samples[next].memoryMb;
            ++next;
        }
    }
    return views;
}

Result<LogTail> BotSupervisor::logs(const std::string& botId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!registry_.contains(botId)) {
            return Result<LogTail>::failure(BotError::NotFound, "Bot not found");
        }
    }
    return logSink_.tail(botId, config_.logTailLines);
}

size_t BotSupervisor::reconcile() {
    std::vector<RunningProcess> exited;
    std::vector<ProcessHandle> reaped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = unreaped_.begin(); it != unreaped_.end();) {
            if (it->poll()) {
                reaped.push_back(std::move(*it));
                it = unreaped_.erase(it);
            } else {
                ++it;
            }
        }

        for (const auto& botId : table_.ids()) {
            if (busy_.count(botId) != 0) {
                continue;
            }
            RunningProcess* process = table_.get(botId);
            if (process != nullptr && process->handle.poll()) {
                auto removed = table_.remove(botId);
                exited.push_back(std::move(*removed.value));
            }
        }
    }

    for (const auto& handle : reaped) {
        logExit("stopped child", handle.pid(), handle.waitStatus());
    }
    for (const auto& process : exited) {
        logExit("bot " + process.botId, process.pid(), process.handle.waitStatus());
    }
    return exited.size();
}

void BotSupervisor::reconcileLoop() {
    std::unique_lock<std::mutex> lock(reconcileMutex_);
    while (!stopping_) {
        reconcileCv_.wait_for(lock, config_.reconcileInterval, [this] { return stopping_; });
        if (stopping_) {
            break;
        }
        lock.unlock();
        reconcile();
        lock.lock();
    }
}

void BotSupervisor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(reconcileMutex_);
        stopping_ = true;
    }
    reconcileCv_.notify_all();
    if (reconciler_.joinable()) {
        reconciler_.join();
    }

    std::vector<std::string> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running = table_.ids();
    }
    for (const auto& botId : running) {
        std::cout << "BotSupervisor::shutdown: terminating bot " << botId << std::endl;
        auto stopped = stop(botId);
        if (!stopped.ok()) {
            std::cerr << "BotSupervisor::shutdown: bot " << botId << ": "
                      << botErrorName(stopped.error) << " (" << stopped.message << ")" << std::endl;
        }
    }

    // Remaining killed children are reaped by their handles' destructors
    std::vector<ProcessHandle> unreaped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        unreaped.swap(unreaped_);
    }
    if (!unreaped.empty()) {
        std::cerr << "BotSupervisor::shutdown: waiting for " << unreaped.size()
                  << " killed children" << std::endl;
    }
}

bool BotSupervisor::isRunning(const std::string& botId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.contains(botId);
}

size_t BotSupervisor::runningCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.size();
}

size_t BotSupervisor::unreapedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unreaped_.size();
}
