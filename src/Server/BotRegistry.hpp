/**
 * @file BotRegistry.hpp
 * @brief In-memory registry of uploaded bots
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "BotRecord.hpp"
#include "BotResult.hpp"

/**
 * @brief Mapping from bot id to bot metadata
 *
 * Pure data, no I/O and no locking: BotSupervisor serialises access.
 * Records keep their insertion order for listing.
 */
class BotRegistry {
public:
    /**
     * @brief Constructor
     * @param maxBotsPerOwner Quota of simultaneously registered bots per owner
     */
    explicit BotRegistry(size_t maxBotsPerOwner);

    /**
     * @brief Register a new bot
     * @param now Creation time; its unix seconds form the id suffix
     * @return The stored record, or QuotaExceeded
     *
     * Ids are never handed out twice during the registry's lifetime; when
     * the natural id was already issued the timestamp part is advanced.
     */
    Result<BotRecord> create(const std::string& owner,
                             const std::string& name,
                             FileType fileType,
                             const std::string& filePath,
                             Clock::time_point now = Clock::now());

    Result<BotRecord> get(const std::string& id) const;

    bool contains(const std::string& id) const;

    /**
     * @brief Records of one owner in insertion order
     */
    std::vector<BotRecord> listByOwner(const std::string& owner) const;

    /**
     * @brief Update the stored script path of a bot
     * @return false if the bot is unknown
     */
    bool setFilePath(const std::string& id, const std::string& filePath);

    /**
     * @brief Delete a record
     *
     * The caller must already have removed any process table entry.
     */
    Result<BotRecord> remove(const std::string& id);

    size_t countByOwner(const std::string& owner) const;
    size_t size() const { return records_.size(); }

    /**
     * @brief Replace characters that are not URL safe with '_'
     */
    static std::string sanitizeIdPart(const std::string& part);

private:
    static std::string makeId(const std::string& owner, const std::string& name, long long timestamp);

    size_t maxBotsPerOwner_;
    std::unordered_map<std::string, BotRecord> records_;
    std::vector<std::string> order_;
    std::unordered_set<std::string> issuedIds_;
};
