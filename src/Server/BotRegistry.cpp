/**
 * @file BotRegistry.cpp
 * @brief Implementation of BotRegistry
 * @version 1.0
 * @date 2025-01-01
 */

#include "BotRegistry.hpp"

#include <algorithm>
#include <cctype>

BotRegistry::BotRegistry(size_t maxBotsPerOwner)
    : maxBotsPerOwner_(maxBotsPerOwner) {}

std::string BotRegistry::sanitizeIdPart(const std::string& part) {
    std::string result;
    result.reserve(part.size());
    for (char c : part) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '.' || c == '_') {
            result += c;
        } else {
            result += '_';
        }
    }
    return result;
}

std::string BotRegistry::makeId(const std::string& owner, const std::string& name, long long timestamp) {
    return sanitizeIdPart(owner) + "_" + sanitizeIdPart(name) + "_" + std::to_string(timestamp);
}

size_t BotRegistry::countByOwner(const std::string& owner) const {
    return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
        [&owner](const auto& entry) { return entry.second.owner == owner; }));
}

Result<BotRecord> BotRegistry::create(const std::string& owner,
                                      const std::string& name,
                                      FileType fileType,
                                      const std::string& filePath,
                                      Clock::time_point now) {
    if (countByOwner(owner) >= maxBotsPerOwner_) {
        return Result<BotRecord>::failure(BotError::QuotaExceeded,
            "Free tier limit: " + std::to_string(maxBotsPerOwner_) + " bots per user");
    }

    long long timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
    std::string id = makeId(owner, name, timestamp);
    while (issuedIds_.count(id) != 0) {
        id = makeId(owner, name, ++timestamp);
    }

    BotRecord record;
    record.id = id;
    record.name = name;
    record.owner = owner;
    record.filePath = filePath;
    record.fileType = fileType;
    record.createdAt = now;

    issuedIds_.insert(id);
    order_.push_back(id);
    records_.emplace(id, record);
    return Result<BotRecord>::success(std::move(record));
}

Result<BotRecord> BotRegistry::get(const std::string& id) const {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Result<BotRecord>::failure(BotError::NotFound, "Bot not found");
    }
    return Result<BotRecord>::success(it->second);
}

bool BotRegistry::contains(const std::string& id) const {
    return records_.count(id) != 0;
}

std::vector<BotRecord> BotRegistry::listByOwner(const std::string& owner) const {
    std::vector<BotRecord> result;
    for (const auto& id : order_) {
        const auto& record = records_.at(id);
        if (record.owner == owner) {
            result.push_back(record);
        }
    }
    return result;
}

bool BotRegistry::setFilePath(const std::string& id, const std::string& filePath) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }
    it->second.filePath = filePath;
    return true;
}

Result<BotRecord> BotRegistry::remove(const std::string& id) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Result<BotRecord>::failure(BotError::NotFound, "Bot not found");
    }

    order_.erase(std::remove(order_.begin(), order_.end(), it->first), order_.end());
    BotRecord record = std::move(it->second);
    records_.erase(it);
    return Result<BotRecord>::success(std::move(record));
}
