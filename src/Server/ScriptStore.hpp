/**
 * @file ScriptStore.hpp
 * @brief Storage of uploaded bot scripts
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <string>

#include "BotRecord.hpp"
#include "BotResult.hpp"

/**
 * @brief Writes and removes bot scripts under the shared storage root
 *
 * File names derive from the unique bot id, so bots never collide.
 */
class ScriptStore {
public:
    explicit ScriptStore(std::string root);

    /**
     * @brief Create the storage root if needed
     * @return false if the directory cannot be created
     */
    bool prepare() const;

    /**
     * @brief {root}/{bot_id}.{py|js}
     */
    std::string scriptPath(const std::string& botId, FileType fileType) const;

    /**
     * @brief Write the uploaded bytes, replacing any previous content
     */
    Result<std::string> write(const std::string& path, const std::string& bytes) const;

    /**
     * @brief Best-effort removal; a missing file is not an error
     */
    bool remove(const std::string& path) const;

private:
    std::string root_;
};
