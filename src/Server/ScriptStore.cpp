/**
 * @file ScriptStore.cpp
 * @brief Implementation of ScriptStore
 * @version 1.0
 * @date 2025-01-01
 */

#include "ScriptStore.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>

namespace fs = std::filesystem;

ScriptStore::ScriptStore(std::string root)
    : root_(std::move(root)) {}

bool ScriptStore::prepare() const {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        std::cerr << "ScriptStore::prepare: cannot create " << root_ << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

std::string ScriptStore::scriptPath(const std::string& botId, FileType fileType) const {
    return (fs::path(root_) / (botId + "." + fileTypeExtension(fileType))).string();
}

Result<std::string> ScriptStore::write(const std::string& path, const std::string& bytes) const {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Result<std::string>::failure(BotError::StorageFailure,
            "Failed to store bot file: cannot open " + path);
    }

    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        return Result<std::string>::failure(BotError::StorageFailure,
            "Failed to store bot file: write error in " + path);
    }
    return Result<std::string>::success(path);
}

bool ScriptStore::remove(const std::string& path) const {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "ScriptStore::remove: " << path << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}
