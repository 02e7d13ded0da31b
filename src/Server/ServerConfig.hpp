/**
 * @file ServerConfig.hpp
 * @brief Runtime configuration of the bot host server
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "BotRecord.hpp"

// Configuration constants
constexpr int DEFAULT_PORT = 10000;
constexpr const char* DEFAULT_CONFIG_PATH = "./config/bothost.conf";
constexpr const char* DEFAULT_STORAGE_ROOT = "/tmp/bots";

/**
 * @brief All tunables of the server and the supervisor
 */
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = DEFAULT_PORT;
    std::string storageRoot = DEFAULT_STORAGE_ROOT;  ///< Scripts, logs and bot working directory
    size_t maxBotsPerUser = 3;

    std::string pythonCommand = "python3";  ///< Empty disables .py bots
    std::string nodeCommand = "node";       ///< Empty disables .js bots

    std::chrono::milliseconds stopTimeout{5000};        ///< SIGTERM -> SIGKILL escalation
    std::chrono::milliseconds killGrace{2000};          ///< Wait after SIGKILL
    std::chrono::milliseconds reconcileInterval{5000};  ///< 0 disables the sweep
    std::chrono::milliseconds statsWindow{100};         ///< CPU sampling window
    size_t logTailLines = 1000;

    /**
     * @brief Runtime command line for a script type
     */
    const std::string& launchCommand(FileType type) const;
};

/**
 * @brief Apply one "key = value" setting
 * @param error Receives the reason on failure
 * @return false on unknown key or invalid value
 */
bool setConfigValue(ServerConfig& config, const std::string& key,
                    const std::string& value, std::string& error);

/**
 * @brief Load settings from a configuration file
 *
 * Configuration file format, one setting per line:
 *   key = value
 * Blank lines and lines starting with '#' are ignored.
 *
 * @return false on I/O or parse error, with the line number in @p error
 */
bool loadConfiguration(const std::string& path, ServerConfig& config, std::string& error);

/**
 * @brief Apply the PORT environment variable, if set
 */
bool applyEnvironment(ServerConfig& config, std::string& error);
