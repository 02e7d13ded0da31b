/**
 * @file ServerConfig.cpp
 * @brief Configuration file and environment loading
 * @version 1.0
 * @date 2025-01-01
 */

#include "ServerConfig.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {

std::string trim(const std::string& input) {
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = input.find_last_not_of(" \t\r\n");
    return input.substr(first, last - first + 1);
}

bool parseNumber(const std::string& value, long long minimum, long long& out, std::string& error) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        if (parsed < minimum) {
            error = "value " + value + " must be at least " + std::to_string(minimum);
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        error = "invalid number '" + value + "'";
        return false;
    }
}

bool parseMillis(const std::string& value, std::chrono::milliseconds& out, std::string& error) {
    long long parsed = 0;
    if (!parseNumber(value, 0, parsed, error)) {
        return false;
    }
    out = std::chrono::milliseconds(parsed);
    return true;
}

} // anonymous namespace

const std::string& ServerConfig::launchCommand(FileType type) const {
    return type == FileType::Python ? pythonCommand : nodeCommand;
}

bool setConfigValue(ServerConfig& config, const std::string& key,
                    const std::string& value, std::string& error) {
    long long number = 0;

    if (key == "host") {
        if (value.empty()) {
            error = "host must not be empty";
            return false;
        }
        config.host = value;
    } else if (key == "port") {
        if (!parseNumber(value, 1, number, error)) {
            return false;
        }
        if (number > 65535) {
            error = "port out of range";
            return false;
        }
        config.port = static_cast<int>(number);
    } else if (key == "storage_root") {
        if (value.empty()) {
            error = "storage_root must not be empty";
            return false;
        }
        config.storageRoot = value;
    } else if (key == "max_bots_per_user") {
        if (!parseNumber(value, 0, number, error)) {
            return false;
        }
        config.maxBotsPerUser = static_cast<size_t>(number);
    } else if (key == "python_command") {
        config.pythonCommand = value;
    } else if (key == "node_command") {
        config.nodeCommand = value;
    } else if (key == "stop_timeout_ms") {
        return parseMillis(value, config.stopTimeout, error);
    } else if (key == "kill_grace_ms") {
        return parseMillis(value, config.killGrace, error);
    } else if (key == "reconcile_interval_ms") {
        return parseMillis(value, config.reconcileInterval, error);
    } else if (key == "stats_window_ms") {
        return parseMillis(value, config.statsWindow, error);
    } else if (key == "log_tail_lines") {
        if (!parseNumber(value, 1, number, error)) {
            return false;
        }
        config.logTailLines = static_cast<size_t>(number);
    } else {
        error = "unknown key '" + key + "'";
        return false;
    }
    return true;
}

bool loadConfiguration(const std::string& path, ServerConfig& config, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Failed to open configuration file: " + path;
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        const std::string content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }

        const auto equals = content.find('=');
        if (equals == std::string::npos) {
            error = path + ":" + std::to_string(lineNumber) + ": expected 'key = value'";
            return false;
        }

        const std::string key = trim(content.substr(0, equals));
        const std::string value = trim(content.substr(equals + 1));
        std::string reason;
        if (!setConfigValue(config, key, value, reason)) {
            error = path + ":" + std::to_string(lineNumber) + ": " + reason;
            return false;
        }
    }
    return true;
}

bool applyEnvironment(ServerConfig& config, std::string& error) {
    const char* port = std::getenv("PORT");
    if (port == nullptr || *port == '\0') {
        return true;
    }

    std::string reason;
    if (!setConfigValue(config, "port", port, reason)) {
        error = "PORT: " + reason;
        return false;
    }
    return true;
}
