/**
 * @file ApiJson.hpp
 * @brief JSON bodies and status codes of the bot host HTTP API
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

#include "BotRecord.hpp"
#include "BotResult.hpp"

/// Returned as "logs" when a bot has never been started
constexpr const char* NO_LOGS_MESSAGE = "No logs available yet";

/**
 * @brief Escape special characters in JSON strings
 */
std::string escapeJsonString(const std::string& input);

/**
 * @brief Local time as ISO-8601 with microseconds, e.g. 2025-01-01T12:00:00.000000
 */
std::string formatIsoTime(Clock::time_point time);

/**
 * @brief HTTP status for a failed supervisor operation
 */
int httpStatusFor(BotError error);

/**
 * @brief Single bot object as listed by /api/bots and /api/bot/status
 */
std::string botViewToJson(const BotView& view);

std::string errorJson(const std::string& message);
std::string messageJson(const std::string& message);
std::string uploadJson(const BotRecord& record, const std::string& message);
std::string startJson(pid_t pid, const std::string& message);
std::string logsJson(const std::string& logs);
std::string botListJson(const std::vector<BotView>& views);
std::string botStatusJson(const BotView& view);
std::string healthJson(Clock::time_point now);
