/**
 * @file HttpApi.hpp
 * @brief REST endpoints of the bot host server
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <atomic>
#include <string>

#include "httplib.h"
#include "BotSupervisor.hpp"

/**
 * @brief Extension of an uploaded file name without the dot
 * @return "" when the name has no dot or ends with one
 */
std::string fileExtension(const std::string& filename);

/**
 * @brief Stop the server once it is listening
 *
 * A stop requested before listen() has bound does nothing in httplib, so
 * this waits until the server runs, or until @p listenReturned reports
 * that listen() gave up.
 */
void stopServer(httplib::Server& server, const std::atomic<bool>& listenReturned);

/**
 * @brief Register all /api routes, CORS handling and request logging
 *
 * Endpoints:
 * - GET    /api/health              - Liveness probe
 * - GET    /api/bots/{username}     - Bots of one user with status
 * - POST   /api/bot/upload          - Multipart upload (bot_file, username, bot_name)
 * - POST   /api/bot/start/{bot_id}  - Start a bot
 * - POST   /api/bot/stop/{bot_id}   - Stop a bot
 * - DELETE /api/bot/delete/{bot_id} - Delete a bot and its files
 * - GET    /api/bot/logs/{bot_id}   - Tail of the bot's output
 * - GET    /api/bot/status/{bot_id} - Status of one bot
 *
 * The supervisor must outlive the server.
 */
void registerRoutes(httplib::Server& server, BotSupervisor& supervisor);
