/**
 * @file HttpApi.cpp
 * @brief Route handlers translating HTTP requests into supervisor calls
 * @version 1.0
 * @date 2025-01-01
 */

#include "HttpApi.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

#include "ApiJson.hpp"

namespace {

void sendJson(httplib::Response& res, int status, const std::string& body) {
    res.status = status;
    res.set_content(body, "application/json");
}

template <typename T>
void sendError(httplib::Response& res, const Result<T>& result) {
    sendJson(res, httpStatusFor(result.error), errorJson(result.message));
}

/**
 * @brief Form field from a multipart part or a url-encoded parameter
 */
std::string formValue(const httplib::Request& req, const std::string& key) {
    if (req.has_file(key)) {
        return req.get_file_value(key).content;
    }
    if (req.has_param(key)) {
        return req.get_param_value(key);
    }
    return "";
}

/**
 * @brief Run a handler, turning escaped exceptions into a 500
 */
template <typename Handler>
httplib::Server::Handler guarded(const char* route, Handler handler) {
    return [route, handler](const httplib::Request& req, httplib::Response& res) {
        try {
            handler(req, res);
        } catch (const std::exception& e) {
            std::cerr << "Error in " << route << ": " << e.what() << std::endl;
            sendJson(res, 500, errorJson("Internal server error"));
        }
    };
}

} // anonymous namespace

std::string fileExtension(const std::string& filename) {
    const auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot + 1 == filename.size()) {
        return "";
    }
    return filename.substr(dot + 1);
}

void stopServer(httplib::Server& server, const std::atomic<bool>& listenReturned) {
    while (!listenReturned && !server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    server.stop();
}

void registerRoutes(httplib::Server& server, BotSupervisor& supervisor) {
    // Enable CORS for browser front ends
    server.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        return httplib::Server::HandlerResponse::Unhandled;
    });

    // Handle OPTIONS requests for CORS
    server.Options(".*", [](const httplib::Request&, httplib::Response&) {
        return; // Headers already set in pre-routing handler
    });

    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << req.method << " " << req.path << " -> " << res.status << std::endl;
    });

    server.Get("/api/health", guarded("/api/health",
        [](const httplib::Request&, httplib::Response& res) {
            sendJson(res, 200, healthJson(Clock::now()));
        }));

    server.Get(R"(/api/bots/([^/]+))", guarded("/api/bots",
        [&supervisor](const httplib::Request& req, httplib::Response& res) {
            sendJson(res, 200, botListJson(supervisor.listByOwner(req.matches[1].str())));
        }));

    server.Post("/api/bot/upload", guarded("/api/bot/upload",
        [&supervisor](const httplib::Request& req, httplib::Response& res) {
            if (!req.has_file("bot_file")) {
                sendJson(res, 400, errorJson("No file uploaded"));
                return;
            }

            const auto file = req.get_file_value("bot_file");
            const std::string username = formValue(req, "username");
            const std::string botName = formValue(req, "bot_name");
            if (username.empty() || botName.empty()) {
                sendJson(res, 400, errorJson("Missing username or bot_name"));
                return;
            }

            auto result = supervisor.upload(username, botName, file.content, fileExtension(file.filename));
            if (!result.ok()) {
                sendError(res, result);
                return;
            }
            sendJson(res, 200, uploadJson(*result.value, result.message));
        }));

    server.Post(R"(/api/bot/start/([^/]+))", guarded("/api/bot/start",
        [&supervisor](const httplib::Request& req, httplib::Response& res) {
            auto result = supervisor.start(req.matches[1].str());
            if (!result.ok()) {
                sendError(res, result);
                return;
            }
            sendJson(res, 200, startJson(*result.value, result.message));
        }));

    server.Post(R"(/api/bot/stop/([^/]+))", guarded("/api/bot/stop",
        [&supervisor](const httplib::Request& req, httplib::Response& res) {
            auto result = supervisor.stop(req.matches[1].str());
            if (!result.ok()) {
                sendError(res, result);
                return;
            }
            sendJson(res, 200, messageJson(result.message));
        }));

    server.Delete(R"(/api/bot/delete/([^/]+))", guarded("/api/bot/delete",
        [&supervisor](const httplib::Request& req, httplib::Response& res) {
            auto result = supervisor.deleteBot(req.matches[1].str());
            if (!result.ok()) {
                sendError(res, result);
                return;
            }
            sendJson(res, 200, messageJson(result.message));
        }));

    server.Get(R"(/api/bot/logs/([^/]+))", guarded("/api/bot/logs",
        [&supervisor](const httplib::Request& req, httplib::Response& res) {
            auto result = supervisor.logs(req.matches[1].str());
            if (!result.ok()) {
                sendError(res, result);
                return;
            }
            const LogTail& tail = *result.value;
            sendJson(res, 200, logsJson(tail.available ? tail.text : NO_LOGS_MESSAGE));
        }));

    server.Get(R"(/api/bot/status/([^/]+))", guarded("/api/bot/status",
        [&supervisor](const httplib::Request& req, httplib::Response& res) {
            auto result = supervisor.status(req.matches[1].str());
            if (!result.ok()) {
                sendError(res, result);
                return;
            }
            sendJson(res, 200, botStatusJson(*result.value));
        }));
}
