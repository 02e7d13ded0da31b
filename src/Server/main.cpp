/**
 * @file main.cpp
 * @brief Bot Host Server - HTTP API for hosting user-uploaded bot scripts
 * @version 1.0
 * @date 2025-01-01
 *
 * Users upload small Python or JavaScript bots; the server runs one process
 * per bot, enforces a per-user quota and captures each bot's output.
 * All state is in memory and lives as long as the server process.
 */

#include <atomic>
#include <iostream>
#include <filesystem>
#include <memory>
#include <signal.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

#include "httplib.h"
#include "BotSupervisor.hpp"
#include "HttpApi.hpp"
#include "ServerConfig.hpp"

// Global variables
ServerConfig g_config;
std::string g_configPath;
std::vector<std::pair<std::string, std::string>> g_overrides;  ///< Command line settings

// Function declarations
int parseArguments(int argc, char* argv[]);
bool loadSettings();
void printUsage(const char* programName);

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    std::cout << "Bot Host Server v1.0" << std::endl;
    std::cout << "====================" << std::endl;

    int parsed = parseArguments(argc, argv);
    if (parsed >= 0) {
        return parsed;
    }

    if (!loadSettings()) {
        return 1;
    }

    // Shutdown signals are handled by a dedicated thread; block them
    // before any other thread exists so every thread inherits the mask.
    sigset_t shutdownSignals;
    sigemptyset(&shutdownSignals);
    sigaddset(&shutdownSignals, SIGINT);
    sigaddset(&shutdownSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &shutdownSignals, nullptr);

    auto supervisor = std::make_unique<BotSupervisor>(g_config);
    if (!supervisor->initialize()) {
        std::cerr << "Cannot prepare storage directory " << g_config.storageRoot << std::endl;
        return 1;
    }

    httplib::Server server;
    registerRoutes(server, *supervisor);

    std::atomic<bool> listenReturned{false};
    std::thread signalThread([&server, &listenReturned, shutdownSignals]() {
        int received = 0;
        if (sigwait(&shutdownSignals, &received) == 0) {
            std::cout << "\nReceived signal " << received << ", shutting down..." << std::endl;
        }
        stopServer(server, listenReturned);
    });

    std::cout << "Storage: " << g_config.storageRoot
              << ", quota: " << g_config.maxBotsPerUser << " bots per user" << std::endl;
    std::cout << "Starting HTTP server on " << g_config.host << ":" << g_config.port << std::endl;

    int exitCode = 0;
    const bool listened = server.listen(g_config.host, g_config.port);
    listenReturned = true;
    if (!listened) {
        std::cerr << "Failed to start server on port " << g_config.port << std::endl;
        std::cerr << "   Port may be in use or insufficient permissions" << std::endl;
        exitCode = 1;
        // Wake the signal thread so it can be joined
        kill(getpid(), SIGTERM);
    }
    signalThread.join();

    supervisor->shutdown();
    std::cout << "Server stopped" << std::endl;
    return exitCode;
}

/**
 * @brief Parse command line arguments into g_overrides
 * @return -1 to continue, otherwise the exit code
 */
int parseArguments(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key;

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires a file path" << std::endl;
                return 1;
            }
            g_configPath = argv[++i];
            continue;
        } else if (arg == "--port" || arg == "-p") {
            key = "port";
        } else if (arg == "--host") {
            key = "host";
        } else if (arg == "--storage" || arg == "-s") {
            key = "storage_root";
        } else if (arg == "--max-bots") {
            key = "max_bots_per_user";
        } else {
            std::cerr << "Error: Unknown argument " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value" << std::endl;
            return 1;
        }
        g_overrides.emplace_back(key, argv[++i]);
    }
    return -1;
}

/**
 * @brief Build g_config from all sources
 *
 * Precedence, lowest first: built-in defaults, configuration file,
 * PORT environment variable, command line flags. Without --config the
 * default location is used when it exists.
 */
bool loadSettings() {
    if (g_configPath.empty() && std::filesystem::exists(DEFAULT_CONFIG_PATH)) {
        g_configPath = DEFAULT_CONFIG_PATH;
    }

    std::string error;
    if (!g_configPath.empty()) {
        if (!loadConfiguration(g_configPath, g_config, error)) {
            std::cerr << "Configuration error: " << error << std::endl;
            return false;
        }
        std::cout << "Using configuration file: " << g_configPath << std::endl;
    }

    if (!applyEnvironment(g_config, error)) {
        std::cerr << "Error: " << error << std::endl;
        return false;
    }

    for (const auto& setting : g_overrides) {
        if (!setConfigValue(g_config, setting.first, setting.second, error)) {
            std::cerr << "Error: " << setting.first << ": " << error << std::endl;
            return false;
        }
    }
    return true;
}

/**
 * @brief Print usage information
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [OPTIONS]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help           Show this help message" << std::endl;
    std::cout << "  -c, --config FILE    Configuration file path" << std::endl;
    std::cout << "  -p, --port PORT      HTTP server port (default: " << DEFAULT_PORT << ", or $PORT)" << std::endl;
    std::cout << "      --host ADDR      Listen address (default: 0.0.0.0)" << std::endl;
    std::cout << "  -s, --storage DIR    Bot storage directory (default: " << DEFAULT_STORAGE_ROOT << ")" << std::endl;
    std::cout << "      --max-bots N     Bots per user (default: 3)" << std::endl;
    std::cout << std::endl;
    std::cout << "Default config location: " << DEFAULT_CONFIG_PATH << std::endl;
}
