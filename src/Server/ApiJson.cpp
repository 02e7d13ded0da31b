/**
 * @file ApiJson.cpp
 * @brief JSON rendering for the HTTP API
 * @version 1.0
 * @date 2025-01-01
 */

#include "ApiJson.hpp"

#include <cstdio>       // std::snprintf
#include <ctime>        // localtime_r, strftime
#include <iomanip>
#include <sstream>

namespace {

std::string quoted(const std::string& value) {
    return "\"" + escapeJsonString(value) + "\"";
}

std::string number(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << value;
    return out.str();
}

} // anonymous namespace

std::string escapeJsonString(const std::string& input) {
    std::string result;
    result.reserve(input.length() * 2); // Reserve space for potential escaping

    for (char c : input) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char escaped[8];
                    std::snprintf(escaped, sizeof(escaped), "\\u%04x", static_cast<unsigned char>(c));
                    result += escaped;
                } else {
                    result += c;
                }
                break;
        }
    }

    return result;
}

std::string formatIsoTime(Clock::time_point time) {
    const std::time_t seconds = Clock::to_time_t(time);
    std::tm local{};
    localtime_r(&seconds, &local);

    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        time.time_since_epoch()).count() % 1000000;

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local);

    std::ostringstream out;
    out << buffer << '.' << std::setw(6) << std::setfill('0') << (micros < 0 ? micros + 1000000 : micros);
    return out.str();
}

int httpStatusFor(BotError error) {
    switch (error) {
        case BotError::None:                return 200;
        case BotError::NotFound:            return 404;
        case BotError::QuotaExceeded:       return 403;
        case BotError::AlreadyRunning:
        case BotError::NotRunning:
        case BotError::InvalidFileType:
        case BotError::UnsupportedFileType: return 400;
        case BotError::SpawnFailure:
        case BotError::StorageFailure:      return 500;
    }
    return 500;
}

std::string botViewToJson(const BotView& view) {
    const BotRecord& record = view.record;
    const bool running = view.status == BotStatus::Running;

    std::string json = "{";
    json += "\"id\": " + quoted(record.id) + ", ";
    json += "\"name\": " + quoted(record.name) + ", ";
    json += "\"username\": " + quoted(record.owner) + ", ";
    json += "\"filepath\": " + quoted(record.filePath) + ", ";
    json += "\"file_type\": " + quoted(fileTypeExtension(record.fileType)) + ", ";
    json += "\"created_at\": " + quoted(formatIsoTime(record.createdAt)) + ", ";
    json += "\"status\": " + quoted(running ? "running" : "stopped") + ", ";
    json += "\"cpu\": " + number(view.cpuPercent) + ", ";
    json += "\"memory\": " + number(view.memoryMb);
    if (running) {
        json += ", \"pid\": " + std::to_string(view.pid);
        if (view.startedAt) {
            json += ", \"started_at\": " + quoted(formatIsoTime(*view.startedAt));
        }
    }
    json += "}";
    return json;
}

std::string errorJson(const std::string& message) {
    return "{\"success\": false, \"message\": " + quoted(message) + "}";
}

std::string messageJson(const std::string& message) {
    return "{\"success\": true, \"message\": " + quoted(message) + "}";
}

std::string uploadJson(const BotRecord& record, const std::string& message) {
    return "{\"success\": true, \"message\": " + quoted(message) +
           ", \"bot_id\": " + quoted(record.id) + "}";
}

std::string startJson(pid_t pid, const std::string& message) {
    return "{\"success\": true, \"message\": " + quoted(message) +
           ", \"pid\": " + std::to_string(pid) + "}";
}

std::string logsJson(const std::string& logs) {
    return "{\"success\": true, \"logs\": " + quoted(logs) + "}";
}

std::string botListJson(const std::vector<BotView>& views) {
    std::string json = "{\"success\": true, \"bots\": [";
    for (size_t i = 0; i < views.size(); ++i) {
        if (i > 0) {
            json += ", ";
        }
        json += botViewToJson(views[i]);
    }
    json += "]}";
    return json;
}

std::string botStatusJson(const BotView& view) {
    return "{\"success\": true, \"bot\": " + botViewToJson(view) + "}";
}

std::string healthJson(Clock::time_point now) {
    return "{\"status\": \"ok\", \"timestamp\": " + quoted(formatIsoTime(now)) + "}";
}
