/**
 * @file BotResult.cpp
 * @brief Names for supervisor error codes
 * @version 1.0
 * @date 2025-01-01
 */

#include "BotResult.hpp"

const char* botErrorName(BotError error) {
    switch (error) {
        case BotError::None:                return "None";
        case BotError::NotFound:            return "NotFound";
        case BotError::AlreadyRunning:      return "AlreadyRunning";
        case BotError::NotRunning:          return "NotRunning";
        case BotError::QuotaExceeded:       return "QuotaExceeded";
        case BotError::InvalidFileType:     return "InvalidFileType";
        case BotError::UnsupportedFileType: return "UnsupportedFileType";
        case BotError::SpawnFailure:        return "SpawnFailure";
        case BotError::StorageFailure:      return "StorageFailure";
    }
    return "Unknown";
}
