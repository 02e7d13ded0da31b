/**
 * @file BotResult.hpp
 * @brief Error taxonomy and result type returned by supervisor operations
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <optional>
#include <string>
#include <utility>

/**
 * @brief Failure kinds reported at the supervisor boundary
 */
enum class BotError {
    None = 0,
    NotFound,             ///< Bot id unknown to the registry
    AlreadyRunning,       ///< Process table already holds the bot
    NotRunning,           ///< Process table has no entry for the bot
    QuotaExceeded,        ///< Owner already holds the maximum number of bots
    InvalidFileType,      ///< Upload extension is not a supported runtime
    UnsupportedFileType,  ///< No launch command configured for the runtime
    SpawnFailure,         ///< fork/exec refused to create the process
    StorageFailure        ///< Script could not be written to storage
};

/**
 * @brief Short stable name of an error ("NotFound", ...)
 */
const char* botErrorName(BotError error);

/**
 * @brief Outcome of a supervisor operation
 *
 * Either carries a value (error == None) or an error code with a message
 * meant for the API caller. A default-constructed Result is neither and
 * is not ok().
 */
template <typename T>
struct Result {
    BotError error = BotError::None;
    std::string message;
    std::optional<T> value;

    bool ok() const { return error == BotError::None && value.has_value(); }

    static Result success(T v, std::string msg = {}) {
        Result r;
        r.message = std::move(msg);
        r.value.emplace(std::move(v));
        return r;
    }

    static Result failure(BotError e, std::string msg) {
        Result r;
        r.error = e;
        r.message = std::move(msg);
        return r;
    }
};
