#pragma once

#include "airline/error.hpp"
#include "airline/logger.hpp"
#include "airline/retry_policy.hpp"
#include "airline/sqlite_store.hpp"

#include <string>

/**
 * @file config.hpp
 * @brief Engine settings read from the command line and an optional config file.
 *
 * Recognized keys (command line as --key=value, config file as INI sections):
 *
 *     [store]        path, pool_size, acquire_timeout_ms, busy_timeout_ms
 *     [ticket]       max_attempts, backoff_min_ms, backoff_max_ms
 *     [seat]         max_attempts, backoff_min_ms, backoff_max_ms
 *     [compensation] max_attempts
 *     [log]          file, level
 *
 * Command-line values win over the config file.
 */

namespace airline {

struct EngineConfig {
    SqliteStoreOptions store;
    RetryPolicy ticket_retry{10, 1, 50};
    RetryPolicy seat_retry{3, 1, 50};
    RetryPolicy compensation_retry{3, 1, 50};
    std::string log_file;                 /**< Empty logs to stderr. */
    LogLevel log_level = LogLevel::Info;

    bool show_help = false;               /**< --help was given; usage holds the option list. */
    std::string usage;
};

/**
 * @brief Parses options into an EngineConfig.
 *
 * @return The config; BadRequest for unknown options, unreadable config files
 *         or values out of range.
 */
Result<EngineConfig> parse_config(int argc, const char* const argv[]);

/**
 * @brief Checks ranges: pool_size >= 1, max_attempts >= 1, 0 <= backoff_min_ms <= backoff_max_ms.
 */
Status validate(const EngineConfig& config);

} // namespace airline
