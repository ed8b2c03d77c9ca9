/**
 * @file logging.hpp
 * @brief spdlog-based logging for CanvaSDK C++
 */

#ifndef CANVASDK_LOGGING_HPP
#define CANVASDK_LOGGING_HPP

#include "types.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>

namespace canvasdk {

/**
 * Logging options
 */
struct LoggingOptions {
    LogLevel level = LogLevel::Info;
    /// Detailed log of every level, debug and above
    std::optional<std::string> file;
    /// Error-only log
    std::optional<std::string> error_file;
};

/**
 * Install the "canvasdk" logger. Safe to call more than once; the last call wins.
 * @param options Sinks and level
 */
void init_logging(const LoggingOptions& options);

void shutdown_logging();

/**
 * The library logger. Falls back to a console logger when init_logging() was never called.
 */
std::shared_ptr<spdlog::logger> logger();

spdlog::level::level_enum to_spdlog_level(LogLevel level);

/**
 * Log one HTTP exchange, at error/warn/info for 4xx-5xx/3xx/2xx
 */
void log_api_request(const std::string& method, const std::string& endpoint, long status_code,
                     double duration_seconds);

void log_oauth_flow(const std::string& step, const std::string& details = "");

void log_tool_execution(const std::string& tool_name, bool success, double duration_seconds,
                        const std::string& error = "");

/**
 * First characters of a secret, for log lines
 */
std::string redact(const std::string& secret, size_t visible = 10);

} // namespace canvasdk

#endif // CANVASDK_LOGGING_HPP
