/**
 * @file logging.cpp
 * @brief Logging implementation for CanvaSDK C++
 */

#include "canvasdk/logging.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <vector>

namespace canvasdk {

static constexpr const char* LOGGER_NAME = "canvasdk";
static constexpr const char* CONSOLE_PATTERN = "%Y-%m-%d %H:%M:%S - %^%l%$ - %v";
static constexpr const char* FILE_PATTERN = "%Y-%m-%d %H:%M:%S.%e - %n - %l - [%t] %v";

static std::mutex logger_mutex;
static std::shared_ptr<spdlog::logger> active_logger;

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::None: return spdlog::level::off;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Warning: return spdlog::level::warn;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::All: return spdlog::level::trace;
        default: return spdlog::level::info;
    }
}

void init_logging(const LoggingOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(to_spdlog_level(options.level));
    console->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(console);

    if (options.file.has_value() && !options.file->empty()) {
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*options.file);
        file->set_level(spdlog::level::debug);
        file->set_pattern(FILE_PATTERN);
        sinks.push_back(file);
    }

    if (options.error_file.has_value() && !options.error_file->empty()) {
        auto errors = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*options.error_file);
        errors->set_level(spdlog::level::err);
        errors->set_pattern(FILE_PATTERN);
        sinks.push_back(errors);
    }

    auto new_logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    // Sinks filter individually; the logger passes everything a file sink may want
    new_logger->set_level(options.level == LogLevel::None && sinks.size() == 1
                              ? spdlog::level::off
                              : spdlog::level::trace);
    new_logger->flush_on(spdlog::level::err);

    std::lock_guard<std::mutex> lock(logger_mutex);
    active_logger = new_logger;
}

void shutdown_logging() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (active_logger) {
        active_logger->flush();
        active_logger.reset();
    }
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!active_logger) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern(CONSOLE_PATTERN);
        active_logger = std::make_shared<spdlog::logger>(LOGGER_NAME, console);
        active_logger->set_level(spdlog::level::warn);
    }
    return active_logger;
}

void log_api_request(const std::string& method, const std::string& endpoint, long status_code,
                     double duration_seconds) {
    auto log = logger();
    if (status_code >= 400) {
        log->error("API request failed: {} {} - Status: {} - Duration: {:.3f}s",
                   method, endpoint, status_code, duration_seconds);
    } else if (status_code >= 300) {
        log->warn("API request redirected: {} {} - Status: {} - Duration: {:.3f}s",
                  method, endpoint, status_code, duration_seconds);
    } else {
        log->info("API request successful: {} {} - Status: {} - Duration: {:.3f}s",
                  method, endpoint, status_code, duration_seconds);
    }
}

void log_oauth_flow(const std::string& step, const std::string& details) {
    if (details.empty()) {
        logger()->info("OAuth flow - {}", step);
    } else {
        logger()->info("OAuth flow - {}: {}", step, details);
    }
}

void log_tool_execution(const std::string& tool_name, bool success, double duration_seconds,
                        const std::string& error) {
    if (success) {
        logger()->info("Tool executed successfully: {} - Duration: {:.3f}s",
                       tool_name, duration_seconds);
    } else {
        logger()->error("Tool execution failed: {} - Duration: {:.3f}s - Error: {}",
                        tool_name, duration_seconds, error);
    }
}

std::string redact(const std::string& secret, size_t visible) {
    if (secret.size() <= visible) {
        return std::string(secret.size(), '*');
    }
    return secret.substr(0, visible) + "...";
}

} // namespace canvasdk
