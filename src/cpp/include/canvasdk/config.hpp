/**
 * @file config.hpp
 * @brief Client configuration for CanvaSDK C++
 */

#ifndef CANVASDK_CONFIG_HPP
#define CANVASDK_CONFIG_HPP

#include "types.hpp"
#include "gateway.hpp"
#include "jobs.hpp"
#include "logging.hpp"
#include "transport.hpp"
#include <memory>

namespace canvasdk {

/**
 * Client configuration options
 */
struct ClientOptions {
    std::optional<std::string> client_id;
    std::optional<std::string> client_secret;
    std::optional<std::string> redirect_uri;
    std::optional<std::string> api_base;
    std::optional<std::string> auth_base;
    std::chrono::milliseconds timeout{30000};
    RetryPolicy retry;
    PollPolicy poll;
    LoggingOptions logging;
    /// Replaces CurlTransport when set
    std::shared_ptr<HttpTransport> transport;
};

/**
 * Build options from the process environment and an optional .env file.
 *
 * Reads CANVA_CLIENT_ID, CANVA_CLIENT_SECRET, CANVA_REDIRECT_URI,
 * CANVA_API_BASE, CANVA_AUTH_BASE, LOG_LEVEL (or CANVA_LOG_LEVEL), LOG_FILE
 * and LOG_ERROR_FILE. A variable set in the environment wins over the file.
 * @param env_file Path to a KEY=VALUE file (defaults to ".env")
 * @return Options
 */
ClientOptions load_client_options_from_env(const std::optional<std::string>& env_file = std::nullopt);

/**
 * Read KEY=VALUE lines, skipping blanks and # comments, with quotes stripped
 * @param path File path
 * @return Entries, empty if the file does not exist
 */
std::map<std::string, std::string> read_env_file(const std::string& path);

/**
 * Names of required settings that are not configured
 */
std::vector<std::string> missing_required_settings(const ClientOptions& options);

} // namespace canvasdk

#endif // CANVASDK_CONFIG_HPP
