/**
 * @file errors.hpp
 * @brief Exception types for CanvaSDK C++
 */

#ifndef CANVASDK_ERRORS_HPP
#define CANVASDK_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <optional>
#include <chrono>
#include <cstdint>

namespace canvasdk {

/**
 * Base exception class for CanvaSDK errors
 */
class CanvaSDKError : public std::runtime_error {
public:
    explicit CanvaSDKError(const std::string& message, const std::string& code = "")
        : std::runtime_error(message), code_(code) {}

    const std::string& code() const { return code_; }

protected:
    std::string code_;
};

enum class AuthErrorKind {
    Unauthenticated,
    InvalidState,
    InvalidGrant,
    RefreshFailed,
    Unauthorized
};

std::string auth_error_kind_to_string(AuthErrorKind kind);

/**
 * Authentication-related errors
 */
class AuthError : public CanvaSDKError {
public:
    AuthError(AuthErrorKind kind, const std::string& message)
        : CanvaSDKError(message, "AUTH_ERROR"),
          kind_(kind) {}

    AuthErrorKind kind() const { return kind_; }

private:
    AuthErrorKind kind_;
};

/**
 * Transport-level failure (DNS, connect, TLS, timeout) for a single attempt
 */
class ConnectionError : public CanvaSDKError {
public:
    explicit ConnectionError(const std::string& message, const std::string& endpoint = "")
        : CanvaSDKError(message, "CONNECTION_ERROR"), endpoint_(endpoint) {}

    const std::string& endpoint() const { return endpoint_; }

private:
    std::string endpoint_;
};

/**
 * Network or 5xx failure that persisted through every retry
 */
class TransientNetworkError : public CanvaSDKError {
public:
    TransientNetworkError(
        const std::string& message,
        int attempts,
        std::optional<int> last_status = std::nullopt
    ) : CanvaSDKError(message, "TRANSIENT_NETWORK_ERROR"),
        attempts_(attempts),
        last_status_(last_status) {}

    int attempts() const { return attempts_; }
    std::optional<int> last_status() const { return last_status_; }

private:
    int attempts_;
    std::optional<int> last_status_;
};

/**
 * Rate limit exceeded
 */
class RateLimitError : public CanvaSDKError {
public:
    RateLimitError(
        const std::string& message,
        std::optional<std::chrono::milliseconds> retry_after = std::nullopt
    ) : CanvaSDKError(message, "RATE_LIMIT_ERROR"), retry_after_(retry_after) {}

    std::optional<std::chrono::milliseconds> retry_after() const { return retry_after_; }

private:
    std::optional<std::chrono::milliseconds> retry_after_;
};

/**
 * Request rejected by the provider with a non-retryable 4xx
 */
class ValidationError : public CanvaSDKError {
public:
    ValidationError(
        const std::string& message,
        int status = 0,
        const std::string& body = ""
    ) : CanvaSDKError(message, "VALIDATION_ERROR"),
        status_(status),
        body_(body) {}

    int status() const { return status_; }
    const std::string& body() const { return body_; }

protected:
    int status_;
    std::string body_;
};

/**
 * Permission denied
 */
class PermissionDeniedError : public ValidationError {
public:
    PermissionDeniedError(const std::string& message, const std::string& body = "")
        : ValidationError(message, 403, body) {
        code_ = "PERMISSION_DENIED";
    }
};

/**
 * Resource not found
 */
class NotFoundError : public ValidationError {
public:
    NotFoundError(const std::string& message, const std::string& body = "")
        : ValidationError(message, 404, body) {
        code_ = "NOT_FOUND";
    }
};

/**
 * Cancellation
 */
class CancellationError : public CanvaSDKError {
public:
    CancellationError() : CanvaSDKError("Operation cancelled", "CANCELLATION_ERROR") {}

protected:
    CancellationError(const std::string& message, const std::string& code)
        : CanvaSDKError(message, code) {}
};

/**
 * Timeout
 */
class TimeoutError : public CanvaSDKError {
public:
    explicit TimeoutError(std::optional<double> timeout = std::nullopt)
        : CanvaSDKError("Operation timed out", "TIMEOUT_ERROR"), timeout_(timeout) {}

    std::optional<double> timeout() const { return timeout_; }

protected:
    TimeoutError(const std::string& message, const std::string& code, std::optional<double> timeout)
        : CanvaSDKError(message, code), timeout_(timeout) {}

    std::optional<double> timeout_;
};

/**
 * Job errors
 */
class JobFailedError : public CanvaSDKError {
public:
    JobFailedError(const std::string& job_id, const std::string& reason)
        : CanvaSDKError("Job " + job_id + " failed: " + reason, "JOB_FAILED"),
          job_id_(job_id),
          reason_(reason) {}

    const std::string& job_id() const { return job_id_; }
    const std::string& reason() const { return reason_; }

private:
    std::string job_id_;
    std::string reason_;
};

class JobTimeoutError : public TimeoutError {
public:
    JobTimeoutError(const std::string& job_id, double timeout)
        : TimeoutError("Job " + job_id + " still in progress after " +
                           std::to_string(static_cast<int64_t>(timeout)) + "s",
                       "JOB_TIMEOUT", timeout),
          job_id_(job_id) {}

    const std::string& job_id() const { return job_id_; }

private:
    std::string job_id_;
};

class JobCancelledError : public CancellationError {
public:
    explicit JobCancelledError(const std::string& job_id)
        : CancellationError("Job " + (job_id.empty() ? std::string("<unsubmitted>") : job_id) +
                                " cancelled",
                            "JOB_CANCELLED"),
          job_id_(job_id) {}

    const std::string& job_id() const { return job_id_; }

private:
    std::string job_id_;
};

/**
 * Job status moved backwards or changed identity
 */
class JobStateError : public CanvaSDKError {
public:
    JobStateError(const std::string& message, const std::string& job_id)
        : CanvaSDKError(message, "JOB_STATE_ERROR"), job_id_(job_id) {}

    const std::string& job_id() const { return job_id_; }

private:
    std::string job_id_;
};

/**
 * Configuration errors
 */
class ConfigurationError : public CanvaSDKError {
public:
    ConfigurationError(const std::string& message, const std::string& config_key = "")
        : CanvaSDKError(message, "CONFIGURATION_ERROR"), config_key_(config_key) {}

    const std::string& config_key() const { return config_key_; }

private:
    std::string config_key_;
};

/**
 * Tool errors
 */
class ToolError : public CanvaSDKError {
public:
    ToolError(const std::string& message, const std::string& tool_name = "")
        : CanvaSDKError(message, "TOOL_ERROR"), tool_name_(tool_name) {}

    const std::string& tool_name() const { return tool_name_; }

protected:
    std::string tool_name_;
};

/**
 * Tool not found
 */
class ToolNotFoundError : public ToolError {
public:
    explicit ToolNotFoundError(const std::string& tool_name)
        : ToolError("Tool not found: " + tool_name, tool_name) {
        code_ = "TOOL_NOT_FOUND";
    }
};

/**
 * Invalid tool arguments
 */
class ToolArgumentError : public ToolError {
public:
    ToolArgumentError(const std::string& tool_name, const std::string& message)
        : ToolError(message, tool_name) {
        code_ = "TOOL_ARGUMENT_ERROR";
    }
};

} // namespace canvasdk

#endif // CANVASDK_ERRORS_HPP
