/**
 * @file types.hpp
 * @brief Type definitions for CanvaSDK C++
 */

#ifndef CANVASDK_TYPES_HPP
#define CANVASDK_TYPES_HPP

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <functional>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace canvasdk {

using json = nlohmann::json;

// =============================================================================
// Constants
// =============================================================================

constexpr const char* CANVA_API_BASE = "https://api.canva.com/rest/v1";
constexpr const char* CANVA_AUTH_BASE = "https://www.canva.com/api/oauth";
constexpr const char* CANVA_TOKEN_PATH = "/oauth/token";
constexpr const char* CANVA_AUTHORIZE_PATH = "/authorize";
constexpr const char* CANVA_CODE_CHALLENGE_METHOD = "s256";
constexpr int64_t TOKEN_SAFETY_MARGIN_SECONDS = 60;
constexpr int64_t DEFAULT_TOKEN_LIFETIME_SECONDS = 3600;
constexpr size_t PKCE_VERIFIER_BYTES = 96;
constexpr size_t OAUTH_STATE_BYTES = 32;
// How long a presented verifier is remembered; authorization codes expire well before this
constexpr int64_t CONSUMED_VERIFIER_RETENTION_SECONDS = 3600;

const std::vector<std::string> CANVA_DEFAULT_SCOPES = {
    "asset:read",
    "asset:write",
    "design:meta:read",
    "folder:read"
};

const std::vector<std::string> CANVA_EXPORT_FILE_TYPES = {
    "pdf", "jpg", "png", "gif", "pptx", "mp4"
};

// =============================================================================
// Enums
// =============================================================================

enum class LogLevel {
    None,
    Error,
    Warning,
    Info,
    Debug,
    All
};

enum class JobKind {
    AssetUpload,
    UrlAssetUpload,
    Export,
    Autofill
};

enum class JobStatus {
    InProgress,
    Success,
    Failed
};

enum class ToolResultType {
    Success,
    Failure
};

// =============================================================================
// Utility Functions
// =============================================================================

std::string job_kind_to_string(JobKind kind);
std::string job_status_to_string(JobStatus status);
JobStatus string_to_job_status(const std::string& str);
LogLevel string_to_log_level(const std::string& str);

// =============================================================================
// OAuth Types
// =============================================================================

using Timestamp = std::chrono::system_clock::time_point;
using SystemClock = std::function<Timestamp()>;

struct Credential {
    std::string access_token;
    std::string refresh_token;
    std::string token_type = "Bearer";
    Timestamp expires_at{};
    std::set<std::string> granted_scopes;

    /**
     * Build a credential from a token endpoint response
     * @param response Parsed token response body
     * @param issued_at Time the response was received
     * @param previous_refresh_token Kept when the response omits one
     * @return Credential
     */
    static Credential from_token_response(
        const json& response,
        Timestamp issued_at,
        const std::string& previous_refresh_token = ""
    );

    static Credential from_json(const json& j);
    json to_json() const;

    /**
     * Whether the credential expires within the given margin
     */
    bool expires_within(std::chrono::seconds margin, Timestamp now) const;
};

struct AuthorizationRequest {
    std::string url;
    std::string code_verifier;
    std::string code_challenge;
    std::string state;
    std::set<std::string> scopes;
    Timestamp created_at{};
};

// =============================================================================
// Job Types
// =============================================================================

struct Job {
    std::string id;
    JobKind kind = JobKind::Export;
    JobStatus status = JobStatus::InProgress;
    std::optional<json> result;
    std::optional<std::string> error;
    Timestamp created_at{};

    bool is_terminal() const { return status != JobStatus::InProgress; }

    /**
     * Apply a newer observation of the same job.
     * Throws JobStateError on a backward or foreign transition.
     * @param observed Job parsed from a status response
     */
    void advance(const Job& observed);

    /**
     * Parse the {job: {...}} envelope returned by create and status endpoints
     * @param kind Job kind the response belongs to
     * @param body Response body
     * @return Job
     */
    static Job from_response(JobKind kind, const json& body);
};

// =============================================================================
// HTTP Types
// =============================================================================

struct RateLimitState {
    std::optional<std::chrono::milliseconds> retry_after;
    std::chrono::steady_clock::time_point observed_at{};
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    long status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /**
     * Case-insensitive header lookup
     * @param name Header name
     * @return Header value or nullopt
     */
    std::optional<std::string> header(const std::string& name) const;
};

struct ApiRequest {
    std::string method = "GET";
    std::string path;
    std::map<std::string, std::string> query;
    std::optional<json> body;
    std::optional<std::string> raw_body;
    std::string content_type = "application/json";
    std::map<std::string, std::string> headers;

    static ApiRequest get(const std::string& path);
    static ApiRequest post(const std::string& path, const json& body);
};

// =============================================================================
// Tool Types
// =============================================================================

struct ToolInvocation {
    std::string name;
    json arguments = json::object();
    std::string call_id;
};

struct ToolResult {
    ToolResultType result_type = ToolResultType::Success;
    json content;
    std::optional<std::string> error_code;
};

struct Tool {
    std::string name;
    std::string description;
    std::optional<json> parameters;
};

using ToolHandler = std::function<ToolResult(const ToolInvocation&)>;

// =============================================================================
// Utility Functions
// =============================================================================

std::string generate_uuid();
std::string format_timestamp(Timestamp tp);
std::string percent_encode(const std::string& value);
std::string build_query_string(const std::map<std::string, std::string>& params);
std::string join_scopes(const std::set<std::string>& scopes);
std::set<std::string> split_scopes(const std::string& scopes);

} // namespace canvasdk

#endif // CANVASDK_TYPES_HPP
