/**
 * @file types.cpp
 * @brief Type implementations for CanvaSDK C++
 */

#include "canvasdk/types.hpp"
#include "canvasdk/errors.hpp"
#include <algorithm>
#include <cctype>
#include <random>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <mutex>

namespace canvasdk {

static std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string job_kind_to_string(JobKind kind) {
    switch (kind) {
        case JobKind::AssetUpload: return "asset_upload";
        case JobKind::UrlAssetUpload: return "url_asset_upload";
        case JobKind::Export: return "export";
        case JobKind::Autofill: return "autofill";
        default: return "unknown";
    }
}

std::string job_status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::InProgress: return "in_progress";
        case JobStatus::Success: return "success";
        case JobStatus::Failed: return "failed";
        default: return "unknown";
    }
}

JobStatus string_to_job_status(const std::string& str) {
    std::string s = to_lower(str);
    if (s == "in_progress") return JobStatus::InProgress;
    if (s == "success") return JobStatus::Success;
    if (s == "failed") return JobStatus::Failed;
    throw ValidationError("Unknown job status: " + str);
}

LogLevel string_to_log_level(const std::string& str) {
    std::string s = to_lower(str);
    if (s == "none" || s == "off") return LogLevel::None;
    if (s == "error" || s == "critical") return LogLevel::Error;
    if (s == "warning" || s == "warn") return LogLevel::Warning;
    if (s == "debug") return LogLevel::Debug;
    if (s == "all" || s == "trace") return LogLevel::All;
    return LogLevel::Info;
}

// =============================================================================
// Credential
// =============================================================================

Credential Credential::from_token_response(
    const json& response,
    Timestamp issued_at,
    const std::string& previous_refresh_token
) {
    if (!response.is_object() || !response.contains("access_token") ||
        !response["access_token"].is_string()) {
        throw ValidationError("Malformed token response", 0, response.dump());
    }

    // null counts as absent
    auto string_field = [&response](const char* key, const std::string& fallback) {
        if (!response.contains(key) || response[key].is_null()) {
            return fallback;
        }
        if (!response[key].is_string()) {
            throw ValidationError(std::string("Malformed token response: ") + key + " must be a string",
                                  0, response.dump());
        }
        return response[key].get<std::string>();
    };

    Credential creds;
    creds.access_token = response["access_token"].get<std::string>();
    creds.refresh_token = string_field("refresh_token", previous_refresh_token);
    if (creds.refresh_token.empty()) {
        creds.refresh_token = previous_refresh_token;
    }
    creds.token_type = string_field("token_type", "Bearer");

    int64_t expires_in = DEFAULT_TOKEN_LIFETIME_SECONDS;
    if (response.contains("expires_in") && !response["expires_in"].is_null()) {
        if (!response["expires_in"].is_number_integer()) {
            throw ValidationError("Malformed token response: expires_in must be an integer",
                                  0, response.dump());
        }
        expires_in = response["expires_in"].get<int64_t>();
    }
    creds.expires_at = issued_at + std::chrono::seconds(expires_in);

    if (response.contains("scope") && response["scope"].is_string()) {
        creds.granted_scopes = split_scopes(response["scope"].get<std::string>());
    }
    return creds;
}

Credential Credential::from_json(const json& j) {
    Credential creds;
    creds.access_token = j.value("access_token", "");
    creds.refresh_token = j.value("refresh_token", "");
    creds.token_type = j.value("token_type", "Bearer");
    creds.expires_at = Timestamp(std::chrono::milliseconds(j.value("expires_at", int64_t(0))));
    if (j.contains("scopes") && j["scopes"].is_array()) {
        for (const auto& scope : j["scopes"]) {
            creds.granted_scopes.insert(scope.get<std::string>());
        }
    }
    return creds;
}

json Credential::to_json() const {
    return {
        {"access_token", access_token},
        {"refresh_token", refresh_token},
        {"token_type", token_type},
        {"expires_at", std::chrono::duration_cast<std::chrono::milliseconds>(
            expires_at.time_since_epoch()).count()},
        {"scopes", granted_scopes}
    };
}

bool Credential::expires_within(std::chrono::seconds margin, Timestamp now) const {
    return expires_at - now < margin;
}

// =============================================================================
// Job
// =============================================================================

static std::vector<std::string> result_fields_for(JobKind kind) {
    switch (kind) {
        case JobKind::AssetUpload:
        case JobKind::UrlAssetUpload:
            return {"asset", "asset_id"};
        case JobKind::Export:
            return {"urls", "download_url"};
        case JobKind::Autofill:
            return {"design", "design_id"};
        default:
            return {};
    }
}

static std::string failure_reason(const json& job) {
    if (job.contains("error")) {
        const json& error = job["error"];
        if (error.is_string()) {
            return error.get<std::string>();
        }
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            return error["message"].get<std::string>();
        }
        if (!error.is_null()) {
            return error.dump();
        }
    }
    if (job.contains("error_message") && job["error_message"].is_string()) {
        return job["error_message"].get<std::string>();
    }
    return "unknown";
}

Job Job::from_response(JobKind kind, const json& body) {
    const json& job_json = body.contains("job") ? body["job"] : body;
    if (!job_json.is_object() || !job_json.contains("id") || !job_json.contains("status")) {
        throw ValidationError("Malformed job response", 0, body.dump());
    }

    Job job;
    job.kind = kind;
    job.id = job_json["id"].is_string() ? job_json["id"].get<std::string>()
                                        : job_json["id"].dump();
    if (!job_json["status"].is_string()) {
        throw ValidationError("Malformed job response", 0, body.dump());
    }
    job.status = string_to_job_status(job_json["status"].get<std::string>());
    job.created_at = std::chrono::system_clock::now();
    if (job_json.contains("created_at") && job_json["created_at"].is_number_integer()) {
        job.created_at = Timestamp(std::chrono::seconds(job_json["created_at"].get<int64_t>()));
    }

    if (job.status == JobStatus::Success) {
        if (job_json.contains("result")) {
            job.result = job_json["result"];
        } else {
            json collected = json::object();
            for (const auto& field : result_fields_for(kind)) {
                if (job_json.contains(field) && !job_json[field].is_null()) {
                    collected[field] = job_json[field];
                }
            }
            job.result = collected.empty() ? job_json : collected;
        }
    } else if (job.status == JobStatus::Failed) {
        job.error = failure_reason(job_json);
    }
    return job;
}

void Job::advance(const Job& observed) {
    if (observed.id != id) {
        throw JobStateError("Status response for job " + observed.id +
                            " does not match job " + id, id);
    }
    if (is_terminal()) {
        if (observed.status != status) {
            throw JobStateError("Job " + id + " moved from " + job_status_to_string(status) +
                                " to " + job_status_to_string(observed.status), id);
        }
        return;
    }
    status = observed.status;
    result = observed.result;
    error = observed.error;
}

// =============================================================================
// HTTP
// =============================================================================

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) {
            return value;
        }
    }
    return std::nullopt;
}

ApiRequest ApiRequest::get(const std::string& path) {
    ApiRequest request;
    request.method = "GET";
    request.path = path;
    return request;
}

ApiRequest ApiRequest::post(const std::string& path, const json& body) {
    ApiRequest request;
    request.method = "POST";
    request.path = path;
    request.body = body;
    return request;
}

// =============================================================================
// Utility Functions
// =============================================================================

std::string generate_uuid() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static std::uniform_int_distribution<> dis2(8, 11);
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);

    std::stringstream ss;
    ss << std::hex;

    for (int i = 0; i < 8; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 4; i++) ss << dis(gen);
    ss << "-4";
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    ss << dis2(gen);
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 12; i++) ss << dis(gen);

    return ss.str();
}

std::string format_timestamp(Timestamp tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::stringstream ss;
    ss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string percent_encode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

std::string build_query_string(const std::map<std::string, std::string>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) query += "&";
        query += percent_encode(key) + "=" + percent_encode(value);
    }
    return query;
}

std::string join_scopes(const std::set<std::string>& scopes) {
    std::string joined;
    for (const auto& scope : scopes) {
        if (!joined.empty()) joined += " ";
        joined += scope;
    }
    return joined;
}

std::set<std::string> split_scopes(const std::string& scopes) {
    std::set<std::string> result;
    std::istringstream in(scopes);
    std::string scope;
    while (in >> scope) {
        result.insert(scope);
    }
    return result;
}

} // namespace canvasdk
