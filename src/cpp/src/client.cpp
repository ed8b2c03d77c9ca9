/**
 * @file client.cpp
 * @brief Client implementation for CanvaSDK C++
 */

#include "canvasdk/client.hpp"
#include "canvasdk/canvasdk.hpp"
#include "canvasdk/errors.hpp"
#include "canvasdk/logging.hpp"
#include <algorithm>

namespace canvasdk {

static json token_summary(const Credential& credential) {
    auto expires_in = std::chrono::duration_cast<std::chrono::seconds>(
        credential.expires_at - std::chrono::system_clock::now()).count();
    return {
        {"access_token", redact(credential.access_token)},
        {"token_type", credential.token_type},
        {"expires_in", std::max<int64_t>(expires_in, 0)},
        {"expires_at", format_timestamp(credential.expires_at)},
        {"scope", join_scopes(credential.granted_scopes)},
        {"has_refresh_token", !credential.refresh_token.empty()}
    };
}

Client::Client(const ClientOptions& options)
    : options_(options),
      started_(false) {
    settings_.client_id = options_.client_id.value_or("");
    settings_.client_secret = options_.client_secret.value_or("");
    settings_.redirect_uri = options_.redirect_uri.value_or("");
    settings_.api_base = options_.api_base.value_or(CANVA_API_BASE);
    settings_.auth_base = options_.auth_base.value_or(CANVA_AUTH_BASE);
    settings_.request_timeout = options_.timeout;

    transport_ = options_.transport ? options_.transport : std::make_shared<CurlTransport>();
    store_ = std::make_shared<CredentialStore>();
    oauth_client_ = std::make_shared<OAuthClient>(settings_, transport_);
    authorization_flow_ = std::make_shared<AuthorizationFlow>(oauth_client_, store_);
    token_manager_ = std::make_shared<TokenManager>(store_, oauth_client_);

    GatewayOptions gateway_options;
    gateway_options.api_base = settings_.api_base;
    gateway_options.request_timeout = options_.timeout;
    gateway_options.retry = options_.retry;
    gateway_ = std::make_shared<HttpGateway>(transport_, token_manager_, gateway_options);

    job_engine_ = std::make_shared<AsyncJobEngine>(gateway_);
}

Client::~Client() {
    stop();
}

void Client::start() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (started_) {
        return;
    }

    init_logging(options_.logging);

    auto missing = missing_required_settings(options_);
    if (!missing.empty()) {
        std::string names;
        for (const auto& name : missing) {
            names += (names.empty() ? "" : ", ") + name;
        }
        logger()->warn("Missing required settings: {}. OAuth calls will be rejected until they are set", names);
    }

    register_auth_tools();
    register_job_tools();
    register_utility_tools();

    started_ = true;
    logger()->info("CanvaSDK {} started with {} tools", VERSION, tools_.names().size());
}

void Client::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    started_ = false;
}

bool Client::is_started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

AuthorizationRequest Client::create_authorization_url(const std::set<std::string>& scopes) {
    return authorization_flow_->create_authorization_url(scopes);
}

Credential Client::exchange_code(
    const std::string& authorization_code,
    const std::string& code_verifier,
    const std::string& expected_state,
    const std::string& received_state
) {
    return authorization_flow_->exchange(authorization_code, code_verifier, expected_state, received_state);
}

Credential Client::refresh_access_token(const CallContext& ctx) {
    return token_manager_->refresh(ctx);
}

void Client::clear_tokens() {
    store_->clear();
    log_oauth_flow("Tokens cleared", "local only");
}

bool Client::is_authenticated() const {
    return store_->is_authenticated();
}

json Client::request(const ApiRequest& request, const CallContext& ctx) {
    return gateway_->execute(request, ctx);
}

json Client::run_job(const JobSpec& spec, const JobOptions& options, const CallContext& ctx) {
    return job_engine_->submit_and_await(spec, options, ctx);
}

JobOptions Client::job_options() const {
    JobOptions options;
    options.poll = options_.poll;
    return options;
}

json Client::oauth_config() const {
    json config = {
        {"client_id", settings_.client_id},
        {"redirect_uri", settings_.redirect_uri},
        {"api_base", settings_.api_base},
        {"auth_base", settings_.auth_base},
        {"has_access_token", false},
        {"has_refresh_token", false},
        {"token_expires_at", nullptr}
    };
    if (auto credential = store_->get()) {
        config["has_access_token"] = !credential->access_token.empty();
        config["has_refresh_token"] = !credential->refresh_token.empty();
        config["token_expires_at"] = format_timestamp(credential->expires_at);
        config["scopes"] = credential->granted_scopes;
    }
    return config;
}

json Client::server_info() const {
    RateLimitState rate_limit = gateway_->rate_limit_state();
    return {
        {"name", "CanvaSDK"},
        {"version", VERSION},
        {"status", "running"},
        {"features", {
            "Authentication (OAuth 2.0 + PKCE)",
            "Asset Upload Jobs",
            "Export Jobs",
            "Autofill Jobs",
            "API Passthrough"
        }},
        {"authenticated", store_->is_authenticated()},
        {"missing_settings", missing_required_settings(options_)},
        {"rate_limited", rate_limit.retry_after.has_value() &&
            rate_limit.observed_at + *rate_limit.retry_after > std::chrono::steady_clock::now()}
    };
}

JobOptions Client::job_options_from(const ToolInvocation& invocation) const {
    JobOptions options = job_options();
    if (auto timeout = optional_integer(invocation, "timeout_seconds")) {
        if (*timeout <= 0) {
            throw ToolArgumentError(invocation.name, "timeout_seconds must be positive");
        }
        options.timeout = std::chrono::seconds(*timeout);
    }
    return options;
}

// =============================================================================
// Tools
// =============================================================================

void Client::register_auth_tools() {
    tools_.register_tool(
        define_tool("create_authorization_url",
                    "Create an OAuth authorization URL for Canva API access",
                    ToolParametersBuilder()
                        .add_string("scopes", "Space-separated list of scopes to request")),
        [this](const ToolInvocation& invocation) {
            auto scopes = split_scopes(optional_string(invocation, "scopes").value_or(""));
            AuthorizationRequest request = create_authorization_url(scopes);
            return success_result({
                {"authorization_url", request.url},
                {"code_verifier", request.code_verifier},
                {"state", request.state},
                {"scopes", join_scopes(request.scopes)}
            });
        });

    tools_.register_tool(
        define_tool("exchange_code_for_token",
                    "Exchange an authorization code for an access token",
                    ToolParametersBuilder()
                        .add_string("authorization_code", "The authorization code received from Canva")
                        .add_string("code_verifier", "The code verifier from create_authorization_url")
                        .add_string("expected_state", "The state from create_authorization_url")
                        .add_string("state", "The state received on the redirect")
                        .required({"authorization_code", "code_verifier", "expected_state", "state"})),
        [this](const ToolInvocation& invocation) {
            Credential credential = exchange_code(
                require_string(invocation, "authorization_code"),
                require_string(invocation, "code_verifier"),
                require_string(invocation, "expected_state"),
                require_string(invocation, "state"));
            return success_result(token_summary(credential));
        });

    tools_.register_tool(
        define_tool("refresh_access_token",
                    "Refresh the access token using the stored refresh token",
                    ToolParametersBuilder()),
        [this](const ToolInvocation&) {
            return success_result(token_summary(refresh_access_token()));
        });

    tools_.register_tool(
        define_tool("get_oauth_config", "Get the current OAuth configuration", ToolParametersBuilder()),
        [this](const ToolInvocation&) {
            return success_result(oauth_config());
        });

    tools_.register_tool(
        define_tool("clear_tokens",
                    "Clear stored access and refresh tokens (local only, no revocation)",
                    ToolParametersBuilder()),
        [this](const ToolInvocation&) {
            clear_tokens();
            return success_result({
                {"message", "Tokens cleared successfully"},
                {"revoked", false}
            });
        });
}

void Client::register_job_tools() {
    tools_.register_tool(
        define_tool("create_asset_upload_job",
                    "Upload an asset and wait for the upload job to finish",
                    ToolParametersBuilder()
                        .add_string("filename", "Name of the file to upload")
                        .add_integer("file_size", "Size of the file in bytes")
                        .add_string("folder_id", "Destination folder")
                        .add_integer("timeout_seconds", "Maximum time to wait (default 300)")
                        .required({"filename", "file_size"})),
        [this](const ToolInvocation& invocation) {
            auto file_size = optional_integer(invocation, "file_size");
            if (!file_size.has_value()) {
                throw ToolArgumentError(invocation.name, "Missing required argument: file_size");
            }
            JobSpec spec = asset_upload_job(require_string(invocation, "filename"), *file_size,
                                            optional_string(invocation, "folder_id"));
            return success_result(run_job(spec, job_options_from(invocation)));
        });

    tools_.register_tool(
        define_tool("create_url_asset_upload_job",
                    "Upload an asset from a URL and wait for the upload job to finish",
                    ToolParametersBuilder()
                        .add_string("url", "URL of the asset")
                        .add_string("filename", "Name for the uploaded asset")
                        .add_string("folder_id", "Destination folder")
                        .add_integer("timeout_seconds", "Maximum time to wait (default 300)")
                        .required({"url", "filename"})),
        [this](const ToolInvocation& invocation) {
            JobSpec spec = url_asset_upload_job(require_string(invocation, "url"),
                                                require_string(invocation, "filename"),
                                                optional_string(invocation, "folder_id"));
            return success_result(run_job(spec, job_options_from(invocation)));
        });

    tools_.register_tool(
        define_tool("create_design_export_job",
                    "Export a design and wait for the download URLs",
                    ToolParametersBuilder()
                        .add_string("design_id", "Design to export")
                        .add_enum("file_type", "Export format", CANVA_EXPORT_FILE_TYPES)
                        .add_object("page_range", "Pages to export")
                        .add_integer("timeout_seconds", "Maximum time to wait (default 300)")
                        .required({"design_id", "file_type"})),
        [this](const ToolInvocation& invocation) {
            JobSpec spec = export_job(require_string(invocation, "design_id"),
                                      require_string(invocation, "file_type"),
                                      optional_json(invocation, "page_range"));
            return success_result(run_job(spec, job_options_from(invocation)));
        });

    tools_.register_tool(
        define_tool("create_design_autofill_job",
                    "Autofill a brand template and wait for the generated design",
                    ToolParametersBuilder()
                        .add_string("brand_template_id", "Brand template to fill")
                        .add_object("dataset", "Field values keyed by data field name")
                        .add_integer("timeout_seconds", "Maximum time to wait (default 300)")
                        .required({"brand_template_id", "dataset"})),
        [this](const ToolInvocation& invocation) {
            auto dataset = optional_json(invocation, "dataset");
            if (!dataset.has_value() || !dataset->is_object()) {
                throw ToolArgumentError(invocation.name, "dataset must be an object");
            }
            JobSpec spec = autofill_job(require_string(invocation, "brand_template_id"), *dataset);
            return success_result(run_job(spec, job_options_from(invocation)));
        });
}

void Client::register_utility_tools() {
    tools_.register_tool(
        define_tool("api_request",
                    "Send an authenticated request to the Canva Connect API",
                    ToolParametersBuilder()
                        .add_enum("method", "HTTP method", {"GET", "POST", "PATCH", "PUT", "DELETE"})
                        .add_string("path", "Path relative to the API base, e.g. /users/me")
                        .add_object("query", "Query parameters")
                        .add_object("body", "JSON request body")
                        .required({"method", "path"})),
        [this](const ToolInvocation& invocation) {
            ApiRequest request;
            request.method = require_string(invocation, "method");
            request.path = require_string(invocation, "path");
            if (request.path.front() != '/') {
                throw ToolArgumentError(invocation.name, "path must start with '/'");
            }
            if (auto query = optional_json(invocation, "query")) {
                if (!query->is_object()) {
                    throw ToolArgumentError(invocation.name, "query must be an object");
                }
                for (const auto& [key, value] : query->items()) {
                    request.query[key] = value.is_string() ? value.get<std::string>() : value.dump();
                }
            }
            request.body = optional_json(invocation, "body");
            return success_result(this->request(request));
        });

    tools_.register_tool(
        define_tool("get_server_info", "Get information about this server", ToolParametersBuilder()),
        [this](const ToolInvocation&) {
            return success_result(server_info());
        });

    tools_.register_tool(
        define_tool("ping_server", "Check that the server is responsive", ToolParametersBuilder()),
        [](const ToolInvocation&) {
            auto now = std::chrono::system_clock::now();
            return success_result({
                {"message", "pong"},
                {"timestamp", format_timestamp(now)}
            });
        });
}

} // namespace canvasdk
