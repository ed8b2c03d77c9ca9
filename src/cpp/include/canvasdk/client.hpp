/**
 * @file client.hpp
 * @brief Main client for CanvaSDK C++
 */

#ifndef CANVASDK_CLIENT_HPP
#define CANVASDK_CLIENT_HPP

#include "types.hpp"
#include "auth.hpp"
#include "config.hpp"
#include "credential_store.hpp"
#include "gateway.hpp"
#include "jobs.hpp"
#include "token_manager.hpp"
#include "tools.hpp"
#include <memory>
#include <mutex>

namespace canvasdk {

/**
 * Main CanvaSDK client.
 *
 * Owns one CredentialStore and wires it into the authorization flow, the
 * token manager, the gateway and the job engine. start() registers the tool
 * set on tools().
 */
class Client {
public:
    /**
     * Create a client
     * @param options Configuration options
     */
    explicit Client(const ClientOptions& options = {});

    ~Client();

    /**
     * Register the tool set. Missing settings are logged, not fatal.
     */
    void start();

    void stop();

    bool is_started() const;

    /**
     * Build an authorization URL with a fresh verifier and state
     * @param scopes Requested scopes (empty for defaults)
     */
    AuthorizationRequest create_authorization_url(const std::set<std::string>& scopes = {});

    /**
     * Exchange an authorization code and store the credential
     */
    Credential exchange_code(
        const std::string& authorization_code,
        const std::string& code_verifier,
        const std::string& expected_state,
        const std::string& received_state
    );

    Credential refresh_access_token(const CallContext& ctx = {});

    /**
     * Drop stored credentials. No revocation request is made.
     */
    void clear_tokens();

    bool is_authenticated() const;

    /**
     * Issue an authenticated API request
     */
    json request(const ApiRequest& request, const CallContext& ctx = {});

    /**
     * Submit a job and wait for its result
     */
    json run_job(const JobSpec& spec, const JobOptions& options, const CallContext& ctx = {});

    /**
     * Default job options (configured poll policy, 300 s timeout)
     */
    JobOptions job_options() const;

    /**
     * Current OAuth configuration, without secrets
     */
    json oauth_config() const;

    /**
     * Server name, version, configured features and missing settings
     */
    json server_info() const;

    ToolRegistry& tools() { return tools_; }

    const ClientOptions& options() const { return options_; }

    std::shared_ptr<CredentialStore> credential_store() const { return store_; }
    std::shared_ptr<TokenManager> token_manager() const { return token_manager_; }
    std::shared_ptr<HttpGateway> gateway() const { return gateway_; }
    std::shared_ptr<AsyncJobEngine> job_engine() const { return job_engine_; }

private:
    void register_auth_tools();
    void register_job_tools();
    void register_utility_tools();

    JobOptions job_options_from(const ToolInvocation& invocation) const;

    ClientOptions options_;
    OAuthSettings settings_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<CredentialStore> store_;
    std::shared_ptr<OAuthClient> oauth_client_;
    std::shared_ptr<AuthorizationFlow> authorization_flow_;
    std::shared_ptr<TokenManager> token_manager_;
    std::shared_ptr<HttpGateway> gateway_;
    std::shared_ptr<AsyncJobEngine> job_engine_;
    ToolRegistry tools_;
    bool started_;
    mutable std::mutex mutex_;
};

} // namespace canvasdk

#endif // CANVASDK_CLIENT_HPP
