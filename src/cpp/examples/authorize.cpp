/**
 * @file authorize.cpp
 * @brief OAuth authorization example for CanvaSDK C++
 */

#include <canvasdk/canvasdk.hpp>
#include <iostream>

using namespace canvasdk;

int main() {
    std::cout << "CanvaSDK C++ - Authorization Example\n\n";

    try {
        Client client(load_client_options_from_env());
        client.start();

        auto missing = missing_required_settings(client.options());
        if (!missing.empty()) {
            std::cerr << "Set " << missing.front() << " (environment or .env) first\n";
            return 1;
        }

        auto request = client.create_authorization_url();
        std::cout << "Open this URL and approve access:\n" << request.url << "\n\n";

        std::string code;
        std::string state;
        std::cout << "Paste the 'code' parameter from the redirect: ";
        std::getline(std::cin, code);
        std::cout << "Paste the 'state' parameter from the redirect: ";
        std::getline(std::cin, state);

        auto credential = client.exchange_code(code, request.code_verifier, request.state, state);
        std::cout << "\nAuthenticated. Token expires at " << format_timestamp(credential.expires_at)
                  << " with scopes: " << join_scopes(credential.granted_scopes) << "\n";

        auto me = client.request(ApiRequest::get("/users/me"));
        std::cout << "Current user: " << me.dump(2) << "\n";

        client.stop();

    } catch (const AuthError& e) {
        std::cerr << "Authorization failed (" << auth_error_kind_to_string(e.kind()) << "): "
                  << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
