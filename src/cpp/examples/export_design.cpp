/**
 * @file export_design.cpp
 * @brief Design export job example for CanvaSDK C++
 *
 * Usage: export_design <design_id> [file_type]
 * Runs the authorization flow first, then exports the design and prints the
 * download URLs.
 */

#include <canvasdk/canvasdk.hpp>
#include <iostream>

using namespace canvasdk;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <design_id> [file_type]\n";
        return 2;
    }
    std::string design_id = argv[1];
    std::string file_type = argc > 2 ? argv[2] : "pdf";

    try {
        Client client(load_client_options_from_env());
        client.start();

        auto request = client.create_authorization_url({"design:meta:read", "design:content:read"});
        std::cout << "Open this URL and approve access:\n" << request.url << "\n\n";

        std::string code;
        std::string state;
        std::cout << "code: ";
        std::getline(std::cin, code);
        std::cout << "state: ";
        std::getline(std::cin, state);
        client.exchange_code(code, request.code_verifier, request.state, state);

        JobOptions options = client.job_options();
        options.timeout = std::chrono::seconds(120);

        std::cout << "Exporting " << design_id << " as " << file_type << "...\n";
        json result = client.run_job(export_job(design_id, file_type), options);
        std::cout << "Export ready:\n" << result.dump(2) << "\n";

    } catch (const JobFailedError& e) {
        std::cerr << "Export failed: " << e.reason() << "\n";
        return 1;
    } catch (const JobTimeoutError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
