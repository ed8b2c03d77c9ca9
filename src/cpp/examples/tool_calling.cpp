/**
 * @file tool_calling.cpp
 * @brief Tool calling example for CanvaSDK C++
 */

#include <canvasdk/canvasdk.hpp>
#include <iostream>

using namespace canvasdk;

int main() {
    std::cout << "CanvaSDK C++ - Tool Calling Example\n\n";

    try {
        Client client(load_client_options_from_env());
        client.start();

        std::cout << "Registered tools:\n";
        for (const auto& tool : client.tools().tools()) {
            std::cout << "  " << tool.name << " - " << tool.description << "\n";
        }

        ToolInvocation ping;
        ping.name = "ping_server";
        ping.call_id = generate_uuid();
        std::cout << "\nping_server: " << client.tools().execute(ping).content.dump() << "\n";

        ToolInvocation info;
        info.name = "get_server_info";
        info.call_id = generate_uuid();
        std::cout << "get_server_info: " << client.tools().execute(info).content.dump(2) << "\n";

        ToolInvocation authorize;
        authorize.name = "create_authorization_url";
        authorize.arguments = {{"scopes", "asset:read design:meta:read"}};
        authorize.call_id = generate_uuid();
        auto result = client.tools().execute(authorize);
        if (result.result_type == ToolResultType::Success) {
            std::cout << "Authorization URL: " << result.content["authorization_url"].get<std::string>() << "\n";
        }

        // Not authenticated yet: fails with AUTH_ERROR instead of throwing
        ToolInvocation export_design;
        export_design.name = "create_design_export_job";
        export_design.arguments = {{"design_id", "DAFexample"}, {"file_type", "png"}};
        export_design.call_id = generate_uuid();
        auto failed = client.tools().execute(export_design);
        std::cout << "create_design_export_job: " << failed.error_code.value_or("ok") << "\n";

        client.stop();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
