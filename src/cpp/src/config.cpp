/**
 * @file config.cpp
 * @brief Client configuration implementation for CanvaSDK C++
 */

#include "canvasdk/config.hpp"
#include <cstdlib>
#include <fstream>

namespace canvasdk {

static std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r");
    return value.substr(start, end - start + 1);
}

std::map<std::string, std::string> read_env_file(const std::string& path) {
    std::map<std::string, std::string> entries;

    std::ifstream file(path);
    if (!file.is_open()) {
        return entries;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.find("export ") == 0) {
            line = trim(line.substr(7));
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        // Remove quotes
        if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
            value = value.substr(1);
        }
        if (!value.empty() && (value.back() == '"' || value.back() == '\'')) {
            value.pop_back();
        }
        if (!key.empty()) {
            entries[key] = value;
        }
    }
    return entries;
}

ClientOptions load_client_options_from_env(const std::optional<std::string>& env_file) {
    std::map<std::string, std::string> file_values = read_env_file(env_file.value_or(".env"));

    auto lookup = [&file_values](const std::string& key) -> std::optional<std::string> {
        const char* env_value = getenv(key.c_str());
        if (env_value && *env_value) {
            return std::string(env_value);
        }
        auto it = file_values.find(key);
        if (it != file_values.end() && !it->second.empty()) {
            return it->second;
        }
        return std::nullopt;
    };

    ClientOptions options;
    options.client_id = lookup("CANVA_CLIENT_ID");
    options.client_secret = lookup("CANVA_CLIENT_SECRET");
    options.redirect_uri = lookup("CANVA_REDIRECT_URI");
    options.api_base = lookup("CANVA_API_BASE");
    options.auth_base = lookup("CANVA_AUTH_BASE");

    auto level = lookup("CANVA_LOG_LEVEL");
    if (!level.has_value()) {
        level = lookup("LOG_LEVEL");
    }
    if (level.has_value()) {
        options.logging.level = string_to_log_level(*level);
    }
    options.logging.file = lookup("LOG_FILE");
    options.logging.error_file = lookup("LOG_ERROR_FILE");

    return options;
}

std::vector<std::string> missing_required_settings(const ClientOptions& options) {
    std::vector<std::string> missing;
    if (!options.client_id.has_value() || options.client_id->empty()) {
        missing.push_back("CANVA_CLIENT_ID");
    }
    if (!options.client_secret.has_value() || options.client_secret->empty()) {
        missing.push_back("CANVA_CLIENT_SECRET");
    }
    if (!options.redirect_uri.has_value() || options.redirect_uri->empty()) {
        missing.push_back("CANVA_REDIRECT_URI");
    }
    return missing;
}

} // namespace canvasdk
