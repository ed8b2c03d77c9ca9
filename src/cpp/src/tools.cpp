/**
 * @file tools.cpp
 * @brief Tool utilities for CanvaSDK C++
 */

#include "canvasdk/tools.hpp"
#include "canvasdk/errors.hpp"
#include "canvasdk/logging.hpp"

namespace canvasdk {

ToolParametersBuilder& ToolParametersBuilder::add_string(const std::string& name, const std::string& description) {
    properties_[name] = {
        {"type", "string"},
        {"description", description}
    };
    return *this;
}

ToolParametersBuilder& ToolParametersBuilder::add_integer(const std::string& name, const std::string& description) {
    properties_[name] = {
        {"type", "integer"},
        {"description", description}
    };
    return *this;
}

ToolParametersBuilder& ToolParametersBuilder::add_object(const std::string& name, const std::string& description) {
    properties_[name] = {
        {"type", "object"},
        {"description", description}
    };
    return *this;
}

ToolParametersBuilder& ToolParametersBuilder::add_string_array(const std::string& name,
                                                               const std::string& description) {
    properties_[name] = {
        {"type", "array"},
        {"items", {{"type", "string"}}},
        {"description", description}
    };
    return *this;
}

ToolParametersBuilder& ToolParametersBuilder::add_enum(
    const std::string& name,
    const std::string& description,
    const std::vector<std::string>& values
) {
    properties_[name] = {
        {"type", "string"},
        {"description", description},
        {"enum", values}
    };
    return *this;
}

ToolParametersBuilder& ToolParametersBuilder::required(const std::vector<std::string>& fields) {
    required_ = fields;
    return *this;
}

json ToolParametersBuilder::build() const {
    return {
        {"type", "object"},
        {"properties", properties_},
        {"required", required_}
    };
}

Tool define_tool(
    const std::string& name,
    const std::string& description,
    const ToolParametersBuilder& builder
) {
    Tool tool;
    tool.name = name;
    tool.description = description;
    tool.parameters = builder.build();
    return tool;
}

ToolResult success_result(const json& content) {
    ToolResult result;
    result.result_type = ToolResultType::Success;
    result.content = content;
    return result;
}

ToolResult failure_result(const std::string& message, const std::string& error_code) {
    ToolResult result;
    result.result_type = ToolResultType::Failure;
    result.content = {
        {"success", false},
        {"error", message},
        {"error_code", error_code}
    };
    result.error_code = error_code;
    return result;
}

// =============================================================================
// Argument accessors
// =============================================================================

std::string require_string(const ToolInvocation& invocation, const std::string& key) {
    auto value = optional_string(invocation, key);
    if (!value.has_value() || value->empty()) {
        throw ToolArgumentError(invocation.name, "Missing required argument: " + key);
    }
    return *value;
}

std::optional<std::string> optional_string(const ToolInvocation& invocation, const std::string& key) {
    if (!invocation.arguments.is_object() || !invocation.arguments.contains(key) ||
        invocation.arguments[key].is_null()) {
        return std::nullopt;
    }
    const json& value = invocation.arguments[key];
    if (!value.is_string()) {
        throw ToolArgumentError(invocation.name, "Argument '" + key + "' must be a string");
    }
    return value.get<std::string>();
}

std::optional<int64_t> optional_integer(const ToolInvocation& invocation, const std::string& key) {
    if (!invocation.arguments.is_object() || !invocation.arguments.contains(key) ||
        invocation.arguments[key].is_null()) {
        return std::nullopt;
    }
    const json& value = invocation.arguments[key];
    if (!value.is_number_integer()) {
        throw ToolArgumentError(invocation.name, "Argument '" + key + "' must be an integer");
    }
    return value.get<int64_t>();
}

std::optional<json> optional_json(const ToolInvocation& invocation, const std::string& key) {
    if (!invocation.arguments.is_object() || !invocation.arguments.contains(key) ||
        invocation.arguments[key].is_null()) {
        return std::nullopt;
    }
    return invocation.arguments[key];
}

// =============================================================================
// ToolRegistry
// =============================================================================

void ToolRegistry::register_tool(const Tool& tool, ToolHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_[tool.name] = tool;
    handlers_[tool.name] = std::move(handler);
}

std::vector<Tool> ToolRegistry::tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Tool> result;
    for (const auto& [name, tool] : tools_) {
        result.push_back(tool);
    }
    return result;
}

std::optional<Tool> ToolRegistry::get_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it != tools_.end()) {
        return it->second;
    }
    return std::nullopt;
}

ToolResult ToolRegistry::execute(const ToolInvocation& invocation) const {
    ToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(invocation.name);
        if (it == handlers_.end()) {
            ToolNotFoundError error(invocation.name);
            log_tool_execution(invocation.name, false, 0.0, error.what());
            return failure_result(error.what(), error.code());
        }
        handler = it->second;
    }

    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    try {
        ToolResult result = handler(invocation);
        log_tool_execution(invocation.name, result.result_type == ToolResultType::Success, elapsed(),
                           result.error_code.value_or(""));
        return result;
    } catch (const CanvaSDKError& e) {
        log_tool_execution(invocation.name, false, elapsed(), e.what());
        return failure_result(e.what(), e.code());
    } catch (const json::exception& e) {
        log_tool_execution(invocation.name, false, elapsed(), e.what());
        return failure_result(std::string("Invalid JSON value: ") + e.what(), "INVALID_ARGUMENT");
    } catch (const std::exception& e) {
        log_tool_execution(invocation.name, false, elapsed(), e.what());
        return failure_result(e.what(), "INTERNAL_ERROR");
    }
}

bool ToolRegistry::has(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.find(name) != tools_.end();
}

std::vector<std::string> ToolRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [name, _] : tools_) {
        result.push_back(name);
    }
    return result;
}

} // namespace canvasdk
