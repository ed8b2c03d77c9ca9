/**
 * @file tools.hpp
 * @brief Tool utilities for CanvaSDK C++
 */

#ifndef CANVASDK_TOOLS_HPP
#define CANVASDK_TOOLS_HPP

#include "types.hpp"
#include <map>
#include <mutex>

namespace canvasdk {

/**
 * Tool parameter builder
 */
class ToolParametersBuilder {
public:
    ToolParametersBuilder() = default;

    /**
     * Add a string parameter
     * @param name Parameter name
     * @param description Parameter description
     * @return Reference to this builder
     */
    ToolParametersBuilder& add_string(const std::string& name, const std::string& description);

    ToolParametersBuilder& add_integer(const std::string& name, const std::string& description);

    /**
     * Add an object parameter (free-form JSON object)
     * @param name Parameter name
     * @param description Parameter description
     * @return Reference to this builder
     */
    ToolParametersBuilder& add_object(const std::string& name, const std::string& description);

    /**
     * Add an array of strings parameter
     */
    ToolParametersBuilder& add_string_array(const std::string& name, const std::string& description);

    /**
     * Add an enum parameter
     * @param name Parameter name
     * @param description Parameter description
     * @param values Allowed values
     * @return Reference to this builder
     */
    ToolParametersBuilder& add_enum(
        const std::string& name,
        const std::string& description,
        const std::vector<std::string>& values
    );

    /**
     * Mark parameters as required
     * @param fields Required field names
     * @return Reference to this builder
     */
    ToolParametersBuilder& required(const std::vector<std::string>& fields);

    /**
     * Build the JSON schema object
     */
    json build() const;

private:
    std::map<std::string, json> properties_;
    std::vector<std::string> required_;
};

/**
 * Create a tool with parameter builder
 * @param name Tool name
 * @param description Tool description
 * @param builder Parameter builder
 * @return Tool definition
 */
Tool define_tool(
    const std::string& name,
    const std::string& description,
    const ToolParametersBuilder& builder
);

ToolResult success_result(const json& content);

/**
 * Create a failure tool result
 * @param message Error text
 * @param error_code Machine-readable code
 */
ToolResult failure_result(const std::string& message, const std::string& error_code);

// Argument accessors; throw ToolArgumentError on a missing or mistyped value

std::string require_string(const ToolInvocation& invocation, const std::string& key);
std::optional<std::string> optional_string(const ToolInvocation& invocation, const std::string& key);
std::optional<int64_t> optional_integer(const ToolInvocation& invocation, const std::string& key);
std::optional<json> optional_json(const ToolInvocation& invocation, const std::string& key);

/**
 * Tool registry for managing multiple tools.
 *
 * execute() never throws: SDK errors become failure results carrying the
 * error code, and every call is logged with its duration.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;

    /**
     * Register a tool with handler
     * @param tool Tool definition
     * @param handler Tool handler
     */
    void register_tool(const Tool& tool, ToolHandler handler);

    std::vector<Tool> tools() const;

    std::optional<Tool> get_tool(const std::string& name) const;

    /**
     * Execute a tool invocation
     * @param invocation Tool invocation
     * @return Tool result
     */
    ToolResult execute(const ToolInvocation& invocation) const;

    bool has(const std::string& name) const;

    std::vector<std::string> names() const;

private:
    std::map<std::string, Tool> tools_;
    std::map<std::string, ToolHandler> handlers_;
    mutable std::mutex mutex_;
};

} // namespace canvasdk

#endif // CANVASDK_TOOLS_HPP
