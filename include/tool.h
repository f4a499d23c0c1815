#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <string>

namespace voxgate {

/**
 * @brief Result structure for tool execution
 */
struct ToolResult {
    bool success = false;
    std::string content;  // Result text for LLM
    std::string error;    // Error message if failed
    std::map<std::string, std::string> metadata;  // Optional metadata

    static ToolResult success_result(const std::string& content) {
        ToolResult result;
        result.success = true;
        result.content = content;
        return result;
    }

    static ToolResult error_result(const std::string& error_msg) {
        ToolResult result;
        result.success = false;
        result.error = error_msg;
        return result;
    }
};

/**
 * @brief Tool call structure from LLM response
 */
struct ToolCall {
    std::string id;           // Tool call ID from LLM
    std::string name;         // Tool name
    nlohmann::json arguments = nlohmann::json::object();
};

/**
 * @brief A privileged action
 *
 * Implementations are constructed only by ToolRegistry, and only after
 * ToolGate has authorized the call; their description and input schema
 * live in the ToolSpec they were registered with.
 */
class Tool {
public:
    virtual ~Tool() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Execute with arguments already validated against the input schema
     */
    virtual ToolResult execute(const nlohmann::json& args) = 0;
};

} // namespace voxgate
