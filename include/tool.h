#pragma once

#include <string>

namespace orbion {

/**
 * @brief Outcome of a tool execution, sent back to the model
 */
struct ToolResult {
    bool success = false;
    std::string content;  // Result text for the model
    std::string error;    // Error message if failed

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
 * @brief Abstract base class for functions the remote model may invoke
 *
 * Each tool provides:
 * - A unique name (the function name the model calls)
 * - A description telling the model when to call it
 * - A JSON schema for its arguments
 * - An execute method run on the session's receive thread
 */
class Tool {
public:
    virtual ~Tool() = default;

    /**
     * @brief Get the tool's unique name
     * @return Function name (e.g., "markCheckpointComplete")
     */
    virtual std::string name() const = 0;

    /**
     * @brief Get the tool's description for the model
     */
    virtual std::string description() const = 0;

    /**
     * @brief Get the JSON schema for the tool's arguments
     * @return JSON schema string (OBJECT / STRING type names)
     */
    virtual std::string parameter_schema() const = 0;

    /**
     * @brief Execute the tool
     * @param args_json JSON object with the call's arguments
     * @return ToolResult with success status and result text or error
     */
    virtual ToolResult execute(const std::string& args_json) = 0;
};

} // namespace orbion
