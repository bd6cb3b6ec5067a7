#pragma once

#include "tool.h"
#include <string>
#include <memory>
#include <map>

namespace orbion {

/**
 * @brief Central registry for tools offered to the remote model
 *
 * Manages tool registration and lookup, and renders the function
 * declarations carried by the session setup message.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool with the registry
     * @param tool Shared pointer to tool instance
     * @return true if registration successful, false if tool with same name already exists
     */
    bool register_tool(std::shared_ptr<Tool> tool);

    /**
     * @brief Get a tool by name
     * @return Shared pointer to tool, or nullptr if not found
     */
    std::shared_ptr<Tool> get_tool(const std::string& name) const;

    /**
     * @brief Function declarations for the setup message
     * @return JSON array of {name, description, parameters}
     */
    std::string get_function_declarations_json() const;

    /**
     * @brief Look up and run a tool
     * @return The tool's result, or an error result for an unknown name
     */
    ToolResult execute(const std::string& name, const std::string& args_json) const;

    bool has_tool(const std::string& name) const;

    size_t size() const { return tools_.size(); }

    void clear();

private:
    std::map<std::string, std::shared_ptr<Tool>> tools_;
};

} // namespace orbion
