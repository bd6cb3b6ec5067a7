#include "tool_registry.h"
#include "logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace orbion {

bool ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
    if (!tool) {
        Logger::error("Attempted to register null tool");
        return false;
    }

    std::string name = tool->name();
    if (tools_.find(name) != tools_.end()) {
        Logger::warn("Tool '" + name + "' is already registered. Skipping.");
        return false;
    }

    tools_[name] = tool;
    LOG_TOOL("Registered " + name);
    return true;
}

std::shared_ptr<Tool> ToolRegistry::get_tool(const std::string& name) const {
    auto it = tools_.find(name);
    if (it != tools_.end()) {
        return it->second;
    }
    return nullptr;
}

std::string ToolRegistry::get_function_declarations_json() const {
    json declarations = json::array();

    for (const auto& [name, tool] : tools_) {
        json decl;
        decl["name"] = tool->name();
        decl["description"] = tool->description();

        try {
            decl["parameters"] = json::parse(tool->parameter_schema());
        } catch (const json::exception& e) {
            Logger::error("Failed to parse parameter schema for tool '" + name + "': " + e.what());
            decl["parameters"] = json::object();
        }

        declarations.push_back(decl);
    }

    return declarations.dump();
}

ToolResult ToolRegistry::execute(const std::string& name, const std::string& args_json) const {
    auto tool = get_tool(name);
    if (!tool) {
        Logger::warn("[Tool] Unknown tool requested: " + name);
        return ToolResult::error_result("Unknown tool: " + name);
    }
    LOG_TOOL(name + "(" + args_json + ")");
    return tool->execute(args_json);
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

void ToolRegistry::clear() {
    tools_.clear();
}

} // namespace orbion
