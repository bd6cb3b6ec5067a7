#include "tools/mark_checkpoint_tool.h"
#include "logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace orbion {

MarkCheckpointCompleteTool::MarkCheckpointCompleteTool(CheckpointMachine& checkpoints,
                                                       std::string example_ids)
    : checkpoints_(checkpoints), example_ids_(std::move(example_ids)) {
}

std::string MarkCheckpointCompleteTool::parameter_schema() const {
    std::string id_description = "The ID of the checkpoint completed";
    if (!example_ids_.empty()) {
        id_description += " (e.g., " + example_ids_ + ")";
    }
    id_description += ".";

    json schema;
    schema["type"] = "OBJECT";
    schema["properties"]["checkpointId"] = json::object({
        {"type", "STRING"},
        {"description", id_description}
    });
    schema["required"] = json::array({"checkpointId"});
    return schema.dump();
}

ToolResult MarkCheckpointCompleteTool::execute(const std::string& args_json) {
    json args;
    try {
        args = json::parse(args_json);
    } catch (const json::exception& e) {
        Logger::warn(std::string("[Tool] markCheckpointComplete: bad arguments: ") + e.what());
        return ToolResult::success_result(RESULT_TEXT);
    }

    if (!args.is_object() || !args.contains("checkpointId") || !args["checkpointId"].is_string()) {
        Logger::warn("[Tool] markCheckpointComplete called without checkpointId");
        return ToolResult::success_result(RESULT_TEXT);
    }

    std::string id = args["checkpointId"].get<std::string>();
    if (checkpoints_.complete(id) && on_completed_) {
        on_completed_(id);
    }
    return ToolResult::success_result(RESULT_TEXT);
}

} // namespace orbion
