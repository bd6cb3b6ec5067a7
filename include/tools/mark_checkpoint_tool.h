#pragma once

#include "tool.h"
#include "checkpoint_machine.h"
#include <functional>
#include <string>

namespace orbion {

/**
 * @brief Lets the model report that the learner met an objective
 *
 * Always answers "Checkpoint marked." so the model never stalls on an id it
 * made up; only known, not yet completed ids change the checkpoint state.
 */
class MarkCheckpointCompleteTool : public Tool {
public:
    /// Called with the checkpoint id after a state change
    using CompletedHandler = std::function<void(const std::string& id)>;

    /**
     * @param checkpoints Machine this tool advances
     * @param example_ids Ids quoted in the argument description
     */
    MarkCheckpointCompleteTool(CheckpointMachine& checkpoints, std::string example_ids);

    std::string name() const override { return "markCheckpointComplete"; }

    std::string description() const override {
        return "Call this function when the student successfully completes a specific objective in the scenario.";
    }

    std::string parameter_schema() const override;

    ToolResult execute(const std::string& args_json) override;

    void set_completed_handler(CompletedHandler handler) { on_completed_ = std::move(handler); }

    static constexpr const char* RESULT_TEXT = "Checkpoint marked.";

private:
    CheckpointMachine& checkpoints_;
    std::string example_ids_;
    CompletedHandler on_completed_;
};

} // namespace orbion
