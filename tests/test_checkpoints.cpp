/**
 * Checkpoint progression and the markCheckpointComplete tool.
 *
 * Run from build dir: ./test_checkpoints
 */

#include "checkpoint_machine.h"
#include "tool_registry.h"
#include "tools/mark_checkpoint_tool.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace orbion;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static std::vector<CheckpointDefinition> cafe() {
    return {
        {"greet", "The Encounter", "Greet the waiter at the café", "Bonjour !"},
        {"order_drink", "The Order", "Order a coffee (or another drink)", "Je voudrais un café, s'il vous plaît."},
        {"ask_bill", "The Bill", "Ask for the check", "L'addition, s'il vous plaît."},
        {"farewell", "Farewell", "Say goodbye politely", "Merci, au revoir !"},
    };
}

static std::vector<CheckpointStatus> statuses(const CheckpointMachine& m) {
    std::vector<CheckpointStatus> out;
    for (const auto& cp : m.checkpoints()) out.push_back(cp.status);
    return out;
}

static int count_current(const CheckpointMachine& m) {
    int n = 0;
    for (const auto& cp : m.checkpoints()) {
        if (cp.status == CheckpointStatus::Current) ++n;
    }
    return n;
}

int main() {
    using S = CheckpointStatus;

    // --- Initial state ---
    CheckpointMachine m(cafe());
    ASSERT(m.size() == 4);
    ASSERT(m.current_index() == 0);
    ASSERT((statuses(m) == std::vector<S>{S::Current, S::Pending, S::Pending, S::Pending}));
    ASSERT(!m.all_complete());
    ASSERT(m.completed_count() == 0);

    // --- In-order progression ---
    ASSERT(m.complete("greet"));
    ASSERT((statuses(m) == std::vector<S>{S::Completed, S::Current, S::Pending, S::Pending}));
    ASSERT(m.complete("order_drink"));
    ASSERT(m.current_index() == 2);

    // --- Unknown id is a no-op ---
    auto before = statuses(m);
    ASSERT(!m.complete("dance"));
    ASSERT(!m.complete(""));
    ASSERT(statuses(m) == before);

    // --- Completing twice changes nothing ---
    ASSERT(!m.complete("greet"));
    ASSERT(statuses(m) == before);

    ASSERT(m.complete("ask_bill"));
    ASSERT(m.complete("farewell"));
    ASSERT(m.all_complete());
    ASSERT(m.current_index() == -1);
    ASSERT(count_current(m) == 0);
    ASSERT(m.completed_count() == 4);

    // --- Reset ---
    m.reset();
    ASSERT((statuses(m) == std::vector<S>{S::Current, S::Pending, S::Pending, S::Pending}));

    // --- Out of order, orphan policy: skipped objectives are left pending ---
    CheckpointMachine orphan(cafe(), OutOfOrderPolicy::Orphan);
    ASSERT(orphan.complete("ask_bill"));
    ASSERT((statuses(orphan) == std::vector<S>{S::Pending, S::Pending, S::Completed, S::Current}));
    ASSERT(count_current(orphan) == 1);
    ASSERT(!orphan.all_complete());
    ASSERT(orphan.complete("greet"));
    ASSERT((statuses(orphan) == std::vector<S>{S::Completed, S::Current, S::Completed, S::Pending}));
    ASSERT(orphan.complete("order_drink"));
    ASSERT(orphan.current_index() == 3);  // skips the already completed bill

    // Completing the last one first leaves nothing current but work remaining
    CheckpointMachine last_first(cafe());
    ASSERT(last_first.complete("farewell"));
    ASSERT(last_first.current_index() == -1);
    ASSERT(!last_first.all_complete());
    ASSERT(last_first.complete("greet"));
    ASSERT(last_first.current_index() == 1);

    // --- Out of order, cascade policy ---
    CheckpointMachine cascade(cafe(), OutOfOrderPolicy::Cascade);
    ASSERT(cascade.complete("ask_bill"));
    ASSERT((statuses(cascade) == std::vector<S>{S::Completed, S::Completed, S::Completed, S::Current}));
    ASSERT(cascade.complete("farewell"));
    ASSERT(cascade.all_complete());

    ASSERT(parse_out_of_order_policy("cascade") == OutOfOrderPolicy::Cascade);
    ASSERT(parse_out_of_order_policy("orphan") == OutOfOrderPolicy::Orphan);
    ASSERT(parse_out_of_order_policy("sideways") == OutOfOrderPolicy::Orphan);

    // --- Empty scenario is complete from the start ---
    CheckpointMachine none({});
    ASSERT(none.all_complete());
    ASSERT(!none.complete("greet"));

    // --- markCheckpointComplete tool ---
    CheckpointMachine progress(cafe());
    auto tool = std::make_shared<MarkCheckpointCompleteTool>(progress, "\"greet\", \"order_drink\"");
    std::vector<std::string> completed;
    tool->set_completed_handler([&](const std::string& id) { completed.push_back(id); });

    ASSERT(tool->name() == "markCheckpointComplete");
    json schema = json::parse(tool->parameter_schema());
    ASSERT(schema["type"] == "OBJECT");
    ASSERT(schema["properties"]["checkpointId"]["type"] == "STRING");
    ASSERT(schema["required"] == json::array({"checkpointId"}));
    std::string desc = schema["properties"]["checkpointId"]["description"].get<std::string>();
    ASSERT(desc.find("\"order_drink\"") != std::string::npos);

    ToolResult r1 = tool->execute(R"({"checkpointId":"greet"})");
    ASSERT(r1.success);
    ASSERT(r1.content == "Checkpoint marked.");
    ASSERT(completed.size() == 1 && completed[0] == "greet");

    // Unknown and repeated ids are acknowledged but change nothing
    ToolResult r2 = tool->execute(R"({"checkpointId":"juggle"})");
    ASSERT(r2.success && r2.content == "Checkpoint marked.");
    ToolResult r3 = tool->execute(R"({"checkpointId":"greet"})");
    ASSERT(r3.success);
    ToolResult r4 = tool->execute("not json");
    ASSERT(r4.success);
    ToolResult r5 = tool->execute("{}");
    ASSERT(r5.success);
    ASSERT(completed.size() == 1);
    ASSERT(progress.current_index() == 1);

    // --- Registry ---
    ToolRegistry registry;
    ASSERT(registry.register_tool(tool));
    ASSERT(!registry.register_tool(tool));
    ASSERT(!registry.register_tool(nullptr));
    ASSERT(registry.has_tool("markCheckpointComplete"));
    ASSERT(registry.size() == 1);

    json decls = json::parse(registry.get_function_declarations_json());
    ASSERT(decls.is_array() && decls.size() == 1);
    ASSERT(decls[0]["name"] == "markCheckpointComplete");
    ASSERT(decls[0]["description"].get<std::string>().find("objective") != std::string::npos);
    ASSERT(decls[0]["parameters"]["required"][0] == "checkpointId");

    ToolResult via_registry = registry.execute("markCheckpointComplete", R"({"checkpointId":"order_drink"})");
    ASSERT(via_registry.success);
    ASSERT(progress.current_index() == 2);

    ToolResult unknown = registry.execute("launchRocket", "{}");
    ASSERT(!unknown.success);
    ASSERT(unknown.error.find("launchRocket") != std::string::npos);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All checkpoint tests passed.\n";
    return 0;
}
