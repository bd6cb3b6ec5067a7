#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace orbion {

/**
 * @brief One learning objective as authored in the scenario
 */
struct CheckpointDefinition {
    std::string id;
    std::string title;
    std::string description;
    std::string hint;  ///< Target phrase shown to the learner
};

enum class CheckpointStatus {
    Pending,
    Current,
    Completed
};

const char* checkpoint_status_name(CheckpointStatus status);

struct Checkpoint {
    CheckpointDefinition definition;
    CheckpointStatus status = CheckpointStatus::Pending;
};

/**
 * @brief How completing a checkpoint ahead of the current one is handled
 *
 * Orphan: only the named checkpoint completes and the current pointer moves
 * past it, leaving skipped checkpoints pending until they are named.
 * Cascade: every checkpoint before the named one completes too.
 */
enum class OutOfOrderPolicy {
    Orphan,
    Cascade
};

OutOfOrderPolicy parse_out_of_order_policy(const std::string& name);

/**
 * @brief Ordered list of objectives with at most one current checkpoint
 *
 * Completing a checkpoint makes the first non-completed checkpoint after it
 * current; when there is none, no checkpoint is current. In-order completion
 * therefore keeps exactly one current until the last one completes.
 * Completion is monotonic until reset().
 */
class CheckpointMachine {
public:
    explicit CheckpointMachine(std::vector<CheckpointDefinition> definitions,
                               OutOfOrderPolicy policy = OutOfOrderPolicy::Orphan);

    /**
     * @brief Mark a checkpoint completed and advance the current pointer
     * @return True if the state changed. Unknown or already completed ids return false.
     */
    bool complete(const std::string& id);

    /// Index of the current checkpoint, or -1 when none is current
    int current_index() const;

    /// Every checkpoint completed
    bool all_complete() const;
    bool contains(const std::string& id) const;

    std::vector<Checkpoint> checkpoints() const;
    size_t size() const;
    size_t completed_count() const;

    /// Back to the initial state: first checkpoint current, rest pending
    void reset();

    OutOfOrderPolicy policy() const { return policy_; }

private:
    int find_index_locked(const std::string& id) const;
    void advance_current_locked(size_t completed);

    mutable std::mutex mutex_;
    std::vector<Checkpoint> checkpoints_;
    OutOfOrderPolicy policy_;
};

} // namespace orbion
