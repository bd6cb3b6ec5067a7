#include "checkpoint_machine.h"
#include "logger.h"

namespace orbion {

const char* checkpoint_status_name(CheckpointStatus status) {
    switch (status) {
        case CheckpointStatus::Pending: return "pending";
        case CheckpointStatus::Current: return "current";
        case CheckpointStatus::Completed: return "completed";
    }
    return "unknown";
}

OutOfOrderPolicy parse_out_of_order_policy(const std::string& name) {
    if (name == "cascade") {
        return OutOfOrderPolicy::Cascade;
    }
    if (name != "orphan" && !name.empty()) {
        Logger::warn("Unknown checkpoint policy '" + name + "', using orphan");
    }
    return OutOfOrderPolicy::Orphan;
}

CheckpointMachine::CheckpointMachine(std::vector<CheckpointDefinition> definitions,
                                     OutOfOrderPolicy policy)
    : policy_(policy) {
    checkpoints_.reserve(definitions.size());
    for (auto& def : definitions) {
        Checkpoint cp;
        cp.definition = std::move(def);
        checkpoints_.push_back(std::move(cp));
    }
    if (!checkpoints_.empty()) {
        checkpoints_.front().status = CheckpointStatus::Current;
    }
}

bool CheckpointMachine::complete(const std::string& id) {
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int idx = find_index_locked(id);
        if (idx >= 0) {
            known = true;
            if (checkpoints_[idx].status == CheckpointStatus::Completed) {
                return false;
            }
            if (policy_ == OutOfOrderPolicy::Cascade) {
                for (int i = 0; i < idx; ++i) {
                    checkpoints_[i].status = CheckpointStatus::Completed;
                }
            }
            checkpoints_[idx].status = CheckpointStatus::Completed;
            advance_current_locked(static_cast<size_t>(idx));
        }
    }

    if (!known) {
        Logger::warn("[Checkpoint] Ignoring unknown checkpoint '" + id + "'");
        return false;
    }
    LOG_CHECKPOINT("Completed '" + id + "'");
    return true;
}

int CheckpointMachine::current_index() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < checkpoints_.size(); ++i) {
        if (checkpoints_[i].status == CheckpointStatus::Current) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

bool CheckpointMachine::all_complete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& cp : checkpoints_) {
        if (cp.status != CheckpointStatus::Completed) return false;
    }
    return true;
}

bool CheckpointMachine::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_index_locked(id) >= 0;
}

std::vector<Checkpoint> CheckpointMachine::checkpoints() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return checkpoints_;
}

size_t CheckpointMachine::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return checkpoints_.size();
}

size_t CheckpointMachine::completed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& cp : checkpoints_) {
        if (cp.status == CheckpointStatus::Completed) ++count;
    }
    return count;
}

void CheckpointMachine::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& cp : checkpoints_) {
        cp.status = CheckpointStatus::Pending;
    }
    if (!checkpoints_.empty()) {
        checkpoints_.front().status = CheckpointStatus::Current;
    }
}

int CheckpointMachine::find_index_locked(const std::string& id) const {
    for (size_t i = 0; i < checkpoints_.size(); ++i) {
        if (checkpoints_[i].definition.id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

void CheckpointMachine::advance_current_locked(size_t completed) {
    // A skipped current checkpoint falls back to pending
    for (auto& cp : checkpoints_) {
        if (cp.status == CheckpointStatus::Current) {
            cp.status = CheckpointStatus::Pending;
        }
    }
    for (size_t i = completed + 1; i < checkpoints_.size(); ++i) {
        if (checkpoints_[i].status != CheckpointStatus::Completed) {
            checkpoints_[i].status = CheckpointStatus::Current;
            return;
        }
    }
}

} // namespace orbion
