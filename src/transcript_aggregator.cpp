#include "transcript_aggregator.h"
#include "logger.h"

namespace orbion {

TranscriptTurn TranscriptAggregator::add_fragment(Role role, const std::string& fragment, bool is_final,
                                                  size_t* index, std::optional<TranscriptTurn>* closed) {
    TranscriptTurn turn;
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!turns_.empty() && !last_sealed_) {
            TranscriptTurn& last = turns_.back();
            if (last.role == role) {
                last.text += fragment;
                last.finalized = is_final;
                if (index) *index = turns_.size() - 1;
                return last;
            }
            // The other speaker took over, so the open turn is over
            if (!last.finalized) {
                last.finalized = true;
                if (closed) *closed = last;
            }
        }

        turn.role = role;
        turn.text = fragment;
        turn.finalized = is_final;
        turns_.push_back(turn);
        last_sealed_ = false;
        count = turns_.size();
        if (index) *index = count - 1;
    }
    LOG_TRANSCRIPT(std::string("New ") + role_name(role) + " turn #" + std::to_string(count));
    return turn;
}

bool TranscriptAggregator::complete_turn(TranscriptTurn* sealed, size_t* index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (turns_.empty()) {
        return false;
    }
    turns_.back().finalized = true;
    last_sealed_ = true;
    if (sealed) {
        *sealed = turns_.back();
    }
    if (index) {
        *index = turns_.size() - 1;
    }
    return true;
}

std::vector<TranscriptTurn> TranscriptAggregator::turns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_;
}

size_t TranscriptAggregator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.size();
}

void TranscriptAggregator::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    turns_.clear();
    last_sealed_ = false;
}

} // namespace orbion
