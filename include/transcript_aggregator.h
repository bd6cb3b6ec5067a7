#pragma once

#include "common.h"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace orbion {

/**
 * @brief Contiguous run of transcript text attributed to one speaker
 */
struct TranscriptTurn {
    Role role = Role::User;
    std::string text;
    bool finalized = false;
};

/**
 * @brief Merges streaming transcription fragments into per-speaker turns
 *
 * A fragment whose role matches the last turn is appended to it and the
 * turn's finalized flag takes the fragment's value. A different role, or a
 * turn sealed by complete_turn(), starts a new turn; a role change also
 * finalizes the turn it leaves behind.
 *
 * Thread-safe; every method returns copies.
 */
class TranscriptAggregator {
public:
    /**
     * @brief Merge one fragment
     * @param index Receives the position of the turn in turns()
     * @param closed Receives the previous turn when this fragment finalized it
     *               (its position is *index - 1)
     * @return The created or updated turn
     */
    TranscriptTurn add_fragment(Role role, const std::string& fragment, bool is_final,
                                size_t* index = nullptr, std::optional<TranscriptTurn>* closed = nullptr);

    /**
     * @brief Finalize the last turn and force the next fragment to open a new one
     * @param sealed Receives the sealed turn, when there is one
     * @param index Receives its position in turns()
     * @return True if a turn existed
     */
    bool complete_turn(TranscriptTurn* sealed = nullptr, size_t* index = nullptr);

    std::vector<TranscriptTurn> turns() const;
    size_t size() const;

    /// Drop all turns (session reset)
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<TranscriptTurn> turns_;
    bool last_sealed_ = false;
};

} // namespace orbion
