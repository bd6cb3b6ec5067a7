#pragma once

#include "common.h"
#include "config.h"
#include "transcript_aggregator.h"
#include <mutex>
#include <string>

namespace orbion {

/**
 * @brief Visible state of the tutor orb
 */
enum class OrbState {
    Idle,
    Listening,
    Speaking,
    Celebrating
};

const char* orb_state_name(OrbState state);

/**
 * @brief Derives the orb state and the on-screen tip from session events
 *
 * A celebration lasts celebration_ms and then falls back to Speaking or
 * Idle depending on playback.
 *
 * All methods take the current time so the tracker can be driven by a test
 * clock. Thread-safe.
 */
class OrbStateTracker {
public:
    static constexpr const char* SILENCE_TIP = "Don't be shy! Try reading the hint if you're stuck.";
    static constexpr const char* INTRO_TIP = "Speak naturally. The orb will start the conversation.";

    explicit OrbStateTracker(PresentationConfig config = PresentationConfig());

    /// Session connected: show the intro tip
    void on_connected(TimePoint now);

    /// Raw (unclamped) capture loudness
    void on_volume(float level, TimePoint now);
    void on_playback(bool active, TimePoint now);
    void on_checkpoint_completed(TimePoint now);

    /**
     * @brief A finalized user turn arms the silence tip, a partial one disarms it
     *
     * While armed, the tip shows once silence_tip_ms pass without transcript
     * activity; every update hides it and restarts the countdown.
     */
    void on_transcript(const TranscriptTurn& turn, TimePoint now);

    /// Back to Idle with no tip
    void reset();

    /// State at @p now, after ending a celebration that has run its course
    OrbState state(TimePoint now);

    /// Tip to show at @p now, empty for none
    std::string tip(TimePoint now) const;

    /// Last loudness clamped to [0, 1]
    float level() const;

private:
    void expire_locked(TimePoint now);

    PresentationConfig config_;
    mutable std::mutex mutex_;
    OrbState state_ = OrbState::Idle;
    float level_ = 0.0f;
    bool playing_ = false;

    TimePoint celebration_until_{};
    bool silence_armed_ = false;
    TimePoint silence_tip_at_{};
    TimePoint intro_until_{};
};

} // namespace orbion
