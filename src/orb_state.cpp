#include "orb_state.h"
#include "volume_meter.h"

namespace orbion {

const char* orb_state_name(OrbState state) {
    switch (state) {
        case OrbState::Idle: return "idle";
        case OrbState::Listening: return "listening";
        case OrbState::Speaking: return "speaking";
        case OrbState::Celebrating: return "celebrating";
    }
    return "unknown";
}

OrbStateTracker::OrbStateTracker(PresentationConfig config)
    : config_(config) {}

void OrbStateTracker::on_connected(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    intro_until_ = now + std::chrono::milliseconds(config_.intro_tip_ms);
}

void OrbStateTracker::on_volume(float level, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    expire_locked(now);
    level_ = clamp_volume(level);

    bool loud = level_ > config_.listening_threshold;
    if (loud && (state_ == OrbState::Idle || state_ == OrbState::Listening)) {
        state_ = OrbState::Listening;
    } else if (!loud && state_ == OrbState::Listening) {
        state_ = OrbState::Idle;
    }
}

void OrbStateTracker::on_playback(bool active, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    expire_locked(now);
    playing_ = active;
    if (state_ == OrbState::Celebrating) {
        return;
    }
    state_ = active ? OrbState::Speaking : OrbState::Idle;
}

void OrbStateTracker::on_checkpoint_completed(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = OrbState::Celebrating;
    celebration_until_ = now + std::chrono::milliseconds(config_.celebration_ms);
}

void OrbStateTracker::on_transcript(const TranscriptTurn& turn, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (turn.role == Role::User) {
        silence_armed_ = turn.finalized;
    }
    // Any update hides the tip and restarts the countdown
    silence_tip_at_ = now + std::chrono::milliseconds(config_.silence_tip_ms);
}

void OrbStateTracker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = OrbState::Idle;
    level_ = 0.0f;
    playing_ = false;
    silence_armed_ = false;
    celebration_until_ = TimePoint();
    intro_until_ = TimePoint();
}

OrbState OrbStateTracker::state(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    expire_locked(now);
    return state_;
}

std::string OrbStateTracker::tip(TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (silence_armed_ && now >= silence_tip_at_) {
        return SILENCE_TIP;
    }
    if (now < intro_until_) {
        return INTRO_TIP;
    }
    return "";
}

float OrbStateTracker::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void OrbStateTracker::expire_locked(TimePoint now) {
    if (state_ == OrbState::Celebrating && now >= celebration_until_) {
        state_ = playing_ ? OrbState::Speaking : OrbState::Idle;
    }
}

} // namespace orbion
