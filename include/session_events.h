#pragma once

/**
 * @file session_events.h
 * @brief Typed events the session core publishes to the presentation layer
 */

#include "errors.h"
#include "transcript_aggregator.h"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <variant>

namespace orbion {

/**
 * @brief Session lifecycle: Disconnected -> Connecting -> Connected -> Closing -> Disconnected
 */
enum class SessionState {
    Disconnected,
    Connecting,
    Connected,
    Closing
};

const char* session_state_name(SessionState state);

/// Raw loudness of the last capture block (unclamped)
struct VolumeChanged {
    float level = 0.0f;
};

/// Playback went from idle to active or back
struct PlaybackActiveChanged {
    bool active = false;
};

struct CheckpointCompleted {
    std::string id;
    bool all_complete = false;  ///< Every checkpoint is completed
};

struct TranscriptUpdated {
    TranscriptTurn turn;
    size_t index = 0;  ///< Position of the turn in the session transcript
};

struct FatalError {
    Error error;
};

struct SessionStateChanged {
    SessionState state = SessionState::Disconnected;
};

using SessionEvent = std::variant<VolumeChanged,
                                  PlaybackActiveChanged,
                                  CheckpointCompleted,
                                  TranscriptUpdated,
                                  FatalError,
                                  SessionStateChanged>;

using EventHandler = std::function<void(const SessionEvent&)>;
using SubscriptionId = uint64_t;

/**
 * @brief Single typed channel between the core and its subscribers
 *
 * publish() delivers synchronously on the calling thread (capture, network
 * or playback-completion thread). Handlers must not block.
 */
class EventDispatcher {
public:
    SubscriptionId subscribe(EventHandler handler);
    void unsubscribe(SubscriptionId id);

    void publish(const SessionEvent& event);

    /// Remove every subscription
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, EventHandler> handlers_;
    SubscriptionId next_id_ = 1;
};

} // namespace orbion
