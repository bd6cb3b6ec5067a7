#include "session_events.h"
#include "logger.h"
#include <vector>

namespace orbion {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Connecting: return "Connecting";
        case SessionState::Connected: return "Connected";
        case SessionState::Closing: return "Closing";
    }
    return "Unknown";
}

SubscriptionId EventDispatcher::subscribe(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    handlers_[id] = std::move(handler);
    return id;
}

void EventDispatcher::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
}

void EventDispatcher::publish(const SessionEvent& event) {
    std::vector<EventHandler> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(handlers_.size());
        for (const auto& [id, handler] : handlers_) {
            targets.push_back(handler);
        }
    }
    for (const auto& handler : targets) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            Logger::error(std::string("Event handler threw: ") + e.what());
        }
    }
}

void EventDispatcher::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
}

} // namespace orbion
