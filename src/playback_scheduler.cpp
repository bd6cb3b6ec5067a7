#include "playback_scheduler.h"
#include "logger.h"
#include "pcm_codec.h"
#include <algorithm>

namespace orbion {

PlaybackScheduler::PlaybackScheduler(IAudioSink& sink, int sample_rate)
    : sink_(sink), sample_rate_(sample_rate) {}

PlaybackScheduler::~PlaybackScheduler() {
    detach();
}

void PlaybackScheduler::set_activity_handler(ActivityHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    on_activity_ = std::move(handler);
}

void PlaybackScheduler::attach() {
    sink_.set_completion_handler([this](BufferHandle handle) {
        on_buffer_complete(handle);
    });
}

void PlaybackScheduler::detach() {
    sink_.set_completion_handler(CompletionHandler());
}

Result<ScheduledBuffer> PlaybackScheduler::enqueue_pcm(const PcmBytes& pcm) {
    auto decoded = pcm::decode(pcm);
    if (decoded.is_error()) {
        return decoded.error();
    }
    auto buffer = std::make_shared<PlaybackBuffer>();
    buffer->samples = std::move(decoded.value());
    buffer->sample_rate = sample_rate_;
    return enqueue(buffer);
}

Result<ScheduledBuffer> PlaybackScheduler::enqueue(std::shared_ptr<const PlaybackBuffer> buffer) {
    if (!buffer || buffer->samples.empty()) {
        return make_decode_error("empty audio chunk");
    }

    ScheduledBuffer slot;
    slot.duration = buffer->duration();
    double now = sink_.now();
    {
        std::lock_guard<std::mutex> signal_lock(signal_mutex_);
        bool became_active = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            slot.handle = next_handle_++;
            slot.start_at = std::max(next_start_time_, now);
            next_start_time_ = slot.start_at + slot.duration;
            became_active = active_.empty();
            active_[slot.handle] = buffer;
        }
        if (became_active) {
            notify(true);
        }
    }

    auto scheduled = sink_.schedule(slot.handle, buffer, slot.start_at);
    if (scheduled.is_error()) {
        std::lock_guard<std::mutex> signal_lock(signal_mutex_);
        bool became_idle = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_.erase(slot.handle);
            // Give the slot back if nothing was queued behind it
            if (next_start_time_ == slot.start_at + slot.duration) {
                next_start_time_ = slot.start_at;
            }
            became_idle = active_.empty();
        }
        if (became_idle) {
            notify(false);
        }
        return scheduled.error();
    }

    LOG_PLAYBACK("Scheduled #" + std::to_string(slot.handle) + " at " + std::to_string(slot.start_at) +
                 "s for " + std::to_string(slot.duration) + "s");
    return slot;
}

void PlaybackScheduler::on_buffer_complete(BufferHandle handle) {
    std::lock_guard<std::mutex> signal_lock(signal_mutex_);
    bool became_idle = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_.erase(handle) == 0) {
            return;
        }
        became_idle = active_.empty();
    }
    if (became_idle) {
        LOG_PLAYBACK("All scheduled audio finished");
        notify(false);
    }
}

double PlaybackScheduler::next_start_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_start_time_;
}

size_t PlaybackScheduler::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

void PlaybackScheduler::reset() {
    std::lock_guard<std::mutex> signal_lock(signal_mutex_);
    bool was_active = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_active = !active_.empty();
        active_.clear();
        next_start_time_ = 0.0;
    }
    if (was_active) {
        notify(false);
    }
}

void PlaybackScheduler::notify(bool active) {
    ActivityHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = on_activity_;
    }
    if (handler) {
        handler(active);
    }
}

} // namespace orbion
