#pragma once

#include "audio_device.h"
#include "common.h"
#include "errors.h"
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace orbion {

/**
 * @brief Where a buffer landed on the output timeline
 */
struct ScheduledBuffer {
    BufferHandle handle = 0;
    double start_at = 0.0;
    double duration = 0.0;
};

/**
 * @brief Gapless, non-overlapping scheduling of decoded output chunks
 *
 * Each buffer starts at max(next_start_time, sink clock) and pushes
 * next_start_time forward by its duration. Scheduled buffers are kept in a
 * counted registry until the sink reports completion; the activity handler
 * fires with true when the count leaves zero and false when it returns to zero.
 * Count changes and their signals are serialized, so handlers see the
 * crossings in the order they happened. A handler must not call back into
 * enqueue(), on_buffer_complete() or reset().
 */
class PlaybackScheduler {
public:
    using ActivityHandler = std::function<void(bool active)>;

    explicit PlaybackScheduler(IAudioSink& sink, int sample_rate = OUTPUT_SAMPLE_RATE);
    ~PlaybackScheduler();

    PlaybackScheduler(const PlaybackScheduler&) = delete;
    PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

    void set_activity_handler(ActivityHandler handler);

    /// Register with the sink for completion notifications
    void attach();

    /// Stop receiving completion notifications
    void detach();

    /**
     * @brief Decode a 16-bit PCM chunk and schedule it
     * @return DecodeFailure for malformed data; the timeline is untouched in that case
     */
    Result<ScheduledBuffer> enqueue_pcm(const PcmBytes& pcm);

    Result<ScheduledBuffer> enqueue(std::shared_ptr<const PlaybackBuffer> buffer);

    /// Sink completion callback
    void on_buffer_complete(BufferHandle handle);

    double next_start_time() const;
    size_t active_count() const;

    /**
     * @brief Forget every tracked buffer and rewind the timeline
     *
     * Signals idle if buffers were still active.
     */
    void reset();

private:
    void notify(bool active);

    IAudioSink& sink_;
    int sample_rate_;

    mutable std::mutex mutex_;
    double next_start_time_ = 0.0;
    BufferHandle next_handle_ = 1;
    std::unordered_map<BufferHandle, std::shared_ptr<const PlaybackBuffer>> active_;

    // Held from a count change until its signal has been delivered
    std::mutex signal_mutex_;

    std::mutex handler_mutex_;
    ActivityHandler on_activity_;
};

} // namespace orbion
