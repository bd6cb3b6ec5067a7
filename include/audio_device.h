#pragma once

/**
 * @file audio_device.h
 * @brief Capture and output capability interfaces
 *
 * The session core talks to audio hardware only through these interfaces,
 * so it can run against PortAudio devices or test fakes.
 */

#include "common.h"
#include "errors.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace orbion {

/**
 * @brief Decoded block of output audio, owned by the playback path until it finishes
 */
struct PlaybackBuffer {
    AudioFrame samples;
    int sample_rate = OUTPUT_SAMPLE_RATE;

    /// Duration in seconds
    double duration() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

/// Opaque handle of a scheduled buffer
using BufferHandle = uint64_t;

/// Called once per captured block, in capture order
using BlockHandler = std::function<void(const AudioFrame&)>;

/// Called when a device fails after it was started
using DeviceErrorHandler = std::function<void(const std::string&)>;

/// Called when a scheduled buffer has finished playing
using CompletionHandler = std::function<void(BufferHandle)>;

/**
 * @brief Abstract microphone interface
 */
class IAudioSource {
public:
    virtual ~IAudioSource() = default;

    /**
     * @brief Acquire the capture device exclusively
     * @param sample_rate Capture rate in Hz
     * @param block_samples Samples per delivered block
     * @return CaptureUnavailable if the device or permission is missing
     */
    virtual Result<void> open(int sample_rate, size_t block_samples) = 0;

    /**
     * @brief Start delivering blocks
     * @param on_block Receives each block in capture order
     * @param on_error Receives mid-stream device loss
     */
    virtual Result<void> start(BlockHandler on_block, DeviceErrorHandler on_error) = 0;

    /**
     * @brief Stop capture, release the device and drop all handler registrations
     *
     * After close() returns no handler is invoked again. Idempotent.
     */
    virtual Result<void> close() = 0;

    virtual bool is_open() const = 0;
};

/**
 * @brief Abstract output interface with an explicit timeline
 */
class IAudioSink {
public:
    virtual ~IAudioSink() = default;

    /**
     * @brief Acquire the output device
     * @return OutputUnavailable on failure
     */
    virtual Result<void> open(int sample_rate, int channels) = 0;

    /**
     * @brief Current output clock in seconds since open()
     */
    virtual double now() const = 0;

    /**
     * @brief Schedule a buffer to start at @p start_at seconds on the output clock
     */
    virtual Result<void> schedule(BufferHandle handle,
                                  std::shared_ptr<const PlaybackBuffer> buffer,
                                  double start_at) = 0;

    /**
     * @brief Register the completion handler (empty function clears it)
     */
    virtual void set_completion_handler(CompletionHandler handler) = 0;

    /**
     * @brief Stop output, discard scheduled buffers and clear the completion handler. Idempotent.
     */
    virtual Result<void> close() = 0;

    virtual bool is_open() const = 0;
};

} // namespace orbion
