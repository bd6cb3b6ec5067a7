#pragma once

#include "audio_device.h"
#include <string>
#include <memory>

namespace orbion {

/**
 * @brief Microphone capture using PortAudio
 *
 * Opens a mono float32 input stream that delivers fixed-size blocks.
 *
 * Thread Safety:
 * - The PortAudio callback only copies blocks into a bounded queue
 * - A dedicated delivery thread pops blocks and invokes the block handler in order
 * - close() joins the delivery thread, so no handler runs after it returns
 */
class PortAudioSource : public IAudioSource {
public:
    /**
     * @param device_name Device name, numeric index, or "default"
     */
    explicit PortAudioSource(const std::string& device_name = "default");
    ~PortAudioSource() override;

    // Non-copyable
    PortAudioSource(const PortAudioSource&) = delete;
    PortAudioSource& operator=(const PortAudioSource&) = delete;

    Result<void> open(int sample_rate, size_t block_samples) override;
    Result<void> start(BlockHandler on_block, DeviceErrorHandler on_error) override;
    Result<void> close() override;
    bool is_open() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Scheduled playback using PortAudio
 *
 * The output clock counts frames rendered by the stream. Scheduled buffers
 * are mixed into the stream at their start frame; finished buffers are
 * reported from a notifier thread rather than the realtime callback.
 */
class PortAudioSink : public IAudioSink {
public:
    explicit PortAudioSink(const std::string& device_name = "default");
    ~PortAudioSink() override;

    PortAudioSink(const PortAudioSink&) = delete;
    PortAudioSink& operator=(const PortAudioSink&) = delete;

    Result<void> open(int sample_rate, int channels) override;
    double now() const override;
    Result<void> schedule(BufferHandle handle,
                          std::shared_ptr<const PlaybackBuffer> buffer,
                          double start_at) override;
    void set_completion_handler(CompletionHandler handler) override;
    Result<void> close() override;
    bool is_open() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

namespace audio_devices {

/**
 * @brief List all available audio devices to the log
 */
void list_devices();

} // namespace audio_devices

} // namespace orbion
