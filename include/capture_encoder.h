#pragma once

#include "audio_device.h"
#include "common.h"
#include "errors.h"
#include <atomic>
#include <functional>

namespace orbion {

/**
 * @brief Capture settings
 */
struct CaptureSettings {
    int sample_rate = INPUT_SAMPLE_RATE;
    size_t block_samples = CAPTURE_BLOCK_SAMPLES;
    float volume_gain = VOLUME_GAIN;
};

/**
 * @brief Microphone front end: per block loudness plus PCM16 encoding
 *
 * For every block the source delivers, the volume handler runs first and
 * the chunk handler second, both on the capture delivery thread and in
 * capture order.
 */
class CaptureEncoder {
public:
    using VolumeHandler = std::function<void(float level)>;
    using ChunkHandler = std::function<void(const PcmBytes& pcm)>;

    CaptureEncoder(IAudioSource& source, CaptureSettings settings = CaptureSettings());
    ~CaptureEncoder();

    CaptureEncoder(const CaptureEncoder&) = delete;
    CaptureEncoder& operator=(const CaptureEncoder&) = delete;

    /**
     * @brief Acquire the capture device
     * @return CaptureUnavailable before any block is produced if that fails
     */
    Result<void> open();

    Result<void> start(VolumeHandler on_volume, ChunkHandler on_chunk, DeviceErrorHandler on_error);

    /// Release the device; no handler runs after this returns
    Result<void> close();

    bool is_open() const { return source_.is_open(); }

    uint64_t blocks_encoded() const { return blocks_encoded_; }

    const CaptureSettings& settings() const { return settings_; }

private:
    void handle_block(const AudioFrame& block);

    IAudioSource& source_;
    CaptureSettings settings_;
    VolumeHandler on_volume_;
    ChunkHandler on_chunk_;
    std::atomic<uint64_t> blocks_encoded_{0};
};

} // namespace orbion
