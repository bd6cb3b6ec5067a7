#include "capture_encoder.h"
#include "logger.h"
#include "pcm_codec.h"
#include "volume_meter.h"

namespace orbion {

CaptureEncoder::CaptureEncoder(IAudioSource& source, CaptureSettings settings)
    : source_(source), settings_(settings) {}

CaptureEncoder::~CaptureEncoder() {
    if (source_.is_open()) {
        auto closed = close();
        if (closed.is_error()) {
            Logger::warn("[Audio] Capture close failed: " + closed.error().message);
        }
    }
}

Result<void> CaptureEncoder::open() {
    auto opened = source_.open(settings_.sample_rate, settings_.block_samples);
    if (opened.is_error()) {
        // Every acquisition failure counts as an unavailable microphone
        return make_capture_error(opened.error().message);
    }
    LOG_AUDIO("Capture open: " + std::to_string(settings_.sample_rate) + " Hz, " +
              std::to_string(settings_.block_samples) + " samples per block");
    return Result<void>();
}

Result<void> CaptureEncoder::start(VolumeHandler on_volume, ChunkHandler on_chunk,
                                   DeviceErrorHandler on_error) {
    if (!source_.is_open()) {
        return make_error(ErrorType::InvalidState, "capture not open");
    }
    on_volume_ = std::move(on_volume);
    on_chunk_ = std::move(on_chunk);
    blocks_encoded_ = 0;
    return source_.start([this](const AudioFrame& block) { handle_block(block); },
                         std::move(on_error));
}

Result<void> CaptureEncoder::close() {
    auto closed = source_.close();
    on_volume_ = nullptr;
    on_chunk_ = nullptr;
    return closed;
}

void CaptureEncoder::handle_block(const AudioFrame& block) {
    if (on_volume_) {
        on_volume_(compute_volume(block, settings_.volume_gain));
    }
    if (on_chunk_) {
        on_chunk_(pcm::encode(block));
    }
    ++blocks_encoded_;
}

} // namespace orbion
