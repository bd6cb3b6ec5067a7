#pragma once

#include "common.h"
#include <cstddef>

namespace orbion {

/**
 * @brief Instantaneous loudness of a block of samples
 *
 * Root-mean-square of the samples multiplied by @p gain. The result is
 * non-negative but unbounded above; consumers clamp it before use.
 * An empty block has volume 0.
 */
float compute_volume(const Sample* samples, size_t count, float gain = VOLUME_GAIN);

inline float compute_volume(const AudioFrame& frame, float gain = VOLUME_GAIN) {
    return compute_volume(frame.data(), frame.size(), gain);
}

/// Clamp a volume estimate to [0, 1] for display
float clamp_volume(float volume);

} // namespace orbion
