#include "volume_meter.h"
#include <algorithm>
#include <cmath>

namespace orbion {

float compute_volume(const Sample* samples, size_t count, float gain) {
    if (!samples || count == 0) {
        return 0.0f;
    }
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        double s = samples[i];
        sum += s * s;
    }
    double rms = std::sqrt(sum / static_cast<double>(count));
    return static_cast<float>(rms) * gain;
}

float clamp_volume(float volume) {
    if (!(volume > 0.0f)) return 0.0f;  // also catches NaN
    return std::min(volume, 1.0f);
}

} // namespace orbion
