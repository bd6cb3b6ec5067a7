#pragma once

/**
 * @file pcm_codec.h
 * @brief Wire audio format: float samples <-> little-endian PCM16, and base64 transport encoding
 */

#include "common.h"
#include "errors.h"
#include <string>

namespace orbion {
namespace pcm {

/**
 * @brief Reformat float samples to little-endian signed 16-bit PCM
 *
 * Samples are clamped to [-1, 1]; negative values scale by 32768 and
 * positive values by 32767. No resampling, no compression.
 */
PcmBytes encode(const Sample* samples, size_t count);

inline PcmBytes encode(const AudioFrame& frame) {
    return encode(frame.data(), frame.size());
}

/**
 * @brief Decode little-endian signed 16-bit PCM to float samples
 * @return Samples, or DecodeFailure when the byte count is odd
 */
Result<AudioFrame> decode(const PcmBytes& bytes);

/// Base64-encode arbitrary bytes (mbedTLS)
std::string base64_encode(const std::string& bytes);

/**
 * @brief Base64-decode a payload
 * @return Bytes, or DecodeFailure on invalid characters or padding
 */
Result<std::string> base64_decode(const std::string& text);

/// Duration in seconds of @p sample_count mono samples at @p sample_rate
inline double duration_seconds(size_t sample_count, int sample_rate) {
    return sample_rate > 0 ? static_cast<double>(sample_count) / sample_rate : 0.0;
}

} // namespace pcm
} // namespace orbion
