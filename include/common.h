#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>

namespace orbion {

// Audio types
using Sample = float;                    ///< Normalized sample in [-1, 1]
using AudioFrame = std::vector<Sample>;  ///< One capture block
using PcmBytes = std::string;            ///< Little-endian 16-bit signed PCM

// Timing
using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

// Audio format constants
constexpr int INPUT_SAMPLE_RATE = 16000;
constexpr int OUTPUT_SAMPLE_RATE = 24000;
constexpr int AUDIO_CHANNELS = 1;
constexpr int CAPTURE_BLOCK_SAMPLES = 4096;  // ~256 ms @ 16kHz

// Loudness
constexpr float VOLUME_GAIN = 5.0f;

// Presentation timing contract
constexpr int CELEBRATION_MS = 2500;
constexpr int SILENCE_TIP_MS = 10000;
constexpr int INTRO_TIP_MS = 5000;

/// Speaker attribution of a transcript fragment
enum class Role {
    User,
    Assistant
};

inline const char* role_name(Role role) {
    return role == Role::User ? "user" : "assistant";
}

} // namespace orbion
