#pragma once

#include "checkpoint_machine.h"
#include "common.h"
#include <string>
#include <vector>

namespace orbion {

struct AudioConfig {
    /// "default", a device index, or an exact device name
    std::string input_device = "default";
    std::string output_device = "default";
    int input_sample_rate = INPUT_SAMPLE_RATE;
    int output_sample_rate = OUTPUT_SAMPLE_RATE;
    int capture_block_samples = CAPTURE_BLOCK_SAMPLES;
    float volume_gain = VOLUME_GAIN;
};

struct LiveConfig {
    std::string endpoint =
        "wss://generativelanguage.googleapis.com/ws/"
        "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";
    std::string api_key;                        ///< Empty = read from api_key_env
    std::string api_key_env = "GEMINI_API_KEY";
    std::string model = "models/gemini-2.5-flash-native-audio-preview-12-2025";
    std::string voice_name = "Zephyr";
    int connect_timeout_ms = 10000;
    int setup_timeout_ms = 10000;  ///< Wait for setupComplete

    /// api_key, or the environment variable when api_key is empty
    std::string resolved_api_key() const;

    /// Endpoint with the key query parameter appended
    std::string url() const;
};

struct ScenarioConfig {
    std::string file;  ///< Optional scenario JSON; overrides the inline fields below
    std::string name;
    std::string system_prompt;
    std::vector<CheckpointDefinition> checkpoints;

    /// system_prompt, or a generic tutor prompt listing the checkpoints when it is empty
    std::string effective_system_prompt() const;
};

struct CheckpointsConfig {
    std::string out_of_order = "orphan";  ///< "orphan" | "cascade"
};

struct PresentationConfig {
    int celebration_ms = CELEBRATION_MS;
    int silence_tip_ms = SILENCE_TIP_MS;
    int intro_tip_ms = INTRO_TIP_MS;
    float listening_threshold = 0.1f;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    AudioConfig audio;
    LiveConfig live;
    ScenarioConfig scenario;
    CheckpointsConfig checkpoints;
    PresentationConfig presentation;
    LoggingConfig logging;

    /// Missing file or keys fall back to defaults; parse errors are logged
    static Config load_from_file(const std::string& path);
    bool save_to_file(const std::string& path) const;

    /// "Café in Paris": greet, order_drink, ask_bill, farewell
    static ScenarioConfig default_scenario();

    /**
     * @brief Load a scenario file ({name, system_prompt, checkpoints})
     * @return false if the file is missing, unparsable or has no checkpoints
     */
    static bool load_scenario_file(const std::string& path, ScenarioConfig& scenario);
};

} // namespace orbion
