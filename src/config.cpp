#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

const char* DEFAULT_SYSTEM_PROMPT = R"(You are Orbion, a glowing AI tutor for French conversation.

SCENARIO: Ordering at a Café in Paris.

OBJECTIVES (Track these in order):
1. "greet": The user must greet you (the waiter).
2. "order_drink": The user must order a coffee or drink.
3. "ask_bill": The user must ask for the check/bill.
4. "farewell": The user must say goodbye.

BEHAVIOR:
- Primary Role: Friendly Parisian waiter.
- Secondary Role: Supportive Tutor.

ADAPTIVITY IS KEY:
- If the user is doing well: Stay in character as the waiter, speak mostly French, and challenge them slightly.
- If the user struggles/stumbles: Break character gently to become the Tutor. Explain the concept in English, break down the pronunciation, or offer the specific French phrase they need. Then, prompt them to try saying it again.

CONVERSATIONAL STYLE:
- Be natural, not rigid. Allow for small talk (weather, mood) if the user initiates it.
- Do not force the user to "pass a test". Make it feel like a chat.
- If they veer off topic, engage briefly, then gently steer them back to the scenario.

PROGRESS:
- When the user satisfies the CURRENT objective naturally, call 'markCheckpointComplete(checkpointId)'.
- Do not acknowledge future objectives until the current one is done.)";

std::string config_dir_of(const std::string& path) {
    std::string::size_type pos = path.find_last_of("/\\");
    if (pos == std::string::npos) return "";
    return path.substr(0, pos + 1);
}

/// ~ expansion, then relative paths resolved against @p base_dir
std::string resolve_relative(const std::string& path, const std::string& base_dir) {
    std::string expanded = orbion::expand_path(path);
    if (expanded.empty() || expanded[0] == '/' || base_dir.empty()) {
        return expanded;
    }
    return base_dir + expanded;
}

std::string device_field(const json& j) {
    if (j.is_number_integer()) return std::to_string(j.get<int>());
    return j.get<std::string>();
}

bool parse_checkpoints(const json& list, std::vector<orbion::CheckpointDefinition>& out) {
    if (!list.is_array()) return false;
    std::vector<orbion::CheckpointDefinition> parsed;
    for (const auto& item : list) {
        if (!item.is_object() || !item.contains("id") || !item["id"].is_string()) {
            orbion::Logger::warn("Skipping checkpoint without an id");
            continue;
        }
        orbion::CheckpointDefinition def;
        def.id = item["id"].get<std::string>();
        def.title = item.value("title", def.id);
        def.description = item.value("description", "");
        def.hint = item.value("hint", "");
        parsed.push_back(std::move(def));
    }
    if (parsed.empty()) return false;
    out = std::move(parsed);
    return true;
}

void apply_json_to_config(orbion::Config& cfg, const json& j) {
    if (j.contains("audio")) {
        auto& a = j["audio"];
        if (a.contains("input_device")) cfg.audio.input_device = device_field(a["input_device"]);
        if (a.contains("output_device")) cfg.audio.output_device = device_field(a["output_device"]);
        if (a.contains("input_sample_rate")) cfg.audio.input_sample_rate = a["input_sample_rate"].get<int>();
        if (a.contains("output_sample_rate")) cfg.audio.output_sample_rate = a["output_sample_rate"].get<int>();
        if (a.contains("capture_block_samples"))
            cfg.audio.capture_block_samples = a["capture_block_samples"].get<int>();
        if (a.contains("volume_gain")) cfg.audio.volume_gain = a["volume_gain"].get<float>();
    }

    if (j.contains("live")) {
        auto& l = j["live"];
        if (l.contains("endpoint")) cfg.live.endpoint = l["endpoint"].get<std::string>();
        if (l.contains("api_key")) cfg.live.api_key = l["api_key"].get<std::string>();
        if (l.contains("api_key_env")) cfg.live.api_key_env = l["api_key_env"].get<std::string>();
        if (l.contains("model")) cfg.live.model = l["model"].get<std::string>();
        if (l.contains("voice_name")) cfg.live.voice_name = l["voice_name"].get<std::string>();
        if (l.contains("connect_timeout_ms")) cfg.live.connect_timeout_ms = l["connect_timeout_ms"].get<int>();
        if (l.contains("setup_timeout_ms")) cfg.live.setup_timeout_ms = l["setup_timeout_ms"].get<int>();
    }

    if (j.contains("scenario")) {
        auto& s = j["scenario"];
        if (s.contains("file")) cfg.scenario.file = s["file"].get<std::string>();
        if (s.contains("name")) cfg.scenario.name = s["name"].get<std::string>();
        if (s.contains("system_prompt")) cfg.scenario.system_prompt = s["system_prompt"].get<std::string>();
        if (s.contains("checkpoints") && !parse_checkpoints(s["checkpoints"], cfg.scenario.checkpoints)) {
            orbion::Logger::warn("Inline scenario has no usable checkpoints; keeping defaults");
        }
    }

    if (j.contains("checkpoints")) {
        auto& c = j["checkpoints"];
        if (c.contains("out_of_order")) cfg.checkpoints.out_of_order = c["out_of_order"].get<std::string>();
    }

    if (j.contains("presentation")) {
        auto& p = j["presentation"];
        if (p.contains("celebration_ms")) cfg.presentation.celebration_ms = p["celebration_ms"].get<int>();
        if (p.contains("silence_tip_ms")) cfg.presentation.silence_tip_ms = p["silence_tip_ms"].get<int>();
        if (p.contains("intro_tip_ms")) cfg.presentation.intro_tip_ms = p["intro_tip_ms"].get<int>();
        if (p.contains("listening_threshold"))
            cfg.presentation.listening_threshold = p["listening_threshold"].get<float>();
    }

    if (j.contains("logging")) {
        auto& g = j["logging"];
        if (g.contains("level")) cfg.logging.level = g["level"].get<std::string>();
        if (g.contains("file")) cfg.logging.file = g["file"].get<std::string>();
    }
}

} // anonymous namespace

namespace orbion {

std::string LiveConfig::resolved_api_key() const {
    if (!api_key.empty()) return api_key;
    if (api_key_env.empty()) return "";
    const char* env = std::getenv(api_key_env.c_str());
    return env ? std::string(env) : std::string();
}

std::string LiveConfig::url() const {
    std::string key = resolved_api_key();
    if (key.empty()) return endpoint;
    char sep = endpoint.find('?') == std::string::npos ? '?' : '&';
    return endpoint + sep + "key=" + key;
}

std::string ScenarioConfig::effective_system_prompt() const {
    if (!system_prompt.empty()) return system_prompt;

    std::string prompt = "You are Orbion, a friendly AI language tutor.\n\nSCENARIO: " + name +
                         ".\n\nOBJECTIVES (Track these in order):\n";
    for (size_t i = 0; i < checkpoints.size(); ++i) {
        const auto& cp = checkpoints[i];
        prompt += std::to_string(i + 1) + ". \"" + cp.id + "\": " + cp.description + "\n";
    }
    prompt += "\nPROGRESS:\n"
              "- When the user satisfies the CURRENT objective naturally, call "
              "'markCheckpointComplete(checkpointId)'.\n"
              "- Do not acknowledge future objectives until the current one is done.";
    return prompt;
}

ScenarioConfig Config::default_scenario() {
    ScenarioConfig s;
    s.name = "Café in Paris";
    s.system_prompt = DEFAULT_SYSTEM_PROMPT;
    s.checkpoints = {
        {"greet", "The Encounter", "Greet the waiter at the café", "Bonjour !"},
        {"order_drink", "The Order", "Order a coffee (or another drink)", "Je voudrais un café, s'il vous plaît."},
        {"ask_bill", "The Bill", "Ask for the check", "L'addition, s'il vous plaît."},
        {"farewell", "Farewell", "Say goodbye politely", "Merci, au revoir !"},
    };
    return s;
}

bool Config::load_scenario_file(const std::string& path, ScenarioConfig& scenario) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open scenario file: " + path);
        return false;
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        Logger::error("Error parsing scenario file " + path + ": " + e.what());
        return false;
    }

    ScenarioConfig loaded;
    loaded.file = scenario.file;
    try {
        if (j.contains("name")) loaded.name = j["name"].get<std::string>();
        if (j.contains("system_prompt")) loaded.system_prompt = j["system_prompt"].get<std::string>();
        if (!j.contains("checkpoints") || !parse_checkpoints(j["checkpoints"], loaded.checkpoints)) {
            Logger::warn("Scenario file " + path + " has no checkpoints");
            return false;
        }
    } catch (const json::exception& e) {
        Logger::error("Invalid scenario file " + path + ": " + e.what());
        return false;
    }

    scenario = std::move(loaded);
    Logger::info("Loaded scenario \"" + scenario.name + "\" (" +
                 std::to_string(scenario.checkpoints.size()) + " checkpoints)");
    return true;
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;
    cfg.scenario = default_scenario();

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
        return cfg;
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()));
        return cfg;
    }

    try {
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        Logger::error("Invalid value in config " + path + ": " + e.what());
        Config fallback;
        fallback.scenario = default_scenario();
        return fallback;
    }

    if (!cfg.scenario.file.empty()) {
        std::string scenario_path = resolve_relative(cfg.scenario.file, config_dir_of(path));
        if (!load_scenario_file(scenario_path, cfg.scenario)) {
            Logger::warn("Keeping scenario \"" + cfg.scenario.name + "\"");
        }
    }
    cfg.logging.file = expand_path(cfg.logging.file);

    return cfg;
}

bool Config::save_to_file(const std::string& path) const {
    json j;

    j["audio"]["input_device"] = audio.input_device;
    j["audio"]["output_device"] = audio.output_device;
    j["audio"]["input_sample_rate"] = audio.input_sample_rate;
    j["audio"]["output_sample_rate"] = audio.output_sample_rate;
    j["audio"]["capture_block_samples"] = audio.capture_block_samples;
    j["audio"]["volume_gain"] = audio.volume_gain;

    j["live"]["endpoint"] = live.endpoint;
    j["live"]["api_key"] = live.api_key;
    j["live"]["api_key_env"] = live.api_key_env;
    j["live"]["model"] = live.model;
    j["live"]["voice_name"] = live.voice_name;
    j["live"]["connect_timeout_ms"] = live.connect_timeout_ms;
    j["live"]["setup_timeout_ms"] = live.setup_timeout_ms;

    if (!scenario.file.empty()) {
        j["scenario"]["file"] = scenario.file;
    } else {
        j["scenario"]["name"] = scenario.name;
        j["scenario"]["system_prompt"] = scenario.system_prompt;
        json list = json::array();
        for (const auto& cp : scenario.checkpoints) {
            json item;
            item["id"] = cp.id;
            item["title"] = cp.title;
            item["description"] = cp.description;
            item["hint"] = cp.hint;
            list.push_back(item);
        }
        j["scenario"]["checkpoints"] = list;
    }

    j["checkpoints"]["out_of_order"] = checkpoints.out_of_order;

    j["presentation"]["celebration_ms"] = presentation.celebration_ms;
    j["presentation"]["silence_tip_ms"] = presentation.silence_tip_ms;
    j["presentation"]["intro_tip_ms"] = presentation.intro_tip_ms;
    j["presentation"]["listening_threshold"] = presentation.listening_threshold;

    j["logging"]["level"] = logging.level;
    j["logging"]["file"] = logging.file;

    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Could not write config file: " + path);
        return false;
    }
    file << j.dump(2);
    return file.good();
}

} // namespace orbion
