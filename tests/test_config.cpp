/**
 * Configuration and scenario file loading.
 *
 * Run from build dir: ./test_config
 * Writes scratch files under a mkdtemp() directory.
 */

#include "config.h"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

using namespace orbion;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

int main() {
    char dir_template[] = "/tmp/orbion_config_XXXXXX";
    char* dir_ptr = mkdtemp(dir_template);
    ASSERT(dir_ptr != nullptr);
    if (!dir_ptr) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    const std::string dir(dir_ptr);

    // --- Missing file: defaults and the built-in café scenario ---
    {
        Config cfg = Config::load_from_file(dir + "/does_not_exist.json");
        ASSERT(cfg.audio.input_device == "default");
        ASSERT(cfg.audio.input_sample_rate == 16000);
        ASSERT(cfg.audio.output_sample_rate == 24000);
        ASSERT(cfg.audio.capture_block_samples == 4096);
        ASSERT(cfg.live.voice_name == "Zephyr");
        ASSERT(cfg.checkpoints.out_of_order == "orphan");
        ASSERT(cfg.presentation.celebration_ms == 2500);
        ASSERT(cfg.scenario.name == "Café in Paris");
        ASSERT(cfg.scenario.checkpoints.size() == 4);
        ASSERT(cfg.scenario.checkpoints[0].id == "greet");
        ASSERT(cfg.scenario.checkpoints[3].hint == "Merci, au revoir !");
        ASSERT(cfg.scenario.effective_system_prompt().find("markCheckpointComplete") != std::string::npos);
    }

    // --- Partial file overrides only what it names ---
    {
        std::string path = dir + "/partial.json";
        write_file(path, R"({
            "audio": {"input_device": 3, "output_device": "USB Audio"},
            "live": {"api_key": "abc123", "setup_timeout_ms": 2500},
            "checkpoints": {"out_of_order": "cascade"},
            "logging": {"level": "debug"}
        })");
        Config cfg = Config::load_from_file(path);
        ASSERT(cfg.audio.input_device == "3");
        ASSERT(cfg.audio.output_device == "USB Audio");
        ASSERT(cfg.audio.volume_gain == 5.0f);
        ASSERT(cfg.live.setup_timeout_ms == 2500);
        ASSERT(cfg.live.connect_timeout_ms == 10000);
        ASSERT(cfg.checkpoints.out_of_order == "cascade");
        ASSERT(cfg.logging.level == "debug");
        ASSERT(cfg.scenario.checkpoints.size() == 4);

        ASSERT(cfg.live.resolved_api_key() == "abc123");
        ASSERT(cfg.live.url() == cfg.live.endpoint + "?key=abc123");
        cfg.live.endpoint = "wss://example.test/live?alt=json";
        ASSERT(cfg.live.url() == "wss://example.test/live?alt=json&key=abc123");
    }

    // --- Key from the environment ---
    {
        LiveConfig live;
        live.api_key_env = "ORBION_TEST_API_KEY";
        unsetenv("ORBION_TEST_API_KEY");
        ASSERT(live.resolved_api_key().empty());
        ASSERT(live.url() == live.endpoint);
        setenv("ORBION_TEST_API_KEY", "from-env", 1);
        ASSERT(live.resolved_api_key() == "from-env");
        live.api_key = "literal";
        ASSERT(live.resolved_api_key() == "literal");
        unsetenv("ORBION_TEST_API_KEY");
    }

    // --- Broken files fall back to defaults ---
    {
        std::string broken = dir + "/broken.json";
        write_file(broken, "{ \"audio\": ");
        Config cfg = Config::load_from_file(broken);
        ASSERT(cfg.audio.input_device == "default");
        ASSERT(cfg.scenario.checkpoints.size() == 4);

        std::string wrong_type = dir + "/wrong_type.json";
        write_file(wrong_type, R"({"audio": {"input_device": "hw:1", "input_sample_rate": "fast"}})");
        Config typed = Config::load_from_file(wrong_type);
        ASSERT(typed.audio.input_sample_rate == 16000);
        ASSERT(typed.audio.input_device == "default");
    }

    // --- Scenario file resolved against the config directory ---
    {
        ASSERT(mkdir((dir + "/scenarios").c_str(), 0755) == 0);
        write_file(dir + "/scenarios/bakery.json", R"({
            "name": "Boulangerie",
            "checkpoints": [
                {"id": "greet", "title": "Hello", "description": "Greet the baker", "hint": "Bonjour !"},
                {"title": "no id, skipped"},
                {"id": "buy_bread", "description": "Buy a baguette"}
            ]
        })");
        std::string path = dir + "/with_scenario.json";
        write_file(path, R"({"scenario": {"file": "scenarios/bakery.json"}})");

        Config cfg = Config::load_from_file(path);
        ASSERT(cfg.scenario.name == "Boulangerie");
        ASSERT(cfg.scenario.checkpoints.size() == 2);
        ASSERT(cfg.scenario.checkpoints[1].id == "buy_bread");
        ASSERT(cfg.scenario.checkpoints[1].title == "buy_bread");
        ASSERT(cfg.scenario.system_prompt.empty());

        // No prompt in the file: a generic one built from the checkpoints
        std::string prompt = cfg.scenario.effective_system_prompt();
        ASSERT(prompt.find("Boulangerie") != std::string::npos);
        ASSERT(prompt.find("\"buy_bread\": Buy a baguette") != std::string::npos);

        // Missing or empty scenario files keep the built-in scenario
        write_file(dir + "/scenarios/empty.json", R"({"name": "Empty", "checkpoints": []})");
        write_file(path, R"({"scenario": {"file": "scenarios/empty.json"}})");
        ASSERT(Config::load_from_file(path).scenario.name == "Café in Paris");
        write_file(path, R"({"scenario": {"file": "scenarios/missing.json"}})");
        ASSERT(Config::load_from_file(path).scenario.checkpoints.size() == 4);
    }

    // --- Inline scenario and save/reload ---
    {
        std::string path = dir + "/inline.json";
        write_file(path, R"({"scenario": {
            "name": "Gare",
            "system_prompt": "Tu vends des billets.",
            "checkpoints": [{"id": "ticket", "title": "Ticket", "description": "Buy a ticket", "hint": "Un billet"}]
        }, "presentation": {"listening_threshold": 0.25}})");
        Config cfg = Config::load_from_file(path);
        ASSERT(cfg.scenario.name == "Gare");
        ASSERT(cfg.scenario.effective_system_prompt() == "Tu vends des billets.");
        ASSERT(cfg.scenario.checkpoints.size() == 1);

        std::string saved = dir + "/saved.json";
        ASSERT(cfg.save_to_file(saved));
        Config reloaded = Config::load_from_file(saved);
        ASSERT(reloaded.scenario.name == "Gare");
        ASSERT(reloaded.scenario.checkpoints.size() == 1);
        ASSERT(reloaded.scenario.checkpoints[0].hint == "Un billet");
        ASSERT(reloaded.presentation.listening_threshold == 0.25f);
        ASSERT(reloaded.live.model == cfg.live.model);

        ASSERT(!cfg.save_to_file(dir + "/no_such_dir/saved.json"));
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
