#include "tutor_app.h"
#include "audio_io.h"
#include "config.h"
#include "logger.h"
#include <csignal>
#include <fstream>
#include <unistd.h>

namespace orbion {

static TutorApp* g_app = nullptr;

void signal_handler(int signal) {
    (void)signal;
    if (g_app) {
        g_app->shutdown();
    }
}

static void print_usage(const char* argv0) {
    Logger::info(std::string("Usage: ") + argv0 + " [--verbose] [--list-devices] [config.json]");
}

} // namespace orbion

int main(int argc, char* argv[]) {
    // Console logging until the config says otherwise
    orbion::Logger::initialize(orbion::LogLevel::INFO);

    bool verbose = false;
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--list-devices") {
            orbion::audio_devices::list_devices();
            orbion::Logger::shutdown();
            return 0;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            orbion::print_usage(argv[0]);
            orbion::Logger::shutdown();
            return 0;
        } else {
            config_path = arg;
        }
    }

    if (config_path.empty()) {
        config_path = "config/orbion.json";
        // Try config directory relative to executable (e.g. build/../config)
        char buf[1024];
        ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
        if (len != -1) {
            buf[len] = '\0';
            std::string exe_dir(buf);
            size_t pos = exe_dir.find_last_of('/');
            if (pos != std::string::npos) {
                std::string candidate = exe_dir.substr(0, pos) + "/../config/orbion.json";
                std::ifstream test(candidate);
                if (test.good()) {
                    config_path = candidate;
                }
            }
        }
    }

    orbion::Config config = orbion::Config::load_from_file(config_path);

    orbion::LogLevel level = verbose ? orbion::LogLevel::DEBUG : orbion::parse_log_level(config.logging.level);
    orbion::Logger::shutdown();
    orbion::Logger::initialize(level, config.logging.file);

    int result = 0;
    {
        orbion::TutorApp app(config);
        orbion::g_app = &app;

        std::signal(SIGINT, orbion::signal_handler);
        std::signal(SIGTERM, orbion::signal_handler);

        result = app.run();

        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        orbion::g_app = nullptr;
    }

    orbion::Logger::shutdown();
    return result;
}
