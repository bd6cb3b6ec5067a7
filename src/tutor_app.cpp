#include "tutor_app.h"
#include "audio_io.h"
#include "checkpoint_machine.h"
#include "logger.h"
#include "orb_state.h"
#include "websocket_transport.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <thread>

namespace orbion {

namespace {

constexpr int LOOP_INTERVAL_MS = 100;

// Upper bound on waiting for the closing remarks once every objective is done
constexpr int FAREWELL_GRACE_MS = 20000;

std::string format_elapsed(int64_t ms) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld",
                  static_cast<long long>(ms / 60000), static_cast<long long>((ms / 1000) % 60));
    return buf;
}

} // anonymous namespace

SessionSettings make_session_settings(const Config& config) {
    SessionSettings settings;
    settings.url = config.live.url();
    settings.setup.model = config.live.model;
    settings.setup.voice_name = config.live.voice_name;
    settings.setup.system_instruction = config.scenario.effective_system_prompt();
    settings.capture.sample_rate = config.audio.input_sample_rate;
    settings.capture.block_samples = static_cast<size_t>(config.audio.capture_block_samples);
    settings.capture.volume_gain = config.audio.volume_gain;
    settings.output_sample_rate = config.audio.output_sample_rate;
    settings.setup_timeout_ms = config.live.setup_timeout_ms;
    return settings;
}

class TutorApp::Impl {
public:
    explicit Impl(const Config& config)
        : config_(config),
          source_(config.audio.input_device),
          sink_(config.audio.output_device),
          transport_(config.live.connect_timeout_ms),
          checkpoints_(config.scenario.checkpoints, parse_out_of_order_policy(config.checkpoints.out_of_order)),
          session_(source_, sink_, transport_, checkpoints_, make_session_settings(config)),
          orb_(config.presentation),
          running_(false),
          all_complete_(false),
          failed_(false) {
        subscription_ = session_.events().subscribe([this](const SessionEvent& event) { present(event); });
    }

    ~Impl() {
        session_.events().unsubscribe(subscription_);
        session_.disconnect();
    }

    int run() {
        Logger::info("=== Orbion: " + config_.scenario.name + " ===");
        for (const auto& cp : checkpoints_.checkpoints()) {
            Logger::info("  Objective: " + cp.definition.title + " - " + cp.definition.description);
        }

        if (config_.live.resolved_api_key().empty()) {
            Logger::error("No API key: set live.api_key or the " + config_.live.api_key_env +
                          " environment variable");
            return 1;
        }

        running_ = true;
        started_ = std::chrono::steady_clock::now();
        auto connected = session_.connect();
        if (connected.is_error()) {
            Logger::error("Failed to start session: " + connected.error().to_string());
            if (connected.error().type == ErrorType::CaptureUnavailable) {
                Logger::error("Check that a microphone is connected and accessible");
            }
            running_ = false;
            return 1;
        }

        orb_.on_connected(std::chrono::steady_clock::now());
        announce_current();

        TimePoint completed_at{};
        while (running_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(LOOP_INTERVAL_MS));
            auto now = std::chrono::steady_clock::now();
            report_status(now);

            if (session_.state() == SessionState::Disconnected) {
                break;
            }
            if (all_complete_) {
                if (completed_at == TimePoint()) {
                    completed_at = now;
                }
                OrbState orb = orb_.state(now);
                bool settled = orb != OrbState::Speaking && orb != OrbState::Celebrating;
                if (settled || ms_since(completed_at) > FAREWELL_GRACE_MS) {
                    Logger::info("All objectives complete!");
                    break;
                }
            }
        }
        running_ = false;

        flush_transcript();
        session_.disconnect();

        Logger::info("Session ended after " + format_elapsed(ms_since(started_)) + ", " +
                     std::to_string(checkpoints_.completed_count()) + "/" +
                     std::to_string(checkpoints_.size()) + " objectives complete");

        // Progress belongs to the session that just ended
        checkpoints_.reset();
        orb_.reset();
        return failed_ ? 1 : 0;
    }

    void shutdown() {
        running_ = false;
    }

private:
    void present(const SessionEvent& event) {
        auto now = std::chrono::steady_clock::now();

        if (auto* volume = std::get_if<VolumeChanged>(&event)) {
            orb_.on_volume(volume->level, now);
        } else if (auto* playback = std::get_if<PlaybackActiveChanged>(&event)) {
            orb_.on_playback(playback->active, now);
        } else if (auto* completed = std::get_if<CheckpointCompleted>(&event)) {
            orb_.on_checkpoint_completed(now);
            on_checkpoint(completed->id, completed->all_complete);
        } else if (auto* transcript = std::get_if<TranscriptUpdated>(&event)) {
            orb_.on_transcript(transcript->turn, now);
            on_transcript(*transcript);
        } else if (auto* fatal = std::get_if<FatalError>(&event)) {
            Logger::error("Session lost: " + fatal->error.to_string());
            failed_ = true;
            running_ = false;
        } else if (auto* changed = std::get_if<SessionStateChanged>(&event)) {
            Logger::debug(std::string("[App] Session ") + session_state_name(changed->state));
        }
    }

    void on_checkpoint(const std::string& id, bool all_complete) {
        for (const auto& cp : checkpoints_.checkpoints()) {
            if (cp.definition.id == id) {
                Logger::info("[" + elapsed() + "] Objective complete: " + cp.definition.title + " (" +
                             std::to_string(checkpoints_.completed_count()) + "/" +
                             std::to_string(checkpoints_.size()) + ")");
                break;
            }
        }
        if (all_complete) {
            all_complete_ = true;
        } else {
            announce_current();
        }
    }

    void announce_current() {
        int idx = checkpoints_.current_index();
        if (idx < 0) return;
        auto cps = checkpoints_.checkpoints();
        const auto& def = cps[static_cast<size_t>(idx)].definition;
        Logger::info("Current objective: " + def.title + " - " + def.description);
        if (!def.hint.empty()) {
            Logger::info("  Hint: \"" + def.hint + "\"");
        }
    }

    // A turn is printed once a later turn starts or the session ends
    void on_transcript(const TranscriptUpdated& update) {
        std::lock_guard<std::mutex> lock(transcript_mutex_);
        LOG_TRANSCRIPT(std::string(role_name(update.turn.role)) + ": " + update.turn.text);
        if (has_pending_turn_ && update.index != pending_index_) {
            print_turn(pending_turn_);
        }
        pending_turn_ = update.turn;
        pending_index_ = update.index;
        has_pending_turn_ = true;
    }

    void flush_transcript() {
        std::lock_guard<std::mutex> lock(transcript_mutex_);
        if (has_pending_turn_) {
            print_turn(pending_turn_);
            has_pending_turn_ = false;
        }
    }

    void print_turn(const TranscriptTurn& turn) {
        std::string speaker = turn.role == Role::User ? "You" : "Orbion";
        Logger::info("[" + elapsed() + "] " + speaker + ": " + turn.text);
    }

    void report_status(TimePoint now) {
        OrbState orb = orb_.state(now);
        std::string tip = orb_.tip(now);
        if (orb != last_orb_) {
            Logger::debug("[" + elapsed() + "] Orb: " + orb_state_name(orb));
            last_orb_ = orb;
        }
        if (tip != last_tip_) {
            if (!tip.empty()) {
                Logger::info("[" + elapsed() + "] Tip: " + tip);
            }
            last_tip_ = tip;
        }
    }

    std::string elapsed() const {
        return format_elapsed(ms_since(started_));
    }

    Config config_;
    PortAudioSource source_;
    PortAudioSink sink_;
    WebSocketTransport transport_;
    CheckpointMachine checkpoints_;
    SessionClient session_;
    OrbStateTracker orb_;
    SubscriptionId subscription_ = 0;

    std::atomic<bool> running_;
    std::atomic<bool> all_complete_;
    std::atomic<bool> failed_;
    TimePoint started_ = std::chrono::steady_clock::now();

    std::mutex transcript_mutex_;
    TranscriptTurn pending_turn_;
    size_t pending_index_ = 0;
    bool has_pending_turn_ = false;

    OrbState last_orb_ = OrbState::Idle;
    std::string last_tip_;
};

TutorApp::TutorApp(const Config& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

TutorApp::~TutorApp() = default;

int TutorApp::run() {
    return pimpl_->run();
}

void TutorApp::shutdown() {
    pimpl_->shutdown();
}

} // namespace orbion
