#include "session_client.h"
#include "logger.h"
#include "pcm_codec.h"
#include "playback_scheduler.h"
#include "tools/mark_checkpoint_tool.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace orbion {

class SessionClient::Impl {
public:
    Impl(IAudioSource& source, IAudioSink& sink, ITransport& transport,
         CheckpointMachine& checkpoints, SessionSettings settings)
        : sink_(sink),
          transport_(transport),
          checkpoints_(checkpoints),
          settings_(std::move(settings)),
          capture_(source, settings_.capture),
          scheduler_(sink, settings_.output_sample_rate) {
        auto mark = std::make_shared<MarkCheckpointCompleteTool>(checkpoints_, example_ids());
        mark->set_completed_handler([this](const std::string& id) {
            CheckpointCompleted event;
            event.id = id;
            event.all_complete = checkpoints_.all_complete();
            events_.publish(event);
        });
        tools_.register_tool(mark);

        scheduler_.set_activity_handler([this](bool active) {
            events_.publish(PlaybackActiveChanged{active});
        });
    }

    ~Impl() {
        disconnect();
        scheduler_.set_activity_handler(nullptr);
    }

    Result<void> connect() {
        // A finished supervisor may still be unwinding after a fatal error
        std::thread previous;
        {
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            if (supervisor_.joinable() && supervisor_.get_id() == std::this_thread::get_id()) {
                return make_error(ErrorType::InvalidState, "connect() called from a session event handler");
            }
            previous = std::move(supervisor_);
        }
        if (previous.joinable()) {
            previous.join();
        }

        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != SessionState::Disconnected) {
                return make_error(ErrorType::InvalidState,
                                  std::string("cannot connect while ") + session_state_name(state_));
            }
            generation = ++generation_;
            accepting_ = true;
            setup_acked_ = false;
            fatal_pending_ = false;
            stop_requested_ = false;
            fatal_error_ = Error();
        }
        transcript_.clear();
        chunks_sent_ = 0;
        chunks_dropped_ = 0;
        set_state(SessionState::Connecting);

        // 1. Output device
        auto sink_opened = sink_.open(settings_.output_sample_rate, AUDIO_CHANNELS);
        if (sink_opened.is_error()) {
            return fail_connect(Error(ErrorType::OutputUnavailable, sink_opened.error().message));
        }
        scheduler_.reset();
        scheduler_.attach();

        // 2. Microphone, before any network traffic
        auto capture_opened = capture_.open();
        if (capture_opened.is_error()) {
            return fail_connect(capture_opened.error());
        }

        // 3. Transport
        TransportHandlers handlers;
        handlers.on_message = [this, generation](const std::string& text) {
            if (accepting(generation)) handle_message(text);
        };
        handlers.on_error = [this, generation](const std::string& reason) {
            if (accepting(generation)) report_fatal("transport error: " + reason);
        };
        handlers.on_closed = [this, generation]() {
            if (accepting(generation)) report_fatal("connection closed by server");
        };
        auto opened = transport_.open(settings_.url, std::move(handlers));
        if (opened.is_error()) {
            return fail_connect(make_connection_error(opened.error().message));
        }

        // 4. Setup handshake
        wire::SetupOptions setup = settings_.setup;
        setup.function_declarations_json = tools_.get_function_declarations_json();
        auto sent = transport_.send(wire::build_setup(setup));
        if (sent.is_error()) {
            return fail_connect(make_connection_error("failed to send setup: " + sent.error().message));
        }
        LOG_SESSION("Setup sent (model " + setup.model + "), waiting for acknowledgement");

        {
            std::unique_lock<std::mutex> lock(state_mutex_);
            bool done = cv_.wait_for(lock, std::chrono::milliseconds(settings_.setup_timeout_ms), [this] {
                return setup_acked_ || fatal_pending_ || stop_requested_;
            });
            if (stop_requested_) {
                lock.unlock();
                return fail_connect(make_connection_error("cancelled by disconnect"));
            }
            if (fatal_pending_) {
                Error error = fatal_error_;
                lock.unlock();
                return fail_connect(error);
            }
            if (!done) {
                lock.unlock();
                return fail_connect(make_timeout_error(
                    "no setup acknowledgement within " + std::to_string(settings_.setup_timeout_ms) + " ms"));
            }
        }

        // 5. Stream
        set_state(SessionState::Connected);
        auto started = capture_.start(
            [this, generation](float level) {
                if (accepting(generation)) events_.publish(VolumeChanged{level});
            },
            [this, generation](const PcmBytes& pcm) {
                if (accepting(generation)) send_audio(pcm);
            },
            [this, generation](const std::string& reason) {
                if (accepting(generation)) report_fatal("capture device lost: " + reason);
            });
        if (started.is_error()) {
            return fail_connect(make_capture_error(started.error().message));
        }

        supervisor_ = std::thread(&Impl::supervise, this);
        LOG_SESSION("Streaming");
        return Result<void>();
    }

    void disconnect() {
        // A connect() waiting for setup holds lifecycle_mutex_; wake it first
        {
            std::lock_guard<std::mutex> state_lock(state_mutex_);
            stop_requested_ = true;
        }
        cv_.notify_all();

        std::thread supervisor;
        bool on_supervisor = false;
        {
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            if (supervisor_.joinable()) {
                on_supervisor = supervisor_.get_id() == std::this_thread::get_id();
                if (!on_supervisor) {
                    supervisor = std::move(supervisor_);
                }
            }
        }
        if (supervisor.joinable()) {
            supervisor.join();
        }

        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        teardown_locked();
    }

    SessionState state() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }

    bool wait_for_state(SessionState state, int timeout_ms) const {
        std::unique_lock<std::mutex> lock(state_mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this, state] {
            return state_ == state;
        });
    }

    EventDispatcher& events() { return events_; }
    ToolRegistry& tools() { return tools_; }
    const TranscriptAggregator& transcript() const { return transcript_; }
    uint64_t chunks_sent() const { return chunks_sent_; }
    uint64_t chunks_dropped() const { return chunks_dropped_; }

private:
    std::string example_ids() const {
        std::string ids;
        for (const auto& cp : checkpoints_.checkpoints()) {
            if (!ids.empty()) ids += ", ";
            ids += "\"" + cp.definition.id + "\"";
        }
        return ids;
    }

    bool accepting(uint64_t generation) const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return accepting_ && generation_ == generation;
    }

    void set_state(SessionState state) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = state;
        }
        cv_.notify_all();
        LOG_SESSION(std::string("State: ") + session_state_name(state));
        events_.publish(SessionStateChanged{state});
    }

    /// Caller holds lifecycle_mutex_
    Result<void> fail_connect(const Error& error) {
        Logger::error("[Session] Connect failed: " + error.to_string());
        teardown_locked();
        return error;
    }

    void report_fatal(const std::string& reason) {
        bool connecting = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (!accepting_ || fatal_pending_) {
                return;
            }
            connecting = state_ == SessionState::Connecting;
            fatal_pending_ = true;
            accepting_ = false;
            fatal_error_ = connecting ? make_connection_error(reason)
                                      : make_error(ErrorType::SessionError, reason);
        }
        Logger::error("[Session] Fatal: " + reason);
        cv_.notify_all();
    }

    void supervise() {
        Error fatal;
        {
            std::unique_lock<std::mutex> lock(state_mutex_);
            cv_.wait(lock, [this] { return stop_requested_ || fatal_pending_; });
            if (stop_requested_) {
                return;
            }
            fatal = fatal_error_;
        }

        events_.publish(FatalError{fatal});

        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        teardown_locked();
    }

    /// Idempotent; caller holds lifecycle_mutex_
    void teardown_locked() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ == SessionState::Disconnected) {
                return;
            }
            accepting_ = false;
        }
        set_state(SessionState::Closing);

        // Each release is independent of the others
        auto capture_closed = capture_.close();
        if (capture_closed.is_error()) {
            Logger::warn("[Session] Capture release failed: " + capture_closed.error().to_string());
        }
        auto transport_closed = transport_.close();
        if (transport_closed.is_error()) {
            Logger::warn("[Session] Transport release failed: " + transport_closed.error().to_string());
        }
        scheduler_.detach();
        auto sink_closed = sink_.close();
        if (sink_closed.is_error()) {
            Logger::warn("[Session] Output release failed: " + sink_closed.error().to_string());
        }
        scheduler_.reset();

        LOG_SESSION("Released (sent " + std::to_string(chunks_sent_.load()) + " chunks, dropped " +
                    std::to_string(chunks_dropped_.load()) + " inbound)");
        set_state(SessionState::Disconnected);
    }

    void send_audio(const PcmBytes& pcm) {
        auto sent = transport_.send(wire::build_realtime_input(pcm, settings_.capture.sample_rate));
        if (sent.is_error()) {
            Logger::debug("[Session] Audio chunk not sent: " + sent.error().message);
            return;
        }
        ++chunks_sent_;
    }

    void handle_message(const std::string& text) {
        auto parsed = wire::parse_server_message(text);
        if (parsed.is_error()) {
            Logger::warn("[Session] Ignoring inbound message: " + parsed.error().message);
            return;
        }
        const wire::ServerMessage& msg = parsed.value();

        if (msg.setup_complete) {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                setup_acked_ = true;
            }
            cv_.notify_all();
            LOG_SESSION("Setup acknowledged");
        }

        for (const auto& chunk : msg.audio_chunks) {
            play_chunk(chunk);
        }

        for (const auto& fragment : msg.transcriptions) {
            TranscriptUpdated update;
            std::optional<TranscriptTurn> closed;
            update.turn = transcript_.add_fragment(fragment.role, fragment.text, fragment.is_final,
                                                   &update.index, &closed);
            if (closed) {
                events_.publish(TranscriptUpdated{*closed, update.index - 1});
            }
            events_.publish(update);
        }

        if (msg.interrupted) {
            LOG_SESSION("Model turn interrupted");
        }
        if (msg.turn_complete || msg.interrupted) {
            TranscriptUpdated update;
            if (transcript_.complete_turn(&update.turn, &update.index)) {
                events_.publish(update);
            }
        }

        for (const auto& call : msg.tool_calls) {
            answer_tool_call(call);
        }
        for (const auto& id : msg.cancelled_tool_calls) {
            LOG_TOOL("Call " + id + " cancelled by server");
        }

        if (msg.error_message) {
            report_fatal("server error: " + *msg.error_message);
        } else if (msg.go_away) {
            report_fatal("server sent goAway");
        }
    }

    void play_chunk(const std::string& base64) {
        auto bytes = pcm::base64_decode(base64);
        if (bytes.is_error()) {
            ++chunks_dropped_;
            Logger::warn("[Playback] Dropping chunk: " + bytes.error().message);
            return;
        }
        auto scheduled = scheduler_.enqueue_pcm(bytes.value());
        if (scheduled.is_error()) {
            ++chunks_dropped_;
            Logger::warn("[Playback] Dropping chunk: " + scheduled.error().to_string());
        }
    }

    void answer_tool_call(const wire::ToolInvocation& call) {
        ToolResult result = tools_.execute(call.name, call.args_json);

        wire::FunctionResponse response;
        response.id = call.id;
        response.name = call.name;
        response.success = result.success;
        response.result = result.success ? result.content : result.error;

        auto sent = transport_.send(wire::build_tool_response({response}));
        if (sent.is_error()) {
            Logger::warn("[Tool] Response to " + call.name + " not sent: " + sent.error().message);
        }
    }

    IAudioSink& sink_;
    ITransport& transport_;
    CheckpointMachine& checkpoints_;
    SessionSettings settings_;

    CaptureEncoder capture_;
    PlaybackScheduler scheduler_;
    TranscriptAggregator transcript_;
    ToolRegistry tools_;
    EventDispatcher events_;

    // Serializes connect, disconnect and supervisor teardown
    std::mutex lifecycle_mutex_;
    std::thread supervisor_;

    mutable std::mutex state_mutex_;
    mutable std::condition_variable cv_;
    SessionState state_ = SessionState::Disconnected;
    uint64_t generation_ = 0;
    bool accepting_ = false;
    bool setup_acked_ = false;
    bool fatal_pending_ = false;
    bool stop_requested_ = false;
    Error fatal_error_;

    std::atomic<uint64_t> chunks_sent_{0};
    std::atomic<uint64_t> chunks_dropped_{0};
};

SessionClient::SessionClient(IAudioSource& source, IAudioSink& sink, ITransport& transport,
                             CheckpointMachine& checkpoints, SessionSettings settings)
    : pimpl_(std::make_unique<Impl>(source, sink, transport, checkpoints, std::move(settings))) {}

SessionClient::~SessionClient() = default;

Result<void> SessionClient::connect() {
    return pimpl_->connect();
}

void SessionClient::disconnect() {
    pimpl_->disconnect();
}

SessionState SessionClient::state() const {
    return pimpl_->state();
}

bool SessionClient::wait_for_state(SessionState state, int timeout_ms) const {
    return pimpl_->wait_for_state(state, timeout_ms);
}

EventDispatcher& SessionClient::events() {
    return pimpl_->events();
}

ToolRegistry& SessionClient::tools() {
    return pimpl_->tools();
}

const TranscriptAggregator& SessionClient::transcript() const {
    return pimpl_->transcript();
}

uint64_t SessionClient::chunks_sent() const {
    return pimpl_->chunks_sent();
}

uint64_t SessionClient::chunks_dropped() const {
    return pimpl_->chunks_dropped();
}

} // namespace orbion
