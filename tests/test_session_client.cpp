/**
 * Session lifecycle end to end against fake devices and a fake network.
 *
 * Run from build dir: ./test_session_client
 */

#include "fakes.h"
#include "pcm_codec.h"
#include "session_client.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cmath>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using namespace orbion;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static std::vector<CheckpointDefinition> cafe() {
    return {
        {"greet", "The Encounter", "Greet the waiter at the café", "Bonjour !"},
        {"order_drink", "The Order", "Order a coffee (or another drink)", "Je voudrais un café, s'il vous plaît."},
        {"ask_bill", "The Bill", "Ask for the check", "L'addition, s'il vous plaît."},
        {"farewell", "Farewell", "Say goodbye politely", "Merci, au revoir !"},
    };
}

static long ms_between(std::chrono::steady_clock::time_point from,
                       std::chrono::steady_clock::time_point to) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count());
}

static SessionSettings test_settings() {
    SessionSettings settings;
    settings.url = "wss://live.example/ws?key=test";
    settings.setup.model = "models/test-model";
    settings.setup.voice_name = "Zephyr";
    settings.setup.system_instruction = "Tu es un serveur parisien.";
    settings.setup_timeout_ms = 2000;
    return settings;
}

static std::string audio_message(size_t samples) {
    json data;
    data["mimeType"] = "audio/pcm;rate=24000";
    data["data"] = pcm::base64_encode(pcm::encode(AudioFrame(samples, 0.0f)));
    json part;
    part["inlineData"] = data;
    json msg;
    msg["serverContent"]["modelTurn"]["parts"] = json::array();
    msg["serverContent"]["modelTurn"]["parts"].push_back(part);
    return msg.dump();
}

static std::string tool_call_message(const std::string& id, const std::string& name,
                                     const std::string& checkpoint) {
    json call;
    call["id"] = id;
    call["name"] = name;
    call["args"]["checkpointId"] = checkpoint;
    json msg;
    msg["toolCall"]["functionCalls"] = json::array();
    msg["toolCall"]["functionCalls"].push_back(call);
    return msg.dump();
}

/// Thread-safe event log
class Recorder {
public:
    explicit Recorder(EventDispatcher& events) : dispatcher_(events) {
        id_ = events.subscribe([this](const SessionEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        });
    }

    ~Recorder() {
        dispatcher_.unsubscribe(id_);
    }

    template<typename T>
    std::vector<T> all() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        for (const auto& event : events_) {
            if (auto* e = std::get_if<T>(&event)) out.push_back(*e);
        }
        return out;
    }

    std::vector<SessionState> states() const {
        std::vector<SessionState> out;
        for (const auto& e : all<SessionStateChanged>()) out.push_back(e.state);
        return out;
    }

private:
    EventDispatcher& dispatcher_;
    SubscriptionId id_ = 0;
    mutable std::mutex mutex_;
    std::vector<SessionEvent> events_;
};

int main() {
    // --- End-to-end scenario ---
    {
        testing::FakeAudioSource source;
        testing::FakeAudioSink sink;
        testing::FakeTransport transport;
        CheckpointMachine checkpoints(cafe());
        SessionClient session(source, sink, transport, checkpoints, test_settings());
        Recorder recorder(session.events());

        ASSERT(session.state() == SessionState::Disconnected);
        auto connected = session.connect();
        ASSERT(connected.is_ok());
        ASSERT(session.state() == SessionState::Connected);
        ASSERT((recorder.states() == std::vector<SessionState>{SessionState::Connecting, SessionState::Connected}));
        ASSERT(transport.opened_url == "wss://live.example/ws?key=test");
        ASSERT(source.opened_rate == INPUT_SAMPLE_RATE);
        ASSERT(source.opened_block == 4096);
        ASSERT(sink.is_open());

        // Setup is the first frame and declares the checkpoint tool
        auto sent = transport.sent();
        ASSERT(!sent.empty());
        json setup = json::parse(sent[0]);
        ASSERT(setup["setup"]["model"] == "models/test-model");
        ASSERT(setup["setup"]["tools"][0]["functionDeclarations"][0]["name"] == "markCheckpointComplete");
        ASSERT(setup["setup"]["systemInstruction"]["parts"][0]["text"] == "Tu es un serveur parisien.");

        // Connecting twice is refused
        auto again = session.connect();
        ASSERT(again.is_error() && again.error().type == ErrorType::InvalidState);

        // Capture block with RMS 0.3 -> volume 1.5, then one realtime input frame
        ASSERT(source.deliver(AudioFrame(4096, 0.3f)));
        auto volumes = recorder.all<VolumeChanged>();
        ASSERT(volumes.size() == 1);
        ASSERT(!volumes.empty() && std::fabs(volumes[0].level - 1.5f) < 1e-4f);
        auto inputs = transport.sent_containing("realtimeInput");
        ASSERT(inputs.size() == 1);
        ASSERT(session.chunks_sent() == 1);
        if (!inputs.empty()) {
            json frame = json::parse(inputs[0]);
            const json& chunk = frame["realtimeInput"]["mediaChunks"][0];
            ASSERT(chunk["mimeType"] == "audio/pcm;rate=16000");
            auto bytes = pcm::base64_decode(chunk["data"].get<std::string>());
            ASSERT(bytes.is_ok() && bytes.value().size() == 4096 * 2);
        }

        // 0.5 s chunk at t=0, then 0.3 s chunk at t=0.1
        transport.inject(audio_message(12000));
        sink.advance(0.1);
        transport.inject(audio_message(7200));
        auto history = sink.history();
        ASSERT(history.size() == 2);
        if (history.size() == 2) {
            ASSERT(std::fabs(history[0].start_at - 0.0) < 1e-9);
            ASSERT(std::fabs(history[1].start_at - 0.5) < 1e-9);
            ASSERT(std::fabs(history[1].duration - 0.3) < 1e-9);
        }
        auto playback = recorder.all<PlaybackActiveChanged>();
        ASSERT(playback.size() == 1 && playback[0].active);
        sink.advance(0.8);
        playback = recorder.all<PlaybackActiveChanged>();
        ASSERT(playback.size() == 2 && !playback[1].active);

        // Malformed audio and garbage frames are dropped without ending the session
        transport.inject(R"({"serverContent":{"modelTurn":{"parts":[{"inlineData":{"mimeType":"audio/pcm","data":"@@@@"}}]}}})");
        transport.inject("not json at all");
        ASSERT(session.chunks_dropped() == 1);
        ASSERT(session.state() == SessionState::Connected);

        // Transcripts
        transport.inject(R"({"serverContent":{"outputTranscription":{"text":"Bonjour ! "}}})");
        transport.inject(R"({"serverContent":{"outputTranscription":{"text":"Bienvenue."}}})");
        transport.inject(R"({"serverContent":{"turnComplete":true}})");
        transport.inject(R"({"serverContent":{"inputTranscription":{"text":"Bon"}}})");
        transport.inject(R"({"serverContent":{"inputTranscription":{"text":"jour"}}})");
        auto turns = session.transcript().turns();
        ASSERT(turns.size() == 2);
        if (turns.size() == 2) {
            ASSERT(turns[0].role == Role::Assistant);
            ASSERT(turns[0].text == "Bonjour ! Bienvenue.");
            ASSERT(turns[0].finalized);
            ASSERT(turns[1].role == Role::User);
            ASSERT(turns[1].text == "Bonjour");
        }
        auto updates = recorder.all<TranscriptUpdated>();
        ASSERT(updates.size() == 5);
        if (updates.size() == 5) {
            ASSERT(updates[2].index == 0 && updates[2].turn.finalized);
            ASSERT(updates[4].index == 1);
        }

        // The model answering finalizes the user's turn before opening its own
        transport.inject(R"({"serverContent":{"outputTranscription":{"text":"Très bien."}}})");
        updates = recorder.all<TranscriptUpdated>();
        ASSERT(updates.size() == 7);
        if (updates.size() == 7) {
            ASSERT(updates[5].index == 1);
            ASSERT(updates[5].turn.role == Role::User && updates[5].turn.finalized);
            ASSERT(updates[5].turn.text == "Bonjour");
            ASSERT(updates[6].index == 2 && updates[6].turn.role == Role::Assistant);
        }
        ASSERT(session.transcript().size() == 3);

        // Tool call: checkpoint advances and exactly one response goes back
        transport.inject(tool_call_message("call-1", "markCheckpointComplete", "greet"));
        ASSERT(checkpoints.current_index() == 1);
        auto responses = transport.sent_containing("toolResponse");
        ASSERT(responses.size() == 1);
        if (!responses.empty()) {
            json r = json::parse(responses[0]);
            const json& fr = r["toolResponse"]["functionResponses"][0];
            ASSERT(fr["id"] == "call-1");
            ASSERT(fr["name"] == "markCheckpointComplete");
            ASSERT(fr["response"]["result"] == "Checkpoint marked.");
        }
        auto completions = recorder.all<CheckpointCompleted>();
        ASSERT(completions.size() == 1);
        ASSERT(!completions.empty() && completions[0].id == "greet" && !completions[0].all_complete);

        // Unknown checkpoint id is still acknowledged; unknown tool gets an error
        transport.inject(tool_call_message("call-2", "markCheckpointComplete", "juggle"));
        transport.inject(tool_call_message("call-3", "launchRocket", "greet"));
        responses = transport.sent_containing("toolResponse");
        ASSERT(responses.size() == 3);
        if (responses.size() == 3) {
            json unknown = json::parse(responses[2]);
            ASSERT(unknown["toolResponse"]["functionResponses"][0]["id"] == "call-3");
            ASSERT(unknown["toolResponse"]["functionResponses"][0]["response"].contains("error"));
        }
        ASSERT(checkpoints.current_index() == 1);
        ASSERT(recorder.all<CheckpointCompleted>().size() == 1);

        for (const char* id : {"order_drink", "ask_bill", "farewell"}) {
            transport.inject(tool_call_message(std::string("c-") + id, "markCheckpointComplete", id));
        }
        completions = recorder.all<CheckpointCompleted>();
        ASSERT(completions.size() == 4);
        ASSERT(completions.size() == 4 && completions[3].all_complete);
        ASSERT(checkpoints.all_complete());

        // Disconnect releases everything and is idempotent
        session.disconnect();
        ASSERT(session.state() == SessionState::Disconnected);
        ASSERT(!sink.is_open());
        ASSERT(!source.is_open());
        ASSERT(!transport.is_open());
        ASSERT(source.close_calls == 1);
        ASSERT(transport.close_calls == 1);
        session.disconnect();
        ASSERT(source.close_calls == 1);
        ASSERT(recorder.states().back() == SessionState::Disconnected);
        ASSERT(recorder.states().size() == 4);

        // Nothing reaches the session after release
        ASSERT(!source.deliver(AudioFrame(4096, 0.3f)));
        transport.inject(audio_message(2400));
        ASSERT(recorder.all<VolumeChanged>().size() == 1);
        ASSERT(sink.history().size() == 2);
        ASSERT(recorder.all<FatalError>().empty());

        // A fresh session can be opened afterwards
        ASSERT(session.connect().is_ok());
        ASSERT(session.transcript().size() == 0);
        session.disconnect();
    }

    // --- Server error after connect -> FatalError, then Disconnected ---
    {
        testing::FakeAudioSource source;
        testing::FakeAudioSink sink;
        testing::FakeTransport transport;
        CheckpointMachine checkpoints(cafe());
        SessionClient session(source, sink, transport, checkpoints, test_settings());
        Recorder recorder(session.events());

        ASSERT(session.connect().is_ok());
        transport.inject(R"({"error":{"code":500,"message":"internal"}})");
        ASSERT(session.wait_for_state(SessionState::Disconnected, 2000));
        auto fatals = recorder.all<FatalError>();
        ASSERT(fatals.size() == 1);
        ASSERT(!fatals.empty() && fatals[0].error.type == ErrorType::SessionError);
        ASSERT(!fatals.empty() && fatals[0].error.message.find("internal") != std::string::npos);
        ASSERT(!sink.is_open() && !source.is_open() && !transport.is_open());

        // The supervisor already tore down; disconnect just joins it
        session.disconnect();
        ASSERT(session.state() == SessionState::Disconnected);
        ASSERT(source.close_calls == 1);
    }

    // --- Transport closed by the server, capture device lost ---
    {
        testing::FakeAudioSource source;
        testing::FakeAudioSink sink;
        testing::FakeTransport transport;
        CheckpointMachine checkpoints(cafe());
        SessionClient session(source, sink, transport, checkpoints, test_settings());
        Recorder recorder(session.events());

        ASSERT(session.connect().is_ok());
        transport.remote_close();
        ASSERT(session.wait_for_state(SessionState::Disconnected, 2000));
        ASSERT(recorder.all<FatalError>().size() == 1);

        ASSERT(session.connect().is_ok());
        source.lose_device("unplugged");
        ASSERT(session.wait_for_state(SessionState::Disconnected, 2000));
        auto fatals = recorder.all<FatalError>();
        ASSERT(fatals.size() == 2);
        ASSERT(fatals.size() == 2 && fatals[1].error.message.find("unplugged") != std::string::npos);

        // A fatal error during teardown is not reported twice
        ASSERT(session.connect().is_ok());
        transport.fail("reset by peer");
        transport.remote_close();
        ASSERT(session.wait_for_state(SessionState::Disconnected, 2000));
        session.disconnect();
        ASSERT(recorder.all<FatalError>().size() == 3);
    }

    // --- Output device missing ---
    {
        testing::FakeAudioSource source;
        testing::FakeAudioSink sink;
        testing::FakeTransport transport;
        sink.fail_open = true;
        CheckpointMachine checkpoints(cafe());
        SessionClient session(source, sink, transport, checkpoints, test_settings());

        auto result = session.connect();
        ASSERT(result.is_error());
        ASSERT(result.error().type == ErrorType::OutputUnavailable);
        ASSERT(session.state() == SessionState::Disconnected);
        ASSERT(source.opened_rate == 0);
        ASSERT(transport.opened_url.empty());
    }

    // --- Microphone permission denied ---
    {
        testing::FakeAudioSource source;
        testing::FakeAudioSink sink;
        testing::FakeTransport transport;
        source.fail_open = true;
        CheckpointMachine checkpoints(cafe());
        SessionClient session(source, sink, transport, checkpoints, test_settings());

        auto result = session.connect();
        ASSERT(result.is_error());
        ASSERT(result.error().type == ErrorType::CaptureUnavailable);
        ASSERT(session.state() == SessionState::Disconnected);
        ASSERT(transport.opened_url.empty());
        ASSERT(transport.sent().empty());
        ASSERT(!sink.is_open());
    }

    // --- Endpoint unreachable ---
    {
        testing::FakeAudioSource source;
        testing::FakeAudioSink sink;
        testing::FakeTransport transport;
        transport.fail_open = true;
        CheckpointMachine checkpoints(cafe());
        SessionClient session(source, sink, transport, checkpoints, test_settings());

        auto result = session.connect();
        ASSERT(result.is_error());
        ASSERT(result.error().type == ErrorType::ConnectionFailed);
        ASSERT(!source.is_open());
        ASSERT(!sink.is_open());
    }

    // --- No setup acknowledgement ---
    {
        testing::FakeAudioSource source;
        testing::FakeAudioSink sink;
        testing::FakeTransport transport;
        transport.setup_reply = "";
        CheckpointMachine checkpoints(cafe());
        SessionSettings settings = test_settings();
        settings.setup_timeout_ms = 50;
        SessionClient session(source, sink, transport, checkpoints, settings);

        auto result = session.connect();
        ASSERT(result.is_error());
        ASSERT(result.error().type == ErrorType::Timeout);
        ASSERT(session.state() == SessionState::Disconnected);
        ASSERT(!transport.is_open());
        ASSERT(!source.is_open());
    }

    // --- Disconnect while waiting for setup acknowledgement ---
    {
        testing::FakeAudioSource source;
        testing::FakeAudioSink sink;
        testing::FakeTransport transport;
        transport.setup_reply = "";
        CheckpointMachine checkpoints(cafe());
        SessionSettings settings = test_settings();
        settings.setup_timeout_ms = 3000;
        SessionClient session(source, sink, transport, checkpoints, settings);

        auto begin = std::chrono::steady_clock::now();
        std::chrono::steady_clock::time_point disconnected;
        std::thread canceller([&] {
            session.wait_for_state(SessionState::Connecting, 1000);
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            session.disconnect();
            disconnected = std::chrono::steady_clock::now();
        });

        auto result = session.connect();
        auto returned = std::chrono::steady_clock::now();
        canceller.join();

        ASSERT(result.is_error());
        ASSERT(result.error().type == ErrorType::ConnectionFailed);
        ASSERT(ms_between(begin, returned) < 1000);
        ASSERT(ms_between(begin, disconnected) < 1000);
        ASSERT(session.state() == SessionState::Disconnected);
        ASSERT(!transport.is_open());
        ASSERT(!source.is_open());
        ASSERT(!sink.is_open());
    }

    // --- Setup rejected by the server ---
    {
        testing::FakeAudioSource source;
        testing::FakeAudioSink sink;
        testing::FakeTransport transport;
        transport.setup_reply = R"({"error":{"message":"API key not valid"}})";
        CheckpointMachine checkpoints(cafe());
        SessionClient session(source, sink, transport, checkpoints, test_settings());
        Recorder recorder(session.events());

        auto result = session.connect();
        ASSERT(result.is_error());
        ASSERT(result.error().type == ErrorType::ConnectionFailed);
        ASSERT(result.error().message.find("API key not valid") != std::string::npos);
        ASSERT(session.state() == SessionState::Disconnected);
        ASSERT(recorder.all<FatalError>().empty());  // returned, not published
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All session client tests passed.\n";
    return 0;
}
