#pragma once

/**
 * @file session_client.h
 * @brief Realtime bidirectional audio session with the remote tutor model
 */

#include "audio_device.h"
#include "capture_encoder.h"
#include "checkpoint_machine.h"
#include "errors.h"
#include "session_events.h"
#include "tool_registry.h"
#include "transcript_aggregator.h"
#include "transport.h"
#include "wire_protocol.h"
#include <memory>
#include <string>

namespace orbion {

struct SessionSettings {
    std::string url;                ///< WebSocket URL including credentials
    wire::SetupOptions setup;       ///< function_declarations_json is filled from the tool registry
    CaptureSettings capture;
    int output_sample_rate = OUTPUT_SAMPLE_RATE;
    int setup_timeout_ms = 10000;
};

/**
 * @brief Owns one session at a time: capture, transport and playback timeline
 *
 * connect() runs Disconnected -> Connecting -> Connected and returns any
 * failure to the caller with every resource released. After Connected, fatal
 * failures publish FatalError and the session tears itself down to
 * Disconnected on a supervisor thread; there is no automatic reconnect.
 *
 * Events are published on the thread that caused them (capture, network,
 * playback completion or supervisor). Handlers must not call connect(), and
 * only a FatalError handler may call disconnect().
 */
class SessionClient {
public:
    SessionClient(IAudioSource& source,
                  IAudioSink& sink,
                  ITransport& transport,
                  CheckpointMachine& checkpoints,
                  SessionSettings settings);
    ~SessionClient();

    SessionClient(const SessionClient&) = delete;
    SessionClient& operator=(const SessionClient&) = delete;

    /**
     * @brief Open devices and transport, exchange setup, start streaming
     * @return CaptureUnavailable, OutputUnavailable, ConnectionFailed, SessionError
     *         or Timeout; InvalidState unless Disconnected
     */
    Result<void> connect();

    /**
     * @brief Release every resource. No-op when already disconnected.
     *
     * Safe from another thread while connect() waits for the setup
     * acknowledgement; that connect() then fails with ConnectionFailed.
     */
    void disconnect();

    SessionState state() const;

    /**
     * @brief Block until the session reaches @p state
     * @return false on timeout
     */
    bool wait_for_state(SessionState state, int timeout_ms) const;

    EventDispatcher& events();
    ToolRegistry& tools();
    const TranscriptAggregator& transcript() const;

    uint64_t chunks_sent() const;
    uint64_t chunks_dropped() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace orbion
