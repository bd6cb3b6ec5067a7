#pragma once

/**
 * @file wire_protocol.h
 * @brief JSON messages of the live conversation protocol
 *
 * Builders produce the outbound text frames; parse_server_message() flattens
 * one inbound frame into the events the session client acts on.
 */

#include "common.h"
#include "errors.h"
#include <optional>
#include <string>
#include <vector>

namespace orbion {
namespace wire {

struct SetupOptions {
    std::string model;
    std::string voice_name;
    std::string system_instruction;
    std::string function_declarations_json = "[]";  ///< JSON array of declarations
    bool input_transcription = true;
    bool output_transcription = true;
};

/// Remote request to run a tool; answered by exactly one FunctionResponse
struct ToolInvocation {
    std::string id;
    std::string name;
    std::string args_json = "{}";
};

struct FunctionResponse {
    std::string id;
    std::string name;
    bool success = true;
    std::string result;  ///< Result text, or error text when !success
};

struct TranscriptionFragment {
    Role role = Role::User;
    std::string text;
    bool is_final = false;
};

/**
 * @brief Everything one inbound frame carries, in processing order
 */
struct ServerMessage {
    bool setup_complete = false;
    std::vector<std::string> audio_chunks;  ///< Base64 PCM16 payloads, in part order
    std::vector<TranscriptionFragment> transcriptions;
    bool turn_complete = false;
    bool interrupted = false;
    std::vector<ToolInvocation> tool_calls;
    std::vector<std::string> cancelled_tool_calls;
    bool go_away = false;
    std::optional<std::string> error_message;

    bool is_fatal() const { return go_away || error_message.has_value(); }
};

std::string build_setup(const SetupOptions& options);

/// One realtimeInput frame carrying a PCM16 chunk at @p sample_rate
std::string build_realtime_input(const PcmBytes& pcm, int sample_rate = INPUT_SAMPLE_RATE);

std::string build_tool_response(const std::vector<FunctionResponse>& responses);

/**
 * @brief Parse one inbound frame
 * @return ParseError when the frame is not a JSON object
 */
Result<ServerMessage> parse_server_message(const std::string& text);

} // namespace wire
} // namespace orbion
