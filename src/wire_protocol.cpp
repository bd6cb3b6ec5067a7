#include "wire_protocol.h"
#include "logger.h"
#include "pcm_codec.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace orbion {
namespace wire {

namespace {

std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

bool bool_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

bool is_audio_mime(const std::string& mime) {
    return mime.empty() || mime.rfind("audio/", 0) == 0;
}

void parse_server_content(const json& content, ServerMessage& out) {
    if (content.contains("modelTurn") && content["modelTurn"].is_object()) {
        const json& turn = content["modelTurn"];
        if (turn.contains("parts") && turn["parts"].is_array()) {
            for (const auto& part : turn["parts"]) {
                if (!part.is_object() || !part.contains("inlineData")) continue;
                const json& inline_data = part["inlineData"];
                if (!inline_data.is_object()) continue;
                std::string mime = string_field(inline_data, "mimeType");
                std::string data = string_field(inline_data, "data");
                if (data.empty()) continue;
                if (!is_audio_mime(mime)) {
                    Logger::debug("[Net] Skipping non-audio part: " + mime);
                    continue;
                }
                out.audio_chunks.push_back(std::move(data));
            }
        }
    }

    // Model speech arrives as finished chunks, user speech as running partials
    if (content.contains("outputTranscription") && content["outputTranscription"].is_object()) {
        std::string text = string_field(content["outputTranscription"], "text");
        if (!text.empty()) {
            out.transcriptions.push_back({Role::Assistant, text, true});
        }
    }
    if (content.contains("inputTranscription") && content["inputTranscription"].is_object()) {
        std::string text = string_field(content["inputTranscription"], "text");
        if (!text.empty()) {
            out.transcriptions.push_back({Role::User, text, false});
        }
    }

    out.turn_complete = bool_field(content, "turnComplete");
    out.interrupted = bool_field(content, "interrupted");
}

void parse_tool_call(const json& tool_call, ServerMessage& out) {
    if (!tool_call.contains("functionCalls") || !tool_call["functionCalls"].is_array()) {
        return;
    }
    for (const auto& call : tool_call["functionCalls"]) {
        if (!call.is_object()) continue;
        ToolInvocation invocation;
        invocation.id = string_field(call, "id");
        invocation.name = string_field(call, "name");
        if (call.contains("args") && call["args"].is_object()) {
            invocation.args_json = call["args"].dump();
        }
        out.tool_calls.push_back(std::move(invocation));
    }
}

} // anonymous namespace

std::string build_setup(const SetupOptions& options) {
    json setup;
    setup["model"] = options.model;

    json generation;
    generation["responseModalities"] = json::array({"AUDIO"});
    if (!options.voice_name.empty()) {
        generation["speechConfig"]["voiceConfig"]["prebuiltVoiceConfig"]["voiceName"] = options.voice_name;
    }
    setup["generationConfig"] = generation;

    if (!options.system_instruction.empty()) {
        json part;
        part["text"] = options.system_instruction;
        setup["systemInstruction"]["parts"] = json::array();
        setup["systemInstruction"]["parts"].push_back(part);
    }

    json declarations = json::array();
    try {
        declarations = json::parse(options.function_declarations_json);
    } catch (const json::exception& e) {
        Logger::error(std::string("[Net] Invalid function declarations: ") + e.what());
    }
    if (declarations.is_array() && !declarations.empty()) {
        json tool;
        tool["functionDeclarations"] = declarations;
        setup["tools"] = json::array();
        setup["tools"].push_back(tool);
    }

    if (options.input_transcription) {
        setup["inputAudioTranscription"] = json::object();
    }
    if (options.output_transcription) {
        setup["outputAudioTranscription"] = json::object();
    }

    json message;
    message["setup"] = setup;
    return message.dump();
}

std::string build_realtime_input(const PcmBytes& pcm, int sample_rate) {
    json chunk;
    chunk["mimeType"] = "audio/pcm;rate=" + std::to_string(sample_rate);
    chunk["data"] = pcm::base64_encode(pcm);

    json message;
    message["realtimeInput"]["mediaChunks"] = json::array();
    message["realtimeInput"]["mediaChunks"].push_back(chunk);
    return message.dump();
}

std::string build_tool_response(const std::vector<FunctionResponse>& responses) {
    json list = json::array();
    for (const auto& r : responses) {
        json entry;
        entry["id"] = r.id;
        entry["name"] = r.name;
        if (r.success) {
            entry["response"]["result"] = r.result;
        } else {
            entry["response"]["error"] = r.result;
        }
        list.push_back(entry);
    }

    json message;
    message["toolResponse"]["functionResponses"] = list;
    return message.dump();
}

Result<ServerMessage> parse_server_message(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        return make_parse_error(std::string("invalid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        return make_parse_error("message is not an object");
    }

    ServerMessage out;
    out.setup_complete = root.contains("setupComplete");

    if (root.contains("serverContent") && root["serverContent"].is_object()) {
        parse_server_content(root["serverContent"], out);
    }
    if (root.contains("toolCall") && root["toolCall"].is_object()) {
        parse_tool_call(root["toolCall"], out);
    }
    if (root.contains("toolCallCancellation") && root["toolCallCancellation"].is_object()) {
        const json& cancel = root["toolCallCancellation"];
        if (cancel.contains("ids") && cancel["ids"].is_array()) {
            for (const auto& id : cancel["ids"]) {
                if (id.is_string()) out.cancelled_tool_calls.push_back(id.get<std::string>());
            }
        }
    }

    out.go_away = root.contains("goAway");
    if (root.contains("error")) {
        const json& err = root["error"];
        std::string message = err.is_object() ? string_field(err, "message") : "";
        if (message.empty()) {
            message = err.is_string() ? err.get<std::string>() : err.dump();
        }
        out.error_message = message;
    }
    return out;
}

} // namespace wire
} // namespace orbion
