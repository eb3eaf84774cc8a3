#include "net/wire_protocol.h"
#include "frame_codec.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace duplex_voice {
namespace net {

namespace {

std::string input_encoding_for(int sample_rate) {
    if (sample_rate == DEFAULT_INPUT_SAMPLE_RATE) {
        return INPUT_ENCODING;
    }
    if (sample_rate % 1000 == 0) {
        return "pcm16@" + std::to_string(sample_rate / 1000) + "kHz mono";
    }
    return "pcm16@" + std::to_string(sample_rate) + "Hz mono";
}

Result<json> parse_object(const std::string& message) {
    try {
        json doc = json::parse(message);
        if (!doc.is_object()) {
            return make_protocol_error("expected a JSON object, got: " + utils::truncate_for_log(message, 60));
        }
        return doc;
    } catch (const json::exception& e) {
        return make_protocol_error("JSON parse error: " + std::string(e.what()));
    }
}

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

InboundEvent transcript_event(Speaker speaker, const std::string& text, bool is_final) {
    InboundEvent ev;
    ev.kind = InboundKind::Transcript;
    ev.fragment.speaker = speaker;
    ev.fragment.text = text;
    ev.fragment.is_final = is_final;
    return ev;
}

InboundEvent simple_event(InboundKind kind, const std::string& message = "") {
    InboundEvent ev;
    ev.kind = kind;
    ev.message = message;
    return ev;
}

/**
 * {"type": ...} messages
 */
class GenericCodec : public IMessageCodec {
public:
    std::string name() const override {
        return "generic";
    }

    std::string connect_url(const TransportConfig& config) const override {
        return config.endpoint;
    }

    std::vector<std::string> connect_headers(const TransportConfig& config) const override {
        std::vector<std::string> headers;
        if (!config.api_key.empty()) {
            headers.push_back("Authorization: Bearer " + config.api_key);
        }
        return headers;
    }

    std::string encode_setup(const SetupRequest& request) const override {
        json msg;
        msg["type"] = "setup";
        msg["behavior_instruction"] = request.behavior_instruction;
        msg["voice_id"] = request.voice_id;
        msg["input_encoding"] = input_encoding_for(request.input_sample_rate);
        return msg.dump();
    }

    std::string encode_audio(const AudioFrame& frame) const override {
        json msg;
        msg["type"] = "audio_input";
        msg["data"] = codec::encode_frame(frame);
        return msg.dump();
    }

    Result<std::vector<InboundEvent>> decode(const std::string& message) const override {
        auto parsed = parse_object(message);
        if (parsed.is_error()) {
            return parsed.error();
        }
        const json& doc = parsed.value();
        std::string type = string_field(doc, "type");
        if (type.empty()) {
            return make_protocol_error("message has no type");
        }

        std::vector<InboundEvent> events;
        if (type == "ready") {
            events.push_back(simple_event(InboundKind::Ready));
        } else if (type == "audio_output") {
            InboundEvent ev;
            ev.kind = InboundKind::Audio;
            ev.audio_base64 = string_field(doc, "data");
            events.push_back(std::move(ev));
        } else if (type == "transcript") {
            std::string speaker = string_field(doc, "speaker");
            if (speaker != "local" && speaker != "remote") {
                return make_protocol_error("transcript with unknown speaker '" + speaker + "'");
            }
            bool is_final = bool_field(doc, "is_final") || bool_field(doc, "isFinal");
            events.push_back(transcript_event(speaker == "local" ? Speaker::Local : Speaker::Remote,
                                              string_field(doc, "text"), is_final));
        } else if (type == "interrupted") {
            events.push_back(simple_event(InboundKind::Interrupted));
        } else if (type == "closed") {
            events.push_back(simple_event(InboundKind::Closed, string_field(doc, "reason")));
        } else if (type == "error") {
            events.push_back(simple_event(InboundKind::Error, string_field(doc, "message")));
        } else {
            LOG_DEBUG("Ignoring message type: " + type);
        }
        return events;
    }
};

/**
 * Realtime "live" API: setup / setupComplete / realtimeInput / serverContent
 */
class LiveApiCodec : public IMessageCodec {
public:
    std::string name() const override {
        return "live_api";
    }

    std::string connect_url(const TransportConfig& config) const override {
        if (config.api_key.empty()) {
            return config.endpoint;
        }
        char sep = config.endpoint.find('?') == std::string::npos ? '?' : '&';
        return config.endpoint + sep + "key=" + config.api_key;
    }

    std::vector<std::string> connect_headers(const TransportConfig&) const override {
        return {};
    }

    std::string encode_setup(const SetupRequest& request) const override {
        json setup;
        std::string model = request.model;
        if (model.rfind("models/", 0) != 0) {
            model = "models/" + model;
        }
        setup["model"] = model;
        setup["generationConfig"]["responseModalities"] = json::array({"AUDIO"});
        setup["generationConfig"]["speechConfig"]["voiceConfig"]["prebuiltVoiceConfig"]["voiceName"] =
            request.voice_id;
        if (!request.behavior_instruction.empty()) {
            json part;
            part["text"] = request.behavior_instruction;
            setup["systemInstruction"]["parts"] = json::array({part});
        }
        if (request.input_transcription) {
            setup["inputAudioTranscription"] = json::object();
        }
        if (request.output_transcription) {
            setup["outputAudioTranscription"] = json::object();
        }

        json msg;
        msg["setup"] = setup;
        return msg.dump();
    }

    std::string encode_audio(const AudioFrame& frame) const override {
        json chunk;
        chunk["mimeType"] = "audio/pcm;rate=" + std::to_string(frame.sample_rate);
        chunk["data"] = codec::encode_frame(frame);

        json msg;
        msg["realtimeInput"]["mediaChunks"] = json::array({chunk});
        return msg.dump();
    }

    Result<std::vector<InboundEvent>> decode(const std::string& message) const override {
        auto parsed = parse_object(message);
        if (parsed.is_error()) {
            return parsed.error();
        }
        const json& doc = parsed.value();
        std::vector<InboundEvent> events;

        if (doc.contains("setupComplete")) {
            events.push_back(simple_event(InboundKind::Ready));
        }

        auto content = doc.find("serverContent");
        if (content != doc.end() && content->is_object()) {
            decode_server_content(*content, events);
        }

        auto go_away = doc.find("goAway");
        if (go_away != doc.end()) {
            std::string reason = "remote is going away";
            if (go_away->is_object() && go_away->contains("timeLeft")) {
                reason += " (time left " + go_away->at("timeLeft").dump() + ")";
            }
            events.push_back(simple_event(InboundKind::Closed, reason));
        }

        auto error = doc.find("error");
        if (error != doc.end()) {
            std::string text = error->is_object() ? string_field(*error, "message") : "";
            if (text.empty()) {
                text = error->dump();
            }
            events.push_back(simple_event(InboundKind::Error, text));
        }
        return events;
    }

private:
    static void decode_server_content(const json& content, std::vector<InboundEvent>& events) {
        if (bool_field(content, "interrupted")) {
            events.push_back(simple_event(InboundKind::Interrupted));
        }

        auto input = content.find("inputTranscription");
        if (input != content.end() && input->is_object()) {
            std::string text = string_field(*input, "text");
            if (!text.empty()) {
                events.push_back(transcript_event(Speaker::Local, text, false));
            }
        }

        auto turn = content.find("modelTurn");
        if (turn != content.end() && turn->is_object()) {
            auto parts = turn->find("parts");
            if (parts != turn->end() && parts->is_array()) {
                for (const auto& part : *parts) {
                    auto inline_data = part.find("inlineData");
                    if (inline_data == part.end() || !inline_data->is_object()) {
                        continue;
                    }
                    InboundEvent ev;
                    ev.kind = InboundKind::Audio;
                    ev.audio_base64 = string_field(*inline_data, "data");
                    events.push_back(std::move(ev));
                }
            }
        }

        auto output = content.find("outputTranscription");
        if (output != content.end() && output->is_object()) {
            std::string text = string_field(*output, "text");
            if (!text.empty()) {
                events.push_back(transcript_event(Speaker::Remote, text, false));
            }
        }

        if (bool_field(content, "turnComplete")) {
            events.push_back(transcript_event(Speaker::Remote, "", true));
        }
    }
};

} // anonymous namespace

std::unique_ptr<IMessageCodec> make_message_codec(const std::string& protocol) {
    if (protocol == "generic") {
        return std::make_unique<GenericCodec>();
    }
    if (protocol == "live_api") {
        return std::make_unique<LiveApiCodec>();
    }
    return nullptr;
}

bool is_auth_message(const std::string& message) {
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const char* markers[] = {"api key", "api_key", "unauthorized", "unauthenticated",
                                    "permission denied", "forbidden", "invalid key"};
    for (const char* marker : markers) {
        if (lower.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace net
} // namespace duplex_voice
