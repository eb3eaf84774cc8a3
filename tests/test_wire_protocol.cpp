/**
 * Wire dialects: setup and audio encoding, inbound classification, credentials.
 */

#include "net/wire_protocol.h"
#include "frame_codec.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <iostream>

using namespace duplex_voice;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static void test_factory() {
    ASSERT(net::make_message_codec("generic") != nullptr);
    ASSERT(net::make_message_codec("live_api") != nullptr);
    ASSERT(net::make_message_codec("carrier-pigeon") == nullptr);
    ASSERT(net::make_message_codec("generic")->name() == "generic");
}

static void test_generic() {
    auto codec = net::make_message_codec("generic");

    TransportConfig config;
    config.endpoint = "wss://voice.example.com/session";
    ASSERT(codec->connect_url(config) == "wss://voice.example.com/session");
    ASSERT(codec->connect_headers(config).empty());
    config.api_key = "secret";
    auto headers = codec->connect_headers(config);
    ASSERT(headers.size() == 1 && headers[0] == "Authorization: Bearer secret");

    net::SetupRequest request;
    request.behavior_instruction = "Be brief.";
    request.voice_id = "Puck";
    json setup = json::parse(codec->encode_setup(request));
    ASSERT(setup["type"] == "setup");
    ASSERT(setup["behavior_instruction"] == "Be brief.");
    ASSERT(setup["voice_id"] == "Puck");
    ASSERT(setup["input_encoding"] == "pcm16@16kHz mono");

    AudioFrame frame;
    frame.samples = {1, 2, 3};
    json audio = json::parse(codec->encode_audio(frame));
    ASSERT(audio["type"] == "audio_input");
    ASSERT(audio["data"] == codec::encode_frame(frame));

    auto ready = codec->decode("{\"type\":\"ready\"}");
    ASSERT(ready.is_ok() && ready.value().size() == 1);
    ASSERT(ready.value()[0].kind == net::InboundKind::Ready);

    auto out = codec->decode("{\"type\":\"audio_output\",\"data\":\"AAA=\"}");
    ASSERT(out.is_ok() && out.value().size() == 1);
    ASSERT(out.value()[0].kind == net::InboundKind::Audio && out.value()[0].audio_base64 == "AAA=");

    auto local = codec->decode("{\"type\":\"transcript\",\"speaker\":\"local\",\"text\":\"hi\",\"is_final\":true}");
    ASSERT(local.is_ok() && local.value().size() == 1);
    const auto& f = local.value()[0].fragment;
    ASSERT(f.speaker == Speaker::Local && f.text == "hi" && f.is_final);

    auto camel = codec->decode("{\"type\":\"transcript\",\"speaker\":\"remote\",\"text\":\"ok\",\"isFinal\":true}");
    ASSERT(camel.is_ok() && camel.value()[0].fragment.is_final);
    ASSERT(camel.value()[0].fragment.speaker == Speaker::Remote);

    auto bad_speaker = codec->decode("{\"type\":\"transcript\",\"speaker\":\"narrator\",\"text\":\"x\"}");
    ASSERT(bad_speaker.is_error() && bad_speaker.error().type == ErrorType::ProtocolError);

    auto closed = codec->decode("{\"type\":\"closed\",\"reason\":\"idle timeout\"}");
    ASSERT(closed.is_ok() && closed.value()[0].kind == net::InboundKind::Closed);
    ASSERT(closed.value()[0].message == "idle timeout");

    auto err = codec->decode("{\"type\":\"error\",\"message\":\"boom\"}");
    ASSERT(err.is_ok() && err.value()[0].kind == net::InboundKind::Error && err.value()[0].message == "boom");

    auto unknown = codec->decode("{\"type\":\"usage\",\"tokens\":12}");
    ASSERT(unknown.is_ok() && unknown.value().empty());

    auto no_type = codec->decode("{\"data\":1}");
    ASSERT(no_type.is_error() && no_type.error().type == ErrorType::ProtocolError);
    auto not_json = codec->decode("{not json");
    ASSERT(not_json.is_error() && not_json.error().type == ErrorType::ProtocolError);
    auto array = codec->decode("[1,2]");
    ASSERT(array.is_error());
}

static void test_live_api() {
    auto codec = net::make_message_codec("live_api");

    TransportConfig config;
    config.endpoint = "wss://live.example.com/ws";
    config.api_key = "k123";
    ASSERT(codec->connect_url(config) == "wss://live.example.com/ws?key=k123");
    config.endpoint = "wss://live.example.com/ws?alt=json";
    ASSERT(codec->connect_url(config) == "wss://live.example.com/ws?alt=json&key=k123");
    ASSERT(codec->connect_headers(config).empty());

    net::SetupRequest request;
    request.model = "gemini-live";
    request.voice_id = "Kore";
    request.behavior_instruction = "Speak like a pirate.";
    request.output_transcription = false;
    json setup = json::parse(codec->encode_setup(request))["setup"];
    ASSERT(setup["model"] == "models/gemini-live");
    ASSERT(setup["generationConfig"]["responseModalities"][0] == "AUDIO");
    ASSERT(setup["generationConfig"]["speechConfig"]["voiceConfig"]["prebuiltVoiceConfig"]["voiceName"] == "Kore");
    ASSERT(setup["systemInstruction"]["parts"][0]["text"] == "Speak like a pirate.");
    ASSERT(setup.contains("inputAudioTranscription"));
    ASSERT(!setup.contains("outputAudioTranscription"));

    request.model = "models/already-prefixed";
    request.behavior_instruction.clear();
    json bare = json::parse(codec->encode_setup(request))["setup"];
    ASSERT(bare["model"] == "models/already-prefixed");
    ASSERT(!bare.contains("systemInstruction"));

    AudioFrame frame;
    frame.samples = {0, -1};
    json audio = json::parse(codec->encode_audio(frame));
    ASSERT(audio["realtimeInput"]["mediaChunks"][0]["mimeType"] == "audio/pcm;rate=16000");
    ASSERT(audio["realtimeInput"]["mediaChunks"][0]["data"] == codec::encode_frame(frame));

    auto ready = codec->decode("{\"setupComplete\":{}}");
    ASSERT(ready.is_ok() && ready.value().size() == 1 && ready.value()[0].kind == net::InboundKind::Ready);

    // One serverContent message can carry several events, surfaced in a fixed order
    const char* content = R"({"serverContent":{
        "turnComplete": true,
        "outputTranscription": {"text": "Ahoy"},
        "modelTurn": {"parts": [{"inlineData": {"mimeType": "audio/pcm", "data": "AAA="}},
                                {"text": "ignored"},
                                {"inlineData": {"data": "AQA="}}]},
        "inputTranscription": {"text": "hello"},
        "interrupted": true
    }})";
    auto multi = codec->decode(content);
    ASSERT(multi.is_ok());
    if (multi.is_ok()) {
        const auto& events = multi.value();
        ASSERT(events.size() == 6);
        if (events.size() == 6) {
            ASSERT(events[0].kind == net::InboundKind::Interrupted);
            ASSERT(events[1].kind == net::InboundKind::Transcript);
            ASSERT(events[1].fragment.speaker == Speaker::Local && events[1].fragment.text == "hello");
            ASSERT(!events[1].fragment.is_final);
            ASSERT(events[2].kind == net::InboundKind::Audio && events[2].audio_base64 == "AAA=");
            ASSERT(events[3].kind == net::InboundKind::Audio && events[3].audio_base64 == "AQA=");
            ASSERT(events[4].fragment.speaker == Speaker::Remote && events[4].fragment.text == "Ahoy");
            ASSERT(events[5].kind == net::InboundKind::Transcript);
            ASSERT(events[5].fragment.speaker == Speaker::Remote);
            ASSERT(events[5].fragment.text.empty() && events[5].fragment.is_final);
        }
    }

    auto go_away = codec->decode("{\"goAway\":{\"timeLeft\":\"5s\"}}");
    ASSERT(go_away.is_ok() && go_away.value().size() == 1);
    ASSERT(go_away.value()[0].kind == net::InboundKind::Closed);

    auto err = codec->decode("{\"error\":{\"code\":401,\"message\":\"API key not valid\"}}");
    ASSERT(err.is_ok() && err.value().size() == 1 && err.value()[0].kind == net::InboundKind::Error);
    ASSERT(err.value()[0].message == "API key not valid");

    auto usage = codec->decode("{\"usageMetadata\":{\"totalTokenCount\":3}}");
    ASSERT(usage.is_ok() && usage.value().empty());

    auto broken = codec->decode("serverContent");
    ASSERT(broken.is_error() && broken.error().type == ErrorType::ProtocolError);
}

static void test_auth_messages() {
    ASSERT(net::is_auth_message("API key not valid. Please pass a valid API key."));
    ASSERT(net::is_auth_message("Request had invalid authentication: UNAUTHENTICATED"));
    ASSERT(net::is_auth_message("403 Forbidden"));
    ASSERT(!net::is_auth_message("Internal error encountered."));
    ASSERT(!net::is_auth_message(""));
}

int main() {
    Logger::initialize(LogLevel::WARN);

    test_factory();
    test_generic();
    test_live_api();
    test_auth_messages();

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All wire protocol tests passed.\n";
    return 0;
}
